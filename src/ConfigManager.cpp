#include "ConfigManager.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

ConfigManager::ConfigManager(const std::string& configFile)
    : configFilePath(configFile), root(nullptr)
{
    loadConfig();
}

ConfigManager::~ConfigManager()
{
    cleanupJSON();
}

void ConfigManager::cleanupJSON()
{
    if (root) {
        cJSON_Delete(root);
        root = nullptr;
    }
}

bool ConfigManager::loadConfig()
{
    cleanupJSON();

    std::ifstream in(configFilePath);
    if (!in) {
        std::cerr << "Could not open config file " << configFilePath << ", using defaults" << std::endl;
        return false;
    }

    std::stringstream text;
    text << in.rdbuf();
    return loadFromString(text.str());
}

bool ConfigManager::loadFromString(const std::string& json)
{
    cleanupJSON();

    cJSON* parsed = cJSON_Parse(json.c_str());
    if (!parsed) {
        const char* where = cJSON_GetErrorPtr();
        std::cerr << "Error parsing JSON config near: " << (where ? where : "(unknown)") << std::endl;
        return false;
    }
    if (!cJSON_IsObject(parsed)) {
        std::cerr << "Config root must be a JSON object" << std::endl;
        cJSON_Delete(parsed);
        return false;
    }

    root = parsed;
    return true;
}

cJSON* ConfigManager::getNestedItem(const std::string& path) const
{
    // "a.b.c": every segment but the last must name an object
    cJSON* node = root;
    size_t start = 0;
    while (node) {
        size_t dot = path.find('.', start);
        std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        cJSON* child = cJSON_GetObjectItemCaseSensitive(node, key.c_str());
        if (dot == std::string::npos) {
            return child;
        }
        node = cJSON_IsObject(child) ? child : nullptr;
        start = dot + 1;
    }
    return nullptr;
}

std::string ConfigManager::getNestedString(const std::string& path, const std::string& defaultValue) const
{
    const cJSON* item = getNestedItem(path);
    return cJSON_IsString(item) ? std::string(item->valuestring) : defaultValue;
}

int ConfigManager::getNestedInt(const std::string& path, int defaultValue) const
{
    const cJSON* item = getNestedItem(path);
    return cJSON_IsNumber(item) ? item->valueint : defaultValue;
}

bool ConfigManager::getNestedBool(const std::string& path, bool defaultValue) const
{
    const cJSON* item = getNestedItem(path);
    return cJSON_IsBool(item) ? cJSON_IsTrue(item) != 0 : defaultValue;
}

bool ConfigManager::parseUInt(const cJSON* item, uint32_t& value)
{
    if (cJSON_IsNumber(item)) {
        double number = item->valuedouble;
        if (number < 0 || number > 4294967295.0) {
            return false;
        }
        value = static_cast<uint32_t>(number);
        return true;
    }

    // USB ids are usually written as "0x0403"
    if (cJSON_IsString(item)) {
        const char* text = item->valuestring;
        if (*text == '\0' || *text == '-') {
            return false;
        }
        char* end = nullptr;
        errno = 0;
        unsigned long long parsed = strtoull(text, &end, 0);
        if (errno != 0 || *end != '\0' || parsed > 0xFFFFFFFFULL) {
            return false;
        }
        value = static_cast<uint32_t>(parsed);
        return true;
    }

    return false;
}

uint32_t ConfigManager::getNestedUInt(const std::string& path, uint32_t defaultValue) const
{
    uint32_t value = 0;
    return parseUInt(getNestedItem(path), value) ? value : defaultValue;
}

bool ConfigManager::getNestedUInt(const std::string& path, uint32_t maxValue, uint32_t defaultValue,
                                  uint32_t& value) const
{
    const cJSON* item = getNestedItem(path);
    if (!item) {
        value = defaultValue;
        return true;
    }

    uint32_t parsed = 0;
    if (!parseUInt(item, parsed) || parsed > maxValue) {
        std::cerr << "Config value " << path << " must be an integer between 0 and " << maxValue << std::endl;
        return false;
    }
    value = parsed;
    return true;
}
