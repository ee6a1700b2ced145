/**
 * @file ConfigManager.hpp
 * @brief Read-only access to the tool's JSON configuration file.
 *
 * Values are addressed by dotted paths ("protocol.timeout_ms"). Every getter
 * takes a default that is returned when the file is missing, the path does
 * not exist or the value has the wrong JSON type.
 */

#pragma once

#include <cstdint>
#include <string>
#include <cjson/cJSON.h>

/**
 * @class ConfigManager
 * @brief Loads a JSON configuration with cJSON and answers typed lookups.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager and tries to load the file.
     * @param configFile The path to the configuration file. Defaults to "config.json".
     */
    ConfigManager(const std::string& configFile = "config.json");

    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * @brief (Re)load the configuration from the file given at construction.
     * @return True if the file was read and parsed.
     */
    bool loadConfig();

    /**
     * @brief Replace the configuration with the given JSON text.
     * @return True if the text parsed.
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Whether a configuration is currently loaded.
     */
    bool isLoaded() const { return root != nullptr; }

    const std::string& getPath() const { return configFilePath; }

    std::string getNestedString(const std::string& path, const std::string& defaultValue = "") const;
    int getNestedInt(const std::string& path, int defaultValue = 0) const;
    bool getNestedBool(const std::string& path, bool defaultValue = false) const;

    /**
     * @brief Retrieves an unsigned value given either as a JSON number or as a
     *        string ("0x0403", "1027").
     *
     * Negative numbers and unparsable strings yield the default.
     */
    uint32_t getNestedUInt(const std::string& path, uint32_t defaultValue = 0) const;

    /**
     * @brief Like getNestedUInt, but a value that is present and unusable is an error.
     *
     * @param value Receives the value, or defaultValue when the path is absent
     * @return false if the value is negative, unparsable or above maxValue
     */
    bool getNestedUInt(const std::string& path, uint32_t maxValue, uint32_t defaultValue,
                       uint32_t& value) const;

private:
    std::string configFilePath;
    cJSON* root;

    cJSON* getNestedItem(const std::string& path) const;
    static bool parseUInt(const cJSON* item, uint32_t& value);
    void cleanupJSON();
};
