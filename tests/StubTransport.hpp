/**
 * @file StubTransport.hpp
 * @brief In-memory transport and simulated cartridge for the session tests.
 *
 * StubTransport is a byte pipe: what the session sends is handed to a
 * responder, and whatever the responder queues is what receive() returns.
 * receive() never sleeps; an empty queue is an immediate timeout. purge()
 * empties the queue.
 *
 * SimulatedDevice is a responder that answers the command protocol against a
 * sparse memory map and can be told to misbehave on the Nth command.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <vector>
#include "Transport.hpp"

class StubTransport : public Transport {
public:
    typedef std::function<void(const std::vector<uint8_t>&)> Responder;

    EverdriveError open(uint16_t vendor_id, uint16_t product_id,
                        std::chrono::milliseconds timeout) override
    {
        opened_vid = vendor_id;
        opened_pid = product_id;
        opened_timeout = timeout;
        open_calls++;
        if (!open_result.ok()) {
            return open_result;
        }
        is_open = true;
        return EverdriveError::success();
    }

    void close() override
    {
        is_open = false;
        close_calls++;
    }

    bool isOpen() const override { return is_open; }

    EverdriveError send(const std::vector<uint8_t>& data) override
    {
        if (!is_open) {
            return EverdriveError(EverdriveError::TRANSPORT_IO, "stub closed");
        }
        if (fail_send) {
            return EverdriveError(EverdriveError::TRANSPORT_IO, "stub send failure");
        }
        sent.push_back(data);
        if (on_send) {
            on_send(data);
        }
        if (responder) {
            responder(data);
        }
        return EverdriveError::success();
    }

    EverdriveError receive(size_t max_len, std::chrono::milliseconds timeout,
                           std::vector<uint8_t>& out) override
    {
        (void)timeout;
        out.clear();
        receive_calls++;
        if (!is_open) {
            return EverdriveError(EverdriveError::TRANSPORT_IO, "stub closed");
        }
        if (fail_receive) {
            return EverdriveError(EverdriveError::TRANSPORT_IO, "stub receive failure");
        }
        if (inbox.empty()) {
            return EverdriveError(EverdriveError::TRANSPORT_TIMEOUT, "stub timeout");
        }
        while (!inbox.empty() && out.size() < max_len) {
            out.push_back(inbox.front());
            inbox.pop_front();
        }
        return EverdriveError::success();
    }

    EverdriveError purge() override
    {
        purge_calls++;
        if (!is_open) {
            return EverdriveError(EverdriveError::TRANSPORT_IO, "stub closed");
        }
        inbox.clear();
        return EverdriveError::success();
    }

    void queue(const std::vector<uint8_t>& bytes)
    {
        inbox.insert(inbox.end(), bytes.begin(), bytes.end());
    }

    EverdriveError open_result;
    bool is_open = false;
    bool fail_send = false;
    bool fail_receive = false;
    int open_calls = 0;
    int close_calls = 0;
    int receive_calls = 0;
    int purge_calls = 0;
    uint16_t opened_vid = 0;
    uint16_t opened_pid = 0;
    std::chrono::milliseconds opened_timeout{0};

    std::deque<uint8_t> inbox;
    std::vector<std::vector<uint8_t>> sent;
    Responder responder;
    std::function<void(const std::vector<uint8_t>&)> on_send;
};

/**
 * One decoded command as seen by the simulated cartridge.
 */
struct SeenCommand {
    char opcode;
    uint32_t address;
    uint32_t blocks;
    uint32_t argument;
    size_t payload_size;
};

class SimulatedDevice {
public:
    enum Fault {
        NONE,
        SILENT,     // no reply at all
        TRUNCATED,  // reply loses its last byte
        ERROR_CODE, // 'e' reply with error_code
        GARBAGE     // reply with a bad prefix
    };

    explicit SimulatedDevice(StubTransport& link, uint32_t block_size = 1)
        : link(link), block_size(block_size)
    {
        link.responder = [this](const std::vector<uint8_t>& bytes) { handle(bytes); };
    }

    /**
     * @brief Misbehave on the command with this index (0 is the handshake).
     */
    void failOn(size_t index, Fault fault, uint8_t code = 0)
    {
        fault_index = index;
        this->fault = fault;
        error_code = code;
    }

    uint8_t peek(uint32_t address) const
    {
        auto it = memory.find(address);
        // Unwritten memory reads back a pattern derived from its address
        return it != memory.end() ? it->second : static_cast<uint8_t>(address ^ (address >> 8));
    }

    std::map<uint32_t, uint8_t> memory;
    std::vector<SeenCommand> commands;
    std::vector<std::vector<uint8_t>> unf_packets;
    std::vector<uint8_t> status_detail;
    std::vector<uint8_t> app_name;

private:
    static uint32_t word(const std::vector<uint8_t>& b, size_t offset)
    {
        return (static_cast<uint32_t>(b[offset]) << 24) | (static_cast<uint32_t>(b[offset + 1]) << 16) |
               (static_cast<uint32_t>(b[offset + 2]) << 8) | static_cast<uint32_t>(b[offset + 3]);
    }

    void reply(std::vector<uint8_t> bytes)
    {
        const size_t index = commands.size() - 1;
        if (index == fault_index) {
            switch (fault) {
                case SILENT:
                    return;
                case TRUNCATED:
                    bytes.pop_back();
                    break;
                case ERROR_CODE:
                    bytes = {'c', 'm', 'd', 'e', error_code};
                    break;
                case GARBAGE:
                    bytes[0] = 'x';
                    break;
                case NONE:
                    break;
            }
        }
        link.queue(bytes);
    }

    void handle(const std::vector<uint8_t>& bytes)
    {
        if (bytes.size() >= 4 && bytes[0] == 'D' && bytes[1] == 'M' && bytes[2] == 'A' && bytes[3] == '@') {
            unf_packets.push_back(bytes);
            return;
        }
        if (bytes.size() < 16 || bytes[0] != 'c' || bytes[1] != 'm' || bytes[2] != 'd') {
            return;
        }

        SeenCommand cmd;
        cmd.opcode = static_cast<char>(bytes[3]);
        cmd.address = word(bytes, 4);
        cmd.blocks = word(bytes, 8);
        cmd.argument = word(bytes, 12);
        cmd.payload_size = bytes.size() - 16;
        commands.push_back(cmd);

        const size_t length = static_cast<size_t>(cmd.blocks) * block_size;
        std::vector<uint8_t> ok = {'c', 'm', 'd', 'r'};

        switch (cmd.opcode) {
            case 't':
                ok.insert(ok.end(), status_detail.begin(), status_detail.end());
                reply(ok);
                break;
            case 'R':
                for (size_t i = 0; i < length; i++) {
                    ok.push_back(peek(cmd.address + static_cast<uint32_t>(i)));
                }
                reply(ok);
                break;
            case 'W':
                for (size_t i = 0; i < cmd.payload_size; i++) {
                    memory[cmd.address + static_cast<uint32_t>(i)] = bytes[16 + i];
                }
                reply(ok);
                break;
            case 'c':
                for (size_t i = 0; i < length; i++) {
                    memory[cmd.address + static_cast<uint32_t>(i)] = static_cast<uint8_t>(cmd.argument);
                }
                reply(ok);
                break;
            case 's':
                app_name.assign(bytes.begin() + 16, bytes.end());
                break;
            default:
                break;
        }
    }

    StubTransport& link;
    uint32_t block_size;
    size_t fault_index = static_cast<size_t>(-1);
    Fault fault = NONE;
    uint8_t error_code = 0;
};
