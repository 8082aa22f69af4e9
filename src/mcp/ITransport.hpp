#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace cycle_mcp {

using json = nlohmann::json;

/**
 * @brief Outcome of reading one message from a transport
 */
struct IncomingMessage {
    enum class Status {
        MESSAGE,      // payload holds a parsed JSON value
        PARSE_ERROR,  // a frame arrived but was not valid JSON; error holds the reason
        CLOSED        // end of input, nothing more will arrive
    };

    Status status = Status::CLOSED;
    json payload;
    std::string error;

    static IncomingMessage message(json value) {
        return {Status::MESSAGE, std::move(value), {}};
    }
    static IncomingMessage parse_error(std::string reason) {
        return {Status::PARSE_ERROR, json(), std::move(reason)};
    }
    static IncomingMessage closed() {
        return {Status::CLOSED, json(), {}};
    }
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations move JSON-RPC messages over a concrete channel.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Block until the next message, a malformed frame, or end of input
     */
    virtual IncomingMessage read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport can still read and write
     */
    virtual bool is_open() const = 0;
};

} // namespace cycle_mcp
