#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace cycle_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

IncomingMessage StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        try {
            json message = json::parse(line);
            spdlog::debug("Read message: {}", line);
            return IncomingMessage::message(std::move(message));
        } catch (const json::parse_error& e) {
            spdlog::warn("JSON parse error: {}", e.what());
            return IncomingMessage::parse_error(e.what());
        }
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return IncomingMessage::closed();
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    out_ << serialized << '\n' << std::flush;
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace cycle_mcp
