#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace cycle_mcp {

/**
 * @brief Newline-delimited JSON over a pair of streams
 *
 * One message per line. Blank lines are ignored. Output is flushed after
 * every message so a client reading the pipe never waits on a buffer.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    IncomingMessage read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace cycle_mcp
