#include "mcp/StdioTransport.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace cycle_mcp;
using json = nlohmann::json;

TEST(StdioTransportTest, ReadsOneMessagePerLine) {
    std::istringstream in("{\"id\":1}\n{\"id\":2}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto first = transport.read_message();
    auto second = transport.read_message();
    auto third = transport.read_message();

    ASSERT_EQ(first.status, IncomingMessage::Status::MESSAGE);
    EXPECT_EQ(first.payload["id"], 1);
    ASSERT_EQ(second.status, IncomingMessage::Status::MESSAGE);
    EXPECT_EQ(second.payload["id"], 2);
    EXPECT_EQ(third.status, IncomingMessage::Status::CLOSED);
}

TEST(StdioTransportTest, SkipsBlankLinesAndCarriageReturns) {
    std::istringstream in("\n   \n{\"id\":3}\r\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto message = transport.read_message();

    ASSERT_EQ(message.status, IncomingMessage::Status::MESSAGE);
    EXPECT_EQ(message.payload["id"], 3);
}

TEST(StdioTransportTest, MalformedLineIsParseError) {
    std::istringstream in("{not json\n{\"id\":4}\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    auto bad = transport.read_message();
    auto good = transport.read_message();

    EXPECT_EQ(bad.status, IncomingMessage::Status::PARSE_ERROR);
    EXPECT_FALSE(bad.error.empty());
    ASSERT_EQ(good.status, IncomingMessage::Status::MESSAGE);
    EXPECT_EQ(good.payload["id"], 4);
}

TEST(StdioTransportTest, WritesNewlineTerminatedJson) {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.write_message({{"jsonrpc", "2.0"}, {"id", 5}});

    std::string written = out.str();
    ASSERT_FALSE(written.empty());
    EXPECT_EQ(written.back(), '\n');
    EXPECT_EQ(json::parse(written)["id"], 5);
}
