#include <agentctl/errors.hpp>
#include <agentctl/transport.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace agentctl;

namespace
{

// Reads until the transport reports end of stream
std::vector<json> read_all(Transport& transport)
{
    std::vector<json> values;
    while (transport.has_messages())
    {
        for (auto& value : transport.read_messages())
            values.push_back(std::move(value));
    }
    return values;
}

} // namespace

TEST(StreamTransportTest, ReadsLinesUntilEof)
{
    std::istringstream in("{\"type\":\"system\",\"subtype\":\"init\"}\n"
                          "\n"
                          "{\"type\":\"result\",\n\"subtype\":\"success\"}\n");
    std::ostringstream out;

    auto transport = create_stream_transport(in, out);
    transport->connect();

    auto values = read_all(*transport);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0]["subtype"], "init");
    EXPECT_EQ(values[1]["subtype"], "success");

    EXPECT_FALSE(transport->has_messages());
    EXPECT_TRUE(transport->read_messages().empty());
}

TEST(StreamTransportTest, WritesVerbatim)
{
    std::istringstream in;
    std::ostringstream out;

    auto transport = create_stream_transport(in, out);
    transport->connect();
    EXPECT_TRUE(transport->is_ready());

    transport->write("{\"a\":1}\n");
    transport->write("{\"b\":2}\n");
    EXPECT_EQ(out.str(), "{\"a\":1}\n{\"b\":2}\n");
}

TEST(StreamTransportTest, WriteBeforeConnectFails)
{
    std::istringstream in;
    std::ostringstream out;

    auto transport = create_stream_transport(in, out);
    EXPECT_THROW(transport->write("{}\n"), TransportError);
    EXPECT_THROW(transport->read_messages(), TransportError);
}

TEST(StreamTransportTest, WriteAfterEndInputFails)
{
    std::istringstream in;
    std::ostringstream out;

    auto transport = create_stream_transport(in, out);
    transport->connect();
    transport->end_input();

    EXPECT_FALSE(transport->is_ready());
    EXPECT_THROW(transport->write("{}\n"), TransportError);
}

TEST(StreamTransportTest, TruncatedValueAtEofIsTransportError)
{
    std::istringstream in("{\"type\":\"assistant\",\n");
    std::ostringstream out;

    auto transport = create_stream_transport(in, out);
    transport->connect();

    EXPECT_TRUE(transport->read_messages().empty());
    EXPECT_THROW(transport->read_messages(), TransportError);
}

TEST(StreamTransportTest, OversizedValueIsTransportError)
{
    std::istringstream in("{\"data\":\"" + std::string(128, 'x') + "\"}\n");
    std::ostringstream out;

    auto transport = create_stream_transport(in, out, 64);
    transport->connect();

    EXPECT_THROW(transport->read_messages(), TransportError);
}

TEST(StreamTransportTest, CloseStopsTransport)
{
    std::istringstream in("{\"n\":1}\n");
    std::ostringstream out;

    auto transport = create_stream_transport(in, out);
    transport->connect();
    EXPECT_TRUE(transport->is_running());

    transport->close();
    EXPECT_FALSE(transport->is_running());
    EXPECT_FALSE(transport->has_messages());
    EXPECT_TRUE(transport->read_messages().empty());
    EXPECT_THROW(transport->write("{}\n"), TransportError);
}
