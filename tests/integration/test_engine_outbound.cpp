#include "../test_utils.hpp"

#include <agentctl/agentctl.hpp>
#include <condition_variable>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace agentctl;
using namespace agentctl::test;
using namespace std::chrono_literals;

namespace
{

// Read side that close() cannot unblock, like std::getline on a live pipe
struct StuckReadState
{
    std::mutex mutex;
    std::condition_variable cv;
    bool reading = false;
    bool released = false;
    bool destroyed = false;
};

class StuckReadTransport : public Transport
{
  public:
    explicit StuckReadTransport(std::shared_ptr<StuckReadState> state) : state_(std::move(state))
    {
    }

    ~StuckReadTransport() override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->destroyed = true;
        state_->cv.notify_all();
    }

    void connect() override {}
    void write(const std::string&) override {}

    std::vector<json> read_messages() override
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->reading = true;
        state_->cv.notify_all();
        state_->cv.wait(lock, [this] { return state_->released; });
        // Data that arrives after stop() must not be dispatched
        return {make_assistant_text("late")};
    }

    bool has_messages() const override
    {
        return true;
    }
    void close() override {}
    bool is_ready() const override
    {
        return true;
    }
    void end_input() override {}
    bool is_running() const override
    {
        return true;
    }

  private:
    std::shared_ptr<StuckReadState> state_;
};

} // namespace

class EngineSessionTest : public ::testing::Test
{
  protected:
    EngineOptions options;
    std::shared_ptr<MockPeer> peer = std::make_shared<MockPeer>();
    std::unique_ptr<ControlEngine> engine;

    void SetUp() override
    {
        options.control_request_timeout_ms = 5000;
        options.diagnostic_callback = [](const std::string&) {};
    }

    void TearDown() override
    {
        if (engine)
            engine->stop();
    }

    void start()
    {
        engine = std::make_unique<ControlEngine>(options, std::make_unique<MockTransport>(peer));
        engine->start();
    }

    // Answer the outbound request written at `index` with a success payload
    json answer(std::size_t index, const json& payload)
    {
        json request = peer->written_at(index);
        peer->send(make_peer_success(request["request_id"].get<std::string>(), payload));
        return request;
    }
};

TEST_F(EngineSessionTest, SendControlRequestResolves)
{
    start();

    auto result = std::async(std::launch::async, [&] {
        return engine->send_control_request("mcp_status", json::object(), 5s);
    });

    json request = answer(0, {{"mcpServers", json::array()}});
    EXPECT_EQ(request["request"]["subtype"], "mcp_status");
    EXPECT_EQ(result.get()["mcpServers"], json::array());
    EXPECT_EQ(engine->pending_request_count(), 0u);
}

TEST_F(EngineSessionTest, PeerErrorRaisesControlRequestError)
{
    start();

    auto result = std::async(std::launch::async, [&] { engine->set_model("m-unknown"); });

    json request = peer->written_at(0);
    EXPECT_EQ(request["request"]["subtype"], "set_model");
    EXPECT_EQ(request["request"]["model"], "m-unknown");
    peer->send(make_peer_error(request["request_id"].get<std::string>(), "Unknown model"));

    try
    {
        result.get();
        FAIL() << "Expected ControlRequestError";
    }
    catch (const ControlRequestError& e)
    {
        EXPECT_STREQ(e.what(), "Unknown model");
    }
}

TEST_F(EngineSessionTest, CancelledRequestIgnoresLateResponse)
{
    start();
    CancellationToken cancel;

    auto result = std::async(std::launch::async, [&] {
        return engine->send_control_request("interrupt", json::object(), 5s, cancel);
    });

    json request = peer->written_at(0);
    cancel.cancel();
    EXPECT_THROW(result.get(), RequestCancelledError);

    // The late answer is dropped without disturbing the session
    peer->send(make_peer_success(request["request_id"].get<std::string>(), json::object()));
    peer->send(make_assistant_text("still alive"));

    auto stream = engine->receive_messages();
    auto msg = stream.get_next_for(2s);
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(is_assistant_message(*msg));
    EXPECT_EQ(peer->written().size(), 1u);
}

TEST_F(EngineSessionTest, TimeoutRaisesControlTimeoutError)
{
    start();

    EXPECT_THROW(engine->send_control_request("interrupt", json::object(), 30ms),
                 ControlTimeoutError);
    EXPECT_EQ(engine->pending_request_count(), 0u);
}

TEST_F(EngineSessionTest, SessionOperationsUseExpectedSubtypes)
{
    start();

    auto ops = std::async(std::launch::async,
                          [&]
                          {
                              engine->interrupt();
                              engine->set_permission_mode("acceptEdits");
                              engine->rewind_files("msg-uuid-1");
                          });

    json interrupt = answer(0, json::object());
    json mode = answer(1, json::object());
    json rewind = answer(2, json::object());
    ops.get();

    EXPECT_EQ(interrupt["request"]["subtype"], "interrupt");
    EXPECT_EQ(mode["request"]["subtype"], "set_permission_mode");
    EXPECT_EQ(mode["request"]["mode"], "acceptEdits");
    EXPECT_EQ(rewind["request"]["subtype"], "rewind_files");
    EXPECT_EQ(rewind["request"]["user_message_id"], "msg-uuid-1");
}

TEST_F(EngineSessionTest, GetMcpStatusReturnsPayload)
{
    start();

    auto status = std::async(std::launch::async, [&] { return engine->get_mcp_status(); });

    json servers = json::array({{{"name", "calc"}, {"status", "connected"}}});
    json request = answer(0, {{"mcpServers", servers}});
    EXPECT_EQ(request["request"]["subtype"], "mcp_status");
    EXPECT_EQ(status.get()["mcpServers"], servers);
}

TEST_F(EngineSessionTest, ReceiveResponseStopsAtResult)
{
    start();

    engine->send_user_message("What is 2 + 2?", "session-7");
    json sent = peer->written_at(0);
    EXPECT_EQ(sent["type"], "user");
    EXPECT_EQ(sent["message"]["role"], "user");
    EXPECT_EQ(sent["message"]["content"], "What is 2 + 2?");
    EXPECT_EQ(sent["session_id"], "session-7");
    EXPECT_TRUE(sent["parent_tool_use_id"].is_null());

    peer->send({{"type", "system"}, {"subtype", "init"}});
    peer->send(make_assistant_text("4"));
    peer->send(make_result("session-7"));
    peer->send(make_assistant_text("next turn"));

    auto messages = engine->receive_response();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_TRUE(is_system_message(messages[0]));
    EXPECT_EQ(get_text_content(std::get<AssistantMessage>(messages[1]).content), "4");
    EXPECT_EQ(std::get<ResultMessage>(messages[2]).session_id, "session-7");

    auto stream = engine->receive_messages();
    auto next = stream.get_next_for(2s);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(get_text_content(std::get<AssistantMessage>(*next).content), "next turn");
}

TEST_F(EngineSessionTest, ParseErrorDoesNotEndStream)
{
    start();

    peer->send({{"type", "result"}, {"subtype", "success"}});
    peer->send(make_assistant_text("after the bad one"));
    peer->finish();

    auto stream = engine->receive_messages();
    EXPECT_THROW(stream.get_next(), MessageParseError);

    auto msg = stream.get_next();
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(is_assistant_message(*msg));

    EXPECT_FALSE(stream.get_next().has_value());
    EXPECT_FALSE(stream.has_more());
}

TEST_F(EngineSessionTest, CleanEndFailsPendingRequests)
{
    start();

    auto result = std::async(std::launch::async, [&] {
        return engine->send_control_request("interrupt", json::object(), 5s);
    });
    peer->written_at(0);
    peer->finish();

    EXPECT_THROW(result.get(), TransportError);

    auto stream = engine->receive_messages();
    EXPECT_FALSE(stream.get_next().has_value());
}

TEST_F(EngineSessionTest, TransportFailureFailsEverything)
{
    start();

    auto stream = engine->receive_messages();
    peer->send(make_assistant_text("before failure"));
    auto msg = stream.get_next();
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(is_assistant_message(*msg));

    auto pending = std::async(std::launch::async, [&] {
        return engine->send_control_request("interrupt", json::object(), 5s);
    });
    peer->written_at(0);
    peer->fail_reads("pipe broken");

    EXPECT_THROW(pending.get(), TransportError);

    try
    {
        stream.get_next();
        FAIL() << "Expected TransportError";
    }
    catch (const TransportError& e)
    {
        EXPECT_NE(std::string(e.what()).find("pipe broken"), std::string::npos);
    }
    EXPECT_FALSE(stream.get_next().has_value());

    EXPECT_THROW(engine->send_control_request("interrupt", json::object(), 1s), TransportError);
    EXPECT_FALSE(engine->is_running());
}

TEST_F(EngineSessionTest, WriteFailureEndsSession)
{
    start();
    peer->fail_writes("stdin closed");

    EXPECT_THROW(engine->send_control_request("interrupt", json::object(), 1s), TransportError);
    EXPECT_EQ(engine->pending_request_count(), 0u);

    auto stream = engine->receive_messages();
    EXPECT_THROW(stream.get_next(), TransportError);
    EXPECT_THROW(engine->send_user_message("hello"), TransportError);
}

TEST_F(EngineSessionTest, InboundRequestAnsweredThroughReader)
{
    options.tool_permission_callback =
        [](const std::string& tool_name, const json&, const ToolPermissionContext&)
            -> PermissionResult
    {
        if (tool_name == "Bash")
            return PermissionResultDeny{"Security policy violation", true};
        return PermissionResultAllow{};
    };
    start();

    peer->send(make_can_use_tool("req_a", "Bash", {{"command", "rm -rf /"}}));
    peer->send(make_can_use_tool("req_b", "Read", {{"path", "/tmp/x"}}));

    ASSERT_TRUE(peer->wait_for_writes(2));
    engine->wait_for_callbacks();

    json denied = peer->response_for("req_a");
    EXPECT_EQ(denied["response"]["behavior"], "deny");
    EXPECT_EQ(denied["response"]["message"], "Security policy violation");
    EXPECT_EQ(denied["response"]["interrupt"], true);

    json allowed = peer->response_for("req_b");
    EXPECT_EQ(allowed["response"], json({{"behavior", "allow"}}));
}

TEST_F(EngineSessionTest, MessageStreamRangeFor)
{
    start();

    peer->send(make_assistant_text("one"));
    peer->send(make_assistant_text("two"));
    peer->finish();

    std::vector<std::string> texts;
    auto stream = engine->receive_messages();
    for (const auto& msg : stream)
        texts.push_back(get_text_content(std::get<AssistantMessage>(msg).content));

    EXPECT_EQ(texts, (std::vector<std::string>{"one", "two"}));
}

TEST_F(EngineSessionTest, StopReturnsWhileReadStaysBlocked)
{
    auto state = std::make_shared<StuckReadState>();
    options.reader_join_timeout_ms = 50;
    engine = std::make_unique<ControlEngine>(options, std::make_unique<StuckReadTransport>(state));
    engine->start();

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        ASSERT_TRUE(state->cv.wait_for(lock, 2s, [&] { return state->reading; }));
    }

    auto stream = engine->receive_messages();
    auto stopped = std::async(std::launch::async, [&] { engine->stop(); });
    ASSERT_EQ(stopped.wait_for(2s), std::future_status::ready);
    stopped.get();
    EXPECT_FALSE(stream.get_next().has_value());

    engine.reset();

    // The detached reader finishes once its read returns, then releases the transport
    std::unique_lock<std::mutex> lock(state->mutex);
    state->released = true;
    state->cv.notify_all();
    EXPECT_TRUE(state->cv.wait_for(lock, 2s, [&] { return state->destroyed; }));
}
