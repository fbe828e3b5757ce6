#include "../../src/internal/message_parser.hpp"

#include <agentctl/errors.hpp>
#include <gtest/gtest.h>

using namespace agentctl;
using namespace agentctl::protocol;

namespace
{

// Runs the parser and returns the thrown error; fails the test when nothing is thrown
MessageParseError parse_error_of(const json& j)
{
    try
    {
        MessageParser::parse(j);
    }
    catch (const MessageParseError& e)
    {
        return e;
    }
    ADD_FAILURE() << "Expected MessageParseError for " << j.dump();
    return MessageParseError(ParseErrorKind::InvalidType, "not thrown");
}

} // namespace

TEST(ParserTest, ParseAssistantText)
{
    std::string json = R"({
        "type":"assistant",
        "message":{
            "model":"model-a",
            "id":"msg_123",
            "role":"assistant",
            "content":[{"type":"text","text":"Hello"}]
        },
        "session_id":"session123"
    })";

    Message msg = MessageParser::parse_message(json);

    ASSERT_TRUE(is_assistant_message(msg));
    auto& assistant = std::get<AssistantMessage>(msg);
    EXPECT_EQ(assistant.model, "model-a");
    ASSERT_EQ(assistant.content.size(), 1u);

    auto* text = std::get_if<TextBlock>(&assistant.content[0]);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "Hello");
    EXPECT_FALSE(assistant.error.has_value());
    EXPECT_FALSE(assistant.parent_tool_use_id.has_value());
}

TEST(ParserTest, ParseMultipleContentBlocks)
{
    std::string json = R"({
        "type":"assistant",
        "message":{
            "model":"model-a",
            "content":[
                {"type":"text","text":"First"},
                {"type":"thinking","thinking":"Thought","signature":"sig"},
                {"type":"tool_use","id":"tool_1","name":"Read","input":{"path":"/a.txt"}},
                {"type":"tool_result","tool_use_id":"tool_1","content":"done","is_error":true}
            ]
        }
    })";

    Message msg = MessageParser::parse_message(json);

    auto& assistant = std::get<AssistantMessage>(msg);
    ASSERT_EQ(assistant.content.size(), 4u);

    auto* thinking = std::get_if<ThinkingBlock>(&assistant.content[1]);
    ASSERT_NE(thinking, nullptr);
    EXPECT_EQ(thinking->thinking, "Thought");
    EXPECT_EQ(thinking->signature, "sig");

    auto* tool_use = std::get_if<ToolUseBlock>(&assistant.content[2]);
    ASSERT_NE(tool_use, nullptr);
    EXPECT_EQ(tool_use->id, "tool_1");
    EXPECT_EQ(tool_use->name, "Read");
    EXPECT_EQ(tool_use->input["path"], "/a.txt");

    auto* tool_result = std::get_if<ToolResultBlock>(&assistant.content[3]);
    ASSERT_NE(tool_result, nullptr);
    EXPECT_EQ(tool_result->tool_use_id, "tool_1");
    EXPECT_EQ(tool_result->content, "done");
    EXPECT_TRUE(tool_result->is_error);

    EXPECT_EQ(get_text_content(assistant.content), "First");
}

TEST(ParserTest, AssistantErrorAndParentFromEnvelope)
{
    json j = {{"type", "assistant"},
              {"error", "rate_limit"},
              {"parent_tool_use_id", "toolu_parent"},
              {"message", {{"model", "model-a"}, {"content", json::array()}}}};

    auto assistant = std::get<AssistantMessage>(MessageParser::parse(j));
    ASSERT_TRUE(assistant.error.has_value());
    EXPECT_EQ(*assistant.error, AssistantMessageError::RateLimit);
    EXPECT_EQ(assistant.parent_tool_use_id, "toolu_parent");
    EXPECT_EQ(assistant.raw_json, j);
}

TEST(ParserTest, UnrecognisedAssistantErrorIsUnknown)
{
    json j = {{"type", "assistant"},
              {"error", "something_new"},
              {"message", {{"model", "model-a"}, {"content", json::array()}}}};

    auto assistant = std::get<AssistantMessage>(MessageParser::parse(j));
    EXPECT_EQ(assistant.error, AssistantMessageError::Unknown);
}

TEST(ParserTest, ParseUserStringContent)
{
    json j = {{"type", "user"},
              {"uuid", "u-1"},
              {"message", {{"role", "user"}, {"content", "Hello there"}}}};

    Message msg = MessageParser::parse(j);

    ASSERT_TRUE(is_user_message(msg));
    auto& user = std::get<UserMessage>(msg);
    ASSERT_TRUE(std::holds_alternative<std::string>(user.content));
    EXPECT_EQ(std::get<std::string>(user.content), "Hello there");
    EXPECT_EQ(user.uuid, "u-1");
    EXPECT_FALSE(user.parent_tool_use_id.has_value());
    EXPECT_FALSE(user.tool_use_result.has_value());
}

TEST(ParserTest, ParseUserBlocksWithToolUseResult)
{
    json tool_use_result = {{"stdout", "ok"}, {"exit_code", 0}};
    json j = {{"type", "user"},
              {"parent_tool_use_id", "toolu_9"},
              {"tool_use_result", tool_use_result},
              {"message",
               {{"role", "user"},
                {"content",
                 json::array({{{"type", "tool_result"}, {"tool_use_id", "toolu_9"}}})}}}};

    auto user = std::get<UserMessage>(MessageParser::parse(j));

    auto& blocks = std::get<std::vector<ContentBlock>>(user.content);
    ASSERT_EQ(blocks.size(), 1u);
    auto& result = std::get<ToolResultBlock>(blocks[0]);
    EXPECT_EQ(result.tool_use_id, "toolu_9");
    EXPECT_TRUE(result.content.is_null());
    EXPECT_FALSE(result.is_error);

    EXPECT_EQ(user.parent_tool_use_id, "toolu_9");
    ASSERT_TRUE(user.tool_use_result.has_value());
    EXPECT_EQ(*user.tool_use_result, tool_use_result);
}

TEST(ParserTest, ParseSystemMessageKeepsPayload)
{
    json j = {{"type", "system"},
              {"subtype", "init"},
              {"session_id", "s1"},
              {"tools", json::array({"Bash", "Read"})}};

    Message msg = MessageParser::parse(j);

    ASSERT_TRUE(is_system_message(msg));
    auto& system = std::get<SystemMessage>(msg);
    EXPECT_EQ(system.subtype, "init");
    EXPECT_EQ(system.data, j);
    EXPECT_EQ(system.data["tools"][1], "Read");
}

TEST(ParserTest, ParseResultMessage)
{
    std::string json = R"({
        "type":"result",
        "subtype":"success",
        "duration_ms":1234,
        "duration_api_ms":789,
        "is_error":false,
        "num_turns":3,
        "session_id":"s1",
        "total_cost_usd":0.01,
        "usage":{"input_tokens":100,"output_tokens":50},
        "result":"All done",
        "structured_output":{"answer":42}
    })";

    Message msg = MessageParser::parse_message(json);

    ASSERT_TRUE(is_result_message(msg));
    auto& result = std::get<ResultMessage>(msg);
    EXPECT_EQ(result.subtype, "success");
    EXPECT_EQ(result.duration_ms, 1234);
    EXPECT_EQ(result.duration_api_ms, 789);
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.num_turns, 3);
    EXPECT_EQ(result.session_id, "s1");
    ASSERT_TRUE(result.total_cost_usd.has_value());
    EXPECT_DOUBLE_EQ(*result.total_cost_usd, 0.01);
    ASSERT_TRUE(result.usage.has_value());
    EXPECT_EQ((*result.usage)["output_tokens"], 50);
    EXPECT_EQ(result.result, "All done");
    ASSERT_TRUE(result.structured_output.has_value());
    EXPECT_EQ((*result.structured_output)["answer"], 42);
}

TEST(ParserTest, ResultOptionalFieldsAbsent)
{
    json j = {{"type", "result"},     {"subtype", "error_max_turns"}, {"duration_ms", 1},
              {"duration_api_ms", 1}, {"is_error", true},             {"num_turns", 10},
              {"session_id", "s2"}};

    auto result = std::get<ResultMessage>(MessageParser::parse(j));
    EXPECT_TRUE(result.is_error);
    EXPECT_FALSE(result.total_cost_usd.has_value());
    EXPECT_FALSE(result.usage.has_value());
    EXPECT_FALSE(result.result.has_value());
    EXPECT_FALSE(result.structured_output.has_value());
}

TEST(ParserTest, ResultCountersKeepSixtyFourBits)
{
    json j = {{"type", "result"},       {"subtype", "success"}, {"duration_ms", 3000000000LL},
              {"duration_api_ms", 1.9}, {"is_error", false},    {"num_turns", 4294967297LL},
              {"session_id", "s3"}};

    auto result = std::get<ResultMessage>(MessageParser::parse(j));
    EXPECT_EQ(result.duration_ms, 3000000000LL);
    EXPECT_EQ(result.duration_api_ms, 1);
    EXPECT_EQ(result.num_turns, 4294967297LL);
}

TEST(ParserTest, ResultRejectsEmptySubtypeAndSessionId)
{
    json base = {{"type", "result"},     {"subtype", "success"}, {"duration_ms", 1},
                 {"duration_api_ms", 1}, {"is_error", false},    {"num_turns", 1},
                 {"session_id", "s4"}};

    for (const char* field : {"subtype", "session_id"})
    {
        json j = base;
        j[field] = "";
        auto error = parse_error_of(j);
        EXPECT_EQ(error.kind(), ParseErrorKind::MissingRequiredField) << field;
        EXPECT_NE(std::string(error.what()).find(field), std::string::npos) << error.what();
    }
}

TEST(ParserTest, NonObjectIsInvalidType)
{
    auto error = parse_error_of(json("just a string"));
    EXPECT_EQ(error.kind(), ParseErrorKind::InvalidType);
    EXPECT_NE(std::string(error.what()).find("string"), std::string::npos);

    error = parse_error_of(json::array({1, 2}));
    EXPECT_EQ(error.kind(), ParseErrorKind::InvalidType);
    EXPECT_NE(std::string(error.what()).find("array"), std::string::npos);
}

TEST(ParserTest, MissingTypeField)
{
    auto error = parse_error_of({{"message", {{"content", "hi"}}}});
    EXPECT_EQ(error.kind(), ParseErrorKind::MissingType);
    ASSERT_NE(error.data(), nullptr);
    EXPECT_TRUE(error.data()->contains("message"));
}

TEST(ParserTest, UnknownTypeNamesTheType)
{
    json j = {{"type", "bogus"}, {"payload", 1}};
    auto error = parse_error_of(j);
    EXPECT_EQ(error.kind(), ParseErrorKind::UnknownType);
    EXPECT_NE(std::string(error.what()).find("bogus"), std::string::npos);
    EXPECT_EQ(error.message_type(), "bogus");
    ASSERT_NE(error.data(), nullptr);
    EXPECT_EQ(*error.data(), j);
}

TEST(ParserTest, MissingRequiredFieldNamesMessageType)
{
    struct Case
    {
        json input;
        std::string type;
    };
    std::vector<Case> cases = {
        {{{"type", "user"}}, "user"},
        {{{"type", "user"}, {"message", {{"role", "user"}}}}, "user"},
        {{{"type", "assistant"}, {"message", {{"content", json::array()}}}}, "assistant"},
        {{{"type", "assistant"}, {"message", {{"model", "m"}}}}, "assistant"},
        {{{"type", "system"}}, "system"},
        {{{"type", "result"}, {"subtype", "success"}}, "result"},
    };

    for (const auto& c : cases)
    {
        auto error = parse_error_of(c.input);
        EXPECT_EQ(error.kind(), ParseErrorKind::MissingRequiredField) << c.input.dump();
        EXPECT_EQ(error.message_type(), c.type);
        EXPECT_NE(std::string(error.what()).find(c.type), std::string::npos) << error.what();
    }
}

TEST(ParserTest, ResultWithNonBooleanIsError)
{
    json j = {{"type", "result"},     {"subtype", "success"}, {"duration_ms", 1},
              {"duration_api_ms", 1}, {"is_error", "no"},     {"num_turns", 1},
              {"session_id", "s"}};

    auto error = parse_error_of(j);
    EXPECT_EQ(error.kind(), ParseErrorKind::MissingRequiredField);
    EXPECT_NE(std::string(error.what()).find("is_error"), std::string::npos);
}

TEST(ParserTest, MalformedBlockFailsWholeMessage)
{
    json j = {{"type", "assistant"},
              {"message",
               {{"model", "m"},
                {"content", json::array({{{"type", "tool_use"}, {"id", "t1"}}})}}}};

    auto error = parse_error_of(j);
    EXPECT_EQ(error.kind(), ParseErrorKind::MissingRequiredField);
    EXPECT_EQ(error.message_type(), "assistant");
    EXPECT_NE(std::string(error.what()).find("name"), std::string::npos);
}

TEST(ParserTest, UnknownBlockTypeIsRejected)
{
    json j = {{"type", "assistant"},
              {"message",
               {{"model", "m"}, {"content", json::array({{{"type", "image"}, {"data", "..."}}})}}}};

    auto error = parse_error_of(j);
    EXPECT_EQ(error.kind(), ParseErrorKind::MissingRequiredField);
    EXPECT_NE(std::string(error.what()).find("image"), std::string::npos);
}

TEST(ParserTest, EmptyModelIsMissing)
{
    json j = {{"type", "assistant"}, {"message", {{"model", ""}, {"content", json::array()}}}};
    EXPECT_THROW(MessageParser::parse(j), MessageParseError);
}

TEST(ParserTest, MalformedJsonText)
{
    EXPECT_THROW(MessageParser::parse_message("{\"type\": \"user\""), JSONDecodeError);
}

TEST(ParserTest, ParsingIsDeterministic)
{
    json j = {{"type", "system"}, {"subtype", "status"}, {"n", 1}};
    auto first = std::get<SystemMessage>(MessageParser::parse(j));
    auto second = std::get<SystemMessage>(MessageParser::parse(j));
    EXPECT_EQ(first.raw_json, second.raw_json);
    EXPECT_EQ(first.subtype, second.subtype);
}
