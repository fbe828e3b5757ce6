#include "message_parser.hpp"

#include <agentctl/errors.hpp>
#include <cstdint>

namespace agentctl
{
namespace protocol
{

namespace
{

MessageParseError missing_field(const std::string& message_type, const std::string& field,
                                const json& data)
{
    return MessageParseError(ParseErrorKind::MissingRequiredField,
                             "Missing required field in " + message_type + " message: " + field,
                             message_type, data);
}

const json& require_string(const json& j, const char* field, const std::string& message_type,
                           const json& envelope)
{
    auto it = j.find(field);
    if (it == j.end() || !it->is_string())
        throw missing_field(message_type, field, envelope);
    return *it;
}

// Fractional values are truncated toward zero
std::int64_t require_int(const json& j, const char* field, const std::string& message_type)
{
    auto it = j.find(field);
    if (it == j.end() || !it->is_number())
        throw missing_field(message_type, field, j);
    if (it->is_number_float())
        return static_cast<std::int64_t>(it->get<double>());
    if (it->is_number_unsigned())
        return static_cast<std::int64_t>(it->get<std::uint64_t>());
    return it->get<std::int64_t>();
}

const json& require_nonempty_string(const json& j, const char* field,
                                    const std::string& message_type)
{
    const json& value = require_string(j, field, message_type, j);
    if (value.get_ref<const std::string&>().empty())
        throw missing_field(message_type, field, j);
    return value;
}

std::optional<std::string> optional_string(const json& j, const char* field)
{
    auto it = j.find(field);
    if (it != j.end() && it->is_string())
        return it->get<std::string>();
    return std::nullopt;
}

// The peer nests role/content/model under "message"
const json& require_inner_message(const json& j, const std::string& message_type)
{
    auto it = j.find("message");
    if (it == j.end() || !it->is_object())
        throw missing_field(message_type, "message", j);
    return *it;
}

} // namespace

Message MessageParser::parse(const json& j)
{
    if (!j.is_object())
        throw MessageParseError(ParseErrorKind::InvalidType,
                                std::string("Invalid message data: expected mapping, got ") +
                                    j.type_name());

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string())
        throw MessageParseError(ParseErrorKind::MissingType, "Message missing 'type' field", "",
                                j);

    const std::string type = type_it->get<std::string>();

    if (type == "user")
        return parse_user_message(j);
    if (type == "assistant")
        return parse_assistant_message(j);
    if (type == "system")
        return parse_system_message(j);
    if (type == "result")
        return parse_result_message(j);

    throw MessageParseError(ParseErrorKind::UnknownType, "Unknown message type: " + type, type, j);
}

Message MessageParser::parse_message(const std::string& json_str)
{
    json j;
    try
    {
        j = json::parse(json_str);
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }
    return parse(j);
}

ContentBlock MessageParser::parse_content_block(const json& j, const std::string& message_type,
                                                const json& envelope)
{
    if (!j.is_object())
        throw missing_field(message_type, "content[].type", envelope);

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string())
        throw missing_field(message_type, "content[].type", envelope);

    const std::string type = type_it->get<std::string>();

    if (type == "text")
    {
        TextBlock block;
        block.text = require_string(j, "text", message_type, envelope).get<std::string>();
        return block;
    }
    if (type == "thinking")
    {
        ThinkingBlock block;
        block.thinking = require_string(j, "thinking", message_type, envelope).get<std::string>();
        block.signature =
            require_string(j, "signature", message_type, envelope).get<std::string>();
        return block;
    }
    if (type == "tool_use")
    {
        ToolUseBlock block;
        block.id = require_string(j, "id", message_type, envelope).get<std::string>();
        block.name = require_string(j, "name", message_type, envelope).get<std::string>();
        if (!j.contains("input"))
            throw missing_field(message_type, "input", envelope);
        block.input = j["input"];
        return block;
    }
    if (type == "tool_result")
    {
        ToolResultBlock block;
        block.tool_use_id =
            require_string(j, "tool_use_id", message_type, envelope).get<std::string>();
        block.content = j.contains("content") ? j["content"] : json(nullptr);
        if (j.contains("is_error") && j["is_error"].is_boolean())
            block.is_error = j["is_error"].get<bool>();
        return block;
    }

    throw MessageParseError(ParseErrorKind::MissingRequiredField,
                            "Unknown content block type in " + message_type + " message: " + type,
                            message_type, envelope);
}

std::vector<ContentBlock> MessageParser::parse_content_blocks(const json& blocks,
                                                              const std::string& message_type,
                                                              const json& envelope)
{
    std::vector<ContentBlock> content;
    content.reserve(blocks.size());
    for (const auto& block : blocks)
        content.push_back(parse_content_block(block, message_type, envelope));
    return content;
}

UserMessage MessageParser::parse_user_message(const json& j)
{
    const std::string type = "user";
    const json& message = require_inner_message(j, type);

    auto content_it = message.find("content");
    if (content_it == message.end())
        throw missing_field(type, "content", j);

    UserMessage msg;
    msg.raw_json = j;

    if (content_it->is_string())
        msg.content = content_it->get<std::string>();
    else if (content_it->is_array())
        msg.content = parse_content_blocks(*content_it, type, j);
    else
        throw missing_field(type, "content", j);

    msg.uuid = optional_string(j, "uuid");
    msg.parent_tool_use_id = optional_string(j, "parent_tool_use_id");
    if (j.contains("tool_use_result") && !j["tool_use_result"].is_null())
        msg.tool_use_result = j["tool_use_result"];

    return msg;
}

AssistantMessage MessageParser::parse_assistant_message(const json& j)
{
    const std::string type = "assistant";
    const json& message = require_inner_message(j, type);

    auto content_it = message.find("content");
    if (content_it == message.end() || !content_it->is_array())
        throw missing_field(type, "content", j);

    auto model_it = message.find("model");
    if (model_it == message.end() || !model_it->is_string() ||
        model_it->get_ref<const std::string&>().empty())
        throw missing_field(type, "model", j);

    AssistantMessage msg;
    msg.raw_json = j;
    msg.content = parse_content_blocks(*content_it, type, j);
    msg.model = model_it->get<std::string>();
    msg.parent_tool_use_id = optional_string(j, "parent_tool_use_id");

    // error sits on the outer envelope, not the inner message
    if (auto error = optional_string(j, "error"))
        msg.error = assistant_error_from_string(*error);

    return msg;
}

SystemMessage MessageParser::parse_system_message(const json& j)
{
    SystemMessage msg;
    msg.subtype = require_string(j, "subtype", "system", j).get<std::string>();
    msg.data = j;
    msg.raw_json = j;
    return msg;
}

ResultMessage MessageParser::parse_result_message(const json& j)
{
    const std::string type = "result";

    ResultMessage msg;
    msg.raw_json = j;

    msg.subtype = require_nonempty_string(j, "subtype", type).get<std::string>();
    msg.duration_ms = require_int(j, "duration_ms", type);
    msg.duration_api_ms = require_int(j, "duration_api_ms", type);

    auto is_error_it = j.find("is_error");
    if (is_error_it == j.end() || !is_error_it->is_boolean())
        throw missing_field(type, "is_error", j);
    msg.is_error = is_error_it->get<bool>();

    msg.num_turns = require_int(j, "num_turns", type);
    msg.session_id = require_nonempty_string(j, "session_id", type).get<std::string>();

    if (j.contains("total_cost_usd") && j["total_cost_usd"].is_number())
        msg.total_cost_usd = j["total_cost_usd"].get<double>();
    if (j.contains("usage") && j["usage"].is_object())
        msg.usage = j["usage"];
    msg.result = optional_string(j, "result");
    if (j.contains("structured_output") && !j["structured_output"].is_null())
        msg.structured_output = j["structured_output"];

    return msg;
}

} // namespace protocol
} // namespace agentctl
