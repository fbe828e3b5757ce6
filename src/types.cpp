#include <agentctl/types.hpp>

namespace agentctl
{

json AgentDefinition::to_json() const
{
    json agent = {{"description", description}, {"prompt", prompt}};
    if (tools.has_value())
        agent["tools"] = *tools;
    if (model.has_value())
        agent["model"] = *model;
    return agent;
}

json PermissionUpdate::to_json() const
{
    json result = {{"type", type}};

    if (destination.has_value())
        result["destination"] = *destination;

    if (type == "addRules" || type == "replaceRules" || type == "removeRules")
    {
        if (rules.has_value())
        {
            json rules_array = json::array();
            for (const auto& rule : *rules)
            {
                json rule_obj = {{"toolName", rule.tool_name}};
                if (rule.rule_content.has_value())
                    rule_obj["ruleContent"] = *rule.rule_content;
                else
                    rule_obj["ruleContent"] = nullptr;
                rules_array.push_back(rule_obj);
            }
            result["rules"] = rules_array;
        }
        if (behavior.has_value())
            result["behavior"] = *behavior;
    }
    else if (type == "setMode")
    {
        if (mode.has_value())
            result["mode"] = *mode;
    }
    else if (type == "addDirectories" || type == "removeDirectories")
    {
        if (directories.has_value())
            result["directories"] = *directories;
    }

    return result;
}

PermissionUpdate PermissionUpdate::from_json(const json& j)
{
    PermissionUpdate update;
    if (!j.is_object())
        return update;

    if (j.contains("type") && j["type"].is_string())
        update.type = j["type"].get<std::string>();
    if (j.contains("behavior") && j["behavior"].is_string())
        update.behavior = j["behavior"].get<std::string>();
    if (j.contains("mode") && j["mode"].is_string())
        update.mode = j["mode"].get<std::string>();
    if (j.contains("destination") && j["destination"].is_string())
        update.destination = j["destination"].get<std::string>();

    if (j.contains("directories") && j["directories"].is_array())
    {
        std::vector<std::string> directories;
        for (const auto& dir : j["directories"])
            if (dir.is_string())
                directories.push_back(dir.get<std::string>());
        update.directories = directories;
    }

    if (j.contains("rules") && j["rules"].is_array())
    {
        std::vector<PermissionRuleValue> rules;
        for (const auto& rule_json : j["rules"])
        {
            if (!rule_json.is_object())
                continue;
            PermissionRuleValue rule;
            if (rule_json.contains("toolName") && rule_json["toolName"].is_string())
                rule.tool_name = rule_json["toolName"].get<std::string>();
            if (rule_json.contains("ruleContent") && rule_json["ruleContent"].is_string())
                rule.rule_content = rule_json["ruleContent"].get<std::string>();
            rules.push_back(rule);
        }
        update.rules = rules;
    }

    return update;
}

AssistantMessageError assistant_error_from_string(const std::string& value)
{
    if (value == "authentication_failed")
        return AssistantMessageError::AuthenticationFailed;
    if (value == "billing_error")
        return AssistantMessageError::BillingError;
    if (value == "rate_limit")
        return AssistantMessageError::RateLimit;
    if (value == "invalid_request")
        return AssistantMessageError::InvalidRequest;
    if (value == "server_error")
        return AssistantMessageError::ServerError;
    return AssistantMessageError::Unknown;
}

const char* to_string(AssistantMessageError error)
{
    switch (error)
    {
    case AssistantMessageError::AuthenticationFailed:
        return "authentication_failed";
    case AssistantMessageError::BillingError:
        return "billing_error";
    case AssistantMessageError::RateLimit:
        return "rate_limit";
    case AssistantMessageError::InvalidRequest:
        return "invalid_request";
    case AssistantMessageError::ServerError:
        return "server_error";
    case AssistantMessageError::Unknown:
        break;
    }
    return "unknown";
}

std::string get_text_content(const std::vector<ContentBlock>& content)
{
    std::string result;

    for (const auto& block : content)
    {
        if (auto* text_block = std::get_if<TextBlock>(&block))
            result += text_block->text;
    }

    return result;
}

const char* message_type_name(const Message& msg)
{
    switch (msg.index())
    {
    case 0:
        return "user";
    case 1:
        return "assistant";
    case 2:
        return "system";
    default:
        return "result";
    }
}

} // namespace agentctl
