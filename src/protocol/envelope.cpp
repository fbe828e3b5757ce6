#include <agentctl/errors.hpp>
#include <agentctl/protocol/envelope.hpp>

namespace agentctl
{
namespace protocol
{

json make_success_response(const std::string& request_id, const json& payload)
{
    return {{"type", "control_response"},
            {"response",
             {{"subtype", "success"}, {"request_id", request_id}, {"response", payload}}}};
}

json make_error_response(const std::string& request_id, const std::string& error)
{
    return {{"type", "control_response"},
            {"response", {{"subtype", "error"}, {"request_id", request_id}, {"error", error}}}};
}

json make_control_request(const std::string& request_id, const std::string& subtype,
                          const json& request_data)
{
    json request = request_data.is_object() ? request_data : json::object();
    request["subtype"] = subtype;

    return {{"type", "control_request"}, {"request_id", request_id}, {"request", request}};
}

json permission_result_to_json(const PermissionResult& result)
{
    json payload = json::object();

    if (const auto* allow = std::get_if<PermissionResultAllow>(&result))
    {
        payload["behavior"] = PermissionBehavior::Allow;

        if (allow->updated_input.has_value())
            payload["updatedInput"] = *allow->updated_input;

        if (allow->updated_permissions.has_value())
        {
            json permissions = json::array();
            for (const auto& update : *allow->updated_permissions)
                permissions.push_back(update.to_json());
            payload["updatedPermissions"] = permissions;
        }
    }
    else
    {
        const auto& deny = std::get<PermissionResultDeny>(result);
        payload["behavior"] = PermissionBehavior::Deny;
        payload["message"] = deny.message;
        if (deny.interrupt)
            payload["interrupt"] = true;
    }

    return payload;
}

json translate_hook_output(const json& hook_output)
{
    if (!hook_output.is_object())
        return hook_output;

    json converted = hook_output;
    for (const auto& rewrite : kReservedKeyRewrites)
    {
        const std::string suffixed = rewrite.first;
        const std::string wire = rewrite.second;

        auto it = converted.find(suffixed);
        if (it == converted.end())
            continue;
        if (!converted.contains(wire))
            converted[wire] = *it;
        converted.erase(suffixed);
    }

    return converted;
}

ControlRequest parse_control_request(const json& envelope)
{
    auto id_it = envelope.find("request_id");
    if (id_it == envelope.end() || !id_it->is_string() ||
        id_it->get_ref<const std::string&>().empty())
        throw ProtocolError("control_request missing request_id");

    auto request_it = envelope.find("request");
    if (request_it == envelope.end() || !request_it->is_object())
        throw ProtocolError("control_request " + id_it->get<std::string>() +
                            " missing request body");

    ControlRequest request;
    request.request_id = id_it->get<std::string>();
    request.request = *request_it;
    return request;
}

ControlResponse parse_control_response(const json& envelope)
{
    auto body_it = envelope.find("response");
    if (body_it == envelope.end() || !body_it->is_object())
        throw ProtocolError("control_response missing response body");

    const json& body = *body_it;
    if (!body.contains("request_id") || !body["request_id"].is_string())
        throw ProtocolError("control_response missing request_id");
    if (!body.contains("subtype") || !body["subtype"].is_string())
        throw ProtocolError("control_response missing subtype");

    ControlResponse response;
    response.response.request_id = body["request_id"].get<std::string>();
    response.response.subtype = body["subtype"].get<std::string>();

    if (body.contains("response") && !body["response"].is_null())
        response.response.response = body["response"];
    else
        response.response.response = json::object();

    if (body.contains("error") && body["error"].is_string())
        response.response.error = body["error"].get<std::string>();

    return response;
}

std::string to_line(const json& envelope)
{
    return envelope.dump() + "\n";
}

} // namespace protocol
} // namespace agentctl
