#ifndef AGENTCTL_ERRORS_HPP
#define AGENTCTL_ERRORS_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace agentctl
{

// Base exception
class AgentError : public std::runtime_error
{
  public:
    explicit AgentError(const std::string& message) : std::runtime_error(message) {}
};

// Read/write failure on the underlying stream. Fatal to the engine session.
class TransportError : public AgentError
{
  public:
    explicit TransportError(const std::string& message) : AgentError(message) {}
};

// JSON decode error
class JSONDecodeError : public AgentError
{
  public:
    explicit JSONDecodeError(const std::string& message) : AgentError(message) {}
};

enum class ParseErrorKind
{
    InvalidType,
    MissingType,
    UnknownType,
    MissingRequiredField
};

// Message parse error
class MessageParseError : public AgentError
{
  public:
    MessageParseError(ParseErrorKind kind, const std::string& message)
        : AgentError(message), kind_(kind), data_(nullptr)
    {
    }

    MessageParseError(ParseErrorKind kind, const std::string& message,
                      const std::string& message_type, const nlohmann::json& data)
        : AgentError(message), kind_(kind), message_type_(message_type),
          data_(std::make_shared<nlohmann::json>(data))
    {
    }

    ParseErrorKind kind() const
    {
        return kind_;
    }

    // Envelope type the failure belongs to ("user", "result", ...); empty when unknown
    const std::string& message_type() const
    {
        return message_type_;
    }

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    ParseErrorKind kind_;
    std::string message_type_;
    std::shared_ptr<nlohmann::json> data_;
};

// Malformed control envelope (missing request_id, response body, ...)
class ProtocolError : public AgentError
{
  public:
    explicit ProtocolError(const std::string& message) : AgentError(message) {}
};

// hook_callback referenced an id that was never registered
class UnknownCallbackError : public AgentError
{
  public:
    explicit UnknownCallbackError(const std::string& callback_id)
        : AgentError("No hook callback found for ID: " + callback_id), callback_id_(callback_id)
    {
    }

    const std::string& callback_id() const
    {
        return callback_id_;
    }

  private:
    std::string callback_id_;
};

// Peer answered one of our control requests with subtype "error"
class ControlRequestError : public AgentError
{
  public:
    explicit ControlRequestError(const std::string& message) : AgentError(message) {}
};

class ControlTimeoutError : public AgentError
{
  public:
    explicit ControlTimeoutError(const std::string& message) : AgentError(message) {}
};

class RequestCancelledError : public AgentError
{
  public:
    explicit RequestCancelledError(const std::string& message) : AgentError(message) {}
};

} // namespace agentctl

#endif // AGENTCTL_ERRORS_HPP
