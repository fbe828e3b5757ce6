#ifndef AGENTCTL_PROTOCOL_CONTROL_HPP
#define AGENTCTL_PROTOCOL_CONTROL_HPP

#include <agentctl/cancellation.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace agentctl
{

// JSON type alias (also defined in types.hpp)
using json = nlohmann::json;

namespace protocol
{

// Control request - either direction
struct ControlRequest
{
    std::string request_id;
    json request; // {"subtype": ..., subtype-specific fields}

    std::string subtype() const
    {
        if (request.is_object() && request.contains("subtype") && request["subtype"].is_string())
            return request["subtype"].get<std::string>();
        return "";
    }
};

// Control response - either direction
struct ControlResponse
{
    struct Response
    {
        std::string subtype; // "success" or "error"
        std::string request_id;
        json response;     // Payload on success
        std::string error; // Message on error
    } response;
};

// Correlates control requests we issue with the responses the peer sends back.
class ControlProtocol
{
  public:
    using WriteFunction = std::function<void(const std::string&)>;

    ControlProtocol();
    ~ControlProtocol();

    // No copy
    ControlProtocol(const ControlProtocol&) = delete;
    ControlProtocol& operator=(const ControlProtocol&) = delete;

    // Register, write, wait. Returns the peer's response payload.
    // Throws ControlRequestError (peer error), ControlTimeoutError, RequestCancelledError,
    // or whatever write_func / fail_all_pending raised. timeout <= 0 waits forever.
    json send_request(const WriteFunction& write_func, const std::string& subtype,
                      const json& request_data, std::chrono::milliseconds timeout,
                      const CancellationToken& cancel = CancellationToken());

    // Deliver a peer response. False when no request is waiting on that id (abandoned).
    bool handle_response(const ControlResponse& response);

    // Drop a pending request and wake its waiter with RequestCancelledError.
    bool cancel_request(const std::string& request_id);

    // Wake every waiter with `error` (a TransportError on session failure). The protocol is
    // closed afterwards: later send_request() calls throw `error` without writing.
    void fail_all_pending(std::exception_ptr error);

    // Unique for the lifetime of this object: req_{counter}_{random hex}
    std::string generate_request_id();

    std::size_t pending_count() const;

  private:
    using Outcome = std::variant<json, std::exception_ptr>;

    // Shared with cancellation callbacks, which can still be running after send_request()
    // has returned.
    struct PendingTable
    {
        std::mutex mutex;
        std::map<std::string, std::promise<json>> requests;
        std::exception_ptr closed_error;

        // Single resolution primitive: fulfils and removes the entry for `request_id`.
        bool settle(const std::string& request_id, Outcome outcome);
    };

    std::atomic<int> request_counter_{0};
    std::shared_ptr<PendingTable> pending_;

    std::future<json> register_request(const std::string& request_id);
};

} // namespace protocol
} // namespace agentctl

#endif // AGENTCTL_PROTOCOL_CONTROL_HPP
