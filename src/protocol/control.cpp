#include <agentctl/errors.hpp>
#include <agentctl/protocol/control.hpp>
#include <agentctl/protocol/envelope.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentctl
{
namespace protocol
{

namespace
{

// Unhooks a cancellation callback when the waiting scope ends
class CancelRegistration
{
  public:
    CancelRegistration(const CancellationToken& token, CancellationToken::Callback callback)
        : token_(token), handle_(token_.on_cancel(std::move(callback)))
    {
    }

    ~CancelRegistration()
    {
        token_.remove(handle_);
    }

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

  private:
    CancellationToken token_;
    std::size_t handle_;
};

} // namespace

ControlProtocol::ControlProtocol() : pending_(std::make_shared<PendingTable>()) {}

ControlProtocol::~ControlProtocol()
{
    fail_all_pending(std::make_exception_ptr(AgentError("Control protocol shutting down")));
}

std::string ControlProtocol::generate_request_id()
{
    int counter = ++request_counter_;

    // 4 random bytes, hex encoded
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << "req_" << counter << "_";
    for (int i = 0; i < 4; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);

    return oss.str();
}

std::future<json> ControlProtocol::register_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(pending_->mutex);
    if (pending_->closed_error)
        std::rethrow_exception(pending_->closed_error);

    std::promise<json> promise;
    auto future = promise.get_future();
    pending_->requests.emplace(request_id, std::move(promise));

    return future;
}

json ControlProtocol::send_request(const WriteFunction& write_func, const std::string& subtype,
                                   const json& request_data, std::chrono::milliseconds timeout,
                                   const CancellationToken& cancel)
{
    if (cancel.is_cancelled())
        throw RequestCancelledError("Control request cancelled: " + subtype);

    std::string request_id = generate_request_id();

    // Register before writing so a fast response cannot miss its waiter
    auto future = register_request(request_id);

    try
    {
        write_func(to_line(make_control_request(request_id, subtype, request_data)));
    }
    catch (const std::exception&)
    {
        std::lock_guard<std::mutex> lock(pending_->mutex);
        pending_->requests.erase(request_id);
        throw;
    }

    // The callback can outlive this call (and this object) when cancel() races completion
    std::weak_ptr<PendingTable> table = pending_;
    auto cancelled = std::make_exception_ptr(
        RequestCancelledError("Control request cancelled: " + request_id));
    CancelRegistration registration(cancel,
                                    [table, request_id, cancelled]
                                    {
                                        if (auto pending = table.lock())
                                            pending->settle(request_id, cancelled);
                                    });

    if (timeout.count() > 0 && future.wait_for(timeout) == std::future_status::timeout)
    {
        // A response that raced the timeout wins; settle() is a no-op then
        pending_->settle(request_id,
                         std::make_exception_ptr(ControlTimeoutError("Control request timed out: " +
                                                                     subtype)));
    }

    return future.get();
}

bool ControlProtocol::handle_response(const ControlResponse& response)
{
    const auto& resp = response.response;

    if (resp.subtype == "success")
        return pending_->settle(resp.request_id, resp.response);

    if (resp.subtype == "error")
        return pending_->settle(resp.request_id,
                                std::make_exception_ptr(ControlRequestError(resp.error)));

    return pending_->settle(resp.request_id, std::make_exception_ptr(ControlRequestError(
                                                 "Unknown response subtype: " + resp.subtype)));
}

bool ControlProtocol::cancel_request(const std::string& request_id)
{
    return pending_->settle(request_id, std::make_exception_ptr(RequestCancelledError(
                                            "Control request cancelled: " + request_id)));
}

void ControlProtocol::fail_all_pending(std::exception_ptr error)
{
    std::lock_guard<std::mutex> lock(pending_->mutex);
    if (!pending_->closed_error)
        pending_->closed_error = error;
    for (auto& [id, promise] : pending_->requests)
        promise.set_exception(error);
    pending_->requests.clear();
}

std::size_t ControlProtocol::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_->mutex);
    return pending_->requests.size();
}

bool ControlProtocol::PendingTable::settle(const std::string& request_id, Outcome outcome)
{
    std::lock_guard<std::mutex> lock(mutex);

    auto it = requests.find(request_id);
    if (it == requests.end())
        return false;

    if (auto* payload = std::get_if<json>(&outcome))
        it->second.set_value(*payload);
    else
        it->second.set_exception(std::get<std::exception_ptr>(outcome));

    requests.erase(it);
    return true;
}

} // namespace protocol
} // namespace agentctl
