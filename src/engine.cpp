#include "internal/message_parser.hpp"

#include <agentctl/engine.hpp>
#include <agentctl/errors.hpp>
#include <agentctl/protocol/control.hpp>
#include <agentctl/protocol/envelope.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <future>
#include <iostream>
#include <mutex>
#include <queue>
#include <set>
#include <thread>
#include <variant>

namespace agentctl
{

namespace
{

// AGENTCTL_INITIALIZE_TIMEOUT_MS can only raise the configured initialize timeout
int get_initialize_timeout_ms(int configured_ms)
{
    int timeout_ms = configured_ms;
    if (const char* env = std::getenv("AGENTCTL_INITIALIZE_TIMEOUT_MS"))
    {
        char* end = nullptr;
        long parsed = std::strtol(env, &end, 10);
        if (end != env && *end == '\0' && parsed > timeout_ms && parsed <= 24L * 3600 * 1000)
            timeout_ms = static_cast<int>(parsed);
    }
    return timeout_ms;
}

std::string string_field(const json& j, const char* field)
{
    auto it = j.find(field);
    if (it != j.end() && it->is_string())
        return it->get<std::string>();
    return "";
}

json object_field(const json& j, const char* field)
{
    auto it = j.find(field);
    if (it != j.end() && !it->is_null())
        return *it;
    return json::object();
}

} // namespace

// Exposed for tests
int agentctl_test_get_initialize_timeout_ms(int configured_ms)
{
    return get_initialize_timeout_ms(configured_ms);
}

// ============================================================================
// MessageStream::Impl - thread-safe queue of messages and per-message failures
// ============================================================================

class MessageStream::Impl
{
  public:
    using Item = std::variant<Message, std::exception_ptr>;

    std::queue<Item> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;

    void push_message(Message&& msg)
    {
        push(Item(std::move(msg)));
    }

    void push_error(std::exception_ptr error)
    {
        push(Item(error));
    }

    // Terminal failure: delivered after everything already queued, then the stream ends
    void fail(std::exception_ptr error)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return;
        queue_.push(Item(error));
        stopped_ = true;
        cv_.notify_all();
    }

    std::optional<Message> pop_message()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        return take(lock);
    }

    std::optional<Message> pop_message_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || stopped_; }))
            return std::nullopt;
        return take(lock);
    }

    void stop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_.notify_all();
    }

    bool has_more() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return !queue_.empty() || !stopped_;
    }

  private:
    void push(Item&& item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(item));
        cv_.notify_one();
    }

    std::optional<Message> take(std::unique_lock<std::mutex>& lock)
    {
        if (queue_.empty())
            return std::nullopt;

        Item item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();

        if (auto* error = std::get_if<std::exception_ptr>(&item))
            std::rethrow_exception(*error);
        return std::move(std::get<Message>(item));
    }
};

// ============================================================================
// ControlEngine::Impl
// ============================================================================

class ControlEngine::Impl : public std::enable_shared_from_this<ControlEngine::Impl>
{
  public:
    EngineOptions options_;
    std::unique_ptr<Transport> transport_;
    protocol::ControlProtocol control_protocol_;
    CallbackRegistry registry_;
    json hooks_config_;

    std::shared_ptr<MessageStream::Impl> message_queue_;

    std::thread reader_thread_;
    std::promise<void> reader_done_;
    std::future<void> reader_finished_;
    std::atomic<bool> running_{false};
    bool started_ = false;

    // Single writer on the outbound stream
    std::mutex write_mutex_;

    // Workers answering peer control requests
    std::mutex workers_mutex_;
    std::vector<std::future<void>> workers_;

    // Recently seen peer request ids, oldest first in inbound_id_order_
    std::mutex inbound_ids_mutex_;
    std::set<std::string> inbound_request_ids_;
    std::deque<std::string> inbound_id_order_;

    // Set once the session has ended (transport failure, end of stream, or stop())
    std::atomic<bool> session_ended_{false};
    mutable std::mutex session_mutex_;
    std::exception_ptr session_error_;

    mutable std::mutex server_info_mutex_;
    std::optional<json> server_info_;

    Impl(EngineOptions options, std::unique_ptr<Transport> transport)
        : options_(std::move(options)), transport_(std::move(transport)),
          message_queue_(std::make_shared<MessageStream::Impl>())
    {
        if (!transport_)
            throw AgentError("ControlEngine requires a transport");

        if (options_.tool_permission_callback)
            registry_.set_permission_callback(*options_.tool_permission_callback);
        for (const auto& [name, handler] : options_.sdk_mcp_handlers)
            registry_.register_mcp_handler(name, handler);
        hooks_config_ = registry_.register_hook_matchers(options_.hooks);
    }

    ~Impl()
    {
        try
        {
            stop();
        }
        catch (const std::exception& e)
        {
            warn(std::string("Error while stopping engine: ") + e.what());
        }
    }

    void warn(const std::string& message) const
    {
        if (options_.diagnostic_callback)
        {
            try
            {
                (*options_.diagnostic_callback)(message);
                return;
            }
            catch (const std::exception& e)
            {
                std::cerr << "Warning: diagnostic callback failed: " << e.what() << "\n";
            }
        }
        std::cerr << "Warning: " << message << std::endl;
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    void start()
    {
        if (started_)
            return;

        transport_->connect();
        running_ = true;
        started_ = true;

        // The reader keeps the engine state alive in case stop() has to detach it
        reader_done_ = std::promise<void>();
        reader_finished_ = reader_done_.get_future();
        auto self = shared_from_this();
        reader_thread_ = std::thread(
            [self]
            {
                self->reader_loop();
                self->reader_done_.set_value();
            });
    }

    void stop()
    {
        if (!started_)
        {
            wait_for_callbacks();
            end_session(std::make_exception_ptr(TransportError("Engine stopped")), false);
            return;
        }
        started_ = false;
        running_ = false;

        // Let in-flight callbacks answer before the write side goes away
        wait_for_callbacks();

        try
        {
            transport_->end_input();
        }
        catch (const std::exception& e)
        {
            warn(std::string("end_input failed: ") + e.what());
        }
        transport_->close();
        join_reader();

        wait_for_callbacks();
        end_session(std::make_exception_ptr(TransportError("Engine stopped")), false);
    }

    // A reader still blocked in read_messages() after close() (a live peer behind a stream
    // that cannot be interrupted) is detached once reader_join_timeout_ms has passed. It
    // exits without dispatching when its read returns.
    void join_reader()
    {
        if (!reader_thread_.joinable())
            return;

        if (options_.reader_join_timeout_ms > 0 &&
            reader_finished_.wait_for(std::chrono::milliseconds(
                options_.reader_join_timeout_ms)) != std::future_status::ready)
        {
            warn("Reader thread still blocked in read_messages after close; detaching it");
            reader_thread_.detach();
            return;
        }
        reader_thread_.join();
    }

    void reader_loop()
    {
        try
        {
            while (running_)
            {
                auto values = transport_->read_messages();
                if (!running_)
                    break;

                if (values.empty())
                {
                    if (!transport_->has_messages())
                        break;
                    continue;
                }

                for (const auto& value : values)
                    dispatch(value);
            }
        }
        catch (const std::exception& e)
        {
            if (running_)
            {
                end_session(std::make_exception_ptr(TransportError(e.what())), true);
                return;
            }
        }

        end_session(std::make_exception_ptr(TransportError("Transport closed")), false);
    }

    // Fails every pending waiter with `error`. With `surface`, the consumer stream receives
    // `error` as its terminal item; otherwise the stream just ends.
    void end_session(std::exception_ptr error, bool surface)
    {
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (session_ended_)
                return;
            session_error_ = error;
            session_ended_ = true;
        }

        if (surface)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception& e)
            {
                warn(std::string("Transport failure: ") + e.what());
            }
            message_queue_->fail(error);
        }
        else
        {
            message_queue_->stop();
        }

        control_protocol_.fail_all_pending(error);
    }

    void throw_if_session_ended() const
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_ended_)
            std::rethrow_exception(session_error_);
    }

    // ------------------------------------------------------------------------
    // Outbound
    // ------------------------------------------------------------------------

    // Writes are still attempted after the inbound stream ends so that in-flight callbacks
    // can deliver their responses; the transport reports whether the peer is gone.
    void write_line(const std::string& line)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        try
        {
            transport_->write(line);
        }
        catch (const TransportError&)
        {
            end_session(std::current_exception(), true);
            throw;
        }
        catch (const std::exception& e)
        {
            auto error = std::make_exception_ptr(TransportError(e.what()));
            end_session(error, true);
            std::rethrow_exception(error);
        }
    }

    void send_response(const std::string& request_id, const json& envelope)
    {
        try
        {
            write_line(protocol::to_line(envelope));
        }
        catch (const std::exception& e)
        {
            warn("Could not write control_response for " + request_id + ": " + e.what());
        }
    }

    json send_control_request(const std::string& subtype, const json& request_data,
                              std::chrono::milliseconds timeout, const CancellationToken& cancel)
    {
        throw_if_session_ended();
        return control_protocol_.send_request([this](const std::string& line) { write_line(line); },
                                              subtype, request_data, timeout, cancel);
    }

    // ------------------------------------------------------------------------
    // Inbound
    // ------------------------------------------------------------------------

    void dispatch(const json& value)
    {
        std::string type;
        if (value.is_object())
            type = string_field(value, "type");

        if (type == "control_request")
            handle_control_request(value);
        else if (type == "control_response")
            handle_control_response(value);
        else if (type == "control_cancel_request")
            warn("Ignoring control_cancel_request for " + string_field(value, "request_id"));
        else
            deliver_content(value);
    }

    void deliver_content(const json& value)
    {
        try
        {
            message_queue_->push_message(protocol::MessageParser::parse(value));
        }
        catch (const MessageParseError&)
        {
            message_queue_->push_error(std::current_exception());
        }
    }

    void handle_control_response(const json& envelope)
    {
        protocol::ControlResponse response;
        try
        {
            response = protocol::parse_control_response(envelope);
        }
        catch (const ProtocolError& e)
        {
            warn(std::string("Dropping malformed control_response: ") + e.what());
            return;
        }

        if (!control_protocol_.handle_response(response))
            warn("Dropping control_response for unknown or abandoned request " +
                 response.response.request_id);
    }

    void handle_control_request(const json& envelope)
    {
        protocol::ControlRequest request;
        try
        {
            request = protocol::parse_control_request(envelope);
        }
        catch (const ProtocolError& e)
        {
            std::string request_id = string_field(envelope, "request_id");
            warn(std::string("Malformed control_request: ") + e.what());
            if (!request_id.empty())
                send_response(request_id, protocol::make_error_response(request_id, e.what()));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(inbound_ids_mutex_);
            if (!inbound_request_ids_.insert(request.request_id).second)
            {
                warn("Ignoring duplicate control_request " + request.request_id);
                return;
            }
            inbound_id_order_.push_back(request.request_id);
            if (inbound_id_order_.size() > options_.max_remembered_request_ids)
            {
                inbound_request_ids_.erase(inbound_id_order_.front());
                inbound_id_order_.pop_front();
            }
        }

        auto worker = std::async(std::launch::async,
                                 [this, request = std::move(request)] { answer(request); });

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.erase(std::remove_if(workers_.begin(), workers_.end(),
                                      [](const std::future<void>& f) {
                                          return f.wait_for(std::chrono::seconds(0)) ==
                                                 std::future_status::ready;
                                      }),
                       workers_.end());
        workers_.push_back(std::move(worker));
    }

    // Runs on a worker thread. Every outcome becomes exactly one response for request_id.
    void answer(const protocol::ControlRequest& request)
    {
        json envelope;
        try
        {
            envelope = protocol::make_success_response(request.request_id, handle(request));
        }
        catch (const std::exception& e)
        {
            envelope = protocol::make_error_response(request.request_id, e.what());
        }
        catch (...)
        {
            envelope = protocol::make_error_response(request.request_id,
                                                     "Callback raised a non-standard exception");
        }

        send_response(request.request_id, envelope);
    }

    json handle(const protocol::ControlRequest& request)
    {
        const std::string subtype = request.subtype();

        if (subtype == "can_use_tool")
            return handle_can_use_tool(request);
        if (subtype == "hook_callback")
            return handle_hook_callback(request);
        if (subtype == "mcp_message")
            return handle_mcp_message(request);

        throw ProtocolError("Unsupported control request subtype: " + subtype);
    }

    json handle_can_use_tool(const protocol::ControlRequest& request)
    {
        const json& body = request.request;
        const std::string tool_name = string_field(body, "tool_name");
        const json input = object_field(body, "input");

        ToolPermissionContext context;
        context.request_id = request.request_id;
        context.raw_request = body;
        if (body.contains("permission_suggestions") && body["permission_suggestions"].is_array())
        {
            for (const auto& suggestion : body["permission_suggestions"])
                context.suggestions.push_back(PermissionUpdate::from_json(suggestion));
        }

        PermissionResult result;
        if (const auto& callback = registry_.permission_callback())
            result = (*callback)(tool_name, input, context);
        else if (options_.default_permission_behavior == DefaultPermissionBehavior::Allow)
            result = PermissionResultAllow{};
        else
            result = PermissionResultDeny{"No permission callback configured for tool: " +
                                          tool_name};

        return protocol::permission_result_to_json(result);
    }

    json handle_hook_callback(const protocol::ControlRequest& request)
    {
        const json& body = request.request;
        const std::string callback_id = string_field(body, "callback_id");

        // Throws UnknownCallbackError
        const HookCallback& hook = registry_.lookup(callback_id);

        HookContext context;
        context.request_id = request.request_id;
        context.callback_id = callback_id;
        context.raw_request = body;

        json output = hook(object_field(body, "input"), string_field(body, "tool_use_id"), context);

        if (output.is_null())
            return json::object();
        if (!output.is_object())
            throw AgentError("Hook callback " + callback_id + " returned " + output.type_name() +
                             ", expected an object");

        return protocol::translate_hook_output(output);
    }

    json handle_mcp_message(const protocol::ControlRequest& request)
    {
        const json& body = request.request;
        const std::string server_name = string_field(body, "server_name");
        auto message_it = body.find("message");

        if (server_name.empty() || message_it == body.end() || !message_it->is_object())
            throw ProtocolError("Missing server_name or message for MCP request");

        const json& message = *message_it;
        json payload = json::object();

        const McpRequestHandler* handler = registry_.find_mcp_handler(server_name);
        if (!handler)
        {
            json error = {{"code", -32601}, {"message", "Server '" + server_name + "' not found"}};
            json rpc = {{"jsonrpc", "2.0"}, {"error", error}};
            rpc["id"] = message.contains("id") ? message["id"] : json(nullptr);
            payload["mcp_response"] = rpc;
            return payload;
        }

        payload["mcp_response"] = (*handler)(message);
        return payload;
    }

    void wait_for_callbacks()
    {
        for (;;)
        {
            std::vector<std::future<void>> batch;
            {
                std::lock_guard<std::mutex> lock(workers_mutex_);
                batch.swap(workers_);
            }
            if (batch.empty())
                return;
            for (auto& worker : batch)
                worker.wait();
        }
    }

    // ------------------------------------------------------------------------
    // Session operations
    // ------------------------------------------------------------------------

    std::chrono::milliseconds control_timeout() const
    {
        return std::chrono::milliseconds(options_.control_request_timeout_ms);
    }

    json initialize()
    {
        json request_data = json::object();
        request_data["hooks"] = hooks_config_.empty() ? json(nullptr) : hooks_config_;

        if (!options_.agents.empty())
        {
            json agents = json::object();
            for (const auto& [name, definition] : options_.agents)
                agents[name] = definition.to_json();
            request_data["agents"] = agents;
        }

        auto timeout =
            std::chrono::milliseconds(get_initialize_timeout_ms(options_.initialize_timeout_ms));
        json result = send_control_request("initialize", request_data, timeout, CancellationToken());

        std::lock_guard<std::mutex> lock(server_info_mutex_);
        server_info_ = result;
        return result;
    }
};

// ============================================================================
// ControlEngine
// ============================================================================

ControlEngine::ControlEngine(EngineOptions options, std::unique_ptr<Transport> transport)
    : impl_(std::make_shared<Impl>(std::move(options), std::move(transport)))
{
}

ControlEngine::~ControlEngine()
{
    try
    {
        impl_->stop();
    }
    catch (const std::exception& e)
    {
        impl_->warn(std::string("Error while stopping engine: ") + e.what());
    }
}

void ControlEngine::start()
{
    impl_->start();
}

void ControlEngine::stop()
{
    impl_->stop();
}

bool ControlEngine::is_running() const
{
    return impl_->running_ && !impl_->session_ended_ && impl_->transport_->is_running();
}

void ControlEngine::dispatch(const json& value)
{
    impl_->dispatch(value);
}

void ControlEngine::wait_for_callbacks()
{
    impl_->wait_for_callbacks();
}

MessageStream ControlEngine::receive_messages()
{
    MessageStream stream;
    stream.impl_ = impl_->message_queue_;
    return stream;
}

std::vector<Message> ControlEngine::receive_response()
{
    std::vector<Message> messages;

    auto stream = receive_messages();
    while (auto msg = stream.get_next())
    {
        bool is_result = is_result_message(*msg);
        messages.push_back(std::move(*msg));
        if (is_result)
            break;
    }

    return messages;
}

json ControlEngine::send_control_request(const std::string& subtype, const json& request_data,
                                         std::chrono::milliseconds timeout,
                                         const CancellationToken& cancel)
{
    return impl_->send_control_request(subtype, request_data, timeout, cancel);
}

json ControlEngine::initialize()
{
    return impl_->initialize();
}

void ControlEngine::interrupt()
{
    impl_->send_control_request("interrupt", json::object(), impl_->control_timeout(),
                                CancellationToken());
}

void ControlEngine::set_permission_mode(const std::string& mode)
{
    impl_->send_control_request("set_permission_mode", {{"mode", mode}},
                                impl_->control_timeout(), CancellationToken());
}

void ControlEngine::set_model(const std::string& model)
{
    impl_->send_control_request("set_model", {{"model", model}}, impl_->control_timeout(),
                                CancellationToken());
}

void ControlEngine::rewind_files(const std::string& user_message_id)
{
    impl_->send_control_request("rewind_files", {{"user_message_id", user_message_id}},
                                impl_->control_timeout(), CancellationToken());
}

json ControlEngine::get_mcp_status()
{
    return impl_->send_control_request("mcp_status", json::object(), impl_->control_timeout(),
                                       CancellationToken());
}

std::optional<json> ControlEngine::get_server_info() const
{
    std::lock_guard<std::mutex> lock(impl_->server_info_mutex_);
    return impl_->server_info_;
}

void ControlEngine::send_user_message(const std::string& prompt, const std::string& session_id)
{
    json msg = {{"type", "user"},
                {"message", {{"role", "user"}, {"content", prompt}}},
                {"parent_tool_use_id", nullptr},
                {"session_id", session_id}};

    impl_->write_line(protocol::to_line(msg));
}

const CallbackRegistry& ControlEngine::callbacks() const
{
    return impl_->registry_;
}

std::size_t ControlEngine::pending_request_count() const
{
    return impl_->control_protocol_.pending_count();
}

// ============================================================================
// MessageStream
// ============================================================================

MessageStream::MessageStream() : impl_(std::make_shared<Impl>()) {}

MessageStream::~MessageStream() = default;

MessageStream::MessageStream(MessageStream&&) noexcept = default;
MessageStream& MessageStream::operator=(MessageStream&&) noexcept = default;

MessageStream::Iterator MessageStream::begin()
{
    return Iterator(this);
}

MessageStream::Iterator MessageStream::end()
{
    return Iterator();
}

std::optional<Message> MessageStream::get_next()
{
    return impl_->pop_message();
}

std::optional<Message> MessageStream::get_next_for(std::chrono::milliseconds timeout)
{
    return impl_->pop_message_for(timeout);
}

bool MessageStream::has_more() const
{
    return impl_->has_more();
}

void MessageStream::stop()
{
    impl_->stop();
}

// ============================================================================
// MessageStream::Iterator
// ============================================================================

MessageStream::Iterator::Iterator() : stream_(nullptr), is_end_(true) {}

MessageStream::Iterator::Iterator(MessageStream* stream) : stream_(stream), is_end_(false)
{
    fetch_next();
}

void MessageStream::Iterator::fetch_next()
{
    if (!stream_)
    {
        is_end_ = true;
        return;
    }

    current_ = stream_->get_next();
    if (!current_)
        is_end_ = true;
}

MessageStream::Iterator::reference MessageStream::Iterator::operator*() const
{
    if (!current_)
        throw AgentError("Dereferencing end iterator");
    return *current_;
}

MessageStream::Iterator::pointer MessageStream::Iterator::operator->() const
{
    return &(operator*());
}

MessageStream::Iterator& MessageStream::Iterator::operator++()
{
    fetch_next();
    return *this;
}

bool MessageStream::Iterator::operator==(const Iterator& other) const
{
    if (is_end_ && other.is_end_)
        return true;
    if (is_end_ || other.is_end_)
        return false;
    return stream_ == other.stream_;
}

bool MessageStream::Iterator::operator!=(const Iterator& other) const
{
    return !(*this == other);
}

} // namespace agentctl
