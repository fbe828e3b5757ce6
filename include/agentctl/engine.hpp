#ifndef AGENTCTL_ENGINE_HPP
#define AGENTCTL_ENGINE_HPP

#include <agentctl/callback_registry.hpp>
#include <agentctl/cancellation.hpp>
#include <agentctl/transport.hpp>
#include <agentctl/types.hpp>
#include <chrono>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentctl
{

// Consumer side of the content stream.
//
// Messages arrive in the order the peer sent them. A content envelope that failed to parse
// is delivered in its place as a thrown MessageParseError; the stream continues after it.
// A transport failure is delivered as a thrown TransportError after every message received
// before it, and ends the stream.
class MessageStream
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Message;
        using difference_type = std::ptrdiff_t;
        using pointer = const Message*;
        using reference = const Message&;

        Iterator();
        explicit Iterator(MessageStream* stream);

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;

      private:
        MessageStream* stream_;
        std::optional<Message> current_;
        bool is_end_;

        void fetch_next();
    };

    MessageStream();
    ~MessageStream();

    // No copy, move only
    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;
    MessageStream(MessageStream&&) noexcept;
    MessageStream& operator=(MessageStream&&) noexcept;

    Iterator begin();
    Iterator end();

    // Next message (blocking). nullopt once the stream has ended and drained.
    std::optional<Message> get_next();

    // Like get_next(), but also returns nullopt on timeout
    std::optional<Message> get_next_for(std::chrono::milliseconds timeout);

    bool has_more() const;

    void stop();

  private:
    friend class ControlEngine;

    class Impl;
    std::shared_ptr<Impl> impl_;
};

/**
 * Control-protocol engine.
 *
 * Reads decoded values from the Transport on one reader thread and:
 *  - resolves our own pending control requests from control_response envelopes,
 *  - answers peer control requests (can_use_tool, hook_callback, mcp_message) by running
 *    the registered callbacks on worker threads and writing the correlated response,
 *  - parses everything else into typed Messages for the consumer stream.
 *
 * Callback failures never escape the engine: they become error control responses.
 * Transport failures end the session: pending requests and the consumer stream are failed
 * with TransportError.
 */
class ControlEngine
{
  public:
    ControlEngine(EngineOptions options, std::unique_ptr<Transport> transport);
    ~ControlEngine();

    ControlEngine(const ControlEngine&) = delete;
    ControlEngine& operator=(const ControlEngine&) = delete;

    // Connect the transport and start the reader thread
    void start();

    // End input, close the transport, join the reader and wait for running callbacks.
    // A reader that close() could not unblock is detached after
    // EngineOptions::reader_join_timeout_ms; it exits once its pending read returns.
    void stop();

    bool is_running() const;

    // Route one inbound value. The reader thread calls this for every value it reads;
    // it is public so callers with their own read loop can drive the engine directly.
    void dispatch(const json& value);

    // Block until every control-request callback started so far has completed
    void wait_for_callbacks();

    MessageStream receive_messages();

    // Messages up to and including the next ResultMessage
    std::vector<Message> receive_response();

    // Issue a control request and wait for its correlated response payload.
    // Throws ControlRequestError, ControlTimeoutError, RequestCancelledError, TransportError.
    json send_control_request(const std::string& subtype, const json& request_data,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& cancel = CancellationToken());

    // Announce hooks and agents; returns (and stores) the peer's server info
    json initialize();
    void interrupt();
    void set_permission_mode(const std::string& mode);
    void set_model(const std::string& model);
    void rewind_files(const std::string& user_message_id);
    json get_mcp_status();

    std::optional<json> get_server_info() const;

    // Write a user turn
    void send_user_message(const std::string& prompt, const std::string& session_id = "default");

    const CallbackRegistry& callbacks() const;

    // Number of control requests we issued that are still waiting for a response
    std::size_t pending_request_count() const;

  private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace agentctl

#endif // AGENTCTL_ENGINE_HPP
