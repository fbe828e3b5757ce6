#ifndef AGENTCTL_CANCELLATION_HPP
#define AGENTCTL_CANCELLATION_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace agentctl
{

// Shared cancellation flag. Copies observe the same state; cancel() runs every registered
// callback exactly once, outside the internal lock.
class CancellationToken
{
  public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel();
    bool is_cancelled() const;

    // Runs `callback` immediately when already cancelled. Returns a handle for remove().
    std::size_t on_cancel(Callback callback);
    void remove(std::size_t handle);

  private:
    struct State
    {
        mutable std::mutex mutex;
        bool cancelled = false;
        std::size_t next_handle = 0;
        std::map<std::size_t, Callback> callbacks;
    };

    std::shared_ptr<State> state_;
};

} // namespace agentctl

#endif // AGENTCTL_CANCELLATION_HPP
