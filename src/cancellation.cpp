#include <agentctl/cancellation.hpp>
#include <vector>

namespace agentctl
{

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel()
{
    std::vector<Callback> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled)
            return;
        state_->cancelled = true;
        for (auto& [handle, callback] : state_->callbacks)
            to_run.push_back(std::move(callback));
        state_->callbacks.clear();
    }

    for (auto& callback : to_run)
        callback();
}

bool CancellationToken::is_cancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

std::size_t CancellationToken::on_cancel(Callback callback)
{
    std::size_t handle;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        handle = state_->next_handle++;
        if (!state_->cancelled)
        {
            state_->callbacks.emplace(handle, std::move(callback));
            return handle;
        }
    }

    callback();
    return handle;
}

void CancellationToken::remove(std::size_t handle)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(handle);
}

} // namespace agentctl
