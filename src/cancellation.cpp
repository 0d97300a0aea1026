#include <agentlink/cancellation.hpp>
#include <map>
#include <mutex>
#include <vector>

namespace agentlink
{

struct CancellationToken::State
{
    std::mutex mutex;
    // Held while callbacks run so unsubscribe() can wait them out
    std::recursive_mutex callback_mutex;
    bool cancelled = false;
    std::size_t next_id = 1;
    std::map<std::size_t, Callback> callbacks;
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel()
{
    std::lock_guard<std::recursive_mutex> running(state_->callback_mutex);

    std::vector<Callback> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled)
            return;
        state_->cancelled = true;
        for (auto& [id, callback] : state_->callbacks)
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

std::size_t CancellationToken::subscribe(Callback callback)
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled)
        {
            std::size_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void CancellationToken::unsubscribe(std::size_t id)
{
    if (id == 0)
        return;

    std::lock_guard<std::recursive_mutex> running(state_->callback_mutex);
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancellationSubscription::CancellationSubscription(const CancellationToken* token,
                                                   CancellationToken::Callback callback)
{
    if (token == nullptr)
        return;

    token_ = *token;
    id_ = token_.subscribe(std::move(callback));
    active_ = true;
}

CancellationSubscription::~CancellationSubscription()
{
    if (active_)
        token_.unsubscribe(id_);
}

} // namespace agentlink
