#include <agentlink/errors.hpp>
#include <agentlink/protocol/pending_requests.hpp>
#include <stdexcept>
#include <vector>

namespace agentlink
{
namespace protocol
{

PendingRequestTable::~PendingRequestTable()
{
    fail_all(std::make_exception_ptr(ControlCancelledError("Control protocol shutting down")));
}

std::future<json> PendingRequestTable::add(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.find(request_id) != entries_.end())
        throw std::invalid_argument("Duplicate control request id: " + request_id);

    std::promise<json> promise;
    auto future = promise.get_future();
    entries_.emplace(request_id, std::move(promise));
    return future;
}

std::optional<std::promise<json>> PendingRequestTable::take(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(request_id);
    if (it == entries_.end())
        return std::nullopt;

    std::promise<json> promise = std::move(it->second);
    entries_.erase(it);
    return promise;
}

bool PendingRequestTable::resolve(const std::string& request_id, json payload)
{
    auto promise = take(request_id);
    if (!promise)
        return false;

    promise->set_value(std::move(payload));
    return true;
}

bool PendingRequestTable::reject(const std::string& request_id, std::exception_ptr error)
{
    auto promise = take(request_id);
    if (!promise)
        return false;

    promise->set_exception(error);
    return true;
}

bool PendingRequestTable::remove(const std::string& request_id)
{
    return take(request_id).has_value();
}

std::size_t PendingRequestTable::fail_all(std::exception_ptr error)
{
    std::vector<std::promise<json>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, promise] : entries_)
            drained.push_back(std::move(promise));
        entries_.clear();
    }

    for (auto& promise : drained)
        promise.set_exception(error);

    return drained.size();
}

std::size_t PendingRequestTable::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool PendingRequestTable::contains(const std::string& request_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(request_id) != entries_.end();
}

} // namespace protocol
} // namespace agentlink
