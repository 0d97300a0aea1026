#ifndef AGENTLINK_PROTOCOL_PENDING_REQUESTS_HPP
#define AGENTLINK_PROTOCOL_PENDING_REQUESTS_HPP

#include <cstddef>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentlink
{
namespace protocol
{

using json = nlohmann::json;

/**
 * Outstanding outbound control requests, keyed by request id.
 *
 * Each entry is a one-shot slot. Every completion path (resolve, reject,
 * abandon, fail_all) removes the entry under the lock before touching the
 * promise, so a slot is completed at most once and completing an absent id
 * is a no-op.
 */
class PendingRequestTable
{
  public:
    PendingRequestTable() = default;
    ~PendingRequestTable();

    PendingRequestTable(const PendingRequestTable&) = delete;
    PendingRequestTable& operator=(const PendingRequestTable&) = delete;

    // Register a slot and return the future side. Throws std::invalid_argument
    // if the id is already pending.
    std::future<json> add(const std::string& request_id);

    // Deliver a payload. Returns false if no such request is pending.
    bool resolve(const std::string& request_id, json payload);

    // Fail a request with an exception. Returns false if not pending.
    bool reject(const std::string& request_id, std::exception_ptr error);

    // Drop a slot without completing it (the waiter gave up).
    // Returns false if it was already completed by someone else.
    bool remove(const std::string& request_id);

    // Fail every pending request with the same error; returns how many
    std::size_t fail_all(std::exception_ptr error);

    std::size_t size() const;
    bool contains(const std::string& request_id) const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::promise<json>> entries_;

    std::optional<std::promise<json>> take(const std::string& request_id);
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_PENDING_REQUESTS_HPP
