#ifndef AGENTLINK_CANCELLATION_HPP
#define AGENTLINK_CANCELLATION_HPP

#include <cstddef>
#include <functional>
#include <memory>

namespace agentlink
{

/**
 * Cooperative cancellation signal.
 *
 * Copies share the same state: cancelling any copy cancels all of them.
 * Blocking operations in the library accept a token and return early (with
 * ControlCancelledError where a result was expected) once it fires.
 * Callbacks run on the thread that calls cancel().
 */
class CancellationToken
{
  public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel();
    bool is_cancelled() const;

    // Register a callback to run on cancellation. Runs immediately (on the
    // calling thread) if the token is already cancelled. Returns an id for
    // unsubscribe(); 0 means the callback already ran.
    std::size_t subscribe(Callback callback);

    // Remove a callback. Blocks while a concurrent cancel() is running
    // callbacks, so the callback is guaranteed not to run after return.
    void unsubscribe(std::size_t id);

  private:
    struct State;
    std::shared_ptr<State> state_;
};

// RAII subscription; unsubscribes on destruction
class CancellationSubscription
{
  public:
    CancellationSubscription(const CancellationToken* token, CancellationToken::Callback callback);
    ~CancellationSubscription();

    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

  private:
    CancellationToken token_;
    bool active_ = false;
    std::size_t id_ = 0;
};

} // namespace agentlink

#endif // AGENTLINK_CANCELLATION_HPP
