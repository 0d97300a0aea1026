#ifndef AGENTLINK_MESSAGE_STREAM_HPP
#define AGENTLINK_MESSAGE_STREAM_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace agentlink
{

using json = nlohmann::json;

/**
 * Thread-safe FIFO of JSON messages.
 *
 * Carries data messages out of a Query and caller input into it. Closing
 * is idempotent; consumers drain whatever was queued before the close.
 */
class MessageChannel
{
  public:
    MessageChannel() = default;

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    // Returns false (dropping the message) if the channel is closed
    bool push(json message);

    // Block until a message is available; nullopt once closed and drained
    std::optional<json> pop();

    // Like pop(), but nullopt also on timeout
    std::optional<json> pop_for(std::chrono::milliseconds timeout);

    void close();
    bool is_closed() const;

    // True while messages are queued or more may arrive
    bool has_more() const;

    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<json> queue_;
    bool closed_ = false;
};

/**
 * Input-iterator view over a MessageChannel.
 *
 * When stop_after_result is set the stream ends right after the first
 * "result" message it yields.
 */
class MessageStream
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = json;
        using difference_type = std::ptrdiff_t;
        using pointer = const json*;
        using reference = const json&;

        Iterator();
        explicit Iterator(MessageStream* stream);

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;

      private:
        MessageStream* stream_;
        std::optional<json> current_;
        bool is_end_;

        void fetch_next();
    };

    explicit MessageStream(std::shared_ptr<MessageChannel> channel, bool stop_after_result = false);

    Iterator begin();
    Iterator end();

    // Get next message (blocking); nullopt at the end of the stream
    std::optional<json> get_next();

    // Get next message with timeout (nullopt on timeout or end)
    std::optional<json> get_next_for(std::chrono::milliseconds timeout);

    bool has_more() const;

  private:
    std::shared_ptr<MessageChannel> channel_;
    bool stop_after_result_;
    bool result_seen_ = false;

    std::optional<json> observe(std::optional<json> message);
};

} // namespace agentlink

#endif // AGENTLINK_MESSAGE_STREAM_HPP
