#include <agentlink/message_stream.hpp>
#include <agentlink/types.hpp>
#include <stdexcept>

namespace agentlink
{

// ============================================================================
// MessageChannel
// ============================================================================

bool MessageChannel::push(json message)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::optional<json> MessageChannel::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait for message or close
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty())
        return std::nullopt;

    json msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
}

std::optional<json> MessageChannel::pop_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; }))
        return std::nullopt;

    if (queue_.empty())
        return std::nullopt;

    json msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
}

void MessageChannel::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool MessageChannel::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool MessageChannel::has_more() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !queue_.empty() || !closed_;
}

std::size_t MessageChannel::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// MessageStream
// ============================================================================

MessageStream::MessageStream(std::shared_ptr<MessageChannel> channel, bool stop_after_result)
    : channel_(std::move(channel)), stop_after_result_(stop_after_result)
{
    if (!channel_)
        throw std::invalid_argument("MessageStream requires a channel");
}

MessageStream::Iterator MessageStream::begin()
{
    return Iterator(this);
}

MessageStream::Iterator MessageStream::end()
{
    return Iterator();
}

std::optional<json> MessageStream::get_next()
{
    if (result_seen_)
        return std::nullopt;
    return observe(channel_->pop());
}

std::optional<json> MessageStream::get_next_for(std::chrono::milliseconds timeout)
{
    if (result_seen_)
        return std::nullopt;
    return observe(channel_->pop_for(timeout));
}

bool MessageStream::has_more() const
{
    return !result_seen_ && channel_->has_more();
}

std::optional<json> MessageStream::observe(std::optional<json> message)
{
    if (message && stop_after_result_ && is_result_message(*message))
        result_seen_ = true;
    return message;
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
        throw std::runtime_error("Dereferencing end iterator");
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

} // namespace agentlink
