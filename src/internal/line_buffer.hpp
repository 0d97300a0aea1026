#ifndef AGENTLINK_INTERNAL_LINE_BUFFER_HPP
#define AGENTLINK_INTERNAL_LINE_BUFFER_HPP

#include <agentlink/transport.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{
namespace internal
{

// Default maximum size of one JSON message (1MB)
constexpr std::size_t kDefaultMaxBufferSize = 1024 * 1024;

/**
 * Splits raw stdout bytes into JSON objects.
 *
 * A line that does not parse is kept and joined with the following lines
 * until the accumulated text parses, so messages split across lines are
 * still recovered. Exceeding the maximum size yields an error result and
 * resets the pending text.
 */
class JsonLineBuffer
{
  public:
    explicit JsonLineBuffer(std::size_t max_buffer_size = kDefaultMaxBufferSize);

    // Feed bytes; returns the objects (and errors) completed by them
    std::vector<ReadResult> add_data(const std::string& data);

    bool has_buffered_data() const
    {
        return !buffer_.empty() || !pending_json_.empty();
    }

    void clear()
    {
        buffer_.clear();
        pending_json_.clear();
    }

  private:
    std::string buffer_;       // Bytes not yet terminated by '\n'
    std::string pending_json_; // Complete lines that did not parse yet
    std::size_t max_buffer_size_;

    std::optional<std::string> extract_line();
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_LINE_BUFFER_HPP
