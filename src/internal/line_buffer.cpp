#include "line_buffer.hpp"

namespace agentlink
{
namespace internal
{

namespace
{
std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
} // namespace

JsonLineBuffer::JsonLineBuffer(std::size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<ReadResult> JsonLineBuffer::add_data(const std::string& data)
{
    std::vector<ReadResult> results;
    buffer_ += data;

    while (auto line = extract_line())
    {
        std::string trimmed = trim(*line);
        if (trimmed.empty())
            continue;

        pending_json_ += trimmed;

        if (pending_json_.size() > max_buffer_size_)
        {
            std::size_t size = pending_json_.size();
            pending_json_.clear();
            results.push_back(ReadResult::failure(
                "JSON message exceeded maximum buffer size of " + std::to_string(max_buffer_size_) +
                " bytes (size: " + std::to_string(size) + ")"));
            continue;
        }

        json parsed = json::parse(pending_json_, nullptr, false);
        if (parsed.is_discarded())
            continue; // Partial message, wait for more lines

        pending_json_.clear();
        results.push_back(ReadResult::message(std::move(parsed)));
    }

    // An unterminated line can also grow without bound
    if (buffer_.size() > max_buffer_size_)
    {
        std::size_t size = buffer_.size();
        buffer_.clear();
        results.push_back(ReadResult::failure("JSON message exceeded maximum buffer size of " +
                                              std::to_string(max_buffer_size_) +
                                              " bytes (size: " + std::to_string(size) + ")"));
    }

    return results;
}

std::optional<std::string> JsonLineBuffer::extract_line()
{
    std::size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    return line;
}

} // namespace internal
} // namespace agentlink
