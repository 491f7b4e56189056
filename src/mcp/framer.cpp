#include <mcp_echo/mcp/framer.hpp>

#include <mcp_echo/core/log.hpp>

namespace mcp_echo {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
           c == '\f' || c == '\v';
}

} // anonymous namespace

std::string_view TrimWhitespace(std::string_view text) {
    std::size_t begin = 0;
    while (begin < text.size() && IsSpace(text[begin])) ++begin;
    std::size_t end = text.size();
    while (end > begin && IsSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

// ---------------------------------------------------------------------------
// LineFramer
// ---------------------------------------------------------------------------
LineFramer::LineFramer(std::istream& in) : in_(in) {}

std::optional<std::string> LineFramer::Next() {
    std::string line;
    while (std::getline(in_, line)) {
        auto trimmed = TrimWhitespace(line);
        if (trimmed.empty()) continue;
        return std::string(trimmed);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// FramingMode
// ---------------------------------------------------------------------------
std::optional<FramingMode> ParseFramingMode(std::string_view name) {
    if (name == "chunk") return FramingMode::Chunk;
    if (name == "newline") return FramingMode::Newline;
    return std::nullopt;
}

const char* FramingModeName(FramingMode mode) {
    switch (mode) {
        case FramingMode::Chunk:   return "chunk";
        case FramingMode::Newline: return "newline";
    }
    return "chunk";
}

// ---------------------------------------------------------------------------
// StreamFramer
// ---------------------------------------------------------------------------
StreamFramer::StreamFramer(FramingMode mode, std::size_t max_buffer)
    : mode_(mode), max_buffer_(max_buffer) {}

std::vector<std::string> StreamFramer::Feed(std::string_view bytes) {
    std::vector<std::string> units;

    if (mode_ == FramingMode::Chunk) {
        // An all-whitespace chunk still yields a (empty) unit so the peer
        // gets a parse error back instead of waiting forever.
        units.emplace_back(TrimWhitespace(bytes));
        return units;
    }

    buffer_.append(bytes.data(), bytes.size());

    std::size_t start = 0;
    for (auto nl = buffer_.find('\n', start); nl != std::string::npos;
         nl = buffer_.find('\n', start)) {
        auto line = TrimWhitespace(
            std::string_view(buffer_).substr(start, nl - start));
        if (!line.empty()) {
            units.emplace_back(line);
        }
        start = nl + 1;
    }
    buffer_.erase(0, start);

    if (buffer_.size() > max_buffer_) {
        LogWarn("framer", "Unterminated message exceeds " +
                std::to_string(max_buffer_) + " bytes, flushing as one unit");
        units.emplace_back(TrimWhitespace(buffer_));
        buffer_.clear();
    }

    return units;
}

std::optional<std::string> StreamFramer::Finish() {
    auto rest = std::string(TrimWhitespace(buffer_));
    buffer_.clear();
    if (rest.empty()) {
        return std::nullopt;
    }
    return rest;
}

} // namespace mcp_echo
