#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_echo {

/// Strip leading and trailing ASCII whitespace (space, \t, \r, \n, \f, \v).
std::string_view TrimWhitespace(std::string_view text);

// ---------------------------------------------------------------------------
// LineFramer: stdio discipline: one JSON text unit per line.
// Blank lines are skipped; end of stream ends the sequence.
// ---------------------------------------------------------------------------
class LineFramer {
public:
    explicit LineFramer(std::istream& in);

    // Next trimmed, non-blank line, or nullopt at end of input.
    [[nodiscard]] std::optional<std::string> Next();

private:
    std::istream& in_;
};

enum class FramingMode {
    Chunk,    // every receive call is one unit (reference wire behavior)
    Newline,  // units are re-assembled across receive calls and split on '\n'
};

/// "chunk" / "newline".
std::optional<FramingMode> ParseFramingMode(std::string_view name);
const char* FramingModeName(FramingMode mode);

// ---------------------------------------------------------------------------
// StreamFramer: socket discipline. Fed with whatever one recv() returned,
// hands back the text units that chunk completed. One instance per
// connection; it holds the partial-line buffer in Newline mode.
// ---------------------------------------------------------------------------
class StreamFramer {
public:
    static constexpr std::size_t kDefaultMaxBuffer = 1024 * 1024;

    explicit StreamFramer(FramingMode mode,
                          std::size_t max_buffer = kDefaultMaxBuffer);

    [[nodiscard]] std::vector<std::string> Feed(std::string_view bytes);

    // End of stream: the trimmed unterminated remainder, if any is left.
    [[nodiscard]] std::optional<std::string> Finish();

    // Bytes held back waiting for a newline (always 0 in Chunk mode).
    [[nodiscard]] std::size_t Buffered() const noexcept { return buffer_.size(); }

    [[nodiscard]] FramingMode Mode() const noexcept { return mode_; }

private:
    FramingMode mode_;
    std::size_t max_buffer_;
    std::string buffer_;
};

} // namespace mcp_echo
