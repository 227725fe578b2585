#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// ─── Pipe Cursor ────────────────────────────────────────────────────────────
// Incremental UTF-8 decoder for the FIFO byte stream. A multi-byte sequence
// split across two reads is held until the rest arrives, including across a
// pipe reopen. Malformed input (stray continuation bytes, overlong forms,
// surrogates, values above U+10FFFF, truncated sequences) becomes U+FFFD.

namespace pipe_cursor {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

class PipeCursor {
public:
    /// Decode bytes, appending complete code points to out.
    void feed(const uint8_t* data, size_t len, std::vector<char32_t>& out);

    /// Total bytes consumed since construction.
    uint64_t offset() const { return offset_; }

    /// True while part of a multi-byte sequence is buffered.
    bool has_partial() const { return need_ > 0; }

    /// Drop any buffered partial sequence.
    void reset();

private:
    void emit(char32_t cp, std::vector<char32_t>& out);

    uint64_t offset_ = 0;
    char32_t cp_     = 0;
    char32_t min_    = 0;
    int      need_   = 0;
};

} // namespace pipe_cursor
