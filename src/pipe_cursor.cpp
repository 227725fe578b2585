#include "pipe_cursor.h"

namespace pipe_cursor {

void PipeCursor::reset() {
    cp_   = 0;
    min_  = 0;
    need_ = 0;
}

void PipeCursor::emit(char32_t cp, std::vector<char32_t>& out) {
    bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
    if (cp < min_ || surrogate || cp > 0x10FFFF) {
        out.push_back(REPLACEMENT_CHAR);
    } else {
        out.push_back(cp);
    }
}

void PipeCursor::feed(const uint8_t* data, size_t len, std::vector<char32_t>& out) {
    size_t i = 0;
    while (i < len) {
        uint8_t b = data[i];

        if (need_ > 0) {
            if ((b & 0xC0) == 0x80) {
                cp_ = (cp_ << 6) | (b & 0x3F);
                ++i;
                if (--need_ == 0) {
                    emit(cp_, out);
                    reset();
                }
                continue;
            }
            // Truncated sequence: replace it, then restart on this byte.
            out.push_back(REPLACEMENT_CHAR);
            reset();
            continue;
        }

        ++i;
        if (b < 0x80) {
            out.push_back(b);
        } else if (b >= 0xC2 && b <= 0xDF) {
            cp_ = b & 0x1F; need_ = 1; min_ = 0x80;
        } else if (b >= 0xE0 && b <= 0xEF) {
            cp_ = b & 0x0F; need_ = 2; min_ = 0x800;
        } else if (b >= 0xF0 && b <= 0xF4) {
            cp_ = b & 0x07; need_ = 3; min_ = 0x10000;
        } else {
            // Stray continuation, C0/C1 overlong lead, or F5..FF
            out.push_back(REPLACEMENT_CHAR);
        }
    }
    offset_ += len;
}

} // namespace pipe_cursor
