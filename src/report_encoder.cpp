#include "report_encoder.h"

#include <algorithm>

namespace report_encoder {

bool ReportFrame::is_release() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

void encode_stroke(const keycode_table::KeyStroke& stroke, std::vector<ReportFrame>& out) {
    out.emplace_back(stroke.modifiers, stroke.usage);
    out.push_back(ReportFrame::release());
}

bool encode(char32_t code_point, keycode_table::Layout layout, std::vector<ReportFrame>& out) {
    if (code_point == U'\n' || code_point == U'\r') {
        encode_stroke({keycode_table::MOD_NONE, keycode_table::KEY_ENTER}, out);
        return true;
    }

    const keycode_table::KeyMapEntry* entry = keycode_table::lookup(layout, code_point);
    if (!entry) return false;

    for (uint8_t i = 0; i < entry->count; ++i) {
        encode_stroke(entry->strokes[i], out);
    }
    return true;
}

} // namespace report_encoder
