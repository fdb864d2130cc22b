#include "ui/Formatting.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <cstdint>

namespace sextant::ui {

namespace {

// One step through a string: either a whole escape sequence or one code point
struct Glyph {
    size_t end = 0;
    int cp = -1;      // -1 for escape sequences and invalid bytes
    int cols = 0;
    bool escape = false;
};

// Returns the end of an escape sequence starting at i, or i if there is none
size_t skip_escape(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size()) return i;

    // CSI sequences (e.g., colors) - \x1B[...m
    if (s[i + 1] == '[') {
        i += 2;
        while (i < s.size() && (s[i] < '@' || s[i] > '~')) {
            i++;
        }
        if (i < s.size()) i++; // Final byte
        return i;
    }
    // APC/Kitty sequences - \x1B_ ... \x1B\ (ESC + backslash)
    if (s[i + 1] == '_') {
        i += 2;
        while (i + 1 < s.size()) {
            if (s[i] == '\x1B' && s[i + 1] == '\\') {
                return i + 2;
            }
            i++;
        }
        return s.size();
    }
    return i;
}

Glyph next_glyph(const std::string& s, size_t i) {
    Glyph g;
    size_t esc_end = skip_escape(s, i);
    if (esc_end != i) {
        g.end = esc_end;
        g.escape = true;
        return g;
    }

    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t pos = static_cast<int32_t>(i);
    int32_t len = static_cast<int32_t>(s.size());
    UChar32 c = 0;
    U8_NEXT(bytes, pos, len, c);

    g.end = static_cast<size_t>(pos);
    if (c < 0) {
        g.cols = 1; // Invalid byte, shown as a replacement glyph
        return g;
    }
    g.cp = c;
    g.cols = codepoint_cols(c);
    return g;
}

bool is_space(int cp) {
    return cp >= 0 && u_isUWhiteSpace(cp);
}

} // namespace

int codepoint_cols(int cp) {
    if (cp == '\t' || cp == ' ') return 1;

    switch (u_charType(cp)) {
        case U_NON_SPACING_MARK:
        case U_ENCLOSING_MARK:
        case U_FORMAT_CHAR:
        case U_CONTROL_CHAR:
            return 0;
        default:
            break;
    }

    int ea = u_getIntPropertyValue(cp, UCHAR_EAST_ASIAN_WIDTH);
    if (ea == U_EA_WIDE || ea == U_EA_FULLWIDTH) {
        return 2;
    }
    return 1;
}

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size(); ) {
        Glyph g = next_glyph(s, i);
        cols += g.cols;
        i = g.end;
    }
    return cols;
}

std::string take_cols(const std::string& s, int width) {
    if (width <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;

    // Zero-column glyphs (marks, escapes) after the last kept character stay with it
    while (i < s.size()) {
        Glyph g = next_glyph(s, i);
        if (seen + g.cols > width) break;
        out.append(s, i, g.end - i);
        seen += g.cols;
        i = g.end;
    }

    return out;
}

int last_space_col(const std::string& s) {
    int found = -1;
    int col = 0;
    for (size_t i = 0; i < s.size(); ) {
        Glyph g = next_glyph(s, i);
        if (is_space(g.cp)) found = col;
        col += g.cols;
        i = g.end;
    }
    return found;
}

std::string trim_right(const std::string& s) {
    size_t keep = 0;
    for (size_t i = 0; i < s.size(); ) {
        Glyph g = next_glyph(s, i);
        if (!is_space(g.cp)) keep = g.end;
        i = g.end;
    }
    return s.substr(0, keep);
}

std::string trunc_pad(const std::string& s, int w, const std::string& ellipsis) {
    if (w <= 0) return "";

    int cols = display_cols(s);

    if (cols == w) {
        return s; // Perfect fit
    }

    if (cols < w) {
        return s + std::string(w - cols, ' ');
    }

    int ellipsis_cols = display_cols(ellipsis);
    std::string cut = w <= ellipsis_cols ? take_cols(s, w) : take_cols(s, w - ellipsis_cols) + ellipsis;

    // take_cols may stop short on a wide character
    int cut_cols = display_cols(cut);
    if (cut_cols < w) cut += std::string(w - cut_cols, ' ');
    return cut;
}

std::string lr_align(int width, const std::string& left, const std::string& right,
                     const std::string& ellipsis) {
    if (width <= 0) return "";

    int rvis = display_cols(right);
    int left_max = width - rvis - 1; // Leave space for at least 1 space between
    if (left_max < 0) left_max = 0;

    std::string l = trunc_pad(left, left_max, ellipsis);
    int lvis = display_cols(l);

    int space = width - lvis - rvis;
    if (space < 0) space = 0;

    return l + std::string(space, ' ') + right;
}

} // namespace sextant::ui
