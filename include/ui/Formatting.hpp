#pragma once

#include <string>

namespace sextant::ui {

/**
 * Display width of a single code point in terminal columns.
 * Combining marks, format and control characters take 0 columns,
 * East Asian Wide and Fullwidth characters take 2, everything else 1.
 */
int codepoint_cols(int cp);

/**
 * Calculate the display width of a string, accounting for:
 * - ANSI escape sequences (which don't take visual space)
 * - UTF-8 multi-byte characters, measured with codepoint_cols()
 * Invalid UTF-8 bytes count as one column each.
 */
int display_cols(const std::string& s);

/**
 * Prefix of `s` occupying at most `width` display columns.
 * Never splits a UTF-8 sequence or an escape sequence; a wide character
 * that would straddle the limit is left out. Combining marks and escape
 * sequences directly after the last kept character are kept.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Column offset of the last whitespace code point in `s`, or -1.
 */
int last_space_col(const std::string& s);

/**
 * `s` with trailing whitespace removed.
 */
std::string trim_right(const std::string& s);

/**
 * Truncate string if too long, pad with spaces if too short.
 * Result will be exactly `width` display columns. A cut string ends in
 * `ellipsis`, or is hard-cut when `width` cannot hold it.
 */
std::string trunc_pad(const std::string& s, int width, const std::string& ellipsis = "…");

/**
 * Align left text and right text with space between.
 * Example: lr_align(40, "CPU", "75%") -> "CPU                                 75%"
 */
std::string lr_align(int width, const std::string& left, const std::string& right,
                     const std::string& ellipsis = "…");

} // namespace sextant::ui
