/// @file StringUtils.hpp
/// @brief Text helpers shared by the resolver, parser and search modules
/// @details All functions operate on UTF-8 encoded std::string. Names are
/// compared byte-wise; only the adjustment scanner and length checks decode
/// code points.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace Formulary {
namespace StringUtils {

/// Trim spaces, tabs and line breaks from both ends
std::string trim(const std::string& str);

/// Split on a delimiter, trim every piece and drop empty pieces
std::vector<std::string> splitTrimmed(const std::string& str, char delimiter);

/// Parse the longest numeric prefix (after leading whitespace)
/// @return Parsed value, or 0.0 when no number is present
double parseLeadingNumber(const std::string& str);

/// Split "name*multiplier" into (trimmed name, multiplier)
/// @details The multiplier must match \d*\.?\d+ after the last '*'.
/// Text without a valid suffix is returned whole with multiplier 1.0.
/// A multiplier that parses to zero falls back to 1.0.
std::pair<std::string, double> splitMultiplier(const std::string& segment);

/// True if str begins with prefix
bool startsWith(const std::string& str, const std::string& prefix);

/// True if haystack contains needle
bool contains(const std::string& haystack, const std::string& needle);

/// ASCII lower-casing; non-ASCII bytes pass through unchanged
std::string toLower(const std::string& str);

/// Decode the UTF-8 code point starting at pos
/// @param str Input text
/// @param pos Byte offset of the lead byte
/// @param length Output: number of bytes consumed (at least 1)
/// @return Code point, or the raw byte value for malformed input
unsigned int decodeCodePoint(const std::string& str, std::size_t pos, std::size_t& length);

/// Number of code points in a UTF-8 string
std::size_t codePointLength(const std::string& str);

/// True for precomposed Hangul syllables
bool isHangulSyllable(unsigned int codePoint);

/// ASCII whitespace plus the Unicode space separators (NBSP, U+2000..U+200A,
/// ideographic space U+3000, BOM, ...)
bool isWhitespace(unsigned int codePoint);

} // namespace StringUtils
} // namespace Formulary
