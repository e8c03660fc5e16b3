#include "formulary/util/StringUtils.hpp"
#include "formulary/util/Constants.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Formulary {
namespace StringUtils {

std::string trim(const std::string& str) {
    std::size_t start = std::string::npos;
    std::size_t end = 0;

    std::size_t pos = 0;
    while (pos < str.size()) {
        std::size_t length = 1;
        unsigned int cp = decodeCodePoint(str, pos, length);
        if (!isWhitespace(cp)) {
            if (start == std::string::npos) start = pos;
            end = pos + length;
        }
        pos += length;
    }

    if (start == std::string::npos) return "";
    return str.substr(start, end - start);
}

std::vector<std::string> splitTrimmed(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= str.size()) {
        std::size_t end = str.find(delimiter, start);
        if (end == std::string::npos) end = str.size();

        std::string part = trim(str.substr(start, end - start));
        if (!part.empty()) {
            parts.push_back(part);
        }
        start = end + 1;
    }
    return parts;
}

double parseLeadingNumber(const std::string& str) {
    std::string text = trim(str);
    if (text.empty()) return 0.0;

    // Only plain decimal notation: optional sign, digits, optional fraction
    std::size_t i = 0;
    if (text[i] == '+' || text[i] == '-') ++i;
    std::size_t digitsStart = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    }
    std::string number = text.substr(0, i);
    if (number.find_first_of("0123456789", digitsStart) == std::string::npos) {
        return 0.0;
    }
    return std::strtod(number.c_str(), nullptr);
}

std::pair<std::string, double> splitMultiplier(const std::string& segment) {
    auto star = segment.rfind('*');
    if (star == std::string::npos || star == 0) {
        return {segment, 1.0};
    }

    // Suffix must be \d*\.?\d+
    const std::string suffix = segment.substr(star + 1);
    if (suffix.empty() || !std::isdigit(static_cast<unsigned char>(suffix.back()))) {
        return {segment, 1.0};
    }
    int dots = 0;
    for (char c : suffix) {
        if (c == '.') {
            ++dots;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return {segment, 1.0};
        }
    }
    if (dots > 1) {
        return {segment, 1.0};
    }

    double multiplier = std::strtod(suffix.c_str(), nullptr);
    if (multiplier == 0.0) multiplier = 1.0;
    return {trim(segment.substr(0, star)), multiplier};
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return lower;
}

unsigned int decodeCodePoint(const std::string& str, std::size_t pos, std::size_t& length) {
    const auto lead = static_cast<unsigned char>(str[pos]);
    length = 1;

    std::size_t extra = 0;
    unsigned int codePoint = lead;
    if (lead >= 0xF0 && lead <= 0xF7) {
        extra = 3;
        codePoint = lead & 0x07;
    } else if (lead >= 0xE0) {
        extra = 2;
        codePoint = lead & 0x0F;
    } else if (lead >= 0xC0) {
        extra = 1;
        codePoint = lead & 0x1F;
    } else {
        return lead;
    }

    if (pos + extra >= str.size()) {
        return lead;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto cont = static_cast<unsigned char>(str[pos + k]);
        if ((cont & 0xC0) != 0x80) {
            return lead;
        }
        codePoint = (codePoint << 6) | (cont & 0x3F);
    }
    length = extra + 1;
    return codePoint;
}

std::size_t codePointLength(const std::string& str) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < str.size()) {
        std::size_t length = 1;
        decodeCodePoint(str, pos, length);
        pos += length;
        ++count;
    }
    return count;
}

bool isWhitespace(unsigned int codePoint) {
    switch (codePoint) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x00A0:    // no-break space
        case 0x1680:
        case 0x2028: case 0x2029:
        case 0x202F: case 0x205F:
        case 0x3000:    // ideographic space
        case 0xFEFF:
            return true;
        default:
            return codePoint >= 0x2000 && codePoint <= 0x200A;
    }
}

bool isHangulSyllable(unsigned int codePoint) {
    return codePoint >= Constants::kHangulFirst && codePoint <= Constants::kHangulLast;
}

} // namespace StringUtils
} // namespace Formulary
