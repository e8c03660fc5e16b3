#include "formulary/parser/FormulaParser.hpp"
#include "formulary/util/Constants.hpp"
#include "formulary/util/ErrorCodes.hpp"
#include "formulary/util/StringUtils.hpp"
#include <algorithm>

namespace Formulary {

std::string FormulaParser::normalize(const std::string& text) {
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.empty()) return "";

    if (trimmed.front() == '<') trimmed.erase(0, 1);
    if (!trimmed.empty() && trimmed.back() == '>') trimmed.pop_back();

    // Whitespace runs and repeated '+' both become a single '+'
    std::string normalized;
    normalized.reserve(trimmed.size());
    std::size_t pos = 0;
    while (pos < trimmed.size()) {
        std::size_t length = 1;
        unsigned int cp = StringUtils::decodeCodePoint(trimmed, pos, length);
        if (cp == '+' || StringUtils::isWhitespace(cp)) {
            if (normalized.empty() || normalized.back() != '+') {
                normalized.push_back('+');
            }
        } else {
            normalized.append(trimmed, pos, length);
        }
        pos += length;
    }

    if (!normalized.empty() && normalized.front() == '+') normalized.erase(0, 1);
    if (!normalized.empty() && normalized.back() == '+') normalized.pop_back();
    return normalized;
}

std::vector<FormulaToken> FormulaParser::tokenize(const std::string& normalized) {
    std::vector<FormulaToken> tokens;
    for (const auto& segment : StringUtils::splitTrimmed(normalized, '+')) {
        auto [searchName, multiplier] = StringUtils::splitMultiplier(segment);
        tokens.push_back({searchName, multiplier});
    }
    return tokens;
}

MatchResult FormulaParser::match(const FormulaToken& token,
                                 const std::vector<ResolvedTemplate>& templates) {
    MatchResult result;
    result.searchName = token.searchName;
    result.multiplier = token.multiplier;

    // 1. Exact name or alias, first catalog hit
    for (const auto& tmpl : templates) {
        if (hasNameOrAlias(tmpl, token.searchName)) {
            result.kind = MatchResult::Kind::Matched;
            result.tmpl = &tmpl;
            return result;
        }
    }

    std::vector<const ResolvedTemplate*> candidates;
    auto addCandidate = [&candidates](const ResolvedTemplate* tmpl) {
        if (std::find(candidates.begin(), candidates.end(), tmpl) == candidates.end()) {
            candidates.push_back(tmpl);
        }
    };

    // 2. Suffix variants, first hit per suffix
    for (int s = 0; s < Constants::kNumFormulaSuffixes; ++s) {
        const std::string withSuffix = token.searchName + Constants::kFormulaSuffixes[s];
        for (const auto& tmpl : templates) {
            if (hasNameOrAlias(tmpl, withSuffix)) {
                addCandidate(&tmpl);
                break;
            }
        }
    }

    // 3. Prefix search, only when no suffix variant exists
    if (candidates.empty()) {
        for (const auto& tmpl : templates) {
            if (hasNameOrAliasPrefix(tmpl, token.searchName)) {
                addCandidate(&tmpl);
            }
        }
    }

    if (candidates.size() == 1) {
        result.kind = MatchResult::Kind::Matched;
        result.tmpl = candidates.front();
    } else if (candidates.size() > 1) {
        result.kind = MatchResult::Kind::Ambiguous;
        for (const auto* tmpl : candidates) {
            result.candidates.push_back(tmpl->name);
        }
    } else {
        result.kind = MatchResult::Kind::NotFound;
    }
    return result;
}

ParseResult FormulaParser::parse(const std::string& text,
                                 const std::vector<ResolvedTemplate>& templates) {
    ParseResult result;

    const std::string normalized = normalize(text);
    if (normalized.empty()) {
        return result;
    }

    std::vector<TemplateMatch> found;
    std::vector<AmbiguousMatch> ambiguous;
    std::vector<std::string> notFound;

    // Scan every token before deciding, errors are reported in one batch
    for (const auto& token : tokenize(normalized)) {
        MatchResult m = match(token, templates);
        switch (m.kind) {
            case MatchResult::Kind::Matched:
                found.push_back({m.tmpl, m.multiplier});
                break;
            case MatchResult::Kind::Ambiguous:
                ambiguous.push_back({m.searchName, m.candidates});
                break;
            case MatchResult::Kind::NotFound:
                notFound.push_back(m.searchName);
                break;
        }
    }

    // Ambiguity takes priority over missing names
    if (!ambiguous.empty()) {
        result.error.code = ErrorCode::kAmbiguousFormula;
        result.error.message = formatAmbiguous(ambiguous);
        result.error.ambiguous = std::move(ambiguous);
        return result;
    }

    if (!notFound.empty()) {
        result.error.code = ErrorCode::kFormulaNotFound;
        result.error.message = formatNotFound(notFound);
        result.error.notFound = std::move(notFound);
        return result;
    }

    result.merged = HerbMerger::merge(found);
    return result;
}

bool FormulaParser::hasNameOrAlias(const ResolvedTemplate& tmpl, const std::string& name) {
    return tmpl.name == name || (!tmpl.alias.empty() && tmpl.alias == name);
}

bool FormulaParser::hasNameOrAliasPrefix(const ResolvedTemplate& tmpl, const std::string& prefix) {
    return StringUtils::startsWith(tmpl.name, prefix) ||
           (!tmpl.alias.empty() && StringUtils::startsWith(tmpl.alias, prefix));
}

std::string FormulaParser::formatAmbiguous(const std::vector<AmbiguousMatch>& ambiguous) {
    std::string message = "Multiple formulas matched - enter an exact name:";
    for (const auto& entry : ambiguous) {
        message += "\n\"" + entry.searchName + "\": ";
        for (std::size_t i = 0; i < entry.candidates.size(); ++i) {
            if (i > 0) message += ", ";
            message += entry.candidates[i];
        }
    }
    return message;
}

std::string FormulaParser::formatNotFound(const std::vector<std::string>& notFound) {
    std::string message = "Formula not found: ";
    for (std::size_t i = 0; i < notFound.size(); ++i) {
        if (i > 0) message += ", ";
        message += notFound[i];
    }
    return message;
}

} // namespace Formulary
