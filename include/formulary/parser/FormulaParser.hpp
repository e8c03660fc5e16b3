/// @file FormulaParser.hpp
/// @brief Parses typed formula text and matches it against the template catalog
/// @details Input such as "<소시호*0.5 반하사심>" is normalized to
/// "소시호*0.5+반하사심", split into tokens, and each token is matched by
/// exact name/alias, then by suffix variant (탕, 산, 환, 음), then by prefix.
/// A parse either matches every token or fails as a whole.

#pragma once

#include "../context/Catalog.hpp"
#include "../context/PrescriptionIO.hpp"
#include "../merger/HerbMerger.hpp"
#include <string>
#include <vector>

namespace Formulary {

/// One '+'-delimited segment of the formula text
struct FormulaToken {
    std::string searchName;
    double multiplier = 1.0;
};

/// Outcome of matching one token
struct MatchResult {
    enum class Kind {
        Matched,
        Ambiguous,
        NotFound
    };

    Kind kind = Kind::NotFound;
    std::string searchName;
    const ResolvedTemplate* tmpl = nullptr;     ///< Set when Matched
    double multiplier = 1.0;
    std::vector<std::string> candidates;        ///< Template names when Ambiguous
};

/// Merged herbs, or the batched error that prevented merging
struct ParseResult {
    std::vector<MergedHerb> merged;
    ParseError error;

    bool ok() const { return error.code == 0; }
};

class FormulaParser {
public:
    /// Normalize typed text
    /// @details Trims, strips one leading '<' and one trailing '>', turns
    /// whitespace runs into '+', collapses repeated '+' and strips '+' at
    /// both ends.
    static std::string normalize(const std::string& text);

    /// Split normalized text into tokens with their multipliers
    static std::vector<FormulaToken> tokenize(const std::string& normalized);

    /// Match one token against the templates
    static MatchResult match(const FormulaToken& token,
                             const std::vector<ResolvedTemplate>& templates);

    /// Parse, match and merge a formula
    /// @param text Formula as typed by the user
    /// @param templates Resolved template catalog
    /// @return Merged herbs; empty with no error if the text is blank
    static ParseResult parse(const std::string& text,
                             const std::vector<ResolvedTemplate>& templates);

private:
    /// Exact name or alias equality (empty aliases never match)
    static bool hasNameOrAlias(const ResolvedTemplate& tmpl, const std::string& name);

    /// Name or alias begins with prefix
    static bool hasNameOrAliasPrefix(const ResolvedTemplate& tmpl, const std::string& prefix);

    /// "Multiple formulas matched ..." message for all ambiguous tokens
    static std::string formatAmbiguous(const std::vector<AmbiguousMatch>& ambiguous);

    /// "Formula not found: ..." message for all missing tokens
    static std::string formatNotFound(const std::vector<std::string>& notFound);
};

} // namespace Formulary
