/// @file DefinitionSearch.hpp
/// @brief Catalog browsing helpers for the definition list and template picker

#pragma once

#include "../context/Catalog.hpp"
#include <map>
#include <string>
#include <vector>

namespace Formulary {

/// One display row of a composition preview
struct CompositionEntry {
    std::string name;
    std::string dosageText;     ///< Empty for combination entries
};

class DefinitionSearch {
public:
    /// Category value meaning "no category filter"
    static constexpr const char* kAllCategories = "all";

    /// Effective category: category, else source, else the default category
    static std::string effectiveCategory(const FormulaDefinition& def);

    /// Filter definitions by search term and category
    /// @param defs Definitions in catalog order
    /// @param searchTerm Keywords separated by whitespace or commas. One
    /// keyword matches name, alias or composition; several keywords must all
    /// appear in the composition. Comparison ignores ASCII case.
    /// @param category Effective category to keep, or kAllCategories
    /// @return Matching definitions, catalog order preserved
    static std::vector<const FormulaDefinition*> filterDefinitions(
        const std::vector<FormulaDefinition>& defs,
        const std::string& searchTerm,
        const std::string& category = kAllCategories);

    /// Count definitions per effective category, plus kAllCategories
    static std::map<std::string, int> categoryStats(const std::vector<FormulaDefinition>& defs);

    /// Category and source values not present in knownCategories, sorted
    static std::vector<std::string> extraCategories(const std::vector<FormulaDefinition>& defs,
                                                    const std::vector<std::string>& knownCategories);

    /// Templates whose name or alias contains term
    /// @details Terms shorter than kMinTemplateSearchLength characters
    /// return nothing.
    static std::vector<const ResolvedTemplate*> searchTemplates(
        const std::vector<ResolvedTemplate>& templates, const std::string& term);

    /// Append a template to formula text, alias preferred over name
    static std::string appendTemplateToFormula(const std::string& formula,
                                               const ResolvedTemplate& tmpl);

    /// Split a composition into display rows
    /// @details Without any ':' the '/'-separated names are listed with an
    /// empty dosage; otherwise each "name:dosage" becomes one row and rows
    /// with an empty name are dropped.
    static std::vector<CompositionEntry> previewComposition(const std::string& composition);

private:
    /// Split a search term on whitespace and commas, lower-cased
    static std::vector<std::string> splitKeywords(const std::string& searchTerm);
};

} // namespace Formulary
