#include "formulary/search/DefinitionSearch.hpp"
#include "formulary/util/Constants.hpp"
#include "formulary/util/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace Formulary {

std::string DefinitionSearch::effectiveCategory(const FormulaDefinition& def) {
    if (!def.category.empty()) return def.category;
    if (!def.source.empty()) return def.source;
    return Constants::kDefaultCategory;
}

std::vector<const FormulaDefinition*> DefinitionSearch::filterDefinitions(
    const std::vector<FormulaDefinition>& defs,
    const std::string& searchTerm,
    const std::string& category) {

    const std::vector<std::string> keywords = splitKeywords(searchTerm);
    std::vector<const FormulaDefinition*> filtered;

    for (const auto& def : defs) {
        if (category != kAllCategories && effectiveCategory(def) != category) {
            continue;
        }

        const std::string composition = StringUtils::toLower(def.composition);
        bool keep = true;
        if (keywords.size() == 1) {
            const std::string& keyword = keywords.front();
            keep = StringUtils::contains(StringUtils::toLower(def.name), keyword) ||
                   StringUtils::contains(StringUtils::toLower(def.alias), keyword) ||
                   StringUtils::contains(composition, keyword);
        } else if (keywords.size() > 1) {
            // Several keywords search herbs: all must be in the composition
            keep = std::all_of(keywords.begin(), keywords.end(),
                               [&composition](const std::string& keyword) {
                                   return StringUtils::contains(composition, keyword);
                               });
        }

        if (keep) {
            filtered.push_back(&def);
        }
    }
    return filtered;
}

std::map<std::string, int> DefinitionSearch::categoryStats(const std::vector<FormulaDefinition>& defs) {
    std::map<std::string, int> stats;
    stats[kAllCategories] = static_cast<int>(defs.size());
    for (const auto& def : defs) {
        ++stats[effectiveCategory(def)];
    }
    return stats;
}

std::vector<std::string> DefinitionSearch::extraCategories(const std::vector<FormulaDefinition>& defs,
                                                           const std::vector<std::string>& knownCategories) {
    const std::set<std::string> known(knownCategories.begin(), knownCategories.end());
    std::set<std::string> extra;
    for (const auto& def : defs) {
        if (!def.category.empty() && known.count(def.category) == 0) {
            extra.insert(def.category);
        }
        if (!def.source.empty() && known.count(def.source) == 0) {
            extra.insert(def.source);
        }
    }
    return {extra.begin(), extra.end()};
}

std::vector<const ResolvedTemplate*> DefinitionSearch::searchTemplates(
    const std::vector<ResolvedTemplate>& templates, const std::string& term) {

    std::vector<const ResolvedTemplate*> found;
    if (StringUtils::codePointLength(term) < static_cast<std::size_t>(Constants::kMinTemplateSearchLength)) {
        return found;
    }

    for (const auto& tmpl : templates) {
        if (StringUtils::contains(tmpl.name, term) ||
            (!tmpl.alias.empty() && StringUtils::contains(tmpl.alias, term))) {
            found.push_back(&tmpl);
        }
    }
    return found;
}

std::string DefinitionSearch::appendTemplateToFormula(const std::string& formula,
                                                      const ResolvedTemplate& tmpl) {
    const std::string& name = tmpl.alias.empty() ? tmpl.name : tmpl.alias;
    const std::string trimmed = StringUtils::trim(formula);
    if (trimmed.empty()) {
        return name;
    }
    return trimmed + " " + name;
}

std::vector<CompositionEntry> DefinitionSearch::previewComposition(const std::string& composition) {
    std::vector<CompositionEntry> entries;
    if (composition.empty()) return entries;

    const bool hasDosages = composition.find(':') != std::string::npos;

    std::size_t start = 0;
    while (start <= composition.size()) {
        std::size_t end = composition.find('/', start);
        if (end == std::string::npos) end = composition.size();
        const std::string item = composition.substr(start, end - start);
        start = end + 1;

        if (!hasDosages) {
            entries.push_back({StringUtils::trim(item), ""});
            continue;
        }

        CompositionEntry entry;
        auto colon = item.find(':');
        entry.name = StringUtils::trim(item.substr(0, colon));
        if (colon != std::string::npos) {
            std::string dosage = item.substr(colon + 1);
            entry.dosageText = StringUtils::trim(dosage.substr(0, dosage.find(':')));
        }
        if (!entry.name.empty()) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::vector<std::string> DefinitionSearch::splitKeywords(const std::string& searchTerm) {
    std::vector<std::string> keywords;
    std::string current;
    for (char c : searchTerm) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                keywords.push_back(StringUtils::toLower(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        keywords.push_back(StringUtils::toLower(current));
    }
    return keywords;
}

} // namespace Formulary
