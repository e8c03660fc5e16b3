/// @file CompositionResolver.hpp
/// @brief Expands stored formula compositions into flat herb lists
/// @details Two composition forms are accepted:
/// - combination: "소시호*0.5+반하사심" references other definitions by
///   name or alias, each with an optional multiplier, resolved recursively
/// - leaf: "시호:12/황금:6/반하:8" lists herbs with grams per dose
///
/// The form is chosen by the presence of '+'. Resolution never fails:
/// cyclic and unknown references are dropped and reported as warnings so a
/// single malformed definition cannot block the rest of the catalog.

#pragma once

#include "../context/Catalog.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Formulary {

/// Herbs of one composition together with the references that were dropped
struct ResolveResult {
    std::vector<ResolvedHerb> herbs;
    std::vector<ResolveWarning> warnings;
};

class CompositionResolver {
public:
    /// Resolve one composition expression
    /// @param catalog Catalog supplying referenced definitions
    /// @param composition Raw composition text
    /// @param multiplier Scale applied to every herb dosage
    /// @param visited References already on the expansion path (ancestors only)
    /// @return Herbs plus warnings for skipped references
    static ResolveResult resolve(const Catalog& catalog,
                                 const std::string& composition,
                                 double multiplier = 1.0,
                                 const std::set<std::string>& visited = {});

    /// Resolve every definition of the catalog, in catalog order
    /// @param catalog Catalog to read definitions from
    /// @param warnings Optional output: warnings keyed by template name
    /// @return One template per definition
    static std::vector<ResolvedTemplate> buildTemplates(
        const Catalog& catalog,
        std::map<std::string, std::vector<ResolveWarning>>* warnings = nullptr);

private:
    /// "+" form: recursive expansion with max-wins merge
    static ResolveResult resolveCombination(const Catalog& catalog,
                                            const std::string& composition,
                                            double multiplier,
                                            const std::set<std::string>& visited);

    /// "/" form: herb:dosage list, no de-duplication
    static ResolveResult resolveLeaf(const std::string& composition, double multiplier);
};

} // namespace Formulary
