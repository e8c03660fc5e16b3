#include "formulary/resolver/CompositionResolver.hpp"
#include "formulary/util/StringUtils.hpp"
#include <algorithm>

namespace Formulary {

ResolveResult CompositionResolver::resolve(const Catalog& catalog,
                                           const std::string& composition,
                                           double multiplier,
                                           const std::set<std::string>& visited) {
    if (composition.empty()) {
        return {};
    }

    if (composition.find('+') != std::string::npos) {
        return resolveCombination(catalog, composition, multiplier, visited);
    }
    return resolveLeaf(composition, multiplier);
}

std::vector<ResolvedTemplate> CompositionResolver::buildTemplates(
    const Catalog& catalog,
    std::map<std::string, std::vector<ResolveWarning>>* warnings) {

    std::vector<ResolvedTemplate> templates;
    templates.reserve(catalog.definitions.size());

    for (const auto& def : catalog.definitions) {
        ResolveResult result = resolve(catalog, def.composition);

        ResolvedTemplate tmpl;
        tmpl.id = def.id;
        tmpl.name = def.name;
        tmpl.alias = def.alias;
        tmpl.herbs = std::move(result.herbs);
        tmpl.description = def.description;
        templates.push_back(std::move(tmpl));

        if (warnings && !result.warnings.empty()) {
            auto& list = (*warnings)[def.name];
            list.insert(list.end(), result.warnings.begin(), result.warnings.end());
        }
    }

    return templates;
}

ResolveResult CompositionResolver::resolveCombination(const Catalog& catalog,
                                                      const std::string& composition,
                                                      double multiplier,
                                                      const std::set<std::string>& visited) {
    ResolveResult result;

    // Herb name -> index into result.herbs, keeps first-occurrence order
    std::map<std::string, std::size_t> herbIndex;

    for (const auto& segment : StringUtils::splitTrimmed(composition, '+')) {
        auto [referenceName, localMultiplier] = StringUtils::splitMultiplier(segment);

        // Only ancestors are in visited, siblings may repeat a reference
        if (visited.count(referenceName) > 0) {
            result.warnings.push_back({ResolveWarning::Kind::CyclicReference, referenceName});
            continue;
        }

        const FormulaDefinition* def = catalog.findDefinition(referenceName);
        if (def == nullptr) {
            result.warnings.push_back({ResolveWarning::Kind::UnresolvedReference, referenceName});
            continue;
        }
        if (def->composition.empty()) {
            continue;
        }

        std::set<std::string> childVisited = visited;
        childVisited.insert(referenceName);

        ResolveResult child = resolve(catalog, def->composition,
                                      multiplier * localMultiplier, childVisited);

        for (auto& herb : child.herbs) {
            auto it = herbIndex.find(herb.herbName);
            if (it == herbIndex.end()) {
                // Merged dosages start from zero, negatives never survive
                herb.dosage = std::max(0.0, herb.dosage);
                herbIndex.emplace(herb.herbName, result.herbs.size());
                result.herbs.push_back(std::move(herb));
            } else {
                auto& existing = result.herbs[it->second];
                existing.dosage = std::max(existing.dosage, herb.dosage);
            }
        }
        result.warnings.insert(result.warnings.end(),
                               child.warnings.begin(), child.warnings.end());
    }

    return result;
}

ResolveResult CompositionResolver::resolveLeaf(const std::string& composition, double multiplier) {
    ResolveResult result;

    std::size_t start = 0;
    while (start <= composition.size()) {
        std::size_t end = composition.find('/', start);
        if (end == std::string::npos) end = composition.size();
        const std::string part = composition.substr(start, end - start);
        start = end + 1;

        auto colon = part.find(':');
        if (colon == std::string::npos) {
            continue;
        }

        std::string herbName = StringUtils::trim(part.substr(0, colon));

        // Dosage text ends at a second ':' if one is present
        std::string dosageText = part.substr(colon + 1);
        auto nextColon = dosageText.find(':');
        if (nextColon != std::string::npos) {
            dosageText = dosageText.substr(0, nextColon);
        }

        if (herbName.empty() || dosageText.empty()) {
            continue;
        }

        ResolvedHerb herb;
        herb.herbName = herbName;
        herb.dosage = StringUtils::parseLeadingNumber(dosageText) * multiplier;
        result.herbs.push_back(std::move(herb));
    }

    return result;
}

} // namespace Formulary
