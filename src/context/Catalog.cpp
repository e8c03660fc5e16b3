#include "formulary/context/Catalog.hpp"

namespace Formulary {

std::string describeWarning(const ResolveWarning& warning) {
    switch (warning.kind) {
        case ResolveWarning::Kind::CyclicReference:
            return "cyclic reference skipped: " + warning.reference;
        case ResolveWarning::Kind::UnresolvedReference:
            return "unresolved reference: " + warning.reference;
    }
    return warning.reference;
}

void Catalog::setHerbs(std::vector<HerbRecord> records) {
    herbs = std::move(records);

    herbIdByName_.clear();
    for (const auto& herb : herbs) {
        // First record wins for duplicate names
        herbIdByName_.emplace(herb.name, herb.id);
    }
}

void Catalog::setDefinitions(std::vector<FormulaDefinition> defs) {
    definitions = std::move(defs);
    reset();

    // Earliest definition wins within each index
    definitionByName_.clear();
    definitionByAlias_.clear();
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        definitionByName_.emplace(definitions[i].name, i);
        if (!definitions[i].alias.empty()) {
            definitionByAlias_.emplace(definitions[i].alias, i);
        }
    }
}

const FormulaDefinition* Catalog::findDefinition(const std::string& nameOrAlias) const {
    auto it = definitionByName_.find(nameOrAlias);
    if (it != definitionByName_.end()) {
        return &definitions[it->second];
    }
    it = definitionByAlias_.find(nameOrAlias);
    if (it != definitionByAlias_.end()) {
        return &definitions[it->second];
    }
    return nullptr;
}

int Catalog::getHerbId(const std::string& herbName) const {
    auto it = herbIdByName_.find(herbName);
    if (it != herbIdByName_.end()) {
        return it->second;
    }
    return -1;
}

void Catalog::reset() {
    templates.clear();
    resolveWarnings.clear();
}

void Catalog::clear() {
    reset();
    herbs.clear();
    definitions.clear();
    definitionByName_.clear();
    definitionByAlias_.clear();
    herbIdByName_.clear();
}

} // namespace Formulary
