/// @file Catalog.hpp
/// @brief Herb and formula-definition catalog with its resolved templates
/// @details The catalog is an owned snapshot. It is rebuilt wholesale when
/// the underlying definitions change and is never mutated in place while a
/// formula is being parsed or calculated.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace Formulary {

/// Herb reference record (herbs table)
struct HerbRecord {
    int id = 0;
    std::string name;
    std::string unit = "g";
};

/// Stored formula definition (prescription_definitions table)
/// @details composition is either "name+name*0.5" (combination of other
/// definitions) or "herb:dosage/herb:dosage" (leaf herb list).
struct FormulaDefinition {
    int id = 0;
    std::string name;
    std::string alias;
    std::string category;
    std::string source;
    std::string composition;
    std::string description;
};

/// One herb of a resolved template, grams per single dose
struct ResolvedHerb {
    std::string herbName;
    double dosage = 0.0;
    std::string unit = "g";
};

/// Definition expanded into a flat herb list
struct ResolvedTemplate {
    int id = 0;
    std::string name;
    std::string alias;
    std::vector<ResolvedHerb> herbs;
    std::string description;
};

/// Reference dropped while resolving a combination composition
struct ResolveWarning {
    enum class Kind {
        CyclicReference,     ///< Reference already on the expansion path
        UnresolvedReference  ///< No definition with that name or alias
    };

    Kind kind = Kind::UnresolvedReference;
    std::string reference;

    bool operator==(const ResolveWarning& other) const {
        return kind == other.kind && reference == other.reference;
    }
};

/// Human-readable form of a resolve warning
std::string describeWarning(const ResolveWarning& warning);

/// Catalog of herbs, definitions and resolved templates
struct Catalog {
    std::vector<HerbRecord> herbs;                 ///< Herb table, catalog order
    std::vector<FormulaDefinition> definitions;    ///< Definition table, catalog order
    std::vector<ResolvedTemplate> templates;       ///< One per definition, same order

    /// Warnings per template name (only templates with warnings appear)
    std::map<std::string, std::vector<ResolveWarning>> resolveWarnings;

    /// Replace the herb table
    void setHerbs(std::vector<HerbRecord> records);

    /// Replace the definition table (templates must be rebuilt afterwards)
    void setDefinitions(std::vector<FormulaDefinition> defs);

    /// Find a definition by exact name, then by exact alias
    /// @return Pointer into definitions, nullptr if not found
    const FormulaDefinition* findDefinition(const std::string& nameOrAlias) const;

    /// Look up a herb id by exact name
    /// @return Herb id, or -1 if the herb is unknown
    int getHerbId(const std::string& herbName) const;

    /// True once templates have been built from a non-empty definition table
    bool isLoaded() const { return !templates.empty(); }

    /// Drop the resolved templates and warnings, keep the tables
    void reset();

    /// Drop everything
    void clear();

private:
    std::map<std::string, std::size_t> definitionByName_;
    std::map<std::string, std::size_t> definitionByAlias_;
    std::map<std::string, int> herbIdByName_;
};

} // namespace Formulary
