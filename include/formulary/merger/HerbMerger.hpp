#pragma once

#include "../context/Catalog.hpp"
#include "../context/PrescriptionIO.hpp"
#include <vector>

namespace Formulary {

/// Template selected by the formula parser with its token multiplier
struct TemplateMatch {
    const ResolvedTemplate* tmpl = nullptr;
    double multiplier = 1.0;
};

/// Combines the herbs of all matched templates into one per-dose list
class HerbMerger {
public:
    /// Merge matched templates
    /// @details Each herb dosage is scaled by its template's multiplier.
    /// Herbs shared by several templates keep the largest scaled dosage
    /// (the first one seen on ties). Output is sorted by dosage descending,
    /// equal dosages in first-occurrence order.
    static std::vector<MergedHerb> merge(const std::vector<TemplateMatch>& matches);
};

} // namespace Formulary
