#include "formulary/merger/HerbMerger.hpp"
#include <algorithm>
#include <map>

namespace Formulary {

std::vector<MergedHerb> HerbMerger::merge(const std::vector<TemplateMatch>& matches) {
    std::vector<MergedHerb> merged;
    std::map<std::string, std::size_t> index;

    for (const auto& match : matches) {
        if (match.tmpl == nullptr) continue;

        for (const auto& herb : match.tmpl->herbs) {
            double scaled = herb.dosage * match.multiplier;

            auto it = index.find(herb.herbName);
            if (it == index.end()) {
                index.emplace(herb.herbName, merged.size());
                merged.push_back({herb.herbName, scaled});
            } else if (merged[it->second].dosage < scaled) {
                // Strongest dose wins, never summed
                merged[it->second].dosage = scaled;
            }
        }
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const MergedHerb& a, const MergedHerb& b) {
                         return a.dosage > b.dosage;
                     });
    return merged;
}

} // namespace Formulary
