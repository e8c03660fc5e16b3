/// @file DosageCalculator.hpp
/// @brief Batch quantities from the merged per-dose herb list
/// @details Pipeline: per-dose weight -> batch amounts (rounded to whole
/// grams) -> manual adjustments -> herb ids and ordering -> pack count and
/// decoction water volume. All functions are total: malformed adjustment
/// text simply yields no adjustments.

#pragma once

#include "../context/PrescriptionIO.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace Formulary {

/// Herb name -> herb id lookup; a non-positive result means unknown
using HerbIdLookup = std::function<int(const std::string&)>;

/// Final herb list and quantities of one batch
struct FinalResult {
    std::vector<FinalHerb> finalHerbs;
    Quantities quantities;
};

class DosageCalculator {
public:
    /// Sum of per-dose dosages
    static double totalPerDoseWeight(const std::vector<MergedHerb>& merged);

    /// Recommended number of doses for a per-dose weight above the target
    /// @param totalPerDoseWeight Sum of merged dosages [g]
    /// @param days Treatment days
    /// @return (doses rounded to one decimal, true), or (0, false) when the
    /// weight does not exceed the target
    static std::pair<double, bool> recommendDoses(double totalPerDoseWeight, int days);

    /// Parse "+감초3 -대추2.5 생강4" style adjustments, in order of appearance
    /// @details Each match is [+-]? followed by Hangul syllables followed by
    /// digits with an optional fraction. No sign means add.
    static std::vector<HerbAdjustment> parseAdjustments(const std::string& text);

    /// Whole-batch amounts before adjustments, round(dosage * totalDoses)
    static std::vector<std::pair<std::string, double>> batchAmounts(
        const std::vector<MergedHerb>& merged, double totalDoses);

    /// Apply adjustments in order to name/amount pairs
    /// @details Adding to an unknown herb introduces it. Subtracting to zero
    /// or below removes the herb.
    static void applyAdjustments(std::vector<std::pair<std::string, double>>& amounts,
                                 const std::vector<HerbAdjustment>& adjustments);

    /// Water for decoction, round(weight * 1.2 + packVolume * (packs + 1) + 300)
    static int waterVolumeMl(double totalBatchWeight, int packVolumeMl, int totalPacks);

    /// Full final computation
    /// @param merged Merged per-dose herbs
    /// @param dosing Batch parameters
    /// @param adjustmentText Free-text herb adjustments
    /// @param herbIdLookup Herb id lookup, unknown herbs get kUnknownHerbId
    static FinalResult computeFinal(const std::vector<MergedHerb>& merged,
                                    const DosingParameters& dosing,
                                    const std::string& adjustmentText,
                                    const HerbIdLookup& herbIdLookup);
};

} // namespace Formulary
