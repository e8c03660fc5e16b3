#include "formulary/calculator/DosageCalculator.hpp"
#include "formulary/util/Constants.hpp"
#include "formulary/util/StringUtils.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <tuple>

namespace Formulary {

namespace {

Eigen::VectorXd dosageVector(const std::vector<MergedHerb>& merged) {
    Eigen::VectorXd dosages(static_cast<Eigen::Index>(merged.size()));
    for (std::size_t i = 0; i < merged.size(); ++i) {
        dosages(static_cast<Eigen::Index>(i)) = merged[i].dosage;
    }
    return dosages;
}

bool isDigitAt(const std::string& text, std::size_t pos) {
    return pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]));
}

/// Try to match one adjustment starting at pos
/// @param end Output: byte offset just past the match
bool matchAdjustmentAt(const std::string& text, std::size_t pos,
                       HerbAdjustment& adjustment, std::size_t& end) {
    std::size_t i = pos;
    bool isAdd = true;
    if (text[i] == '+' || text[i] == '-') {
        isAdd = text[i] == '+';
        ++i;
    }

    const std::size_t nameStart = i;
    while (i < text.size()) {
        std::size_t length = 1;
        unsigned int cp = StringUtils::decodeCodePoint(text, i, length);
        if (!StringUtils::isHangulSyllable(cp)) break;
        i += length;
    }
    if (i == nameStart) return false;
    const std::size_t nameEnd = i;

    if (!isDigitAt(text, i)) return false;
    while (isDigitAt(text, i)) ++i;
    if (i < text.size() && text[i] == '.' && isDigitAt(text, i + 1)) {
        ++i;
        while (isDigitAt(text, i)) ++i;
    }

    adjustment.herbName = text.substr(nameStart, nameEnd - nameStart);
    adjustment.amount = std::strtod(text.substr(nameEnd, i - nameEnd).c_str(), nullptr);
    adjustment.isAdd = isAdd;
    end = i;
    return true;
}

} // namespace

double DosageCalculator::totalPerDoseWeight(const std::vector<MergedHerb>& merged) {
    if (merged.empty()) return 0.0;
    return dosageVector(merged).sum();
}

std::pair<double, bool> DosageCalculator::recommendDoses(double totalPerDoseWeight, int days) {
    if (totalPerDoseWeight > Constants::kTargetDosagePerDose) {
        double doses = days * Constants::kTargetDosagePerDose / totalPerDoseWeight;
        return {std::round(doses * 10.0) / 10.0, true};
    }
    return {0.0, false};
}

std::vector<HerbAdjustment> DosageCalculator::parseAdjustments(const std::string& text) {
    std::vector<HerbAdjustment> adjustments;
    if (StringUtils::trim(text).empty()) return adjustments;

    std::size_t pos = 0;
    while (pos < text.size()) {
        HerbAdjustment adjustment;
        std::size_t end = pos;
        if (matchAdjustmentAt(text, pos, adjustment, end)) {
            adjustments.push_back(std::move(adjustment));
            pos = end;
        } else {
            // Advance one code point and retry
            std::size_t length = 1;
            StringUtils::decodeCodePoint(text, pos, length);
            pos += length;
        }
    }
    return adjustments;
}

std::vector<std::pair<std::string, double>> DosageCalculator::batchAmounts(
    const std::vector<MergedHerb>& merged, double totalDoses) {

    std::vector<std::pair<std::string, double>> amounts;
    if (merged.empty()) return amounts;

    // Whole grams, halves rounded away from zero
    Eigen::VectorXd batch = (dosageVector(merged) * totalDoses).array().round().matrix();

    amounts.reserve(merged.size());
    for (std::size_t i = 0; i < merged.size(); ++i) {
        const std::string& name = merged[i].herbName;
        const double amount = batch(static_cast<Eigen::Index>(i));

        auto it = std::find_if(amounts.begin(), amounts.end(),
                               [&name](const std::pair<std::string, double>& entry) {
                                   return entry.first == name;
                               });
        if (it == amounts.end()) {
            amounts.emplace_back(name, amount);
        } else {
            it->second = amount;
        }
    }
    return amounts;
}

void DosageCalculator::applyAdjustments(std::vector<std::pair<std::string, double>>& amounts,
                                        const std::vector<HerbAdjustment>& adjustments) {
    for (const auto& adj : adjustments) {
        auto it = std::find_if(amounts.begin(), amounts.end(),
                               [&adj](const std::pair<std::string, double>& entry) {
                                   return entry.first == adj.herbName;
                               });
        const double current = (it != amounts.end()) ? it->second : 0.0;

        if (adj.isAdd) {
            if (it != amounts.end()) {
                it->second = current + adj.amount;
            } else {
                amounts.emplace_back(adj.herbName, adj.amount);
            }
            continue;
        }

        const double newAmount = current - adj.amount;
        if (newAmount <= 0.0) {
            if (it != amounts.end()) amounts.erase(it);
        } else {
            it->second = newAmount;
        }
    }
}

int DosageCalculator::waterVolumeMl(double totalBatchWeight, int packVolumeMl, int totalPacks) {
    double water = totalBatchWeight * Constants::kWaterAbsorptionFactor
                 + static_cast<double>(packVolumeMl) * (totalPacks + Constants::kExtraPackVolumes)
                 + Constants::kWaterConstantMl;
    return static_cast<int>(std::lround(water));
}

FinalResult DosageCalculator::computeFinal(const std::vector<MergedHerb>& merged,
                                           const DosingParameters& dosing,
                                           const std::string& adjustmentText,
                                           const HerbIdLookup& herbIdLookup) {
    FinalResult result;
    Quantities& q = result.quantities;

    q.totalPerDoseWeight = totalPerDoseWeight(merged);
    std::tie(q.recommendedDoses, q.hasRecommendedDoses) =
        recommendDoses(q.totalPerDoseWeight, dosing.days);

    auto amounts = batchAmounts(merged, dosing.totalDoses);
    applyAdjustments(amounts, parseAdjustments(adjustmentText));

    result.finalHerbs.reserve(amounts.size());
    for (const auto& entry : amounts) {
        FinalHerb herb;
        int id = herbIdLookup ? herbIdLookup(entry.first) : 0;
        herb.herbId = id > 0 ? id : Constants::kUnknownHerbId;
        herb.herbName = entry.first;
        herb.amount = entry.second;
        result.finalHerbs.push_back(std::move(herb));
    }

    // Catalog order by herb id, ad hoc herbs last
    std::stable_sort(result.finalHerbs.begin(), result.finalHerbs.end(),
                     [](const FinalHerb& a, const FinalHerb& b) {
                         return a.herbId < b.herbId;
                     });

    Eigen::VectorXd finalAmounts(static_cast<Eigen::Index>(result.finalHerbs.size()));
    for (std::size_t i = 0; i < result.finalHerbs.size(); ++i) {
        finalAmounts(static_cast<Eigen::Index>(i)) = result.finalHerbs[i].amount;
    }
    q.totalBatchWeight = result.finalHerbs.empty() ? 0.0 : finalAmounts.sum();

    q.totalPacks = dosing.days * dosing.dosesPerDay;
    q.waterVolumeMl = waterVolumeMl(q.totalBatchWeight, dosing.packVolumeMl, q.totalPacks);

    return result;
}

} // namespace Formulary
