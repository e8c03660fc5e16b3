#pragma once

#include "../util/Constants.hpp"
#include <string>
#include <vector>

namespace Formulary {

/// Herb of the merged per-dose list
struct MergedHerb {
    std::string herbName;
    double dosage = 0.0;                ///< g per dose
};

/// Manual herb adjustment parsed from free text ("+감초3 -대추2")
struct HerbAdjustment {
    std::string herbName;
    double amount = 0.0;                ///< g
    bool isAdd = true;
};

/// Herb of the dispensing list, amount for the whole batch
struct FinalHerb {
    int herbId = Constants::kUnknownHerbId;
    std::string herbName;
    double amount = 0.0;                ///< g
};

/// Caller supplied batch parameters
struct DosingParameters {
    double totalDoses = Constants::kDefaultTotalDoses;  ///< Doses brewed (may be fractional)
    int days = Constants::kDefaultDays;
    int dosesPerDay = Constants::kDefaultDosesPerDay;
    int packVolumeMl = Constants::kDefaultPackVolumeMl;
};

/// Derived batch quantities
struct Quantities {
    double totalPerDoseWeight = 0.0;    ///< Sum of merged dosages
    double totalBatchWeight = 0.0;      ///< Sum of final amounts
    int totalPacks = 0;
    int waterVolumeMl = 0;
    double recommendedDoses = 0.0;      ///< Valid only if hasRecommendedDoses
    bool hasRecommendedDoses = false;
};

/// One ambiguous formula token and its candidates
struct AmbiguousMatch {
    std::string searchName;
    std::vector<std::string> candidates;
};

/// Batched formula parse failure
struct ParseError {
    int code = 0;                       ///< ErrorCode value, 0 = no error
    std::string message;
    std::vector<AmbiguousMatch> ambiguous;
    std::vector<std::string> notFound;
};

/// Input/Output state
/// Bridge between the caller (UI, persistence) and the pipeline
struct PrescriptionIO {
    // Input variables
    std::string formulaText;            ///< Formula as typed ("소시호*0.5 반하사심")
    DosingParameters dosing;
    std::string herbAdjustment;         ///< Adjustment text ("+감초3 -대추2")
    std::string notes;
    std::string patientName;
    int iPrintResultsMode = 0;          ///< Print mode (0=silent, 1=warnings, 2=trace)

    // Output variables
    int INFO = 0;                       ///< Status/error code
    std::string errorMessage;           ///< Detailed message for INFO != 0
    ParseError parseError;
    std::vector<MergedHerb> mergedHerbs;
    std::vector<FinalHerb> finalHerbs;
    Quantities quantities;

    /// Clear outputs, keep inputs
    void resetOutputs();

    /// Restore default inputs and clear outputs
    void reset();
};

} // namespace Formulary
