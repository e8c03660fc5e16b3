/// @file PrescriptionRecord.hpp
/// @brief Prescription payload handed to the persistence layer

#pragma once

#include "../FormularyContext.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace Formulary {

/// Everything that is saved for one issued prescription
struct PrescriptionRecord {
    std::string formula;
    std::vector<MergedHerb> mergedHerbs;
    std::vector<FinalHerb> finalHerbs;
    DosingParameters dosing;
    int totalPacks = 0;
    std::string herbAdjustment;
    std::string notes;
    std::string patientName;
    double totalPerDoseWeight = 0.0;
    double finalTotalAmount = 0.0;
    int waterVolumeMl = 0;
};

/// Assemble a record from the context's current inputs and outputs
PrescriptionRecord buildRecord(const FormularyContext& ctx);

/// Check a record before saving
/// @return kSuccess, kEmptyFormula or kNoHerbsResolved
int validateRecord(const PrescriptionRecord& record);

/// Change of a final herb against its unadjusted batch amount
/// @details The unadjusted amount is round(dosage * totalDoses) of the
/// merged herb with the same name, or 0 for herbs added by adjustment.
double adjustmentDelta(const FinalHerb& finalHerb,
                       const std::vector<MergedHerb>& merged,
                       double totalDoses);

/// Write a human-readable prescription report
void printRecord(const PrescriptionRecord& record, std::ostream& out);

} // namespace Formulary
