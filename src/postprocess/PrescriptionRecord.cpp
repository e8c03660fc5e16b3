#include "formulary/postprocess/PrescriptionRecord.hpp"
#include "formulary/util/ErrorCodes.hpp"
#include "formulary/util/StringUtils.hpp"
#include <cmath>
#include <iomanip>

namespace Formulary {

PrescriptionRecord buildRecord(const FormularyContext& ctx) {
    const auto& io = *ctx.io;

    PrescriptionRecord record;
    record.formula = io.formulaText;
    record.mergedHerbs = io.mergedHerbs;
    record.finalHerbs = io.finalHerbs;
    record.dosing = io.dosing;
    record.totalPacks = io.quantities.totalPacks;
    record.herbAdjustment = io.herbAdjustment;
    record.notes = io.notes;
    record.patientName = io.patientName;
    record.totalPerDoseWeight = io.quantities.totalPerDoseWeight;
    record.finalTotalAmount = io.quantities.totalBatchWeight;
    record.waterVolumeMl = io.quantities.waterVolumeMl;
    return record;
}

int validateRecord(const PrescriptionRecord& record) {
    if (StringUtils::trim(record.formula).empty()) {
        return ErrorCode::kEmptyFormula;
    }
    if (record.mergedHerbs.empty()) {
        return ErrorCode::kNoHerbsResolved;
    }
    return ErrorCode::kSuccess;
}

double adjustmentDelta(const FinalHerb& finalHerb,
                       const std::vector<MergedHerb>& merged,
                       double totalDoses) {
    double original = 0.0;
    for (const auto& herb : merged) {
        if (herb.herbName == finalHerb.herbName) {
            original = std::round(herb.dosage * totalDoses);
            break;
        }
    }
    return finalHerb.amount - original;
}

void printRecord(const PrescriptionRecord& record, std::ostream& out) {
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();

    out << "\n";
    out << "========================================\n";
    out << "          PRESCRIPTION\n";
    out << "========================================\n";

    if (!record.patientName.empty()) {
        out << "  Patient: " << record.patientName << "\n";
    }
    out << "  Formula: " << record.formula << "\n";

    out << "\nPer-dose herbs:\n";
    for (const auto& herb : record.mergedHerbs) {
        out << "  " << std::setw(20) << std::left << herb.herbName
            << ": " << std::fixed << std::setprecision(2) << herb.dosage << " g\n";
    }
    out << "  Total per dose: " << std::fixed << std::setprecision(2)
        << record.totalPerDoseWeight << " g\n";

    out << "\nBatch (" << std::setprecision(1) << record.dosing.totalDoses << " doses):\n";
    for (const auto& herb : record.finalHerbs) {
        out << "  " << std::setw(20) << std::left << herb.herbName
            << ": " << std::fixed << std::setprecision(1) << herb.amount << " g";
        double delta = adjustmentDelta(herb, record.mergedHerbs, record.dosing.totalDoses);
        if (delta != 0.0) {
            out << " (" << (delta > 0.0 ? "+" : "") << std::setprecision(1) << delta << ")";
        }
        out << "\n";
    }
    out << "  Total: " << std::fixed << std::setprecision(1) << record.finalTotalAmount << " g\n";

    if (!record.herbAdjustment.empty()) {
        out << "  Adjustment: " << record.herbAdjustment << "\n";
    }

    out << "\nDays: " << record.dosing.days
        << ", doses per day: " << record.dosing.dosesPerDay
        << ", packs: " << record.totalPacks
        << " x " << record.dosing.packVolumeMl << " mL\n";
    out << "Water: " << record.waterVolumeMl << " mL\n";

    if (!record.notes.empty()) {
        out << "Notes: " << record.notes << "\n";
    }

    out << "\n========================================\n\n";

    out.flags(flags);
    out.precision(precision);
}

} // namespace Formulary
