#include "formulary/context/PrescriptionIO.hpp"

namespace Formulary {

void PrescriptionIO::resetOutputs() {
    INFO = 0;
    errorMessage.clear();
    parseError = ParseError{};
    mergedHerbs.clear();
    finalHerbs.clear();
    quantities = Quantities{};
}

void PrescriptionIO::reset() {
    formulaText.clear();
    dosing = DosingParameters{};
    herbAdjustment.clear();
    notes.clear();
    patientName.clear();
    iPrintResultsMode = 0;

    resetOutputs();
}

} // namespace Formulary
