/// @file PrescriptionSession.cpp
/// @brief Implementation of the prescription session API

#include "formulary/PrescriptionSession.hpp"
#include "formulary/Formulary.hpp"
#include "formulary/util/ErrorCodes.hpp"

namespace Formulary {

PrescriptionSession::PrescriptionSession() = default;

PrescriptionSession::~PrescriptionSession() = default;

PrescriptionSession::PrescriptionSession(PrescriptionSession&&) noexcept = default;

PrescriptionSession& PrescriptionSession::operator=(PrescriptionSession&&) noexcept = default;

// =========================================================================
// Catalog
// =========================================================================

void PrescriptionSession::loadCatalog(std::vector<HerbRecord> herbs,
                                      std::vector<FormulaDefinition> definitions) {
    ::Formulary::loadCatalog(context_, std::move(herbs), std::move(definitions));
    context_.resetPrescription();
}

const std::vector<ResolvedTemplate>& PrescriptionSession::getTemplates() const {
    return context_.catalog->templates;
}

int PrescriptionSession::getNumberTemplates() const {
    return static_cast<int>(context_.catalog->templates.size());
}

const std::map<std::string, std::vector<ResolveWarning>>& PrescriptionSession::getResolveWarnings() const {
    return context_.catalog->resolveWarnings;
}

std::vector<const ResolvedTemplate*> PrescriptionSession::searchTemplates(const std::string& term) const {
    return DefinitionSearch::searchTemplates(context_.catalog->templates, term);
}

void PrescriptionSession::addTemplateToFormula(const ResolvedTemplate& tmpl) {
    context_.io->formulaText =
        DefinitionSearch::appendTemplateToFormula(context_.io->formulaText, tmpl);
}

// =========================================================================
// Input Configuration
// =========================================================================

void PrescriptionSession::setFormula(const std::string& text) {
    ::Formulary::setFormula(context_, text);
}

const std::string& PrescriptionSession::getFormula() const {
    return context_.io->formulaText;
}

void PrescriptionSession::setDosing(const DosingParameters& dosing) {
    ::Formulary::setDosing(context_, dosing);
}

void PrescriptionSession::setTotalDoses(double totalDoses) {
    ::Formulary::setTotalDoses(context_, totalDoses);
}

void PrescriptionSession::setSchedule(int days, int dosesPerDay) {
    ::Formulary::setSchedule(context_, days, dosesPerDay);
}

void PrescriptionSession::setPackVolume(int packVolumeMl) {
    ::Formulary::setPackVolume(context_, packVolumeMl);
}

void PrescriptionSession::setHerbAdjustment(const std::string& text) {
    ::Formulary::setHerbAdjustment(context_, text);
}

void PrescriptionSession::setNotes(const std::string& notes) {
    context_.io->notes = notes;
}

void PrescriptionSession::setPatientName(const std::string& name) {
    context_.io->patientName = name;
}

void PrescriptionSession::setPrintResultsMode(int mode) {
    ::Formulary::setPrintResultsMode(context_, mode);
}

const DosingParameters& PrescriptionSession::getDosing() const {
    return context_.io->dosing;
}

// =========================================================================
// Calculation
// =========================================================================

int PrescriptionSession::calculate() {
    ::Formulary::calculate(context_);
    return context_.info();
}

bool PrescriptionSession::applyRecommendedDoses() {
    const auto& q = context_.io->quantities;
    if (!q.hasRecommendedDoses) {
        return false;
    }
    // Advisory value, only applied on request
    setTotalDoses(q.recommendedDoses);
    calculate();
    return true;
}

// =========================================================================
// Output Retrieval
// =========================================================================

const std::vector<MergedHerb>& PrescriptionSession::getMergedHerbs() const {
    return context_.io->mergedHerbs;
}

const std::vector<FinalHerb>& PrescriptionSession::getFinalHerbs() const {
    return context_.io->finalHerbs;
}

const Quantities& PrescriptionSession::getQuantities() const {
    return context_.io->quantities;
}

std::pair<double, bool> PrescriptionSession::getRecommendedDoses() const {
    const auto& q = context_.io->quantities;
    return {q.recommendedDoses, q.hasRecommendedDoses};
}

const ParseError& PrescriptionSession::getParseError() const {
    return context_.io->parseError;
}

PrescriptionRecord PrescriptionSession::getRecord() const {
    return buildRecord(context_);
}

int PrescriptionSession::validateForSave() const {
    return validateRecord(buildRecord(context_));
}

void PrescriptionSession::printResults() const {
    ::Formulary::printResults(context_);
}

// =========================================================================
// Status
// =========================================================================

int PrescriptionSession::getInfoCode() const {
    return context_.info();
}

bool PrescriptionSession::isSuccess() const {
    return context_.isSuccess();
}

std::string PrescriptionSession::getErrorMessage() const {
    if (!context_.io->errorMessage.empty()) {
        return context_.io->errorMessage;
    }
    return ErrorCode::getMessage(context_.info());
}

// =========================================================================
// Reset
// =========================================================================

void PrescriptionSession::reset() {
    context_.resetPrescription();
}

void PrescriptionSession::resetAll() {
    context_.resetAll();
}

} // namespace Formulary
