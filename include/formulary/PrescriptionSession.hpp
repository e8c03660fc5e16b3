/// @file PrescriptionSession.hpp
/// @brief Object-oriented API for composing one prescription
/// @details Owns a FormularyContext and drives the resolve -> parse ->
/// merge -> calculate pipeline over it.

#pragma once

#include "formulary/FormularyContext.hpp"
#include "formulary/postprocess/PrescriptionRecord.hpp"
#include "formulary/search/DefinitionSearch.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Formulary {

/// @brief Prescription composition session
/// @details Typical use:
/// @code
/// PrescriptionSession session;
/// session.loadCatalog(herbs, definitions);
/// session.setFormula("소시호 반하사심*0.5");
/// session.setSchedule(15, 2);
/// session.setHerbAdjustment("+감초2");
/// if (session.calculate() == 0) {
///     session.printResults();
/// }
/// @endcode
class PrescriptionSession {
public:
    /// @brief Constructor - empty catalog, default dosing parameters
    PrescriptionSession();

    /// @brief Destructor
    ~PrescriptionSession();

    /// @brief Move constructor
    PrescriptionSession(PrescriptionSession&&) noexcept;

    /// @brief Move assignment
    PrescriptionSession& operator=(PrescriptionSession&&) noexcept;

    // Delete copy operations (FormularyContext is not copyable)
    PrescriptionSession(const PrescriptionSession&) = delete;
    PrescriptionSession& operator=(const PrescriptionSession&) = delete;

    // =========================================================================
    // Catalog
    // =========================================================================

    /// @brief Replace herbs and definitions and rebuild all templates
    /// @param herbs Herb table
    /// @param definitions Formula definitions
    void loadCatalog(std::vector<HerbRecord> herbs, std::vector<FormulaDefinition> definitions);

    /// @brief Resolved templates, in definition order
    const std::vector<ResolvedTemplate>& getTemplates() const;

    /// @brief Number of templates in the catalog
    int getNumberTemplates() const;

    /// @brief Warnings collected while resolving the catalog, by template name
    const std::map<std::string, std::vector<ResolveWarning>>& getResolveWarnings() const;

    /// @brief Templates whose name or alias contains term (at least 2 characters)
    std::vector<const ResolvedTemplate*> searchTemplates(const std::string& term) const;

    /// @brief Append a template (alias preferred) to the current formula text
    void addTemplateToFormula(const ResolvedTemplate& tmpl);

    // =========================================================================
    // Input Configuration
    // =========================================================================

    /// @brief Set formula text
    void setFormula(const std::string& text);

    /// @brief Get formula text
    const std::string& getFormula() const;

    /// @brief Set all dosing parameters
    void setDosing(const DosingParameters& dosing);

    /// @brief Set total doses in the batch
    void setTotalDoses(double totalDoses);

    /// @brief Set days and doses per day
    void setSchedule(int days, int dosesPerDay);

    /// @brief Set pack volume [mL]
    void setPackVolume(int packVolumeMl);

    /// @brief Set herb adjustment text ("+감초3 -대추2")
    void setHerbAdjustment(const std::string& text);

    /// @brief Set free-text notes
    void setNotes(const std::string& notes);

    /// @brief Set patient name
    void setPatientName(const std::string& name);

    /// @brief Set print mode (0 = silent, 1 = warnings, 2 = trace)
    void setPrintResultsMode(int mode);

    /// @brief Current dosing parameters
    const DosingParameters& getDosing() const;

    // =========================================================================
    // Calculation
    // =========================================================================

    /// @brief Run the pipeline on the current inputs
    /// @return Error code (0 = success)
    int calculate();

    /// @brief Set total doses to the recommendation, if one applies
    /// @return true if a recommendation was applied
    bool applyRecommendedDoses();

    // =========================================================================
    // Output Retrieval
    // =========================================================================

    /// @brief Merged per-dose herbs, dosage descending
    const std::vector<MergedHerb>& getMergedHerbs() const;

    /// @brief Final batch herbs, herb id ascending
    const std::vector<FinalHerb>& getFinalHerbs() const;

    /// @brief Derived quantities
    const Quantities& getQuantities() const;

    /// @brief Recommended doses
    /// @return Pair of (doses, available)
    std::pair<double, bool> getRecommendedDoses() const;

    /// @brief Details of the last parse failure
    const ParseError& getParseError() const;

    /// @brief Assemble the record to be saved
    PrescriptionRecord getRecord() const;

    /// @brief Check that the current prescription can be saved
    /// @return Error code (0 = savable)
    int validateForSave() const;

    /// @brief Print the prescription to stdout
    void printResults() const;

    // =========================================================================
    // Status
    // =========================================================================

    /// @brief Get error/info code
    int getInfoCode() const;

    /// @brief Check if the last calculation succeeded
    bool isSuccess() const;

    /// @brief Get error message
    std::string getErrorMessage() const;

    // =========================================================================
    // Reset
    // =========================================================================

    /// @brief Clear outputs (keeps catalog and inputs)
    void reset();

    /// @brief Reset everything including catalog
    void resetAll();

    /// @brief Access the underlying context
    FormularyContext& getContext() { return context_; }
    const FormularyContext& getContext() const { return context_; }

private:
    FormularyContext context_;
};

} // namespace Formulary
