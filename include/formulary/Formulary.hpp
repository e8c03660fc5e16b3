#pragma once

#include "FormularyContext.hpp"
#include "calculator/DosageCalculator.hpp"
#include "parser/FormulaParser.hpp"
#include "resolver/CompositionResolver.hpp"
#include "util/Constants.hpp"
#include "util/ErrorCodes.hpp"

#include <string>
#include <utility>
#include <vector>

namespace Formulary {

// ============================================================================
// Pure Pipeline Functions
// ============================================================================

/// Resolve every definition into a template, in definition order
std::vector<ResolvedTemplate> buildCatalog(const std::vector<FormulaDefinition>& definitions);

/// Parse typed formula text against a template catalog and merge the herbs
ParseResult parseFormula(const std::string& text, const std::vector<ResolvedTemplate>& catalog);

/// Final herb list and batch quantities
FinalResult computeFinal(const std::vector<MergedHerb>& mergedHerbs,
                         const DosingParameters& dosing,
                         const std::string& adjustmentText,
                         const HerbIdLookup& herbIdLookup);

/// Recommended doses for the per-dose weight
/// Returns (doses, true), or (0, false) when no recommendation applies
std::pair<double, bool> recommendDoses(double totalPerDoseWeight, int days);

// ============================================================================
// Catalog Functions
// ============================================================================

/// Replace the context's catalog tables and rebuild its templates
void loadCatalog(FormularyContext& ctx,
                 std::vector<HerbRecord> herbs,
                 std::vector<FormulaDefinition> definitions);

/// Rebuild templates from the definitions already in the context
void buildCatalog(FormularyContext& ctx);

// ============================================================================
// Input Setting Functions
// ============================================================================

/// Set the formula text as typed
void setFormula(FormularyContext& ctx, const std::string& text);

/// Set all dosing parameters
void setDosing(FormularyContext& ctx, const DosingParameters& dosing);

/// Set total doses brewed in the batch
void setTotalDoses(FormularyContext& ctx, double totalDoses);

/// Set days and doses per day
void setSchedule(FormularyContext& ctx, int days, int dosesPerDay);

/// Set volume of one pack [mL]
void setPackVolume(FormularyContext& ctx, int packVolumeMl);

/// Set herb adjustment text
void setHerbAdjustment(FormularyContext& ctx, const std::string& text);

/// Set print mode (0=silent, 1=warnings, 2=trace)
void setPrintResultsMode(FormularyContext& ctx, int mode);

// ============================================================================
// Calculation
// ============================================================================

/// Parse the formula, merge herbs and compute the batch
/// Sets ctx.io->INFO (0 on success) and the outputs
void calculate(FormularyContext& ctx);

/// Print the current prescription to standard output
void printResults(const FormularyContext& ctx);

} // namespace Formulary
