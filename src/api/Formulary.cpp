#include "formulary/Formulary.hpp"
#include "formulary/postprocess/PrescriptionRecord.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

namespace Formulary {

std::vector<ResolvedTemplate> buildCatalog(const std::vector<FormulaDefinition>& definitions) {
    Catalog catalog;
    catalog.setDefinitions(definitions);
    return CompositionResolver::buildTemplates(catalog);
}

ParseResult parseFormula(const std::string& text, const std::vector<ResolvedTemplate>& catalog) {
    return FormulaParser::parse(text, catalog);
}

FinalResult computeFinal(const std::vector<MergedHerb>& mergedHerbs,
                         const DosingParameters& dosing,
                         const std::string& adjustmentText,
                         const HerbIdLookup& herbIdLookup) {
    return DosageCalculator::computeFinal(mergedHerbs, dosing, adjustmentText, herbIdLookup);
}

std::pair<double, bool> recommendDoses(double totalPerDoseWeight, int days) {
    return DosageCalculator::recommendDoses(totalPerDoseWeight, days);
}

void loadCatalog(FormularyContext& ctx,
                 std::vector<HerbRecord> herbs,
                 std::vector<FormulaDefinition> definitions) {
    ctx.catalog->clear();
    ctx.catalog->setHerbs(std::move(herbs));
    ctx.catalog->setDefinitions(std::move(definitions));
    buildCatalog(ctx);
}

void buildCatalog(FormularyContext& ctx) {
    auto& catalog = *ctx.catalog;
    catalog.reset();
    catalog.templates = CompositionResolver::buildTemplates(catalog, &catalog.resolveWarnings);

    if (ctx.io->iPrintResultsMode >= 1) {
        for (const auto& entry : catalog.resolveWarnings) {
            for (const auto& warning : entry.second) {
                std::cerr << "[CompositionResolver] " << entry.first << ": "
                          << describeWarning(warning) << "\n";
            }
        }
    }
    if (ctx.io->iPrintResultsMode >= 2) {
        std::cerr << "[CompositionResolver] Resolved " << catalog.templates.size()
                  << " templates from " << catalog.definitions.size() << " definitions\n";
    }
}

void setFormula(FormularyContext& ctx, const std::string& text) {
    ctx.io->formulaText = text;
}

void setDosing(FormularyContext& ctx, const DosingParameters& dosing) {
    ctx.io->dosing = dosing;
}

void setTotalDoses(FormularyContext& ctx, double totalDoses) {
    ctx.io->dosing.totalDoses = totalDoses;
}

void setSchedule(FormularyContext& ctx, int days, int dosesPerDay) {
    ctx.io->dosing.days = days;
    ctx.io->dosing.dosesPerDay = dosesPerDay;
}

void setPackVolume(FormularyContext& ctx, int packVolumeMl) {
    ctx.io->dosing.packVolumeMl = packVolumeMl;
}

void setHerbAdjustment(FormularyContext& ctx, const std::string& text) {
    ctx.io->herbAdjustment = text;
}

void setPrintResultsMode(FormularyContext& ctx, int mode) {
    ctx.io->iPrintResultsMode = mode;
}

void calculate(FormularyContext& ctx) {
    auto& io = *ctx.io;
    ctx.resetPrescription();

    const auto& dosing = io.dosing;
    if (std::isnan(dosing.totalDoses) || dosing.totalDoses < 0.0 ||
        dosing.days < 0 || dosing.dosesPerDay < 0 || dosing.packVolumeMl < 0) {
        ctx.setInfo(ErrorCode::kInvalidDosingParameters, "");
        return;
    }

    if (!ctx.isCatalogLoaded() && !FormulaParser::normalize(io.formulaText).empty()) {
        ctx.setInfo(ErrorCode::kCatalogNotLoaded, "");
        return;
    }

    ParseResult parsed = FormulaParser::parse(io.formulaText, ctx.catalog->templates);
    if (!parsed.ok()) {
        ctx.setInfo(parsed.error.code, parsed.error.message);
        io.parseError = std::move(parsed.error);
        if (io.iPrintResultsMode >= 1) {
            std::cerr << "[FormulaParser] " << io.errorMessage << "\n";
        }
        return;
    }
    io.mergedHerbs = std::move(parsed.merged);

    const Catalog& catalog = *ctx.catalog;
    FinalResult batch = DosageCalculator::computeFinal(
        io.mergedHerbs, io.dosing, io.herbAdjustment,
        [&catalog](const std::string& name) { return catalog.getHerbId(name); });

    io.finalHerbs = std::move(batch.finalHerbs);
    io.quantities = batch.quantities;

    if (io.iPrintResultsMode >= 2) {
        std::cerr << "[DosageCalculator] " << io.mergedHerbs.size() << " merged herbs, "
                  << io.finalHerbs.size() << " final herbs, "
                  << io.quantities.totalBatchWeight << " g total\n";
    }
}

void printResults(const FormularyContext& ctx) {
    printRecord(buildRecord(ctx), std::cout);

    const auto& q = ctx.io->quantities;
    if (q.hasRecommendedDoses) {
        const std::ios_base::fmtflags flags = std::cout.flags();
        const std::streamsize precision = std::cout.precision();
        std::cout << "Recommended doses: " << std::fixed << std::setprecision(1)
                  << q.recommendedDoses << " (per-dose weight "
                  << std::setprecision(2) << q.totalPerDoseWeight << " g)\n\n";
        std::cout.flags(flags);
        std::cout.precision(precision);
    }
}

} // namespace Formulary
