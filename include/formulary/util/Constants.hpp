#pragma once

namespace Formulary {
namespace Constants {

// Dosing targets
constexpr double kTargetDosagePerDose = 100.0;    // g per dose used for the recommendation
constexpr int kUnknownHerbId = 99999;             // Sorts unknown herbs to the end

// Decoction water formula: weight * factor + packVolume * (packs + 1) + constant
constexpr double kWaterAbsorptionFactor = 1.2;
constexpr int kExtraPackVolumes = 1;              // Brewing loss allowance
constexpr double kWaterConstantMl = 300.0;

// Default dosing parameters
constexpr double kDefaultTotalDoses = 15.0;
constexpr int kDefaultDays = 15;
constexpr int kDefaultDosesPerDay = 2;
constexpr int kDefaultPackVolumeMl = 100;

// Formula name suffixes tried when there is no exact match
constexpr const char* kFormulaSuffixes[] = {
    "탕",   // decoction
    "산",   // powder
    "환",   // pill
    "음"    // drink
};

constexpr int kNumFormulaSuffixes = 4;

// Category shown for definitions with neither category nor source
constexpr const char* kDefaultCategory = "기타";  // "other"

// Quick template search needs at least this many characters
constexpr int kMinTemplateSearchLength = 2;

constexpr const char* kDefaultUnit = "g";

// Hangul syllable block (U+AC00 - U+D7A3)
constexpr unsigned int kHangulFirst = 0xAC00;
constexpr unsigned int kHangulLast = 0xD7A3;

} // namespace Constants
} // namespace Formulary
