#pragma once

namespace Formulary {
namespace ErrorCode {

// Success
constexpr int kSuccess = 0;

// Formula parsing errors (1-9)
constexpr int kAmbiguousFormula = 1;
constexpr int kFormulaNotFound = 2;

// Input validation errors (10-19)
constexpr int kInvalidDosingParameters = 10;
constexpr int kCatalogNotLoaded = 11;

// Record validation errors (20-29)
constexpr int kEmptyFormula = 20;
constexpr int kNoHerbsResolved = 21;

// Get error message string
inline const char* getMessage(int code) {
    switch (code) {
        case kSuccess: return "Success";
        case kAmbiguousFormula: return "Multiple formulas matched";
        case kFormulaNotFound: return "Formula not found";
        case kInvalidDosingParameters: return "Invalid dosing parameters";
        case kCatalogNotLoaded: return "Formula catalog not loaded";
        case kEmptyFormula: return "Formula text is empty";
        case kNoHerbsResolved: return "Formula did not resolve to any herbs";
        default: return "Unknown error";
    }
}

} // namespace ErrorCode
} // namespace Formulary
