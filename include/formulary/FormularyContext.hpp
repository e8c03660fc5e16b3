#pragma once

#include <memory>
#include "context/Catalog.hpp"
#include "context/PrescriptionIO.hpp"

namespace Formulary {

/// Main context object holding all pipeline state
/// Pass FormularyContext& to the free functions in Formulary.hpp
class FormularyContext {
public:
    /// Herb table, definitions and resolved templates
    std::unique_ptr<Catalog> catalog;

    /// Input/Output state
    std::unique_ptr<PrescriptionIO> io;

    /// Constructor - initializes all state objects
    FormularyContext();

    /// Destructor
    ~FormularyContext();

    /// Move constructor
    FormularyContext(FormularyContext&&) noexcept;

    /// Move assignment
    FormularyContext& operator=(FormularyContext&&) noexcept;

    // Deleted copy operations (context is not copyable)
    FormularyContext(const FormularyContext&) = delete;
    FormularyContext& operator=(const FormularyContext&) = delete;

    /// Get the current error/info code
    int info() const { return io->INFO; }

    /// Set the error/info code and its detailed message
    void setInfo(int code, const std::string& message);

    /// Check if the last operation was successful
    bool isSuccess() const { return io->INFO == 0; }

    /// Reset outputs for a new calculation (keeps catalog and inputs)
    void resetPrescription();

    /// Full reset including catalog
    void resetAll();

    /// Check if a catalog has been loaded
    bool isCatalogLoaded() const { return catalog->isLoaded(); }
};

} // namespace Formulary
