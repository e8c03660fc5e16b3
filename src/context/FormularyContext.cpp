#include "formulary/FormularyContext.hpp"
#include "formulary/util/ErrorCodes.hpp"

namespace Formulary {

FormularyContext::FormularyContext()
    : catalog(std::make_unique<Catalog>())
    , io(std::make_unique<PrescriptionIO>())
{
}

FormularyContext::~FormularyContext() = default;

FormularyContext::FormularyContext(FormularyContext&&) noexcept = default;

FormularyContext& FormularyContext::operator=(FormularyContext&&) noexcept = default;

void FormularyContext::setInfo(int code, const std::string& message) {
    io->INFO = code;
    io->errorMessage = message.empty() && code != ErrorCode::kSuccess
        ? ErrorCode::getMessage(code)
        : message;
}

void FormularyContext::resetPrescription() {
    io->resetOutputs();
}

void FormularyContext::resetAll() {
    catalog->clear();
    io->reset();
}

} // namespace Formulary
