#include "lsra/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace lsra {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::kInvalidReference:
        return "InvalidReference";
    case ErrorCode::kGraphFrozen:
        return "GraphFrozen";
    case ErrorCode::kUnreachableBlock:
        return "UnreachableBlock";
    case ErrorCode::kUseBeforeDef:
        return "UseBeforeDef";
    case ErrorCode::kAllocationImpossible:
        return "AllocationImpossible";
    case ErrorCode::kInvalidRegisterPool:
        return "InvalidRegisterPool";
    case ErrorCode::kInternalError:
        return "InternalError";
    }
    return "Unknown";
}

ErrorReporter::ErrorReporter(): m_suppress(false) {}

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(ErrorCode code, const std::string& message) {
    if (!m_suppress) {
        spdlog::error("{}: {}", errorCodeName(code), message);
    }
    m_errors.emplace_back(Error{code, message});
}

bool ErrorReporter::hasError(ErrorCode code) const {
    return std::any_of(m_errors.begin(), m_errors.end(), [code](const Error& error) { return error.code == code; });
}

} // namespace lsra
