#ifndef SRC_LSRA_ERROR_REPORTER_HPP_
#define SRC_LSRA_ERROR_REPORTER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace lsra {

enum class ErrorCode : int32_t {
    kInvalidReference,
    kGraphFrozen,
    kUnreachableBlock,
    kUseBeforeDef,
    kAllocationImpossible,
    kInvalidRegisterPool,
    // A pipeline stage or its validation failed on a defect in the allocator itself, not on a problem with the input.
    kInternalError
};

const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;
};

// Collects the errors encountered while building a Graph or running the Pipeline on it. Errors are never thrown, every
// failing operation returns an invalid value and leaves a description here.
class ErrorReporter {
public:
    ErrorReporter();
    // If |suppress| is true errors are recorded but not logged, useful for tests that provoke errors on purpose.
    explicit ErrorReporter(bool suppress);
    ~ErrorReporter();

    void addError(ErrorCode code, const std::string& message);

    size_t errorCount() const { return m_errors.size(); }
    bool hasError(ErrorCode code) const;
    const std::vector<Error>& errors() const { return m_errors; }

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace lsra

#endif // SRC_LSRA_ERROR_REPORTER_HPP_
