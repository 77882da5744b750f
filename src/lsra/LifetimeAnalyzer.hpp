#ifndef SRC_LSRA_LIFETIME_ANALYZER_HPP_
#define SRC_LSRA_LIFETIME_ANALYZER_HPP_

#include <cstdint>
#include <memory>

namespace lsra {

class ErrorReporter;
class Graph;
struct LinearFrame;

// This is an implementation of the pseudocode described in the BuildIntervals algorithm of [RA5] in the Bibliography,
// "Linear Scan Register Allocation on SSA Form" by C. Wimmer and M. Franz, extended to allow values to be defined more
// than once.
class LifetimeAnalyzer {
public:
    LifetimeAnalyzer() = delete;
    explicit LifetimeAnalyzer(std::shared_ptr<ErrorReporter> errorReporter);
    ~LifetimeAnalyzer() = default;

    // Computes liveIns and the valueLifetimes elements in the LinearFrame for values in |registerClass|. All
    // modifications to the instructions must occur before this step. Returns false if some value is used on a path
    // from the entry block before it is defined.
    bool buildLifetimes(const Graph* graph, LinearFrame* linearFrame, int32_t registerClass);

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace lsra

#endif // SRC_LSRA_LIFETIME_ANALYZER_HPP_
