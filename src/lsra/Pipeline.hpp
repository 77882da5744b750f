#ifndef SRC_LSRA_PIPELINE_HPP_
#define SRC_LSRA_PIPELINE_HPP_

// By default we turn off pipeline validation in Release builds.
#ifndef LSRA_PIPELINE_VALIDATE
#ifdef NDEBUG
#define LSRA_PIPELINE_VALIDATE 0
#else
#define LSRA_PIPELINE_VALIDATE 1
#endif // NDEBUG
#endif // LSRA_PIPELINE_VALIDATE

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lsra {

class ErrorReporter;
class Graph;
struct LinearFrame;

// Utility class to run a Graph through every stage of register allocation. Includes optional code to validate the
// allocator state between each step in the pipeline, and virtual methods for additional validation work per-step.
class Pipeline {
public:
    Pipeline();
    explicit Pipeline(std::shared_ptr<ErrorReporter> errorReporter);
    virtual ~Pipeline();

    // Parameters to override before allocation, or leave at defaults. The register pool is an ordered list of
    // distinct names, a register's number is its index in the list. Returns false on an empty pool or duplicate names,
    // leaving the previous pool in place.
    bool setRegisterNames(std::vector<std::string> registerNames);
    const std::vector<std::string>& registerNames() const { return m_registerNames; }
    int32_t numberOfRegisters() const { return static_cast<int32_t>(m_registerNames.size()); }

    // Only virtual registers of this class are allocated, all others are ignored.
    int32_t registerClass() const { return m_registerClass; }
    void setRegisterClass(int32_t registerClass) { m_registerClass = registerClass; }

    // Freezes |graph| and returns the allocation of its virtual registers, or nullptr on error. The returned
    // LinearFrame points into |graph|, which must outlive it. A stage failing without having reported a problem with
    // the input adds ErrorCode::kInternalError.
    std::unique_ptr<LinearFrame> allocate(Graph* graph);

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

#if LSRA_PIPELINE_VALIDATE
    // With pipeline validation on these methods are called after internal validation of each step. Their default
    // implementions do nothing. They are intended primarily for use by the Pipeline unittests, allowing for additional
    // testing work on each pipeline step as needed. Any method that returns false will stop the pipeline from moving
    // to the next step, without adding an error.
    virtual bool afterBlockSerializer(const Graph* graph, const LinearFrame* linearFrame);
    virtual bool afterLifetimeAnalyzer(const Graph* graph, const LinearFrame* linearFrame);
    virtual bool afterRegisterAllocator(const Graph* graph, const LinearFrame* linearFrame);
    virtual bool afterResolver(const Graph* graph, const LinearFrame* linearFrame);
#endif // LSRA_PIPELINE_VALIDATE

protected:
    void setDefaults();
    // Adds ErrorCode::kInternalError unless errors were reported since the reporter held |errorCount|. Returns nullptr.
    std::unique_ptr<LinearFrame> stageFailed(const char* stage, size_t errorCount);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<std::string> m_registerNames;
    int32_t m_registerClass;
};

} // namespace lsra

#endif // SRC_LSRA_PIPELINE_HPP_
