#include "lsra/Pipeline.hpp"

#include "lsra/Arch.hpp"
#include "lsra/BlockSerializer.hpp"
#include "lsra/ErrorReporter.hpp"
#include "lsra/Graph.hpp"
#include "lsra/LifetimeAnalyzer.hpp"
#include "lsra/LinearFrame.hpp"
#include "lsra/RegisterAllocator.hpp"
#include "lsra/Resolver.hpp"
#include "lsra/Validator.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <set>

namespace lsra {

Pipeline::Pipeline(): m_errorReporter(std::make_shared<ErrorReporter>()) { setDefaults(); }

Pipeline::Pipeline(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) { setDefaults(); }

Pipeline::~Pipeline() {}

bool Pipeline::setRegisterNames(std::vector<std::string> registerNames) {
    if (registerNames.empty()) {
        m_errorReporter->addError(ErrorCode::kInvalidRegisterPool, "register pool is empty");
        return false;
    }
    std::set<std::string> names;
    for (const auto& name : registerNames) {
        if (!names.emplace(name).second) {
            m_errorReporter->addError(ErrorCode::kInvalidRegisterPool, fmt::format("register pool names register "
                    "'{}' more than once", name));
            return false;
        }
    }
    m_registerNames = std::move(registerNames);
    return true;
}

std::unique_ptr<LinearFrame> Pipeline::allocate(Graph* graph) {
    auto errorCount = m_errorReporter->errorCount();

    BlockSerializer serializer(m_errorReporter);
    auto linearFrame = serializer.serialize(graph);
    if (!linearFrame) { return stageFailed("BlockSerializer", errorCount); }
#if LSRA_PIPELINE_VALIDATE
    if (!Validator::validateLinearFrame(graph, linearFrame.get())) {
        return stageFailed("BlockSerializer validation", errorCount);
    }
    if (!afterBlockSerializer(graph, linearFrame.get())) { return nullptr; }
#endif // LSRA_PIPELINE_VALIDATE

    LifetimeAnalyzer analyzer(m_errorReporter);
    if (!analyzer.buildLifetimes(graph, linearFrame.get(), m_registerClass)) {
        return stageFailed("LifetimeAnalyzer", errorCount);
    }
#if LSRA_PIPELINE_VALIDATE
    if (!Validator::validateLifetimes(graph, linearFrame.get(), m_registerClass)) {
        return stageFailed("LifetimeAnalyzer validation", errorCount);
    }
    if (!afterLifetimeAnalyzer(graph, linearFrame.get())) { return nullptr; }
#endif // LSRA_PIPELINE_VALIDATE

    RegisterAllocator allocator(numberOfRegisters(), m_errorReporter);
    if (!allocator.allocateRegisters(linearFrame.get())) { return stageFailed("RegisterAllocator", errorCount); }
#if LSRA_PIPELINE_VALIDATE
    if (!Validator::validateAllocation(linearFrame.get(), numberOfRegisters())) {
        return stageFailed("RegisterAllocator validation", errorCount);
    }
    if (!afterRegisterAllocator(graph, linearFrame.get())) { return nullptr; }
#endif // LSRA_PIPELINE_VALIDATE

    Resolver resolver;
    if (!resolver.resolve(graph, linearFrame.get())) { return stageFailed("Resolver", errorCount); }
#if LSRA_PIPELINE_VALIDATE
    if (!Validator::validateResolution(graph, linearFrame.get())) {
        return stageFailed("Resolver validation", errorCount);
    }
    if (!afterResolver(graph, linearFrame.get())) { return nullptr; }
#endif // LSRA_PIPELINE_VALIDATE

    SPDLOG_DEBUG("Pipeline allocated {} values of register class {} over {} positions with {} registers",
            linearFrame->valueLifetimes.size(), m_registerClass, linearFrame->numberOfPositions(),
            numberOfRegisters());
    return linearFrame;
}

#if LSRA_PIPELINE_VALIDATE
bool Pipeline::afterBlockSerializer(const Graph*, const LinearFrame*) { return true; }
bool Pipeline::afterLifetimeAnalyzer(const Graph*, const LinearFrame*) { return true; }
bool Pipeline::afterRegisterAllocator(const Graph*, const LinearFrame*) { return true; }
bool Pipeline::afterResolver(const Graph*, const LinearFrame*) { return true; }
#endif // LSRA_PIPELINE_VALIDATE

std::unique_ptr<LinearFrame> Pipeline::stageFailed(const char* stage, size_t errorCount) {
    // Failures on bad input have already been reported, anything else is a defect in an earlier stage.
    if (m_errorReporter->errorCount() == errorCount) {
        SPDLOG_CRITICAL("{} failed without reporting an error", stage);
        m_errorReporter->addError(ErrorCode::kInternalError, fmt::format("{} failed on an internal defect", stage));
    }
    return nullptr;
}

void Pipeline::setDefaults() {
    m_registerNames.clear();
    for (int32_t i = 0; i < kNumberOfPhysicalRegisters; ++i) {
        m_registerNames.emplace_back(fmt::format("r{}", i));
    }
    m_registerClass = 0;
}

} // namespace lsra
