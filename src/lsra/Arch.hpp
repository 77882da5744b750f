#ifndef SRC_LSRA_ARCH_HPP_
#define SRC_LSRA_ARCH_HPP_

#include <cstdint>

// Contains information about the CPU architecture lsra is running on, used to size the default register pool.
namespace lsra {

// Stack pointer, frame pointer, and one scratch register are kept out of allocation.
static constexpr int32_t kNumberOfReservedRegisters = 3;

#if defined(__i386__)
static constexpr int32_t kNumberOfPhysicalRegisters = 8 - kNumberOfReservedRegisters;
#elif defined(__x86_64__)
static constexpr int32_t kNumberOfPhysicalRegisters = 16 - kNumberOfReservedRegisters;
#elif defined(__arm__)
static constexpr int32_t kNumberOfPhysicalRegisters = 16 - kNumberOfReservedRegisters;
#elif defined(__aarch64__)
static constexpr int32_t kNumberOfPhysicalRegisters = 32 - kNumberOfReservedRegisters;
#else
#    error "Undefined chipset"
#endif

} // namespace lsra

#endif // SRC_LSRA_ARCH_HPP_
