#include "lsra/Location.hpp"

#include "fmt/format.h"

namespace lsra {

std::string Location::toString() const {
    return fmt::format("{}{}", isRegister() ? "r" : "s", number);
}

} // namespace lsra
