#ifndef SRC_LSRA_LINEAR_FRAME_DUMP_JSON_HPP_
#define SRC_LSRA_LINEAR_FRAME_DUMP_JSON_HPP_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lsra {

struct LinearFrame;

// Serializes the results of allocation for debugging and visualization tools. To avoid copying strings around this
// class wraps the string and provides access to it via the json() accessor.
class LinearFrameDumpJSON {
public:
    LinearFrameDumpJSON();
    ~LinearFrameDumpJSON();

    // Registers are written using their names in |registerNames|, spill slots as "s<number>".
    void dump(const LinearFrame* linearFrame, const std::vector<std::string>& registerNames, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace lsra

#endif // SRC_LSRA_LINEAR_FRAME_DUMP_JSON_HPP_
