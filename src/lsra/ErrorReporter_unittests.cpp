#include "lsra/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>

namespace lsra {

TEST_CASE("ErrorReporter collects errors") {
    SUBCASE("empty reporter") {
        ErrorReporter er(true);
        CHECK_EQ(er.errorCount(), 0);
        CHECK(er.errors().empty());
        CHECK(!er.hasError(ErrorCode::kInvalidReference));
    }
    SUBCASE("errors kept in order") {
        ErrorReporter er(true);
        er.addError(ErrorCode::kGraphFrozen, "first");
        er.addError(ErrorCode::kUseBeforeDef, "second");
        REQUIRE_EQ(er.errorCount(), 2);
        CHECK_EQ(er.errors()[0].code, ErrorCode::kGraphFrozen);
        CHECK_EQ(er.errors()[0].message, "first");
        CHECK_EQ(er.errors()[1].code, ErrorCode::kUseBeforeDef);
        CHECK_EQ(er.errors()[1].message, "second");
        CHECK(er.hasError(ErrorCode::kGraphFrozen));
        CHECK(er.hasError(ErrorCode::kUseBeforeDef));
        CHECK(!er.hasError(ErrorCode::kUnreachableBlock));
    }
}

TEST_CASE("ErrorReporter code names") {
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kInvalidReference)), "InvalidReference");
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kGraphFrozen)), "GraphFrozen");
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kUnreachableBlock)), "UnreachableBlock");
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kUseBeforeDef)), "UseBeforeDef");
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kAllocationImpossible)), "AllocationImpossible");
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kInvalidRegisterPool)), "InvalidRegisterPool");
    CHECK_EQ(std::string(errorCodeName(ErrorCode::kInternalError)), "InternalError");
}

} // namespace lsra
