#include "lsra/LifetimeInterval.hpp"

#include "doctest/doctest.h"

namespace lsra {

TEST_CASE("LifetimeInterval addLiveRange") {
    SUBCASE("disjoint ranges kept in order") {
        LifetimeInterval lt;
        CHECK(lt.isEmpty());
        lt.addLiveRange(8, 10);
        lt.addLiveRange(0, 2);
        lt.addLiveRange(4, 6);
        REQUIRE(lt.ranges.size() == 3);
        auto it = lt.ranges.begin();
        CHECK(it->from == 0);
        CHECK(it->to == 2);
        ++it;
        CHECK(it->from == 4);
        CHECK(it->to == 6);
        ++it;
        CHECK(it->from == 8);
        CHECK(it->to == 10);
        CHECK(lt.start() == 0);
        CHECK(lt.end() == 10);
    }

    SUBCASE("empty range ignored") {
        LifetimeInterval lt;
        lt.addLiveRange(4, 4);
        CHECK(lt.isEmpty());
    }

    SUBCASE("adjacent ranges merge") {
        LifetimeInterval lt;
        lt.addLiveRange(6, 9);
        lt.addLiveRange(2, 4);
        lt.addLiveRange(4, 6);
        REQUIRE(lt.ranges.size() == 1);
        CHECK(lt.start() == 2);
        CHECK(lt.end() == 9);
        lt.addLiveRange(9, 12);
        REQUIRE(lt.ranges.size() == 1);
        CHECK(lt.end() == 12);
    }

    SUBCASE("overlap spanning several ranges") {
        LifetimeInterval lt;
        lt.addLiveRange(0, 5);
        lt.addLiveRange(20, 25);
        lt.addLiveRange(40, 45);
        lt.addLiveRange(60, 65);
        CHECK(lt.ranges.size() == 4);
        lt.addLiveRange(3, 42);
        REQUIRE(lt.ranges.size() == 2);
        CHECK(lt.ranges.front().from == 0);
        CHECK(lt.ranges.front().to == 45);
        CHECK(lt.ranges.back().from == 60);
        CHECK(lt.ranges.back().to == 65);
        // Contained range changes nothing.
        lt.addLiveRange(61, 63);
        REQUIRE(lt.ranges.size() == 2);
        CHECK(lt.ranges.back().to == 65);
        lt.addLiveRange(44, 70);
        REQUIRE(lt.ranges.size() == 1);
        CHECK(lt.start() == 0);
        CHECK(lt.end() == 70);
    }
}

TEST_CASE("LifetimeInterval setFrom and usages") {
    SUBCASE("definition shortens the first range") {
        LifetimeInterval lt(3);
        lt.addLiveRange(10, 20);
        lt.addLiveRange(0, 7);
        lt.setFrom(5);
        REQUIRE(lt.ranges.size() == 2);
        CHECK(lt.start() == 5);
        CHECK(lt.ranges.front().to == 7);
        CHECK(lt.valueNumber == 3);
    }

    SUBCASE("register requirement wins") {
        LifetimeInterval lt;
        lt.addUsage(4, UseKind::kAny);
        lt.addUsage(4, UseKind::kRegister);
        lt.addUsage(4, UseKind::kAny);
        lt.addUsage(8, UseKind::kAny);
        REQUIRE(lt.usages.size() == 2);
        CHECK(lt.usages[4] == UseKind::kRegister);
        CHECK(lt.usages[8] == UseKind::kAny);
    }

    SUBCASE("next register use") {
        LifetimeInterval lt;
        lt.addLiveRange(1, 20);
        lt.addUsage(1, UseKind::kAny);
        lt.addUsage(6, UseKind::kRegister);
        lt.addUsage(10, UseKind::kAny);
        lt.addUsage(14, UseKind::kRegister);
        CHECK(lt.nextRegisterUse(0) == 6);
        CHECK(lt.nextRegisterUse(6) == 6);
        CHECK(lt.nextRegisterUse(7) == 14);
        CHECK(lt.nextRegisterUse(15) == kMaxPosition);
    }
}

TEST_CASE("LifetimeInterval splitAt") {
    SUBCASE("empty split") {
        LifetimeInterval lt;
        auto split = lt.splitAt(100);
        CHECK(lt.isEmpty());
        CHECK(split.isEmpty());
    }

    SUBCASE("split before start moves everything") {
        LifetimeInterval lt(2);
        lt.addLiveRange(10, 20);
        lt.addUsage(10, UseKind::kAny);
        lt.addLiveRange(24, 30);
        lt.addUsage(26, UseKind::kRegister);
        auto split = lt.splitAt(4);
        CHECK(lt.isEmpty());
        CHECK(lt.usages.empty());
        CHECK(split.valueNumber == 2);
        CHECK(split.isSplit);
        REQUIRE(split.ranges.size() == 2);
        CHECK(split.start() == 10);
        CHECK(split.end() == 30);
        CHECK(split.usages.size() == 2);
    }

    SUBCASE("split after end moves nothing") {
        LifetimeInterval lt;
        lt.addLiveRange(10, 20);
        lt.addUsage(12, UseKind::kAny);
        auto split = lt.splitAt(20);
        CHECK(split.isEmpty());
        CHECK(lt.start() == 10);
        CHECK(lt.end() == 20);
        CHECK(lt.usages.size() == 1);
    }

    SUBCASE("split inside a range") {
        LifetimeInterval lt;
        lt.addLiveRange(1, 9);
        lt.addUsage(1, UseKind::kAny);
        lt.addUsage(4, UseKind::kAny);
        lt.addUsage(8, UseKind::kRegister);
        auto split = lt.splitAt(4);
        REQUIRE(lt.ranges.size() == 1);
        CHECK(lt.start() == 1);
        CHECK(lt.end() == 4);
        REQUIRE(lt.usages.size() == 1);
        CHECK(lt.usages.count(1) == 1);
        REQUIRE(split.ranges.size() == 1);
        CHECK(split.start() == 4);
        CHECK(split.end() == 9);
        REQUIRE(split.usages.size() == 2);
        CHECK(split.usages.count(4) == 1);
        CHECK(split.usages.count(8) == 1);
    }

    SUBCASE("split at the start of a range") {
        LifetimeInterval lt;
        lt.addLiveRange(0, 4);
        lt.addLiveRange(8, 12);
        auto split = lt.splitAt(8);
        REQUIRE(lt.ranges.size() == 1);
        CHECK(lt.end() == 4);
        REQUIRE(split.ranges.size() == 1);
        CHECK(split.start() == 8);
        CHECK(split.end() == 12);
    }

    SUBCASE("split inside a lifetime hole") {
        LifetimeInterval lt;
        lt.addLiveRange(0, 4);
        lt.addLiveRange(9, 12);
        lt.addLiveRange(16, 20);
        auto split = lt.splitAt(6);
        REQUIRE(lt.ranges.size() == 1);
        CHECK(lt.end() == 4);
        REQUIRE(split.ranges.size() == 2);
        CHECK(split.start() == 9);
        CHECK(split.end() == 20);
    }
}

TEST_CASE("LifetimeInterval covers") {
    LifetimeInterval lt;
    CHECK(!lt.covers(0));
    lt.addLiveRange(2, 5);
    lt.addLiveRange(8, 10);
    CHECK(!lt.covers(1));
    CHECK(lt.covers(2));
    CHECK(lt.covers(4));
    CHECK(!lt.covers(5));
    CHECK(!lt.covers(7));
    CHECK(lt.covers(8));
    CHECK(lt.covers(9));
    CHECK(!lt.covers(10));
}

TEST_CASE("LifetimeInterval findFirstIntersection") {
    SUBCASE("no intersection") {
        LifetimeInterval a, b;
        a.addLiveRange(0, 4);
        a.addLiveRange(10, 14);
        b.addLiveRange(4, 10);
        Position first = -1;
        CHECK(!a.findFirstIntersection(b, first));
        CHECK(!b.findFirstIntersection(a, first));
        CHECK(first == -1);
        LifetimeInterval empty;
        CHECK(!a.findFirstIntersection(empty, first));
    }

    SUBCASE("intersection in second range") {
        LifetimeInterval a, b;
        a.addLiveRange(0, 4);
        a.addLiveRange(10, 14);
        b.addLiveRange(5, 7);
        b.addLiveRange(12, 20);
        Position first = -1;
        REQUIRE(a.findFirstIntersection(b, first));
        CHECK(first == 12);
        first = -1;
        REQUIRE(b.findFirstIntersection(a, first));
        CHECK(first == 12);
    }
}

} // namespace lsra
