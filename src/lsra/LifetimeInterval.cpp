#include "lsra/LifetimeInterval.hpp"

#include <algorithm>

namespace lsra {

void LifetimeInterval::addLiveRange(Position from, Position to) {
    // Valid ranges only please.
    assert(to >= from);
    if (from == to) {
        return;
    }

    // Traverse existing range list to see if |from| is contained in or adjacent to an existing range.
    auto fromIter = ranges.begin();
    bool fromWithin = false;
    while (fromIter != ranges.end()) {
        if (from >= fromIter->from) {
            if (from <= fromIter->to) {
                fromWithin = true;
                break;
            } else {
                ++fromIter;
            }
        } else {
            break;
        }
    }

    if (!fromWithin) {
        fromIter = ranges.emplace(fromIter, LiveRange(from, to));
    } else {
        // If re-using an existing range expand to |to| if needed.
        fromIter->to = std::max(fromIter->to, to);
    }

    // fromIter is pointing at either the newly-created range or the existing range that contained |from|. Now we
    // iterate forward, deleting any ranges ending before |to| ends, and absorbing one that |to| reaches into.
    auto toIter = fromIter;
    ++toIter;
    while (toIter != ranges.end()) {
        if (fromIter->to >= toIter->to) {
            toIter = ranges.erase(toIter);
        } else if (fromIter->to >= toIter->from) {
            fromIter->to = toIter->to;
            ranges.erase(toIter);
            break;
        } else {
            break;
        }
    }
}

void LifetimeInterval::setFrom(Position from) {
    if (isEmpty()) {
        ranges.emplace_back(LiveRange(from, from + 1));
        return;
    }
    assert(from < ranges.front().to);
    ranges.front().from = from;
}

void LifetimeInterval::addUsage(Position position, UseKind kind) {
    auto emplace = usages.emplace(position, kind);
    if (!emplace.second && kind == UseKind::kRegister) {
        emplace.first->second = UseKind::kRegister;
    }
}

LifetimeInterval LifetimeInterval::splitAt(Position splitTime) {
    LifetimeInterval split(valueNumber);
    split.isSplit = true;

    if (isEmpty() || end() <= splitTime) {
        return split;
    }

    if (splitTime <= start()) {
        split.ranges = std::move(ranges);
        ranges = std::list<LiveRange>();
        split.usages = std::move(usages);
        usages = std::map<Position, UseKind>();
        return split;
    }

    auto firstIter = ranges.begin();
    bool splitWithin = false;
    while (firstIter != ranges.end()) {
        if (firstIter->to <= splitTime) {
            ++firstIter;
        } else if (firstIter->from < splitTime) {
            splitWithin = true;
            break;
        } else {
            break;
        }
    }

    // Transfer rest of list to the split lifetime.
    split.ranges.splice(split.ranges.end(), ranges, firstIter, ranges.end());
    if (splitWithin) {
        ranges.emplace_back(LiveRange(split.start(), splitTime));
        split.ranges.begin()->from = splitTime;
    }

    // Divide the usages maps.
    auto lowerBound = usages.lower_bound(splitTime);
    while (lowerBound != usages.end()) {
        split.usages.insert(usages.extract(lowerBound));
        lowerBound = usages.lower_bound(splitTime);
    }

    return split;
}

bool LifetimeInterval::covers(Position p) const {
    if (isEmpty() || p < start() || p >= end()) {
        return false;
    }

    for (const auto& range : ranges) {
        if (p >= range.from && p < range.to) {
            return true;
        } else if (p < range.from) {
            return false;
        }
    }

    return false;
}

bool LifetimeInterval::findFirstIntersection(const LifetimeInterval& lt, Position& first) const {
    // Early-out for either Interval empty.
    if (isEmpty() || lt.isEmpty()) {
        return false;
    }

    // Early-out for no intersection between the intervals.
    if (end() <= lt.start() || lt.end() <= start()) {
        return false;
    }

    auto a = ranges.begin();
    auto b = lt.ranges.begin();
    while (a != ranges.end() && b != lt.ranges.end()) {
        if (a->to <= b->from) {
            ++a;
        } else if (b->to <= a->from) {
            ++b;
        } else {
            first = std::max(a->from, b->from);
            return true;
        }
    }

    return false;
}

Position LifetimeInterval::nextRegisterUse(Position p) const {
    for (auto iter = usages.lower_bound(p); iter != usages.end(); ++iter) {
        if (iter->second == UseKind::kRegister) {
            return iter->first;
        }
    }
    return kMaxPosition;
}

} // namespace lsra
