#pragma once

#include "local_store.hpp"
#include "coverage.hpp"
#include <memory>
#include <vector>

class GapPlanner {
public:
    explicit GapPlanner(std::shared_ptr<StoreRegistry> stores);

    // Sub-ranges of [start, end] with no recorded coverage, ascending.
    std::vector<CoverageRange> plan(const SeriesKey& key, int64_t start, int64_t end) const;

    static std::vector<CoverageRange> plan_against(const std::vector<CoverageRange>& existing,
                                                   Interval interval, int64_t start, int64_t end);

private:
    std::shared_ptr<StoreRegistry> stores_;
};
