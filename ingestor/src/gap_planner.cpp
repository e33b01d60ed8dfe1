#include "gap_planner.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

GapPlanner::GapPlanner(std::shared_ptr<StoreRegistry> stores)
    : stores_(std::move(stores)) {}

std::vector<CoverageRange> GapPlanner::plan(const SeriesKey& key, int64_t start, int64_t end) const {
    auto store = stores_->get(key);
    auto existing = store->coverage(key);
    auto gaps = plan_against(existing, key.interval, start, end);

    spdlog::debug("Plan for {} [{} .. {}]: {} gap(s) {}", key.to_string(),
                  util::format_datetime(start), util::format_datetime(end),
                  gaps.size(), coverage::describe(gaps));
    return gaps;
}

std::vector<CoverageRange> GapPlanner::plan_against(const std::vector<CoverageRange>& existing,
                                                    Interval interval, int64_t start, int64_t end) {
    const auto unit = schema::unit_seconds(interval);
    int64_t aligned_start = coverage::align_down(start, unit);
    int64_t aligned_end = coverage::align_down(end, unit);
    if (aligned_start > aligned_end) {
        throw std::invalid_argument("Requested start " + util::format_datetime(start) +
                                    " is after end " + util::format_datetime(end));
    }

    coverage::check_consistent(existing);
    return coverage::subtract({aligned_start, aligned_end}, existing, unit);
}
