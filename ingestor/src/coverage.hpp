#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

// Closed range [start, end] of epoch seconds on an interval's sampling grid.
struct CoverageRange {
    int64_t start;
    int64_t end;

    bool operator==(const CoverageRange& other) const {
        return start == other.start && end == other.end;
    }
};

void to_json(nlohmann::json& j, const CoverageRange& r);
void from_json(const nlohmann::json& j, CoverageRange& r);

namespace coverage {
    int64_t align_down(int64_t ts, int64_t unit);

    bool overlaps(const CoverageRange& a, const CoverageRange& b);

    // Throws StorageIntegrityError if any two ranges overlap or a range is inverted.
    void check_consistent(const std::vector<CoverageRange>& ranges);

    // Sorts and merges ranges that overlap or touch within one unit.
    std::vector<CoverageRange> normalize(std::vector<CoverageRange> ranges, int64_t unit);

    std::vector<CoverageRange> add(const std::vector<CoverageRange>& ranges,
                                   const CoverageRange& range, int64_t unit);

    // Parts of request not covered by ranges, ascending. ranges must be consistent.
    std::vector<CoverageRange> subtract(const CoverageRange& request,
                                        const std::vector<CoverageRange>& ranges,
                                        int64_t unit);

    int64_t total_units(const std::vector<CoverageRange>& ranges, int64_t unit);

    std::string describe(const std::vector<CoverageRange>& ranges);
}
