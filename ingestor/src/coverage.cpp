#include "coverage.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

void to_json(nlohmann::json& j, const CoverageRange& r) {
    j = nlohmann::json::array({r.start, r.end});
}

void from_json(const nlohmann::json& j, CoverageRange& r) {
    r.start = j.at(0).get<int64_t>();
    r.end = j.at(1).get<int64_t>();
}

namespace coverage {

int64_t align_down(int64_t ts, int64_t unit) {
    int64_t r = ts % unit;
    if (r < 0) r += unit;
    return ts - r;
}

bool overlaps(const CoverageRange& a, const CoverageRange& b) {
    return a.start <= b.end && b.start <= a.end;
}

void check_consistent(const std::vector<CoverageRange>& ranges) {
    auto sorted = ranges;
    std::sort(sorted.begin(), sorted.end(),
              [](const CoverageRange& a, const CoverageRange& b) { return a.start < b.start; });
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i].start > sorted[i].end) {
            throw StorageIntegrityError("Inverted coverage range " + describe({sorted[i]}));
        }
        if (i > 0 && overlaps(sorted[i - 1], sorted[i])) {
            throw StorageIntegrityError("Overlapping coverage ranges " +
                                        describe({sorted[i - 1], sorted[i]}));
        }
    }
}

std::vector<CoverageRange> normalize(std::vector<CoverageRange> ranges, int64_t unit) {
    std::sort(ranges.begin(), ranges.end(),
              [](const CoverageRange& a, const CoverageRange& b) { return a.start < b.start; });
    std::vector<CoverageRange> merged;
    for (const auto& r : ranges) {
        if (!merged.empty() && r.start <= merged.back().end + unit) {
            merged.back().end = std::max(merged.back().end, r.end);
        } else {
            merged.push_back(r);
        }
    }
    return merged;
}

std::vector<CoverageRange> add(const std::vector<CoverageRange>& ranges,
                               const CoverageRange& range, int64_t unit) {
    auto all = ranges;
    all.push_back(range);
    return normalize(std::move(all), unit);
}

std::vector<CoverageRange> subtract(const CoverageRange& request,
                                    const std::vector<CoverageRange>& ranges,
                                    int64_t unit) {
    std::vector<CoverageRange> gaps;
    int64_t cursor = request.start;

    for (const auto& r : normalize(ranges, unit)) {
        if (r.end < cursor) continue;
        if (r.start > request.end) break;
        if (r.start > cursor) {
            gaps.push_back({cursor, r.start - unit});
        }
        cursor = r.end + unit;
        if (cursor > request.end) break;
    }

    if (cursor <= request.end) {
        gaps.push_back({cursor, request.end});
    }
    return gaps;
}

int64_t total_units(const std::vector<CoverageRange>& ranges, int64_t unit) {
    int64_t total = 0;
    for (const auto& r : ranges) {
        total += (r.end - r.start) / unit + 1;
    }
    return total;
}

std::string describe(const std::vector<CoverageRange>& ranges) {
    std::string out;
    for (const auto& r : ranges) {
        if (!out.empty()) out += ", ";
        out += "[" + util::format_datetime(r.start) + " .. " + util::format_datetime(r.end) + "]";
    }
    return out.empty() ? "[]" : out;
}

} // namespace coverage
