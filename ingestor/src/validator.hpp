#pragma once

#include "bars.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class Verdict {
    Pass,
    Warn,
    Fail
};

std::string verdict_name(Verdict verdict);

struct ValidationStats {
    std::size_t total_rows = 0;
    std::size_t clean_rows = 0;
    std::size_t warned_rows = 0;
    std::size_t failed_rows = 0;
    std::size_t missing_fields = 0;
    std::size_t ohlc_violations = 0;
    std::size_t out_of_bounds = 0;
    std::size_t ordering_errors = 0;
    std::size_t zero_volume = 0;
    std::size_t spikes = 0;
    std::size_t open_interest_issues = 0;
};

struct ValidationReport {
    Verdict verdict = Verdict::Pass;
    ValidationStats stats;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<Bar> bars;  // empty when verdict is Fail

    bool storable() const { return verdict != Verdict::Fail; }
    std::vector<std::string> messages() const;
    nlohmann::json to_json() const;
};

class Validator {
public:
    static constexpr std::size_t kMaxMessages = 20;

    static ValidationReport validate(const std::vector<RawBar>& rows, const SegmentRules& rules);
};
