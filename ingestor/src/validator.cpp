#include "validator.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <cmath>
#include <algorithm>

std::string verdict_name(Verdict verdict) {
    switch (verdict) {
        case Verdict::Pass: return "pass";
        case Verdict::Warn: return "warn";
        case Verdict::Fail: return "fail";
    }
    return "unknown";
}

namespace {

struct RowFindings {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

void record(std::vector<std::string>& sink, std::size_t& total, const std::string& msg) {
    ++total;
    if (sink.size() < Validator::kMaxMessages) {
        sink.push_back(msg);
    }
}

std::string row_label(std::size_t index, const RawBar& row) {
    if (row.timestamp) {
        return fmt::format("row {} ({})", index, util::format_datetime(*row.timestamp));
    }
    return fmt::format("row {}", index);
}

void check_price(const char* field, double value, const SegmentRules& rules,
                 RowFindings& findings, ValidationStats& stats) {
    if (!std::isfinite(value)) {
        findings.errors.push_back(fmt::format("{} is not finite", field));
        ++stats.out_of_bounds;
        return;
    }
    if (value == 0.0) {
        if (!rules.zero_price_allowed) {
            findings.errors.push_back(fmt::format("{} is zero", field));
            ++stats.out_of_bounds;
        }
        return;
    }
    if (value < rules.min_price || value > rules.max_price) {
        findings.errors.push_back(fmt::format("{} {} outside [{}, {}]", field, value,
                                              rules.min_price, rules.max_price));
        ++stats.out_of_bounds;
    }
}

} // namespace

std::vector<std::string> ValidationReport::messages() const {
    std::vector<std::string> out = errors;
    out.insert(out.end(), warnings.begin(), warnings.end());
    return out;
}

nlohmann::json ValidationReport::to_json() const {
    return {
        {"verdict", verdict_name(verdict)},
        {"total_rows", stats.total_rows},
        {"clean_rows", stats.clean_rows},
        {"warned_rows", stats.warned_rows},
        {"failed_rows", stats.failed_rows},
        {"errors", errors},
        {"warnings", warnings}
    };
}

ValidationReport Validator::validate(const std::vector<RawBar>& rows, const SegmentRules& rules) {
    ValidationReport report;
    auto& stats = report.stats;
    stats.total_rows = rows.size();

    if (rows.empty()) {
        report.verdict = Verdict::Warn;
        report.warnings.push_back("empty batch");
        return report;
    }

    std::size_t error_count = 0;
    std::size_t warning_count = 0;
    std::optional<int64_t> prev_ts;
    std::optional<double> prev_close;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        RowFindings findings;

        std::vector<std::string> missing;
        if (!row.timestamp) missing.push_back("timestamp");
        if (!row.open) missing.push_back("open");
        if (!row.high) missing.push_back("high");
        if (!row.low) missing.push_back("low");
        if (!row.close) missing.push_back("close");
        if (!row.volume) missing.push_back("volume");

        if (!missing.empty()) {
            ++stats.missing_fields;
            ++stats.failed_rows;
            std::string fields;
            for (const auto& f : missing) {
                if (!fields.empty()) fields += ", ";
                fields += f;
            }
            record(report.errors, error_count, row_label(i, row) + ": missing " + fields);
            continue;
        }

        double o = *row.open, h = *row.high, l = *row.low, c = *row.close;

        if (rules.open_interest_expected && !row.open_interest) {
            findings.warnings.push_back("open interest missing");
            ++stats.open_interest_issues;
        } else if (!rules.open_interest_expected && row.open_interest) {
            findings.warnings.push_back("unexpected open interest ignored");
            ++stats.open_interest_issues;
        }

        check_price("open", o, rules, findings, stats);
        check_price("high", h, rules, findings, stats);
        check_price("low", l, rules, findings, stats);
        check_price("close", c, rules, findings, stats);

        if (l > std::min(o, c) || std::max(o, c) > h || l > h) {
            findings.errors.push_back(fmt::format("OHLC violation o={} h={} l={} c={}", o, h, l, c));
            ++stats.ohlc_violations;
        }

        if (*row.volume < 0 || *row.volume > rules.max_volume) {
            findings.errors.push_back(fmt::format("volume {} out of range", *row.volume));
            ++stats.out_of_bounds;
        } else if (*row.volume == 0) {
            findings.warnings.push_back("zero volume");
            ++stats.zero_volume;
        }

        if (rules.open_interest_expected && row.open_interest &&
            (*row.open_interest < 0 || *row.open_interest > rules.max_open_interest)) {
            findings.errors.push_back(fmt::format("open interest {} out of range", *row.open_interest));
            ++stats.out_of_bounds;
        }

        if (prev_ts && *row.timestamp <= *prev_ts) {
            findings.errors.push_back(*row.timestamp == *prev_ts ? "duplicate timestamp"
                                                                 : "timestamp out of order");
            ++stats.ordering_errors;
        }
        prev_ts = std::max(prev_ts.value_or(*row.timestamp), *row.timestamp);

        if (prev_close && *prev_close > 0.0 && std::isfinite(c)) {
            double move = std::abs(c - *prev_close) / *prev_close;
            if (move > rules.spike_threshold) {
                findings.warnings.push_back(fmt::format("price spike {:.1f}%", move * 100.0));
                ++stats.spikes;
            }
        }
        if (std::isfinite(c)) prev_close = c;

        if (!findings.errors.empty()) {
            ++stats.failed_rows;
            for (const auto& e : findings.errors) {
                record(report.errors, error_count, row_label(i, row) + ": " + e);
            }
            continue;
        }

        if (!findings.warnings.empty()) {
            ++stats.warned_rows;
            for (const auto& w : findings.warnings) {
                record(report.warnings, warning_count, row_label(i, row) + ": " + w);
            }
        } else {
            ++stats.clean_rows;
        }

        Bar bar;
        bar.timestamp = *row.timestamp;
        bar.open = o;
        bar.high = h;
        bar.low = l;
        bar.close = c;
        bar.volume = *row.volume;
        bar.open_interest = rules.open_interest_expected ? row.open_interest.value_or(0) : 0;
        report.bars.push_back(bar);
    }

    if (error_count > report.errors.size()) {
        report.errors.push_back(fmt::format("... and {} more errors", error_count - report.errors.size()));
    }
    if (warning_count > report.warnings.size()) {
        report.warnings.push_back(fmt::format("... and {} more warnings",
                                              warning_count - report.warnings.size()));
    }

    double warn_ratio = static_cast<double>(stats.warned_rows) / static_cast<double>(stats.total_rows);

    if (stats.failed_rows > 0) {
        report.verdict = Verdict::Fail;
    } else if (warn_ratio > rules.max_warn_ratio) {
        report.verdict = Verdict::Fail;
        report.errors.push_back(fmt::format("{} of {} rows carry warnings, above the {:.0f}% limit",
                                            stats.warned_rows, stats.total_rows,
                                            rules.max_warn_ratio * 100.0));
    } else if (stats.warned_rows > 0) {
        report.verdict = Verdict::Warn;
    } else {
        report.verdict = Verdict::Pass;
    }

    if (report.verdict == Verdict::Fail) {
        report.bars.clear();
    }
    return report;
}
