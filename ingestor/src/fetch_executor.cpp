#include "fetch_executor.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <exception>

std::string chunk_status_name(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Fetched: return "fetched";
        case ChunkStatus::ValidationFailed: return "validation_failed";
        case ChunkStatus::TransientExhausted: return "transient_exhausted";
        case ChunkStatus::PermanentFailure: return "permanent_failure";
        case ChunkStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::size_t FetchReport::count(ChunkStatus status) const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [status](const ChunkOutcome& o) { return o.status == status; }));
}

FetchExecutor::FetchExecutor(std::shared_ptr<BarSource> source,
                             std::shared_ptr<RateLimiter> limiter,
                             std::shared_ptr<Clock> clock,
                             FetchSettings settings)
    : source_(std::move(source)), limiter_(std::move(limiter)), clock_(std::move(clock)),
      settings_(settings), pool_(settings.workers) {}

std::vector<Chunk> FetchExecutor::split_into_chunks(const std::vector<CoverageRange>& ranges,
                                                    Interval interval) {
    const auto& traits = schema::traits(interval);
    const int64_t unit = traits.unit_seconds;
    const int64_t max_span = static_cast<int64_t>(traits.max_span_days) * 86400;

    auto sorted = ranges;
    std::sort(sorted.begin(), sorted.end(),
              [](const CoverageRange& a, const CoverageRange& b) { return a.start < b.start; });

    std::vector<Chunk> chunks;
    for (const auto& r : sorted) {
        int64_t s = r.start;
        while (s <= r.end) {
            int64_t e = std::min(r.end, s + max_span - unit);
            chunks.push_back({chunks.size(), {s, e}});
            s = e + unit;
        }
    }
    return chunks;
}

ChunkOutcome FetchExecutor::run_chunk(const SeriesKey& key, const Chunk& chunk,
                                      const std::function<bool()>& should_stop) {
    ChunkOutcome outcome;
    outcome.chunk = chunk;

    RetryMachine machine(settings_.retry);
    std::vector<RawBar> rows;

    while (!machine.finished()) {
        if (machine.state() == RetryState::Waiting) {
            spdlog::warn("{} chunk {} attempt {} failed: {} (retrying in {} ms)",
                         key.to_string(), chunk.index, machine.attempts(),
                         machine.last_error(), machine.pending_delay().count());
            clock_->sleep_for(machine.pending_delay());
            machine.resume();
            continue;
        }

        if (should_stop()) {
            outcome.status = ChunkStatus::Cancelled;
            outcome.attempts = machine.attempts();
            outcome.error = "cancelled";
            return outcome;
        }

        limiter_->acquire();
        if (should_stop()) {
            limiter_->release();
            outcome.status = ChunkStatus::Cancelled;
            outcome.attempts = machine.attempts();
            outcome.error = "cancelled";
            return outcome;
        }

        machine.begin_attempt();
        try {
            rows = source_->fetch_bars(key, chunk.range.start, chunk.range.end);
            machine.on_success();
        } catch (const TransientFetchError& e) {
            machine.on_transient_failure(e.what());
        } catch (const PermanentFetchError& e) {
            machine.on_permanent_failure(e.what());
        } catch (const std::exception& e) {
            machine.on_permanent_failure(std::string("unexpected: ") + e.what());
        }
    }

    outcome.attempts = machine.attempts();

    if (machine.state() == RetryState::Exhausted) {
        outcome.status = ChunkStatus::TransientExhausted;
        outcome.error = machine.last_error();
        spdlog::error("{} chunk {} gave up after {} attempts: {}",
                      key.to_string(), chunk.index, outcome.attempts, outcome.error);
        return outcome;
    }
    if (machine.state() == RetryState::PermanentFailure) {
        outcome.status = ChunkStatus::PermanentFailure;
        outcome.error = machine.last_error();
        spdlog::error("{} chunk {} failed permanently: {}", key.to_string(), chunk.index, outcome.error);
        return outcome;
    }

    // Upstream ranges are inclusive and sometimes generous at the edges.
    std::size_t before = rows.size();
    rows.erase(std::remove_if(rows.begin(), rows.end(), [&chunk](const RawBar& r) {
        return r.timestamp && (*r.timestamp < chunk.range.start || *r.timestamp > chunk.range.end);
    }), rows.end());

    auto rules = SegmentRules::for_segment(key.segment);
    rules.max_warn_ratio = settings_.max_warn_ratio;
    outcome.validation = Validator::validate(rows, rules);
    if (rows.size() != before) {
        outcome.validation.warnings.push_back(
            std::to_string(before - rows.size()) + " rows outside the requested range dropped");
    }

    outcome.status = outcome.validation.storable() ? ChunkStatus::Fetched : ChunkStatus::ValidationFailed;
    return outcome;
}

FetchReport FetchExecutor::execute(const SeriesKey& key, const std::vector<CoverageRange>& ranges,
                                   const CancelToken* cancel, const ChunkSink& sink) {
    FetchReport report;
    auto chunks = split_into_chunks(ranges, key.interval);
    if (chunks.empty()) {
        return report;
    }

    spdlog::info("Fetching {} in {} chunk(s)", key.to_string(), chunks.size());

    auto halted = std::make_shared<std::atomic<bool>>(false);
    std::function<bool()> should_stop = [halted, cancel]() {
        return halted->load() || (cancel && cancel->is_cancelled());
    };

    std::vector<std::future<ChunkOutcome>> pending;
    pending.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        pending.push_back(pool_.submit([this, key, chunk, should_stop]() {
            return run_chunk(key, chunk, should_stop);
        }));
    }

    std::exception_ptr failure;
    for (auto& future : pending) {
        ChunkOutcome outcome = future.get();

        if (failure) {
            outcome.status = ChunkStatus::Cancelled;
            outcome.error = "halted after storage failure";
            report.outcomes.push_back(std::move(outcome));
            continue;
        }

        if (outcome.status == ChunkStatus::Fetched && should_stop()) {
            outcome.status = ChunkStatus::Cancelled;
            outcome.error = "cancelled before commit";
        }

        if (sink) {
            try {
                sink(key, outcome);
            } catch (const std::exception& e) {
                spdlog::error("{} halted at chunk {}: {}", key.to_string(), outcome.chunk.index, e.what());
                failure = std::current_exception();
                halted->store(true);
            }
        }
        report.outcomes.push_back(std::move(outcome));
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    spdlog::info("Fetched {}: {} ok, {} invalid, {} exhausted, {} permanent, {} cancelled",
                 key.to_string(), report.count(ChunkStatus::Fetched),
                 report.count(ChunkStatus::ValidationFailed),
                 report.count(ChunkStatus::TransientExhausted),
                 report.count(ChunkStatus::PermanentFailure),
                 report.count(ChunkStatus::Cancelled));
    return report;
}
