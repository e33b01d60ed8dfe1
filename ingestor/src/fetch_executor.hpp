#pragma once

#include "bar_source.hpp"
#include "rate_limiter.hpp"
#include "retry.hpp"
#include "validator.hpp"
#include "worker_pool.hpp"
#include "coverage.hpp"
#include "clock.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct Chunk {
    std::size_t index;
    CoverageRange range;
};

enum class ChunkStatus {
    Fetched,
    ValidationFailed,
    TransientExhausted,
    PermanentFailure,
    Cancelled
};

std::string chunk_status_name(ChunkStatus status);

struct ChunkOutcome {
    Chunk chunk;
    ChunkStatus status = ChunkStatus::Cancelled;
    int attempts = 0;
    std::string error;
    ValidationReport validation;
};

struct FetchReport {
    std::vector<ChunkOutcome> outcomes;

    std::size_t count(ChunkStatus status) const;
};

struct FetchSettings {
    std::size_t workers = 3;
    RetryPolicy retry;
    double max_warn_ratio = 0.5;
};

// Called once per chunk in ascending order. The sink reports per-chunk
// failures itself and throws only StorageIntegrityError, which stops the
// remaining chunks of the series and is rethrown from execute.
using ChunkSink = std::function<void(const SeriesKey&, const ChunkOutcome&)>;

class FetchExecutor {
public:
    FetchExecutor(std::shared_ptr<BarSource> source,
                  std::shared_ptr<RateLimiter> limiter,
                  std::shared_ptr<Clock> clock,
                  FetchSettings settings);

    FetchReport execute(const SeriesKey& key, const std::vector<CoverageRange>& ranges,
                        const CancelToken* cancel = nullptr, const ChunkSink& sink = {});

    static std::vector<Chunk> split_into_chunks(const std::vector<CoverageRange>& ranges,
                                                Interval interval);

private:
    ChunkOutcome run_chunk(const SeriesKey& key, const Chunk& chunk,
                           const std::function<bool()>& should_stop);

    std::shared_ptr<BarSource> source_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<Clock> clock_;
    FetchSettings settings_;
    WorkerPool pool_;
};
