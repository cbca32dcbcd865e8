#ifndef DEEPZOOM_JOB_CONTEXT_HPP
#define DEEPZOOM_JOB_CONTEXT_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "logger/logger.hpp"
#include "pipeline/tile_error.hpp"

namespace deepzoom {
namespace pipeline {

enum class TileStatus {
    RECORDED,
    SKIPPED,
    FAILED
};

const char* tile_status_to_string(TileStatus status);

// Result of one tile task, folded into the job counters after a batch join
struct TileOutcome {
    std::string key;
    std::string tile_id;
    TileStatus status{TileStatus::FAILED};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string message;
};

struct JobSummary {
    uint64_t total{0};
    uint64_t processed{0};
    uint64_t skipped{0};
    uint64_t failed{0};
    bool cancelled{false};
};

// Per-job state passed through the pipeline: counters, logger and cancellation.
// Counters are written by the orchestrating thread only.
class JobContext {
public:
    using CancelFlag = std::shared_ptr<std::atomic<bool>>;

    // A shared cancel_flag lets the owner cancel before the context exists
    explicit JobContext(std::string job_id, CancelFlag cancel_flag = nullptr);

    JobContext(const JobContext&) = delete;
    JobContext& operator=(const JobContext&) = delete;

    const std::string& job_id() const { return job_id_; }
    logging::JobLogger& logger() { return logger_; }

    // ---- CANCELLATION ----
    // Takes effect at the next batch boundary
    void cancel() { cancelled_->store(true); }
    bool is_cancelled() const { return cancelled_->load(); }

    // ---- COUNTERS ----
    void set_total(uint64_t total) { total_.store(total); }
    void record(const TileOutcome& outcome);
    uint64_t total() const { return total_.load(); }
    uint64_t processed() const { return processed_.load(); }
    uint64_t skipped() const { return skipped_.load(); }
    uint64_t failed() const { return failed_.load(); }

    JobSummary summary() const;

private:
    std::string job_id_;
    logging::JobLogger logger_;
    CancelFlag cancelled_;
    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace pipeline
} // namespace deepzoom

#endif // DEEPZOOM_JOB_CONTEXT_HPP
