#include "pipeline/job_context.hpp"
#include <utility>

namespace deepzoom {
namespace pipeline {

const char* tile_status_to_string(TileStatus status) {
    switch (status) {
        case TileStatus::RECORDED: return "Recorded";
        case TileStatus::SKIPPED: return "Skipped";
        case TileStatus::FAILED: return "Failed";
        default: return "Unknown";
    }
}

JobContext::JobContext(std::string job_id, CancelFlag cancel_flag)
    : job_id_(std::move(job_id))
    , logger_(logging::make_job_logger(job_id_))
    , cancelled_(cancel_flag ? std::move(cancel_flag) : std::make_shared<std::atomic<bool>>(false)) {}

void JobContext::record(const TileOutcome& outcome) {
    switch (outcome.status) {
        case TileStatus::RECORDED:
            ++processed_;
            break;
        case TileStatus::SKIPPED:
            ++skipped_;
            break;
        case TileStatus::FAILED:
            ++failed_;
            break;
    }
}

JobSummary JobContext::summary() const {
    JobSummary summary;
    summary.total = total();
    summary.processed = processed();
    summary.skipped = skipped();
    summary.failed = failed();
    summary.cancelled = is_cancelled();
    return summary;
}

} // namespace pipeline
} // namespace deepzoom
