#pragma once

#include <string>

namespace crawl_archiver { namespace orchestrator {

// Overall result of one invocation
enum class JobStatus {
    Success,
    Stopped,
    Failed,
    FailedMaxAttempts,
    FailedNoArtifacts,
    FailedPathConversion
};

inline std::string jobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Success: return "success";
        case JobStatus::Stopped: return "stopped";
        case JobStatus::Failed: return "failed";
        case JobStatus::FailedMaxAttempts: return "failed_max_attempts";
        case JobStatus::FailedNoArtifacts: return "failed_no_artifacts";
        case JobStatus::FailedPathConversion: return "failed_path_conversion";
    }
    return "failed";
}

// Terminal state of one stage attempt
enum class StageOutcome {
    Success,
    Failed,
    Stopped,
    StoppedForAdaptation
};

inline std::string stageOutcomeName(StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::Success: return "success";
        case StageOutcome::Failed: return "failed";
        case StageOutcome::Stopped: return "stopped";
        case StageOutcome::StoppedForAdaptation: return "stopped_for_adaptation";
    }
    return "failed";
}

} } // namespace crawl_archiver::orchestrator
