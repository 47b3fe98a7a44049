#include "JobStatus.h"
#include <algorithm>

auto jobStatusToString(JobStatus status) -> std::string {
    switch (status) {
        case JobStatus::SUBMITTED:
            return "submitted";
        case JobStatus::PROCESSING:
            return "processing";
        case JobStatus::COMPLETED:
            return "completed";
        case JobStatus::FAILED:
            return "failed";
        case JobStatus::CANCELLED:
            return "cancelled";
    }

    throw std::invalid_argument("Unknown job status " + std::to_string(static_cast<int>(status)));
}

auto jobStatusFromString(const std::string& status) -> JobStatus {
    for (auto candidate : {JobStatus::SUBMITTED, JobStatus::PROCESSING, JobStatus::COMPLETED, JobStatus::FAILED,
                           JobStatus::CANCELLED}) {
        if (jobStatusToString(candidate) == status) {
            return candidate;
        }
    }

    throw std::invalid_argument("Unknown job status '" + status + "'");
}

auto allowedPredecessors(JobStatus target) -> std::vector<JobStatus> {
    switch (target) {
        case JobStatus::SUBMITTED:
            return {};
        case JobStatus::PROCESSING:
            return {JobStatus::SUBMITTED, JobStatus::PROCESSING};
        case JobStatus::COMPLETED:
        case JobStatus::FAILED:
            return {JobStatus::PROCESSING};
        case JobStatus::CANCELLED:
            return {JobStatus::SUBMITTED};
    }

    return {};
}

auto canTransition(JobStatus from, JobStatus to) -> bool {
    auto predecessors = allowedPredecessors(to);
    return std::find(predecessors.begin(), predecessors.end(), from) != predecessors.end();
}

auto isTerminal(JobStatus status) -> bool {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
}
