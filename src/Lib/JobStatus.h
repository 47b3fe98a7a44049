//
// Archive job lifecycle states and the transitions allowed between them
//

#ifndef SDS_ARCHIVE_SERVER_JOBSTATUS_H
#define SDS_ARCHIVE_SERVER_JOBSTATUS_H

#include <stdexcept>
#include <string>
#include <vector>

enum class JobStatus {
    SUBMITTED,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED
};

class eInvalidJobTransition : public std::runtime_error {
public:
    explicit eInvalidJobTransition(const std::string& what) : std::runtime_error(what) {}
};

auto jobStatusToString(JobStatus status) -> std::string;
auto jobStatusFromString(const std::string& status) -> JobStatus;

// The states a job may be in immediately before moving to `target`. A job never returns to SUBMITTED, so that list is
// empty. PROCESSING may be re-entered by a redelivered message.
auto allowedPredecessors(JobStatus target) -> std::vector<JobStatus>;
auto canTransition(JobStatus from, JobStatus to) -> bool;
auto isTerminal(JobStatus status) -> bool;

#endif //SDS_ARCHIVE_SERVER_JOBSTATUS_H
