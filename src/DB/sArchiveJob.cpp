#include "MySqlConnector.h"
#include "sArchiveJob.h"
#include <archive_schema.h>
#include <sqlpp11/sqlpp11.h>

using namespace sqlpp;

namespace {
auto statusNames(const std::vector<JobStatus>& states) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(states.size());
    for (auto state : states) {
        names.push_back(jobStatusToString(state));
    }
    return names;
}

// Called when a guarded update touched no rows. MySQL reports rows changed rather than rows matched, so a permitted
// self transition (processing to processing) also lands here.
void checkRefusedTransition(const std::string& jobId, JobStatus target) {
    auto job = sArchiveJob::getByJobId(jobId);
    if (job.id == 0) {
        throw eInvalidJobTransition("Job " + jobId + " does not exist");
    }

    if (job.status == target && canTransition(target, target)) {
        return;
    }

    throw eInvalidJobTransition(
            "Job " + jobId + " can not move from " + jobStatusToString(job.status) + " to "
            + jobStatusToString(target)
    );
}
}

void sArchiveJob::save() {
    auto _database = MySqlConnector();
    schema::Userjobs _jobTable;

    if (dateCreated.time_since_epoch().count() == 0) {
        dateCreated = std::chrono::system_clock::now();
    }

    auto sizeValue = jobSize
            ? value_or_null(static_cast<int64_t>(*jobSize))
            : value_or_null<integral>(null);
    auto urlValue = downloadUrl
            ? value_or_null(*downloadUrl)
            : value_or_null<text>(null);

    if (id != 0) {
        // Update the record
        _database->run(
                update(_jobTable)
                        .set(
                                _jobTable.email = email,
                                _jobTable.sourceIP = sourceIp,
                                _jobTable.collection = collection,
                                _jobTable.jobStatus = jobStatusToString(status),
                                _jobTable.jobSize = sizeValue,
                                _jobTable.downloadURL = urlValue
                        )
                        .where(
                                _jobTable.id == static_cast<uint64_t>(id)
                        )
        );
    } else {
        // Create the record
        id = _database->run(
                insert_into(_jobTable)
                        .set(
                                _jobTable.jobid = jobId,
                                _jobTable.email = email,
                                _jobTable.sourceIP = sourceIp,
                                _jobTable.collection = collection,
                                _jobTable.dateCreated = std::chrono::time_point_cast<std::chrono::microseconds>(
                                        dateCreated
                                ),
                                _jobTable.jobStatus = jobStatusToString(status),
                                _jobTable.jobSize = sizeValue,
                                _jobTable.downloadURL = urlValue
                        )
        );
    }
}

auto sArchiveJob::getByJobId(const std::string& jobId) -> sArchiveJob {
    auto _database = MySqlConnector();
    schema::Userjobs _jobTable;

    auto jobResults =
            _database->run(
                    select(all_of(_jobTable))
                            .from(_jobTable)
                            .where(_jobTable.jobid == jobId)
            );

    if (!jobResults.empty()) {
        return fromRecord(&jobResults.front());
    }

    return sArchiveJob{};
}

auto sArchiveJob::getLatestActive(const std::string& email, const std::string& collection) -> sArchiveJob {
    auto _database = MySqlConnector();
    schema::Userjobs _jobTable;

    // Failed attempts never block a retry, so only the newest non-failed record counts
    auto jobResults =
            _database->run(
                    select(all_of(_jobTable))
                            .from(_jobTable)
                            .where(
                                    _jobTable.email == email
                                    and _jobTable.collection == collection
                                    and _jobTable.jobStatus != jobStatusToString(JobStatus::FAILED)
                            )
                            .order_by(_jobTable.dateCreated.desc())
                            .limit(1U)
            );

    if (!jobResults.empty()) {
        return fromRecord(&jobResults.front());
    }

    return sArchiveJob{};
}

void sArchiveJob::transitionStatus(const std::string& jobId, JobStatus target) {
    auto predecessors = allowedPredecessors(target);
    if (predecessors.empty()) {
        throw eInvalidJobTransition("No job may move to " + jobStatusToString(target));
    }

    auto _database = MySqlConnector();
    schema::Userjobs _jobTable;

    auto updated = _database->run(
            update(_jobTable)
                    .set(_jobTable.jobStatus = jobStatusToString(target))
                    .where(
                            _jobTable.jobid == jobId
                            and _jobTable.jobStatus.in(value_list(statusNames(predecessors)))
                    )
    );

    if (updated == 0) {
        checkRefusedTransition(jobId, target);
    }
}

void sArchiveJob::markCompleted(const std::string& jobId, uint64_t sizeMb, const std::string& downloadUrl) {
    auto _database = MySqlConnector();
    schema::Userjobs _jobTable;

    auto updated = _database->run(
            update(_jobTable)
                    .set(
                            _jobTable.jobStatus = jobStatusToString(JobStatus::COMPLETED),
                            _jobTable.jobSize = static_cast<int64_t>(sizeMb),
                            _jobTable.downloadURL = downloadUrl
                    )
                    .where(
                            _jobTable.jobid == jobId
                            and _jobTable.jobStatus.in(
                                    value_list(statusNames(allowedPredecessors(JobStatus::COMPLETED)))
                            )
                    )
    );

    if (updated == 0) {
        checkRefusedTransition(jobId, JobStatus::COMPLETED);
    }
}
