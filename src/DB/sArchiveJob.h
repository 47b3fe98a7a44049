//
// Job records in the userjobs table
//

#ifndef SDS_ARCHIVE_SERVER_S_ARCHIVE_JOB_H
#define SDS_ARCHIVE_SERVER_S_ARCHIVE_JOB_H

#include "../Lib/JobStatus.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sArchiveJob {
    static auto fromRecord(auto record) -> sArchiveJob {
        return {
                .id = static_cast<uint64_t>(record->id),
                .jobId = record->jobid,
                .email = record->email,
                .sourceIp = record->sourceIP,
                .collection = record->collection,
                .status = jobStatusFromString(record->jobStatus),
                .jobSize = record->jobSize.is_null()
                        ? std::nullopt
                        : std::optional<uint64_t>(static_cast<uint64_t>(record->jobSize)),
                .downloadUrl = record->downloadURL.is_null()
                        ? std::nullopt
                        : std::optional<std::string>(record->downloadURL.value()),
                .dateCreated = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                        record->dateCreated.value()
                )
        };
    }

    // Database methods - implemented in sArchiveJob.cpp
    void save();
    static auto getByJobId(const std::string& jobId) -> sArchiveJob;
    static auto getLatestActive(const std::string& email, const std::string& collection) -> sArchiveJob;

    // Moves the job to `target` only if its stored status is an allowed predecessor. Throws eInvalidJobTransition
    // when the job is missing or in a state that can't move to `target`.
    static void transitionStatus(const std::string& jobId, JobStatus target);
    static void markCompleted(const std::string& jobId, uint64_t sizeMb, const std::string& downloadUrl);

    uint64_t id = 0;
    std::string jobId;
    std::string email;
    std::string sourceIp;
    std::string collection;
    JobStatus status = JobStatus::SUBMITTED;
    std::optional<uint64_t> jobSize;
    std::optional<std::string> downloadUrl;
    std::chrono::system_clock::time_point dateCreated;
};

#endif //SDS_ARCHIVE_SERVER_S_ARCHIVE_JOB_H
