#include "../DB/sArchiveJob.h"
#include "../Lib/GeneralUtils.h"
#include "../Queue/sQueueMessage.h"
#include "SubmissionGateway.h"
#include <iostream>
#include <utility>

auto sSubmissionResult::message() const -> std::string {
    switch (outcome) {
        case SubmissionOutcome::ACCEPTED:
            return "Your download request has been submitted. You will receive an email response to your request "
                   "with a download link. Once your request has been processed, the download link will remain valid "
                   "for 24 hours";
        case SubmissionOutcome::DENY_LISTED:
            return "Your request cannot be fulfilled since your email address is in deny list, please contact the "
                   "administrator if you think you are wrongly put on this list.";
        case SubmissionOutcome::DUPLICATE:
            return "You submitted duplicate requests in short timeframe, please wait for completion of your prior "
                   "request. Thank you for your cooperation.";
    }

    return {};
}

auto sSubmissionResult::toJson() const -> nlohmann::json {
    nlohmann::json result;
    switch (outcome) {
        case SubmissionOutcome::ACCEPTED:
            result["Acknowledgement"] = message();
            break;
        case SubmissionOutcome::DENY_LISTED:
            result["Warning"] = message();
            break;
        case SubmissionOutcome::DUPLICATE:
            result["Invalid Request"] = message();
            break;
    }
    return result;
}

SubmissionGateway::SubmissionGateway(std::shared_ptr<IWorkQueue> queue, DenyList denyList,
                                     std::chrono::minutes minimumJobInterval) :
        queue(std::move(queue)), denyList(std::move(denyList)), minimumJobInterval(minimumJobInterval) {
}

auto SubmissionGateway::submit(const std::string& collectionPath, const std::string& email,
                               const std::string& sourceIp) -> sSubmissionResult {
    if (denyList.contains(email)) {
        std::cout << "GATEWAY: Refused request from deny listed " << email << " for " << collectionPath << std::endl;
        return {.outcome = SubmissionOutcome::DENY_LISTED};
    }

    auto collection = collectionBasename(collectionPath);
    auto now = std::chrono::system_clock::now();

    auto latest = sArchiveJob::getLatestActive(email, collection);
    if (latest.id != 0 && now - latest.dateCreated < minimumJobInterval) {
        std::cout << "GATEWAY: Duplicate request from " << email << " for " << collection << ", job "
                  << latest.jobId << " was submitted at " << formatTimestamp(latest.dateCreated) << std::endl;
        return {.outcome = SubmissionOutcome::DUPLICATE};
    }

    sArchiveJob job{
            .jobId = generateTimeOrderedUUID(),
            .email = email,
            .sourceIp = sourceIp,
            .collection = collection,
            .status = JobStatus::SUBMITTED,
            .dateCreated = now
    };
    job.save();

    // A crash between here and the publish leaves a submitted job with no message
    queue->publish(sQueueMessage{.sdaPath = collectionPath, .email = email, .jobId = job.jobId}.toJson());

    std::cout << "GATEWAY: Accepted job " << job.jobId << " for " << email << " (" << collectionPath << ")"
              << std::endl;

    return {.outcome = SubmissionOutcome::ACCEPTED, .jobId = job.jobId};
}
