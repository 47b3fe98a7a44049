//
// Admits, deduplicates and enqueues retrieval requests
//

#ifndef SDS_ARCHIVE_SERVER_SUBMISSIONGATEWAY_H
#define SDS_ARCHIVE_SERVER_SUBMISSIONGATEWAY_H

#include "../Interfaces/IWorkQueue.h"
#include "DenyList.h"
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

enum class SubmissionOutcome {
    ACCEPTED,
    DENY_LISTED,
    DUPLICATE
};

struct sSubmissionResult {
    // The user facing text for the outcome
    [[nodiscard]] auto message() const -> std::string;

    // A single key object, {"Acknowledgement" | "Warning" | "Invalid Request": message()}
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    SubmissionOutcome outcome = SubmissionOutcome::ACCEPTED;
    // Only set when accepted
    std::string jobId;
};

class SubmissionGateway {
public:
    SubmissionGateway(std::shared_ptr<IWorkQueue> queue, DenyList denyList, std::chrono::minutes minimumJobInterval);

    auto submit(const std::string& collectionPath, const std::string& email, const std::string& sourceIp)
            -> sSubmissionResult;

private:
    std::shared_ptr<IWorkQueue> queue;
    DenyList denyList;
    std::chrono::minutes minimumJobInterval;
};

#endif //SDS_ARCHIVE_SERVER_SUBMISSIONGATEWAY_H
