//
// The retrieval request carried by the work queue
//

#ifndef SDS_ARCHIVE_SERVER_S_QUEUE_MESSAGE_H
#define SDS_ARCHIVE_SERVER_S_QUEUE_MESSAGE_H

#include <string>

struct sQueueMessage {
    // Serialises to {"sda_path": ..., "email": ..., "job_id": ...}
    [[nodiscard]] auto toJson() const -> std::string;

    // Throws std::invalid_argument if the body is not a JSON object carrying all three string fields
    static auto fromJson(const std::string& body) -> sQueueMessage;

    std::string sdaPath;
    std::string email;
    std::string jobId;
};

#endif //SDS_ARCHIVE_SERVER_S_QUEUE_MESSAGE_H
