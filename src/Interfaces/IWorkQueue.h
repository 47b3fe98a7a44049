//
// Interface for the durable work queue between the gateway and the workers
//

#ifndef SDS_ARCHIVE_SERVER_I_WORK_QUEUE_H
#define SDS_ARCHIVE_SERVER_I_WORK_QUEUE_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// A message handed to a consumer. The delivery tag settles it through ack or reject.
struct sQueueDelivery {
    uint64_t deliveryTag = 0;
    std::string body;
    uint32_t deliveryCount = 0;
};

// Raised when a consumer asks for a second message while still holding one (prefetch is 1)
class eUnsettledDelivery : public std::runtime_error {
public:
    explicit eUnsettledDelivery(const std::string& what) : std::runtime_error(what) {}
};

// Raised when settling a delivery this consumer no longer holds, such as one whose lease ran out
class eUnknownDelivery : public std::runtime_error {
public:
    explicit eUnknownDelivery(const std::string& what) : std::runtime_error(what) {}
};

class IWorkQueue {
public:
    virtual ~IWorkQueue() = default;

    virtual void publish(const std::string& body) = 0;

    // Claims the oldest ready message, or returns nothing if the queue is empty
    virtual auto consume() -> std::optional<sQueueDelivery> = 0;

    virtual void ack(uint64_t deliveryTag) = 0;
    virtual void reject(uint64_t deliveryTag, bool requeue) = 0;
};

#endif //SDS_ARCHIVE_SERVER_I_WORK_QUEUE_H
