//
// Durable work queue stored in the work_queue table
//

#ifndef SDS_ARCHIVE_SERVER_MYSQL_WORK_QUEUE_H
#define SDS_ARCHIVE_SERVER_MYSQL_WORK_QUEUE_H

#include "../Interfaces/IWorkQueue.h"
#include "../Lib/GeneralUtils.h"
#include <chrono>
#include <string>

class MySqlWorkQueue : public IWorkQueue {
public:
    MySqlWorkQueue(std::string queueName, std::chrono::seconds redeliveryAfter);

    void publish(const std::string& body) override;
    auto consume() -> std::optional<sQueueDelivery> override;
    void ack(uint64_t deliveryTag) override;
    void reject(uint64_t deliveryTag, bool requeue) override;

    [[nodiscard]] auto getConsumerTag() const -> const std::string& { return consumerTag; }

    // Number of messages in the queue, ready or held
    [[nodiscard]] auto depth() const -> uint64_t;

private:
    auto hasUnsettledDelivery() const -> bool;
    auto claimOldestReady() -> uint64_t;

    std::string queueName;
    std::string consumerTag;
    std::chrono::seconds redeliveryAfter;
};

#endif //SDS_ARCHIVE_SERVER_MYSQL_WORK_QUEUE_H
