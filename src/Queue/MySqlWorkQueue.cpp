#include "../DB/MySqlConnector.h"
#include "MySqlWorkQueue.h"
#include <archive_schema.h>
#include <iostream>
#include <sqlpp11/sqlpp11.h>
#include <utility>

using namespace sqlpp;

// A claim can lose the race against another consumer, give up after this many candidates
constexpr uint32_t MAX_CLAIM_ATTEMPTS = 5;

MySqlWorkQueue::MySqlWorkQueue(std::string queueName, std::chrono::seconds redeliveryAfter) :
        queueName(std::move(queueName)),
        consumerTag("consumer-" + generateTimeOrderedUUID()),
        redeliveryAfter(redeliveryAfter) {
}

void MySqlWorkQueue::publish(const std::string& body) {
    auto _database = MySqlConnector();
    schema::WorkQueue _queueTable;

    auto messageId = _database->run(
            insert_into(_queueTable)
                    .set(
                            _queueTable.queue = queueName,
                            _queueTable.body = body,
                            _queueTable.deliveryCount = 0,
                            _queueTable.publishedAt = std::chrono::time_point_cast<std::chrono::microseconds>(
                                    std::chrono::system_clock::now()
                            )
                    )
    );

    std::cout << "QUEUE: Published message " << messageId << " to " << queueName << std::endl;
}

auto MySqlWorkQueue::consume() -> std::optional<sQueueDelivery> {
    if (hasUnsettledDelivery()) {
        throw eUnsettledDelivery("Consumer " + consumerTag + " still holds an unsettled delivery");
    }

    for (uint32_t attempt = 0; attempt < MAX_CLAIM_ATTEMPTS; attempt++) {
        auto candidate = claimOldestReady();
        if (candidate == 0) {
            return std::nullopt;
        }

        auto _database = MySqlConnector();
        schema::WorkQueue _queueTable;

        auto messageResults =
                _database->run(
                        select(_queueTable.id, _queueTable.body, _queueTable.deliveryCount)
                                .from(_queueTable)
                                .where(
                                        _queueTable.id == candidate
                                        and _queueTable.consumer == consumerTag
                                )
                );

        if (messageResults.empty()) {
            continue;
        }

        const auto& message = messageResults.front();
        sQueueDelivery delivery{
                .deliveryTag = static_cast<uint64_t>(message.id),
                .body = message.body,
                .deliveryCount = static_cast<uint32_t>(message.deliveryCount)
        };

        if (delivery.deliveryCount > 1) {
            std::cout << "QUEUE: Redelivering message " << delivery.deliveryTag << " (delivery "
                      << delivery.deliveryCount << ")" << std::endl;
        }

        return delivery;
    }

    return std::nullopt;
}

void MySqlWorkQueue::ack(uint64_t deliveryTag) {
    auto _database = MySqlConnector();
    schema::WorkQueue _queueTable;

    auto removed = _database->run(
            remove_from(_queueTable)
                    .where(
                            _queueTable.id == deliveryTag
                            and _queueTable.consumer == consumerTag
                    )
    );

    if (removed == 0) {
        throw eUnknownDelivery("Delivery " + std::to_string(deliveryTag) + " is not held by " + consumerTag);
    }
}

void MySqlWorkQueue::reject(uint64_t deliveryTag, bool requeue) {
    auto _database = MySqlConnector();
    schema::WorkQueue _queueTable;

    size_t affected = 0;
    if (requeue) {
        affected = _database->run(
                update(_queueTable)
                        .set(
                                _queueTable.consumer = null,
                                _queueTable.deliveredAt = null
                        )
                        .where(
                                _queueTable.id == deliveryTag
                                and _queueTable.consumer == consumerTag
                        )
        );
    } else {
        affected = _database->run(
                remove_from(_queueTable)
                        .where(
                                _queueTable.id == deliveryTag
                                and _queueTable.consumer == consumerTag
                        )
        );
    }

    if (affected == 0) {
        throw eUnknownDelivery("Delivery " + std::to_string(deliveryTag) + " is not held by " + consumerTag);
    }
}

auto MySqlWorkQueue::depth() const -> uint64_t {
    auto _database = MySqlConnector();
    schema::WorkQueue _queueTable;

    auto countResults =
            _database->run(
                    select(count(_queueTable.id))
                            .from(_queueTable)
                            .where(_queueTable.queue == queueName)
            );

    return static_cast<uint64_t>(countResults.front().count);
}

auto MySqlWorkQueue::hasUnsettledDelivery() const -> bool {
    auto _database = MySqlConnector();
    schema::WorkQueue _queueTable;

    // A held message past its lease is ready again, the claim below hands it back as a redelivery
    auto now = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    auto leaseCutoff = now - std::chrono::duration_cast<std::chrono::microseconds>(redeliveryAfter);

    auto heldResults =
            _database->run(
                    select(count(_queueTable.id))
                            .from(_queueTable)
                            .where(
                                    _queueTable.queue == queueName
                                    and _queueTable.consumer == consumerTag
                                    and _queueTable.deliveredAt > leaseCutoff
                            )
            );

    return static_cast<uint64_t>(heldResults.front().count) != 0;
}

auto MySqlWorkQueue::claimOldestReady() -> uint64_t {
    auto _database = MySqlConnector();
    schema::WorkQueue _queueTable;

    auto now = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    auto leaseCutoff = now - std::chrono::duration_cast<std::chrono::microseconds>(redeliveryAfter);

    // Ready means nobody holds it, or the holder's lease ran out
    auto candidateResults =
            _database->run(
                    select(_queueTable.id)
                            .from(_queueTable)
                            .where(
                                    _queueTable.queue == queueName
                                    and (
                                            _queueTable.consumer.is_null()
                                            or _queueTable.deliveredAt <= leaseCutoff
                                    )
                            )
                            .order_by(_queueTable.id.asc())
                            .limit(1U)
            );

    if (candidateResults.empty()) {
        return 0;
    }

    auto candidate = static_cast<uint64_t>(candidateResults.front().id);

    // Guarded claim, a competing consumer that got there first leaves nothing to update
    auto claimed = _database->run(
            update(_queueTable)
                    .set(
                            _queueTable.consumer = consumerTag,
                            _queueTable.deliveredAt = now,
                            _queueTable.deliveryCount = _queueTable.deliveryCount + 1
                    )
                    .where(
                            _queueTable.id == candidate
                            and (
                                    _queueTable.consumer.is_null()
                                    or _queueTable.deliveredAt <= leaseCutoff
                            )
                    )
    );

    if (claimed == 0) {
        std::cout << "QUEUE: Lost the claim on message " << candidate << ", retrying" << std::endl;
    }

    return candidate;
}
