//
// Single flight consumer that stages archive files and reports the outcome to the requester
//

#ifndef SDS_ARCHIVE_SERVER_RETRIEVALWORKER_H
#define SDS_ARCHIVE_SERVER_RETRIEVALWORKER_H

#include "../Interfaces/IArchiveTool.h"
#include "../Interfaces/INotifier.h"
#include "../Interfaces/IWorkQueue.h"
#include "../Lib/GeneralUtils.h"
#include "../Queue/sQueueMessage.h"
#include "StagingArea.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

struct sWorkerSettings {
    uint64_t usageThresholdBytes = 0;
    std::string httpDownloadBase;
    std::chrono::seconds toolTimeout{0};
    std::chrono::milliseconds idlePoll{0};
};

// An ack or reject the queue did not take, retried before the next consume
struct sPendingSettlement {
    uint64_t deliveryTag = 0;
    bool acknowledge = false;
    bool requeue = false;
};

class RetrievalWorker {
public:
    RetrievalWorker(std::shared_ptr<IWorkQueue> queue, std::shared_ptr<IArchiveTool> archiveTool,
                    std::shared_ptr<INotifier> notifier, StagingArea staging, sWorkerSettings settings);

    // Consumes until stop() is called
    void run();
    void stop();

    // Handles at most one message. Returns false if the queue was empty or an earlier delivery is still unsettled.
    auto processNext() -> bool;

    // <download base>/<basename>, ignoring a trailing separator on the base
    [[nodiscard]] auto downloadUrlFor(const std::string& collectionPath) const -> std::string;

private:
    void handleDelivery(const sQueueDelivery& delivery);
    auto checkCache(const sQueueMessage& message) -> bool;
    void cancel(const sQueueMessage& message, uint64_t deliveryTag);
    void fail(const sQueueMessage& message);
    void acknowledge(uint64_t deliveryTag);
    void discard(uint64_t deliveryTag, bool requeue);
    void settle(const sPendingSettlement& settlement);
    auto settlePending() -> bool;

    std::shared_ptr<IWorkQueue> queue;
    std::shared_ptr<IArchiveTool> archiveTool;
    std::shared_ptr<INotifier> notifier;
    StagingArea staging;
    sWorkerSettings settings;
    InterruptableTimer timer;
    std::optional<sPendingSettlement> unsettled;
};

#endif //SDS_ARCHIVE_SERVER_RETRIEVALWORKER_H
