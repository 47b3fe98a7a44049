#include "../DB/sArchiveJob.h"
#include "RetrievalWorker.h"
#include <iostream>
#include <utility>

RetrievalWorker::RetrievalWorker(std::shared_ptr<IWorkQueue> queue, std::shared_ptr<IArchiveTool> archiveTool,
                                 std::shared_ptr<INotifier> notifier, StagingArea staging,
                                 sWorkerSettings settings) :
        queue(std::move(queue)),
        archiveTool(std::move(archiveTool)),
        notifier(std::move(notifier)),
        staging(std::move(staging)),
        settings(std::move(settings)) {
}

void RetrievalWorker::run() {
    std::cout << "WORKER: Consuming from the work queue, staging in " << staging.getDirectory().string()
              << std::endl;

    while (!timer.stopped()) {
        try {
            if (!processNext()) {
                timer.wait_for(settings.idlePoll);
            }
        } catch (std::exception& e) {
            dumpExceptions(e);
            timer.wait_for(settings.idlePoll);
        }
    }

    std::cout << "WORKER: Stopped" << std::endl;
}

void RetrievalWorker::stop() {
    timer.stop();
}

auto RetrievalWorker::processNext() -> bool {
    if (!settlePending()) {
        return false;
    }

    auto delivery = queue->consume();
    if (!delivery) {
        return false;
    }

    handleDelivery(*delivery);
    return true;
}

auto RetrievalWorker::downloadUrlFor(const std::string& collectionPath) const -> std::string {
    auto base = settings.httpDownloadBase;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + collectionBasename(collectionPath);
}

void RetrievalWorker::handleDelivery(const sQueueDelivery& delivery) {
    sQueueMessage message;
    try {
        message = sQueueMessage::fromJson(delivery.body);
    } catch (std::exception& e) {
        // Nothing can ever process it, so don't requeue it
        std::cout << "WORKER: Discarding malformed message " << delivery.deliveryTag << std::endl;
        dumpExceptions(e);
        discard(delivery.deliveryTag, false);
        return;
    }

    std::cout << "WORKER: Processing job " << message.jobId << " (" << message.sdaPath << ") for "
              << message.email << std::endl;

    auto cached = checkCache(message);

    if (timer.stopped()) {
        // Shut down mid lookup, leave the job to the next consumer
        std::cout << "WORKER: Returning job " << message.jobId << " to the queue on shutdown" << std::endl;
        discard(delivery.deliveryTag, true);
        return;
    }

    std::string downloadUrl;
    bool completed = false;
    try {
        if (!cached && !staging.hasEnoughSpace(settings.usageThresholdBytes)) {
            cancel(message, delivery.deliveryTag);
            return;
        }

        try {
            sArchiveJob::transitionStatus(message.jobId, JobStatus::PROCESSING);
        } catch (eInvalidJobTransition& e) {
            auto job = sArchiveJob::getByJobId(message.jobId);
            if (job.id != 0 && isTerminal(job.status)) {
                // A redelivery of a job that already finished
                std::cout << "WORKER: Job " << message.jobId << " is already " << jobStatusToString(job.status)
                          << ", acknowledging the redelivered message" << std::endl;
                acknowledge(delivery.deliveryTag);
                return;
            }
            throw;
        }

        auto localFile = staging.pathFor(message.sdaPath);
        if (cached) {
            std::cout << "WORKER: " << localFile.string() << " is already staged" << std::endl;
        } else {
            archiveTool->retrieve(message.sdaPath, localFile.string(), settings.toolTimeout);
        }

        // Truncated to whole megabytes
        auto sizeMb = static_cast<uint64_t>(boost::filesystem::file_size(localFile)) >> 20U;
        downloadUrl = downloadUrlFor(message.sdaPath);

        sArchiveJob::markCompleted(message.jobId, sizeMb, downloadUrl);
        completed = true;

        std::cout << "WORKER: Job " << message.jobId << " completed, " << sizeMb << "MB at " << downloadUrl
                  << std::endl;
    } catch (std::exception& e) {
        std::cout << "WORKER: Job " << message.jobId << " failed" << std::endl;
        dumpExceptions(e);
        fail(message);
    }

    if (completed) {
        try {
            notifier->notifyCompleted(message.email, collectionBasename(message.sdaPath), downloadUrl);
        } catch (std::exception& e) {
            std::cout << "WORKER: Completion notice for job " << message.jobId << " was not sent" << std::endl;
            dumpExceptions(e);
        }
    }

    acknowledge(delivery.deliveryTag);
}

auto RetrievalWorker::checkCache(const sQueueMessage& message) -> bool {
    try {
        return staging.isInCache(message.sdaPath, timer);
    } catch (std::exception& e) {
        std::cout << "WORKER: Warning, cache lookup for " << message.sdaPath << " failed, treating it as a miss"
                  << std::endl;
        dumpExceptions(e);
        return false;
    }
}

void RetrievalWorker::cancel(const sQueueMessage& message, uint64_t deliveryTag) {
    std::cout << "WORKER: Staging area is full, cancelling job " << message.jobId << std::endl;

    discard(deliveryTag, false);

    try {
        sArchiveJob::transitionStatus(message.jobId, JobStatus::CANCELLED);
    } catch (std::exception& e) {
        std::cout << "WORKER: Unable to mark job " << message.jobId << " cancelled" << std::endl;
        dumpExceptions(e);
    }

    try {
        notifier->notifyCancelled(message.email, collectionBasename(message.sdaPath));
    } catch (std::exception& e) {
        std::cout << "WORKER: Cancellation notice for job " << message.jobId << " was not sent" << std::endl;
        dumpExceptions(e);
    }
}

void RetrievalWorker::fail(const sQueueMessage& message) {
    try {
        sArchiveJob::transitionStatus(message.jobId, JobStatus::FAILED);
    } catch (std::exception& e) {
        std::cout << "WORKER: Unable to mark job " << message.jobId << " failed" << std::endl;
        dumpExceptions(e);
    }

    try {
        notifier->notifyFailed(message.email, collectionBasename(message.sdaPath));
    } catch (std::exception& e) {
        std::cout << "WORKER: Failure notice for job " << message.jobId << " was not sent" << std::endl;
        dumpExceptions(e);
    }
}

void RetrievalWorker::acknowledge(uint64_t deliveryTag) {
    settle({.deliveryTag = deliveryTag, .acknowledge = true, .requeue = false});
}

void RetrievalWorker::discard(uint64_t deliveryTag, bool requeue) {
    settle({.deliveryTag = deliveryTag, .acknowledge = false, .requeue = requeue});
}

void RetrievalWorker::settle(const sPendingSettlement& settlement) {
    try {
        if (settlement.acknowledge) {
            queue->ack(settlement.deliveryTag);
        } else {
            queue->reject(settlement.deliveryTag, settlement.requeue);
        }
        unsettled.reset();
    } catch (eUnknownDelivery& e) {
        // The lease ran out and the queue took the message back, nothing is left to settle
        std::cout << "WORKER: Delivery " << settlement.deliveryTag << " is no longer held, dropping its "
                  << (settlement.acknowledge ? "ack" : "reject") << std::endl;
        dumpExceptions(e);
        unsettled.reset();
    } catch (std::exception& e) {
        std::cout << "WORKER: Unable to " << (settlement.acknowledge ? "acknowledge" : "reject") << " delivery "
                  << settlement.deliveryTag << ", will retry" << std::endl;
        dumpExceptions(e);
        unsettled = settlement;
    }
}

auto RetrievalWorker::settlePending() -> bool {
    if (!unsettled) {
        return true;
    }

    std::cout << "WORKER: Retrying settlement of delivery " << unsettled->deliveryTag << std::endl;
    auto settlement = *unsettled;
    settle(settlement);
    return !unsettled.has_value();
}
