#include "../../DB/sArchiveJob.h"
#include "../../tests/fixtures/DatabaseFixture.h"
#include "../../tests/fixtures/Fakes.h"
#include "../../tests/fixtures/StagingFixture.h"
#include "../RetrievalWorker.h"
#include <boost/test/unit_test.hpp>

struct RetrievalWorkerFixture : public DatabaseFixture, public StagingFixture {
    std::shared_ptr<RecordingWorkQueue> queue = std::make_shared<RecordingWorkQueue>();
    std::shared_ptr<FakeArchiveTool> archiveTool = std::make_shared<FakeArchiveTool>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();

    [[nodiscard]] auto makeWorker(uint64_t usageThresholdBytes = 1024ULL * 1024ULL * 1024ULL) const
            -> std::unique_ptr<RetrievalWorker> {
        return std::make_unique<RetrievalWorker>(
                queue, archiveTool, notifier,
                StagingArea(stagingDir.path(), std::chrono::milliseconds(10), std::chrono::milliseconds(50)),
                sWorkerSettings{
                        .usageThresholdBytes = usageThresholdBytes,
                        .httpDownloadBase = "https://dl.example.org/sds/",
                        .toolTimeout = std::chrono::seconds(5),
                        .idlePoll = std::chrono::milliseconds(10)
                }
        );
    }

    // Creates the job row and queues its message, as the gateway would
    void submitJob(const std::string& jobId, const std::string& status = "submitted") const {
        insertJob(jobId, "u@x.com", "a.zip", status);
        queue->publish(sQueueMessage{.sdaPath = "/archive/2021/a.zip", .email = "u@x.com", .jobId = jobId}.toJson());
    }
};

BOOST_FIXTURE_TEST_SUITE(retrieval_worker_test_suite, RetrievalWorkerFixture)
    BOOST_AUTO_TEST_CASE(test_download_url) {
        auto worker = makeWorker();
        BOOST_CHECK_EQUAL(worker->downloadUrlFor("/archive/2021/a.zip"), "https://dl.example.org/sds/a.zip");
    }

    BOOST_AUTO_TEST_CASE(test_empty_queue) {
        auto worker = makeWorker();
        BOOST_CHECK(!worker->processNext());
    }

    BOOST_AUTO_TEST_CASE(test_retrieval_completes_job) {
        submitJob("job-1");
        auto worker = makeWorker();

        BOOST_CHECK(worker->processNext());

        BOOST_REQUIRE_EQUAL(archiveTool->calls.size(), 1);
        BOOST_CHECK_EQUAL(archiveTool->calls.front().first, "/archive/2021/a.zip");
        BOOST_CHECK_EQUAL(archiveTool->calls.front().second, stagedPath("a.zip").string());

        auto job = sArchiveJob::getByJobId("job-1");
        BOOST_CHECK(job.status == JobStatus::COMPLETED);
        BOOST_CHECK_EQUAL(job.jobSize.value_or(0), 2);
        BOOST_CHECK_EQUAL(job.downloadUrl.value_or(""), "https://dl.example.org/sds/a.zip");

        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
        BOOST_CHECK(queue->rejected.empty());

        BOOST_REQUIRE_EQUAL(notifier->sent.size(), 1);
        BOOST_CHECK_EQUAL(notifier->sent.front().kind, "completed");
        BOOST_CHECK_EQUAL(notifier->sent.front().email, "u@x.com");
        BOOST_CHECK_EQUAL(notifier->sent.front().collection, "a.zip");
        BOOST_CHECK_EQUAL(notifier->sent.front().downloadUrl, "https://dl.example.org/sds/a.zip");

        BOOST_CHECK(!worker->processNext());
    }

    BOOST_AUTO_TEST_CASE(test_small_file_reports_zero_megabytes) {
        archiveTool->fileSize = 1024ULL * 1024ULL - 1;
        submitJob("job-1");

        makeWorker()->processNext();

        auto job = sArchiveJob::getByJobId("job-1");
        BOOST_CHECK(job.status == JobStatus::COMPLETED);
        BOOST_CHECK_EQUAL(job.jobSize.value_or(99), 0);
    }

    BOOST_AUTO_TEST_CASE(test_cached_file_skips_retrieval) {
        writeFile(stagedPath("a.zip"), 1024ULL * 1024ULL * 3ULL);
        submitJob("job-1");

        makeWorker()->processNext();

        BOOST_CHECK(archiveTool->calls.empty());
        auto job = sArchiveJob::getByJobId("job-1");
        BOOST_CHECK(job.status == JobStatus::COMPLETED);
        BOOST_CHECK_EQUAL(job.jobSize.value_or(0), 3);
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
    }

    BOOST_AUTO_TEST_CASE(test_full_staging_area_cancels_job) {
        writeFile(stagedPath("other.zip"), 2048);
        submitJob("job-1");

        makeWorker(1024)->processNext();

        BOOST_CHECK(archiveTool->calls.empty());
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "cancelled");
        BOOST_CHECK_EQUAL(queue->rejected.size(), 1);
        BOOST_CHECK(queue->requeued.empty());
        BOOST_CHECK(queue->acked.empty());

        BOOST_REQUIRE_EQUAL(notifier->sent.size(), 1);
        BOOST_CHECK_EQUAL(notifier->sent.front().kind, "cancelled");
    }

    BOOST_AUTO_TEST_CASE(test_cached_file_ignores_full_staging_area) {
        writeFile(stagedPath("a.zip"), 4096);
        submitJob("job-1");

        makeWorker(1024)->processNext();

        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
    }

    BOOST_AUTO_TEST_CASE(test_tool_timeout_fails_job) {
        archiveTool->behaviour = FakeToolBehaviour::TIMEOUT;
        submitJob("job-1");

        makeWorker()->processNext();

        auto job = sArchiveJob::getByJobId("job-1");
        BOOST_CHECK(job.status == JobStatus::FAILED);
        BOOST_CHECK(!job.downloadUrl.has_value());
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);

        BOOST_REQUIRE_EQUAL(notifier->sent.size(), 1);
        BOOST_CHECK_EQUAL(notifier->sent.front().kind, "failed");
    }

    BOOST_AUTO_TEST_CASE(test_tool_error_fails_job) {
        archiveTool->behaviour = FakeToolBehaviour::FAIL;
        submitJob("job-1");

        makeWorker()->processNext();

        BOOST_CHECK_EQUAL(jobStatus("job-1"), "failed");
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
    }

    BOOST_AUTO_TEST_CASE(test_notification_failure_keeps_job_completed) {
        notifier->failSending = true;
        submitJob("job-1");

        makeWorker()->processNext();

        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
    }

    BOOST_AUTO_TEST_CASE(test_settle_failure_is_not_fatal) {
        queue->failSettling = true;
        submitJob("job-1");

        auto worker = makeWorker();
        BOOST_CHECK_NO_THROW(worker->processNext());
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
        BOOST_CHECK(queue->acked.empty());

        // While the queue is still down the worker keeps the ack and takes nothing new
        submitJob("job-2");
        BOOST_CHECK(!worker->processNext());
        BOOST_CHECK_EQUAL(jobStatus("job-2"), "submitted");

        // Once it recovers the held ack goes through and the next message is processed
        queue->failSettling = false;
        BOOST_CHECK(worker->processNext());
        BOOST_CHECK_EQUAL(jobStatus("job-2"), "completed");

        BOOST_REQUIRE_EQUAL(queue->acked.size(), 2);
        BOOST_CHECK_EQUAL(queue->acked[0], 1);
        BOOST_CHECK_EQUAL(queue->acked[1], 2);
        BOOST_CHECK(!worker->processNext());
    }

    BOOST_AUTO_TEST_CASE(test_ack_for_a_redelivered_message_is_dropped) {
        queue->failSettling = true;
        submitJob("job-1");

        auto worker = makeWorker();
        worker->processNext();
        BOOST_CHECK(queue->acked.empty());

        // The lease ran out before the queue came back, so the message is delivered again
        queue->expireHeld();
        queue->failSettling = false;

        BOOST_CHECK(worker->processNext());
        BOOST_CHECK_EQUAL(archiveTool->calls.size(), 1);
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
        BOOST_REQUIRE_EQUAL(queue->acked.size(), 1);
        BOOST_CHECK_EQUAL(queue->acked.front(), 1);
        BOOST_CHECK(!worker->processNext());
    }

    BOOST_AUTO_TEST_CASE(test_redelivered_finished_job_is_acknowledged) {
        submitJob("job-1", "completed");

        makeWorker()->processNext();

        BOOST_CHECK(archiveTool->calls.empty());
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
        BOOST_CHECK(notifier->sent.empty());
    }

    BOOST_AUTO_TEST_CASE(test_redelivered_processing_job_is_resumed) {
        // A worker died after marking the job processing
        submitJob("job-1", "processing");

        makeWorker()->processNext();

        BOOST_CHECK_EQUAL(archiveTool->calls.size(), 1);
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
    }

    BOOST_AUTO_TEST_CASE(test_message_for_unknown_job_is_acknowledged) {
        queue->publish(sQueueMessage{.sdaPath = "/archive/a.zip", .email = "u@x.com", .jobId = "missing"}.toJson());

        makeWorker()->processNext();

        BOOST_CHECK(archiveTool->calls.empty());
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);
        BOOST_CHECK_EQUAL(jobCount(), 0);
    }

    BOOST_AUTO_TEST_CASE(test_malformed_message_is_discarded) {
        queue->publish("{\"sda_path\": 5}");

        makeWorker()->processNext();

        BOOST_CHECK(archiveTool->calls.empty());
        BOOST_CHECK_EQUAL(queue->rejected.size(), 1);
        BOOST_CHECK(queue->requeued.empty());
        BOOST_CHECK(queue->acked.empty());
    }

    BOOST_AUTO_TEST_CASE(test_shutdown_during_cache_check_requeues) {
        writeFile(stagedPath("a.zip"), 4096);
        submitJob("job-1");

        auto worker = makeWorker();
        worker->stop();
        worker->processNext();

        BOOST_CHECK_EQUAL(queue->requeued.size(), 1);
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "submitted");
        BOOST_CHECK(notifier->sent.empty());

        // Nothing is held, so another consumer can take the job
        BOOST_CHECK(makeWorker()->processNext());
        BOOST_CHECK_EQUAL(jobStatus("job-1"), "completed");
    }

    BOOST_AUTO_TEST_CASE(test_run_returns_once_stopped) {
        auto worker = makeWorker();
        worker->stop();
        worker->run();

        BOOST_CHECK(queue->acked.empty());
    }
BOOST_AUTO_TEST_SUITE_END()
