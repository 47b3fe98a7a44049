#include "../../DB/sArchiveJob.h"
#include "../../Gateway/SubmissionGateway.h"
#include "../../Tokens/DownloadTokenService.h"
#include "../../tests/fixtures/DatabaseFixture.h"
#include "../../tests/fixtures/Fakes.h"
#include "../../tests/fixtures/StagingFixture.h"
#include "../RetrievalWorker.h"
#include <boost/test/unit_test.hpp>

// A request followed from submission through retrieval to its downloads
struct RetrievalScenarioFixture : public DatabaseFixture, public StagingFixture {
    std::shared_ptr<RecordingWorkQueue> queue = std::make_shared<RecordingWorkQueue>();
    std::shared_ptr<FakeArchiveTool> archiveTool = std::make_shared<FakeArchiveTool>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();

    SubmissionGateway gateway = SubmissionGateway(queue, DenyList(), std::chrono::minutes(360));
    DownloadTokenService tokenService = DownloadTokenService(3, std::chrono::hours(24));
    RetrievalWorker worker = RetrievalWorker(
            queue, archiveTool, notifier,
            StagingArea(stagingDir.path(), std::chrono::milliseconds(10), std::chrono::milliseconds(50)),
            sWorkerSettings{
                    .usageThresholdBytes = 1024ULL * 1024ULL * 1024ULL,
                    .httpDownloadBase = "https://dl.example.org/sds/",
                    .toolTimeout = std::chrono::seconds(5),
                    .idlePoll = std::chrono::milliseconds(10)
            }
    );
};

BOOST_FIXTURE_TEST_SUITE(retrieval_scenario_test_suite, RetrievalScenarioFixture)
    BOOST_AUTO_TEST_CASE(test_submitted_collection_is_downloadable_up_to_the_limit) {
        auto submission = gateway.submit("/archive/2021/a.zip", "u@x.com", "10.0.0.1");
        BOOST_REQUIRE(submission.outcome == SubmissionOutcome::ACCEPTED);

        // Not downloadable until the worker has staged it
        BOOST_CHECK_THROW(tokenService.issue(submission.jobId, "u@x.com"), eTokenNotReady);

        BOOST_CHECK(worker.processNext());

        auto job = sArchiveJob::getByJobId(submission.jobId);
        BOOST_CHECK(job.status == JobStatus::COMPLETED);
        BOOST_CHECK_EQUAL(job.downloadUrl.value_or(""), "https://dl.example.org/sds/a.zip");
        BOOST_CHECK(boost::filesystem::exists(stagedPath("a.zip")));
        BOOST_CHECK_EQUAL(queue->acked.size(), 1);

        BOOST_REQUIRE_EQUAL(notifier->sent.size(), 1);
        BOOST_CHECK_EQUAL(notifier->sent.front().kind, "completed");

        auto token = tokenService.issue(submission.jobId, "u@x.com").token;
        for (uint32_t count = 1; count <= 3; count++) {
            BOOST_CHECK_EQUAL(tokenService.recordDownload(token, "10.0.0.1").downloadCount, count);
        }
        BOOST_CHECK_THROW(tokenService.recordDownload(token, "10.0.0.1"), eTokenForbidden);

        auto record = tokenService.getByToken(token);
        BOOST_CHECK_EQUAL(record.downloadCount, 3);
        BOOST_CHECK(record.status == TokenStatus::EXPIRED);

        // The same request again inside the window is a duplicate
        auto again = gateway.submit("/archive/2021/a.zip", "u@x.com", "10.0.0.1");
        BOOST_CHECK(again.outcome == SubmissionOutcome::DUPLICATE);
        BOOST_CHECK(!worker.processNext());
    }
BOOST_AUTO_TEST_SUITE_END()
