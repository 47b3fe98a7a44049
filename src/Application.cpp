#include "Application.h"
#include "Notify/MailNotifier.h"
#include "Settings.h"
#include "Worker/ArchiveTool.h"
#include <iostream>

// NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

Application::Application() :
        workQueue(createWorkQueue()),
        tokenService(createTokenService()),
        gateway(std::make_shared<SubmissionGateway>(
                workQueue, DenyList::fromCsv(DENY_LIST_PATH), std::chrono::minutes(MINIMUM_JOB_INTERVAL_MINUTES)
        )),
        httpServer(std::make_shared<HttpServer>(gateway, tokenService)) {
}

Application::~Application() {
    stopSweeper();
}

auto Application::createWorkQueue() -> std::shared_ptr<MySqlWorkQueue> {
    return std::make_shared<MySqlWorkQueue>(QUEUE_NAME, std::chrono::seconds(QUEUE_REDELIVERY_SECONDS));
}

auto Application::createTokenService() -> std::shared_ptr<DownloadTokenService> {
    return std::make_shared<DownloadTokenService>(TOKEN_MAX_DOWNLOADS, std::chrono::hours(TOKEN_EXPIRY_HOURS));
}

auto Application::createWorker(const std::shared_ptr<IWorkQueue>& queue) -> std::unique_ptr<RetrievalWorker> {
    auto archiveTool = std::make_shared<ArchiveTool>(sArchiveToolSettings{
            .binary = ARCHIVE_TOOL_PATH,
            .keytab = ARCHIVE_TOOL_KEYTAB,
            .user = ARCHIVE_TOOL_USER,
            .firewall = ARCHIVE_TOOL_FIREWALL
    });

    auto notifier = std::make_shared<MailNotifier>(sMailSettings{
            .smtpServer = SMTP_SERVER,
            .sender = EMAIL_SENDER,
            .contactEmail = CONTACT_EMAIL
    });

    StagingArea staging(
            STAGING_DIR,
            std::chrono::seconds(CACHE_POLL_INTERVAL_SECONDS),
            std::chrono::seconds(CACHE_ZERO_SIZE_LIMIT_SECONDS)
    );

    return std::make_unique<RetrievalWorker>(
            queue,
            archiveTool,
            notifier,
            staging,
            sWorkerSettings{
                    .usageThresholdBytes = static_cast<uint64_t>(STAGING_USAGE_THRESHOLD_GB * BYTES_PER_GB),
                    .httpDownloadBase = HTTP_DOWNLOAD_BASE,
                    .toolTimeout = std::chrono::seconds(ARCHIVE_TOOL_TIMEOUT_SECONDS),
                    .idlePoll = std::chrono::milliseconds(WORKER_IDLE_POLL_MILLISECONDS)
            }
    );
}

auto Application::createHousekeeper() -> Housekeeper {
    return {
            STAGING_DIR,
            std::chrono::minutes(HOUSEKEEPING_TTL_MINUTES),
            Housekeeper::loadAllowList(HOUSEKEEPING_ALLOW_LIST_PATH)
    };
}

void Application::startSweeper() {
    sweepThread = std::thread(&Application::runSweeper, this);
}

void Application::stopSweeper() {
    sweepTimer.stop();
    if (sweepThread.joinable()) {
        sweepThread.join();
    }
}

void Application::runSweeper() {
    while (sweepTimer.wait_for(std::chrono::seconds(TOKEN_SWEEP_INTERVAL_SECONDS))) {
        try {
            tokenService->sweepExpired();
            httpServer->sweepSessions();
        } catch (std::exception& e) {
            dumpExceptions(e);
        }
    }
}
