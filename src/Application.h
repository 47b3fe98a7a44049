//
// Builds the server's components from the process settings
//

#ifndef SDS_ARCHIVE_SERVER_APPLICATION_H
#define SDS_ARCHIVE_SERVER_APPLICATION_H

#include "Gateway/SubmissionGateway.h"
#include "HTTP/HttpServer.h"
#include "Lib/GeneralUtils.h"
#include "Queue/MySqlWorkQueue.h"
#include "Tokens/DownloadTokenService.h"
#include "Worker/Housekeeper.h"
#include "Worker/RetrievalWorker.h"
#include <memory>
#include <thread>

class Application {
public:
    Application();
    ~Application();

    Application(Application const&) = delete;
    auto operator =(Application const&) -> Application& = delete;
    Application(Application&&) = delete;
    auto operator=(Application&&) -> Application& = delete;

    auto getWorkQueue() -> const std::shared_ptr<MySqlWorkQueue>& { return workQueue; }
    auto getGateway() -> const std::shared_ptr<SubmissionGateway>& { return gateway; }
    auto getTokenService() -> const std::shared_ptr<DownloadTokenService>& { return tokenService; }
    auto getHttpServer() -> const std::shared_ptr<HttpServer>& { return httpServer; }

    // The worker and sweep modes build only what they use, so they don't depend on the gateway's deny list
    [[nodiscard]] static auto createWorkQueue() -> std::shared_ptr<MySqlWorkQueue>;
    [[nodiscard]] static auto createTokenService() -> std::shared_ptr<DownloadTokenService>;
    [[nodiscard]] static auto createWorker(const std::shared_ptr<IWorkQueue>& queue) -> std::unique_ptr<RetrievalWorker>;
    [[nodiscard]] static auto createHousekeeper() -> Housekeeper;

    // Expires lapsed download tokens and idle API sessions every TOKEN_SWEEP_INTERVAL_SECONDS
    void startSweeper();
    void stopSweeper();

private:
    void runSweeper();

    std::shared_ptr<MySqlWorkQueue> workQueue;
    std::shared_ptr<DownloadTokenService> tokenService;
    std::shared_ptr<SubmissionGateway> gateway;
    std::shared_ptr<HttpServer> httpServer;

    InterruptableTimer sweepTimer;
    std::thread sweepThread;
};

#endif //SDS_ARCHIVE_SERVER_APPLICATION_H
