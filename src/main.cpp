#include "Application.h"
#include "Settings.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <curl/curl.h>
#include <iostream>
#include <string>

namespace {
void usage(const std::string& program) {
    std::cerr << "Usage: " << program << " [gateway|worker|sweep|housekeep]" << std::endl;
}

auto runWorker() -> int {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    auto worker = Application::createWorker(Application::createWorkQueue());

    // Stop consuming on SIGINT or SIGTERM, an in flight retrieval still runs to completion
    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([&worker](const boost::system::error_code& errorCode, int signalNumber) {
        if (!errorCode) {
            std::cout << "WORKER: Received signal " << signalNumber << ", stopping" << std::endl;
            worker->stop();
        }
    });
    std::thread signalThread([&signalContext]() { signalContext.run(); });

    worker->run();

    signalContext.stop();
    signalThread.join();
    curl_global_cleanup();
    return 0;
}
}

auto main(int argc, char* argv[]) -> int
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    std::string mode = argc > 1 ? argv[1] : "gateway";

    try {
        if (mode == "gateway") {
            Application application;

            // Start the http server to handle api requests, and keep the token table tidy alongside it
            application.startSweeper();
            application.getHttpServer()->start();
            application.getHttpServer()->join();
            return 0;
        }

        if (mode == "worker") {
            return runWorker();
        }

        if (mode == "sweep") {
            std::cout << "Expired " << Application::createTokenService()->sweepExpired() << " download tokens"
                      << std::endl;
            return 0;
        }

        if (mode == "housekeep") {
            Application::createHousekeeper().purge(std::chrono::system_clock::now());
            return 0;
        }
    } catch (std::exception& e) {
        dumpExceptions(e);
        return 1;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    usage(argv[0]);
    return 1;
}
