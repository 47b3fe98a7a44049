//
// Small helpers shared by the gateway, the worker and the tests
//

#ifndef SDS_ARCHIVE_SERVER_GENERALUTILS_H
#define SDS_ARCHIVE_SERVER_GENERALUTILS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

auto base64Encode(std::string input) -> std::string;
auto base64Decode(std::string input) -> std::string;
auto generateTimeOrderedUUID() -> std::string;
auto collectionBasename(const std::string& collectionPath) -> std::string;
auto formatTimestamp(std::chrono::system_clock::time_point timestamp) -> std::string;
void dumpExceptions(std::exception& exception);
auto acceptingConnections(uint16_t port) -> bool;

struct InterruptableTimer {
    // Returns false if killed
    template<class R, class P>
    auto wait_for( std::chrono::duration<R,P> const& time ) const -> bool {
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&]{ return terminate; });
    }

    void stop() {
        std::unique_lock<std::mutex> const lock(m);
        terminate = true;
        cv.notify_all();
    }

    [[nodiscard]] auto stopped() const -> bool {
        std::unique_lock<std::mutex> const lock(m);
        return terminate;
    }

private:
    mutable std::condition_variable cv;
    mutable std::mutex m;
    bool terminate = false;
};

#ifdef BUILD_TESTS
// NOLINTBEGIN
#define EXPOSE_PROPERTY_FOR_TESTING(term) public: auto get##term () { return &term; } auto set##term (typeof(term) value) { term = value; }
// NOLINTEND
#else
// Noop
#define EXPOSE_PROPERTY_FOR_TESTING(x)
#endif

#endif //SDS_ARCHIVE_SERVER_GENERALUTILS_H
