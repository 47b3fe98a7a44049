//
// Thin HTTP surface over the submission gateway and the download token service
//

#ifndef SDS_ARCHIVE_SERVER_HTTPSERVER_H
#define SDS_ARCHIVE_SERVER_HTTPSERVER_H

#include "../Lib/GeneralUtils.h"
#include "../Lib/SessionCache.h"
#include <iostream>
#include <nlohmann/json.hpp>
#include <server_http.hpp>
#include <thread>
#include <utility>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

class SubmissionGateway;
class DownloadTokenService;

class eNotAuthorized : public std::exception {
};

struct sJwtSecret {
public:
    explicit sJwtSecret(const nlohmann::json& jToken) {
        name_ = jToken["name"];
        secret_ = jToken["secret"];
    }

    // The name of the client holding this secret
    auto name() const -> const auto & { return name_; }

    // The secret (JWT Secret) for this client
    auto secret() const -> const auto & { return secret_; }

private:
    std::string name_;
    std::string secret_;
};

struct sAuthorizationResult {
public:
    sAuthorizationResult(nlohmann::json payload, const sJwtSecret &secret)
            : payload_(std::move(payload)), secret_(secret) {}

    // The decoded payload from the JWT Authorization header
    auto payload() -> const auto & { return payload_; }

    // The JwtSecret that successfully decoded the Authorization header
    auto secret() -> const auto & { return secret_; }

private:
    const nlohmann::json payload_;
    const sJwtSecret &secret_;
};

class HttpServer {
public:
    HttpServer(const std::shared_ptr<SubmissionGateway>& gateway,
               const std::shared_ptr<DownloadTokenService>& tokenService);

    void start();

    void join();

    void stop();

    auto getServer() -> HttpServerImpl & { return this->server; }

    auto isAuthorized(SimpleWeb::CaseInsensitiveMultimap &headers) -> std::unique_ptr<sAuthorizationResult>;

    // Drops verified Authorization headers that have not been presented recently
    auto sweepSessions() -> size_t { return sessions.sweep(); }

private:
    struct sVerifiedSession {
        nlohmann::json payload;
        size_t secretIndex = 0;
    };

    HttpServerImpl server;
    std::thread server_thread;
    std::vector<sJwtSecret> vJwtSecrets;
    SessionCache<sVerifiedSession> sessions;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(vJwtSecrets);
};

void ArchiveApi(const std::string &path, HttpServer *server, const std::shared_ptr<SubmissionGateway>& gateway);
void TokenApi(const std::string &path, HttpServer *server, const std::shared_ptr<DownloadTokenService>& tokenService);
void DownloadApi(const std::string &path, HttpServer *server,
                 const std::shared_ptr<DownloadTokenService>& tokenService);


#endif //SDS_ARCHIVE_SERVER_HTTPSERVER_H
