#include "../DB/sArchiveJob.h"
#include "../Tokens/DownloadTokenService.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace {
// Maps the token service's exceptions onto status codes. Returns false for anything else.
auto writeTokenError(const std::shared_ptr<HttpServerImpl::Response> &response, std::exception_ptr error) -> bool {
    try {
        std::rethrow_exception(std::move(error));
    } catch (eTokenNotFound& e) {
        response->write(SimpleWeb::StatusCode::client_error_not_found, e.what());
    } catch (eTokenForbidden& e) {
        response->write(SimpleWeb::StatusCode::client_error_forbidden, e.what());
    } catch (eTokenNotReady& e) {
        response->write(SimpleWeb::StatusCode::client_error_conflict, e.what());
    } catch (std::exception& e) {
        dumpExceptions(e);
        return false;
    }
    return true;
}

auto authorize(HttpServer *server, const std::shared_ptr<HttpServerImpl::Response> &response,
               const std::shared_ptr<HttpServerImpl::Request> &request) -> std::unique_ptr<sAuthorizationResult> {
    try {
        return server->isAuthorized(request->header);
    } catch (std::exception& e) {
        dumpExceptions(e);

        // Invalid request
        response->write(SimpleWeb::StatusCode::client_error_forbidden, "Not authorized");
        return nullptr;
    }
}
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void TokenApi(const std::string &path, HttpServer *server, const std::shared_ptr<DownloadTokenService>& tokenService) {
    // Post     -> Issue a token for a completed job (jwt)
    // Get      -> Validate a token (token), or list a job's tokens (jobId, jwt)
    // Delete   -> Disable a token (jwt)
    // Patch    -> Expire every token past its limits (jwt)

    server->getServer().resource["^" + path + "$"]["POST"] = [server, tokenService](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto authResult = authorize(server, response, request);
        if (!authResult) {
            return;
        }

        nlohmann::json post_data;
        try {
            // Read the json from the post body
            request->content >> post_data;

            if (!post_data.contains("jobId") || !post_data.contains("email")) {
                throw std::invalid_argument("jobId and email are required");
            }
        } catch (std::exception& e) {
            dumpExceptions(e);

            // Report bad request
            response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
            return;
        }

        try {
            std::optional<uint32_t> maxDownloads;
            if (post_data.contains("maxDownloads")) {
                maxDownloads = post_data["maxDownloads"].get<uint32_t>();
            }

            std::optional<std::chrono::hours> expiry;
            if (post_data.contains("expiryHours")) {
                expiry = std::chrono::hours(post_data["expiryHours"].get<uint32_t>());
            }

            std::cout << "API: " << authResult->secret().name() << " issuing a token for job "
                      << post_data["jobId"].get<std::string>() << std::endl;

            auto token = tokenService->issue(
                    post_data["jobId"].get<std::string>(),
                    post_data["email"].get<std::string>(),
                    maxDownloads,
                    expiry
            );

            writeJson(response, SimpleWeb::StatusCode::success_ok, token.toJson(std::chrono::system_clock::now()));
        } catch (std::exception&) {
            if (!writeTokenError(response, std::current_exception())) {
                response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
            }
        }
    };

    server->getServer().resource["^" + path + "$"]["GET"] = [server, tokenService](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto query_fields = request->parse_query_string();

        try {
            if (hasQueryParam(query_fields, "jobId")) {
                // Listing a job's tokens exposes the token strings, so it needs a client secret
                if (!authorize(server, response, request)) {
                    return;
                }

                auto now = std::chrono::system_clock::now();
                nlohmann::json result;
                result["tokens"] = nlohmann::json::array();
                for (const auto &token : tokenService->getJobTokens(getQueryParamAsString(query_fields, "jobId"))) {
                    result["tokens"].push_back(token.toJson(now));
                }

                writeJson(response, SimpleWeb::StatusCode::success_ok, result);
                return;
            }

            auto token = getQueryParamAsString(query_fields, "token");
            if (token.empty()) {
                response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
                return;
            }

            auto validation = tokenService->validate(token);
            writeJson(response, SimpleWeb::StatusCode::success_ok,
                      validation.toJson(std::chrono::system_clock::now()));
        } catch (std::exception&) {
            if (!writeTokenError(response, std::current_exception())) {
                response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
            }
        }
    };

    server->getServer().resource["^" + path + "$"]["DELETE"] = [server, tokenService](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        if (!authorize(server, response, request)) {
            return;
        }

        try {
            // Read the json from the body
            nlohmann::json post_data;
            request->content >> post_data;

            auto token = post_data["token"].get<std::string>();
            tokenService->disable(token);

            nlohmann::json result;
            result["disabled"] = true;
            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        } catch (std::exception&) {
            if (!writeTokenError(response, std::current_exception())) {
                response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
            }
        }
    };

    server->getServer().resource["^" + path + "$"]["PATCH"] = [server, tokenService](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        if (!authorize(server, response, request)) {
            return;
        }

        try {
            nlohmann::json result;
            result["expired"] = tokenService->sweepExpired();
            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        } catch (std::exception& e) {
            dumpExceptions(e);

            response->write(SimpleWeb::StatusCode::server_error_internal_server_error, "Internal server error");
        }
    };
}

void DownloadApi(const std::string &path, HttpServer *server,
                 const std::shared_ptr<DownloadTokenService>& tokenService) {
    // Get      -> Count a download and redirect to the staged artifact (token)

    server->getServer().resource["^" + path + "$"]["GET"] = [tokenService](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto query_fields = request->parse_query_string();
        auto token = getQueryParamAsString(query_fields, "token");
        if (token.empty()) {
            response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
            return;
        }

        try {
            auto record = tokenService->recordDownload(token, getSourceIp(request));

            auto job = sArchiveJob::getByJobId(record.jobId);
            if (job.id == 0 || !job.downloadUrl) {
                throw eTokenNotFound("Job " + record.jobId + " has no staged artifact");
            }

            SimpleWeb::CaseInsensitiveMultimap headers;
            headers.emplace("Location", *job.downloadUrl);
            response->write(SimpleWeb::StatusCode::redirection_found, headers);
        } catch (std::exception&) {
            if (!writeTokenError(response, std::current_exception())) {
                response->write(SimpleWeb::StatusCode::server_error_internal_server_error, "Internal server error");
            }
        }
    };
}
