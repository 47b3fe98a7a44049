#include "../Gateway/SubmissionGateway.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <exception>
#include <memory>
#include <string>

void ArchiveApi(const std::string &path, HttpServer *server, const std::shared_ptr<SubmissionGateway>& gateway) {
    // Get      -> Submit a retrieval request (p: archive path, uid: requester email)

    server->getServer().resource["^" + path + "$"]["GET"] = [gateway](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto query_fields = request->parse_query_string();

        auto collectionPath = getQueryParamAsString(query_fields, "p");
        auto email = getQueryParamAsString(query_fields, "uid");

        // The requester address ends up in mail headers, and neither value may span lines
        auto hasLineBreak = [](const std::string& value) { return value.find_first_of("\r\n") != std::string::npos; };

        if (collectionPath.empty() || email.empty() || hasLineBreak(collectionPath) || hasLineBreak(email)) {
            response->write(SimpleWeb::StatusCode::client_error_bad_request, "Bad request");
            return;
        }

        try {
            auto sourceIp = getSourceIp(request);
            std::cout << "API: Retrieval request for " << collectionPath << " from " << email << " at " << sourceIp
                      << std::endl;

            auto result = gateway->submit(collectionPath, email, sourceIp);

            writeJson(response, SimpleWeb::StatusCode::success_ok, result.toJson());
        } catch (std::exception& e) {
            dumpExceptions(e);

            response->write(SimpleWeb::StatusCode::server_error_internal_server_error, "Internal server error");
        }
    };
}
