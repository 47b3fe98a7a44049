//
// Request and response helpers shared by the API handlers
//

#ifndef SDS_ARCHIVE_SERVER_HTTPUTILS_H
#define SDS_ARCHIVE_SERVER_HTTPUTILS_H

#include "HttpServer.h"

auto getHeader(SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string;
auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;
auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> bool;

// The client address as seen by the proxy in front of us: X-Real-IP, then the first X-Forwarded-For entry, then
// the peer address
auto getSourceIp(const std::shared_ptr<HttpServerImpl::Request> &request) -> std::string;

void writeJson(const std::shared_ptr<HttpServerImpl::Response> &response, SimpleWeb::StatusCode status,
               const nlohmann::json &result);

#endif //SDS_ARCHIVE_SERVER_HTTPUTILS_H
