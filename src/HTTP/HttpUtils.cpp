#include "HttpUtils.h"
#include <boost/algorithm/string/trim.hpp>

auto getHeader(SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string {
    auto headerItem = headers.find(header);
    if (headerItem != headers.end()) {
        return headerItem->second;
    }

    // Return an empty string
    return {};
}

auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> std::string {
    auto ptr = query_fields.find(what);
    std::string result;
    if (ptr != query_fields.end()) {
        result = ptr->second;
    }
    return result;
}

auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> bool {
    auto ptr = query_fields.find(what);
    return ptr != query_fields.end();
}

auto getSourceIp(const std::shared_ptr<HttpServerImpl::Request> &request) -> std::string {
    auto realIp = boost::algorithm::trim_copy(getHeader(request->header, "X-Real-IP"));
    if (!realIp.empty()) {
        return realIp;
    }

    auto forwardedFor = getHeader(request->header, "X-Forwarded-For");
    auto firstHop = boost::algorithm::trim_copy(forwardedFor.substr(0, forwardedFor.find(',')));
    if (!firstHop.empty()) {
        return firstHop;
    }

    try {
        return request->remote_endpoint().address().to_string();
    } catch (std::exception& e) {
        // The peer may already have gone away
        dumpExceptions(e);
        return "unknown";
    }
}

void writeJson(const std::shared_ptr<HttpServerImpl::Response> &response, SimpleWeb::StatusCode status,
               const nlohmann::json &result) {
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", "application/json");

    response->write(status, result.dump(), headers);
}
