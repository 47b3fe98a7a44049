#include "../Lib/GeneralUtils.h"
#include "MySqlConnector.h"
#include "sDownloadToken.h"
#include <archive_schema.h>
#include <sqlpp11/sqlpp11.h>
#include <stdexcept>

using namespace sqlpp;

auto tokenStatusToString(TokenStatus status) -> std::string {
    switch (status) {
        case TokenStatus::ACTIVE:
            return "active";
        case TokenStatus::DISABLED:
            return "disabled";
        case TokenStatus::EXPIRED:
            return "expired";
    }

    throw std::invalid_argument("Unknown token status " + std::to_string(static_cast<int>(status)));
}

auto tokenStatusFromString(const std::string& status) -> TokenStatus {
    for (auto candidate : {TokenStatus::ACTIVE, TokenStatus::DISABLED, TokenStatus::EXPIRED}) {
        if (tokenStatusToString(candidate) == status) {
            return candidate;
        }
    }

    throw std::invalid_argument("Unknown token status '" + status + "'");
}

auto sDownloadToken::toJson(std::chrono::system_clock::time_point now) const -> nlohmann::json {
    nlohmann::json result;
    result["token_id"] = tokenId;
    result["token"] = token;
    result["job_id"] = jobId;
    result["status"] = tokenStatusToString(status);
    result["download_count"] = downloadCount;
    result["max_downloads"] = maxDownloads;
    result["created_time"] = formatTimestamp(createdTime);
    result["expires_at"] = formatTimestamp(expiresAt);
    result["last_download_time"] = lastDownloadTime ? nlohmann::json(formatTimestamp(*lastDownloadTime)) : nullptr;
    result["last_download_ip"] = lastDownloadIp ? nlohmann::json(*lastDownloadIp) : nullptr;
    result["is_valid"] = isValid(now);
    result["remaining_downloads"] = remainingDownloads();
    return result;
}

void sDownloadToken::save() {
    auto _database = MySqlConnector();
    schema::DownloadTokens _tokenTable;

    tokenId = _database->run(
            insert_into(_tokenTable)
                    .set(
                            _tokenTable.token = token,
                            _tokenTable.jobId = jobId,
                            _tokenTable.status = tokenStatusToString(status),
                            _tokenTable.downloadCount = downloadCount,
                            _tokenTable.maxDownloads = maxDownloads,
                            _tokenTable.createdTime = std::chrono::time_point_cast<std::chrono::microseconds>(
                                    createdTime
                            ),
                            _tokenTable.expiresAt = std::chrono::time_point_cast<std::chrono::microseconds>(
                                    expiresAt
                            )
                    )
    );
}

auto sDownloadToken::getByToken(const std::string& token) -> sDownloadToken {
    auto _database = MySqlConnector();
    schema::DownloadTokens _tokenTable;

    auto tokenResults =
            _database->run(
                    select(all_of(_tokenTable))
                            .from(_tokenTable)
                            .where(_tokenTable.token == token)
            );

    if (!tokenResults.empty()) {
        return fromRecord(&tokenResults.front());
    }

    return sDownloadToken{};
}

auto sDownloadToken::getByJobId(const std::string& jobId) -> std::vector<sDownloadToken> {
    auto _database = MySqlConnector();
    schema::DownloadTokens _tokenTable;

    auto tokenResults =
            _database->run(
                    select(all_of(_tokenTable))
                            .from(_tokenTable)
                            .where(_tokenTable.jobId == jobId)
                            .order_by(_tokenTable.createdTime.desc(), _tokenTable.tokenId.desc())
            );

    std::vector<sDownloadToken> tokens;
    for (const auto& token : tokenResults) {
        tokens.push_back(fromRecord(&token));
    }

    return tokens;
}

auto sDownloadToken::expire(const std::string& token) -> bool {
    auto _database = MySqlConnector();
    schema::DownloadTokens _tokenTable;

    auto updated = _database->run(
            update(_tokenTable)
                    .set(_tokenTable.status = tokenStatusToString(TokenStatus::EXPIRED))
                    .where(
                            _tokenTable.token == token
                            and _tokenTable.status == tokenStatusToString(TokenStatus::ACTIVE)
                    )
    );

    return updated != 0;
}

auto sDownloadToken::disable(const std::string& token) -> bool {
    auto _database = MySqlConnector();
    schema::DownloadTokens _tokenTable;

    auto updated = _database->run(
            update(_tokenTable)
                    .set(_tokenTable.status = tokenStatusToString(TokenStatus::DISABLED))
                    .where(
                            _tokenTable.token == token
                            and _tokenTable.status != tokenStatusToString(TokenStatus::DISABLED)
                    )
    );

    return updated != 0;
}

auto sDownloadToken::expireCrossed(std::chrono::system_clock::time_point now) -> uint64_t {
    auto _database = MySqlConnector();
    schema::DownloadTokens _tokenTable;

    return _database->run(
            update(_tokenTable)
                    .set(_tokenTable.status = tokenStatusToString(TokenStatus::EXPIRED))
                    .where(
                            _tokenTable.status == tokenStatusToString(TokenStatus::ACTIVE)
                            and (
                                    _tokenTable.expiresAt <= std::chrono::time_point_cast<std::chrono::microseconds>(now)
                                    or _tokenTable.downloadCount >= _tokenTable.maxDownloads
                            )
                    )
    );
}
