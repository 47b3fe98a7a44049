//
// Download token records in the download_tokens table
//

#ifndef SDS_ARCHIVE_SERVER_S_DOWNLOAD_TOKEN_H
#define SDS_ARCHIVE_SERVER_S_DOWNLOAD_TOKEN_H

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class TokenStatus {
    ACTIVE,
    DISABLED,
    EXPIRED
};

auto tokenStatusToString(TokenStatus status) -> std::string;
auto tokenStatusFromString(const std::string& status) -> TokenStatus;

struct sDownloadToken {
    static auto fromRecord(auto record) -> sDownloadToken {
        return {
                .tokenId = static_cast<uint64_t>(record->tokenId),
                .token = record->token,
                .jobId = record->jobId,
                .status = tokenStatusFromString(record->status),
                .downloadCount = static_cast<uint32_t>(record->downloadCount),
                .maxDownloads = static_cast<uint32_t>(record->maxDownloads),
                .createdTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                        record->createdTime.value()
                ),
                .expiresAt = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                        record->expiresAt.value()
                ),
                .lastDownloadTime = record->lastDownloadTime.is_null()
                        ? std::nullopt
                        : std::optional<std::chrono::system_clock::time_point>(
                                std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                                        record->lastDownloadTime.value()
                                )
                        ),
                .lastDownloadIp = record->lastDownloadIp.is_null()
                        ? std::nullopt
                        : std::optional<std::string>(record->lastDownloadIp.value())
        };
    }

    // A token is usable while it is active, unexpired and below its download limit
    [[nodiscard]] auto isValid(std::chrono::system_clock::time_point now) const -> bool {
        return status == TokenStatus::ACTIVE && now < expiresAt && downloadCount < maxDownloads;
    }

    [[nodiscard]] auto remainingDownloads() const -> uint32_t {
        return downloadCount >= maxDownloads ? 0 : maxDownloads - downloadCount;
    }

    [[nodiscard]] auto toJson(std::chrono::system_clock::time_point now) const -> nlohmann::json;

    // Database methods - implemented in sDownloadToken.cpp
    void save();
    static auto getByToken(const std::string& token) -> sDownloadToken;
    static auto getByJobId(const std::string& jobId) -> std::vector<sDownloadToken>;

    // Flip an active token to expired. Returns false if the token was no longer active.
    static auto expire(const std::string& token) -> bool;
    static auto disable(const std::string& token) -> bool;

    // Expire every active token whose time or count bound is crossed, returning how many were flipped
    static auto expireCrossed(std::chrono::system_clock::time_point now) -> uint64_t;

    uint64_t tokenId = 0;
    std::string token;
    std::string jobId;
    TokenStatus status = TokenStatus::ACTIVE;
    uint32_t downloadCount = 0;
    uint32_t maxDownloads = 0;
    std::chrono::system_clock::time_point createdTime;
    std::chrono::system_clock::time_point expiresAt;
    std::optional<std::chrono::system_clock::time_point> lastDownloadTime;
    std::optional<std::string> lastDownloadIp;
};

#endif //SDS_ARCHIVE_SERVER_S_DOWNLOAD_TOKEN_H
