//
// Issues and enforces the time and count limited links to completed artifacts
//

#ifndef SDS_ARCHIVE_SERVER_DOWNLOADTOKENSERVICE_H
#define SDS_ARCHIVE_SERVER_DOWNLOADTOKENSERVICE_H

#include "../DB/sDownloadToken.h"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class eTokenNotFound : public std::runtime_error {
public:
    explicit eTokenNotFound(const std::string& what) : std::runtime_error(what) {}
};

class eTokenForbidden : public std::runtime_error {
public:
    explicit eTokenForbidden(const std::string& what) : std::runtime_error(what) {}
};

class eTokenNotReady : public std::runtime_error {
public:
    explicit eTokenNotReady(const std::string& what) : std::runtime_error(what) {}
};

enum class TokenInvalidReason {
    DISABLED,
    EXPIRED,
    TIME_ELAPSED,
    DOWNLOAD_LIMIT_REACHED
};

auto tokenInvalidReasonToString(TokenInvalidReason reason) -> std::string;

struct sTokenValidation {
    // {"valid": bool, "reason": string (only when invalid), "token": snapshot}
    [[nodiscard]] auto toJson(std::chrono::system_clock::time_point now) const -> nlohmann::json;

    bool valid = false;
    std::optional<TokenInvalidReason> reason;
    sDownloadToken token;
};

class DownloadTokenService {
public:
    DownloadTokenService(uint32_t defaultMaxDownloads, std::chrono::hours defaultExpiry);

    // The job must exist (eTokenNotFound), belong to `email` (eTokenForbidden) and be completed (eTokenNotReady)
    auto issue(const std::string& jobId, const std::string& email,
               std::optional<uint32_t> maxDownloads = std::nullopt,
               std::optional<std::chrono::hours> expiry = std::nullopt) const -> sDownloadToken;

    // Throws eTokenNotFound for an unknown token. A token found past its time or count bound is flipped to expired.
    auto validate(const std::string& token) const -> sTokenValidation;

    // Counts one download. Throws eTokenNotFound, or eTokenForbidden if the token is not valid or another download
    // took the last slot first.
    auto recordDownload(const std::string& token, const std::string& clientIp) const -> sDownloadToken;

    auto sweepExpired() const -> uint64_t;
    void disable(const std::string& token) const;
    auto getJobTokens(const std::string& jobId) const -> std::vector<sDownloadToken>;
    auto getByToken(const std::string& token) const -> sDownloadToken;

    // First 32 hex characters of SHA-256("<jobId>:<email>:<timestamp>:<32 random hex>")
    static auto generateToken(const std::string& jobId, const std::string& email) -> std::string;

private:
    uint32_t defaultMaxDownloads;
    std::chrono::hours defaultExpiry;
};

#endif //SDS_ARCHIVE_SERVER_DOWNLOADTOKENSERVICE_H
