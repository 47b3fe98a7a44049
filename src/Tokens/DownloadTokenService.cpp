#include "../DB/MySqlConnector.h"
#include "../DB/sArchiveJob.h"
#include "../Lib/GeneralUtils.h"
#include "DownloadTokenService.h"
#include <archive_schema.h>
#include <array>
#include <iostream>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sqlpp11/sqlpp11.h>

using namespace sqlpp;

namespace {
constexpr size_t TOKEN_LENGTH = 32;
constexpr size_t TOKEN_RANDOM_BYTES = 16;

auto toHex(const unsigned char* data, size_t length) -> std::string {
    static constexpr std::array<char, 16> digits = {
            '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; i++) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        result += digits.at(data[i] >> 4U);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        result += digits.at(data[i] & 0x0FU);
    }
    return result;
}
}

auto tokenInvalidReasonToString(TokenInvalidReason reason) -> std::string {
    switch (reason) {
        case TokenInvalidReason::DISABLED:
            return "disabled";
        case TokenInvalidReason::EXPIRED:
            return "expired";
        case TokenInvalidReason::TIME_ELAPSED:
            return "time_elapsed";
        case TokenInvalidReason::DOWNLOAD_LIMIT_REACHED:
            return "download_limit_reached";
    }

    return "unknown";
}

auto sTokenValidation::toJson(std::chrono::system_clock::time_point now) const -> nlohmann::json {
    nlohmann::json result;
    result["valid"] = valid;
    if (reason) {
        result["reason"] = tokenInvalidReasonToString(*reason);
    }
    result["token"] = token.toJson(now);
    return result;
}

DownloadTokenService::DownloadTokenService(uint32_t defaultMaxDownloads, std::chrono::hours defaultExpiry) :
        defaultMaxDownloads(defaultMaxDownloads), defaultExpiry(defaultExpiry) {
}

auto DownloadTokenService::generateToken(const std::string& jobId, const std::string& email) -> std::string {
    std::array<unsigned char, TOKEN_RANDOM_BYTES> randomBytes{};
    if (RAND_bytes(randomBytes.data(), static_cast<int>(randomBytes.size())) != 1) {
        throw std::runtime_error("Unable to gather random bytes for a download token");
    }

    auto timestamp = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()
    ).count();
    auto input = jobId + ":" + email + ":" + std::to_string(timestamp) + ":"
                 + toHex(randomBytes.data(), randomBytes.size());

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &digestLength, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Unable to hash a download token");
    }

    return toHex(digest.data(), digestLength).substr(0, TOKEN_LENGTH);
}

auto DownloadTokenService::issue(const std::string& jobId, const std::string& email,
                                 std::optional<uint32_t> maxDownloads,
                                 std::optional<std::chrono::hours> expiry) const -> sDownloadToken {
    auto job = sArchiveJob::getByJobId(jobId);
    if (job.id == 0) {
        throw eTokenNotFound("Job " + jobId + " does not exist");
    }

    if (job.email != email) {
        throw eTokenForbidden("Job " + jobId + " does not belong to " + email);
    }

    if (job.status != JobStatus::COMPLETED) {
        throw eTokenNotReady("Job " + jobId + " is " + jobStatusToString(job.status) + ", not completed");
    }

    auto now = std::chrono::system_clock::now();
    sDownloadToken token{
            .token = generateToken(jobId, email),
            .jobId = jobId,
            .status = TokenStatus::ACTIVE,
            .downloadCount = 0,
            .maxDownloads = maxDownloads.value_or(defaultMaxDownloads),
            .createdTime = now,
            .expiresAt = now + expiry.value_or(defaultExpiry)
    };
    token.save();

    std::cout << "TOKEN: Issued token " << token.tokenId << " for job " << jobId << ", " << token.maxDownloads
              << " downloads until " << formatTimestamp(token.expiresAt) << std::endl;

    // Reload so the stored time precision is what the caller sees
    return sDownloadToken::getByToken(token.token);
}

auto DownloadTokenService::validate(const std::string& token) const -> sTokenValidation {
    auto record = sDownloadToken::getByToken(token);
    if (record.tokenId == 0) {
        throw eTokenNotFound("Unknown download token");
    }

    auto now = std::chrono::system_clock::now();

    std::optional<TokenInvalidReason> reason;
    if (record.status == TokenStatus::DISABLED) {
        reason = TokenInvalidReason::DISABLED;
    } else if (record.status == TokenStatus::EXPIRED) {
        reason = TokenInvalidReason::EXPIRED;
    } else if (now >= record.expiresAt) {
        reason = TokenInvalidReason::TIME_ELAPSED;
    } else if (record.downloadCount >= record.maxDownloads) {
        reason = TokenInvalidReason::DOWNLOAD_LIMIT_REACHED;
    }

    if (reason == TokenInvalidReason::TIME_ELAPSED || reason == TokenInvalidReason::DOWNLOAD_LIMIT_REACHED) {
        if (sDownloadToken::expire(token)) {
            std::cout << "TOKEN: Expired token " << record.tokenId << " ("
                      << tokenInvalidReasonToString(*reason) << ")" << std::endl;
        }
        record.status = TokenStatus::EXPIRED;
    }

    return {.valid = !reason.has_value(), .reason = reason, .token = record};
}

auto DownloadTokenService::recordDownload(const std::string& token, const std::string& clientIp) const
        -> sDownloadToken {
    auto validation = validate(token);
    if (!validation.valid) {
        throw eTokenForbidden(
                "Download token is not valid: " + tokenInvalidReasonToString(validation.reason.value())
        );
    }

    {
        auto _database = MySqlConnector();
        schema::DownloadTokens _tokenTable;

        _database->start_transaction();

        try {
            auto now = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
            auto active = tokenStatusToString(TokenStatus::ACTIVE);

            // Only succeeds while the token is still usable, so two racing downloads can't both take the last slot
            auto counted = _database->run(
                    update(_tokenTable)
                            .set(
                                    _tokenTable.downloadCount = _tokenTable.downloadCount + 1,
                                    _tokenTable.lastDownloadTime = now,
                                    _tokenTable.lastDownloadIp = clientIp
                            )
                            .where(
                                    _tokenTable.token == token
                                    and _tokenTable.status == active
                                    and _tokenTable.downloadCount < _tokenTable.maxDownloads
                                    and _tokenTable.expiresAt > now
                            )
            );

            if (counted == 0) {
                throw eTokenForbidden("Download token was used up by a concurrent download");
            }

            _database->run(
                    update(_tokenTable)
                            .set(_tokenTable.status = tokenStatusToString(TokenStatus::EXPIRED))
                            .where(
                                    _tokenTable.token == token
                                    and _tokenTable.status == active
                                    and _tokenTable.downloadCount >= _tokenTable.maxDownloads
                            )
            );

            _database->commit_transaction();
        } catch (std::exception&) {
            // Abort the transaction
            _database->rollback_transaction(false);
            throw;
        }
    }

    auto record = sDownloadToken::getByToken(token);
    std::cout << "TOKEN: Download " << record.downloadCount << " of " << record.maxDownloads << " on token "
              << record.tokenId << " from " << clientIp << std::endl;
    return record;
}

auto DownloadTokenService::sweepExpired() const -> uint64_t {
    auto expired = sDownloadToken::expireCrossed(std::chrono::system_clock::now());
    std::cout << "TOKEN: Sweep expired " << expired << " tokens" << std::endl;
    return expired;
}

void DownloadTokenService::disable(const std::string& token) const {
    auto record = sDownloadToken::getByToken(token);
    if (record.tokenId == 0) {
        throw eTokenNotFound("Unknown download token");
    }

    if (sDownloadToken::disable(token)) {
        std::cout << "TOKEN: Disabled token " << record.tokenId << std::endl;
    }
}

auto DownloadTokenService::getJobTokens(const std::string& jobId) const -> std::vector<sDownloadToken> {
    return sDownloadToken::getByJobId(jobId);
}

auto DownloadTokenService::getByToken(const std::string& token) const -> sDownloadToken {
    auto record = sDownloadToken::getByToken(token);
    if (record.tokenId == 0) {
        throw eTokenNotFound("Unknown download token");
    }
    return record;
}
