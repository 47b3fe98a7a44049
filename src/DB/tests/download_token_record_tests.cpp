#include "../sDownloadToken.h"
#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(download_token_record_test_suite)
    BOOST_AUTO_TEST_CASE(test_validity_predicate) {
        auto now = std::chrono::system_clock::now();
        sDownloadToken token{
                .token = "abc",
                .jobId = "job-1",
                .status = TokenStatus::ACTIVE,
                .downloadCount = 0,
                .maxDownloads = 3,
                .createdTime = now,
                .expiresAt = now + std::chrono::hours(24)
        };

        BOOST_CHECK(token.isValid(now));
        BOOST_CHECK_EQUAL(token.remainingDownloads(), 3);

        // Exactly at the expiry instant the token is no longer usable
        BOOST_CHECK(!token.isValid(token.expiresAt));
        BOOST_CHECK(!token.isValid(token.expiresAt + std::chrono::seconds(1)));

        token.downloadCount = 3;
        BOOST_CHECK(!token.isValid(now));
        BOOST_CHECK_EQUAL(token.remainingDownloads(), 0);

        token.downloadCount = 1;
        token.status = TokenStatus::DISABLED;
        BOOST_CHECK(!token.isValid(now));
    }

    BOOST_AUTO_TEST_CASE(test_snapshot_json) {
        auto now = std::chrono::system_clock::now();
        sDownloadToken token{
                .tokenId = 7,
                .token = "abc",
                .jobId = "job-1",
                .status = TokenStatus::ACTIVE,
                .downloadCount = 1,
                .maxDownloads = 3,
                .createdTime = now,
                .expiresAt = now + std::chrono::hours(24)
        };

        auto json = token.toJson(now);
        BOOST_CHECK_EQUAL(json["token_id"].get<uint64_t>(), 7);
        BOOST_CHECK_EQUAL(json["status"].get<std::string>(), "active");
        BOOST_CHECK_EQUAL(json["is_valid"].get<bool>(), true);
        BOOST_CHECK_EQUAL(json["remaining_downloads"].get<uint32_t>(), 2);
        BOOST_CHECK(json["last_download_time"].is_null());
        BOOST_CHECK(json["last_download_ip"].is_null());

        token.lastDownloadIp = "10.0.0.1";
        token.lastDownloadTime = now;
        json = token.toJson(now);
        BOOST_CHECK_EQUAL(json["last_download_ip"].get<std::string>(), "10.0.0.1");
        BOOST_CHECK(json["last_download_time"].is_string());
    }

    BOOST_AUTO_TEST_CASE(test_status_names) {
        BOOST_CHECK_EQUAL(tokenStatusToString(TokenStatus::EXPIRED), "expired");
        BOOST_CHECK(tokenStatusFromString("disabled") == TokenStatus::DISABLED);
        BOOST_CHECK_THROW(tokenStatusFromString("revoked"), std::invalid_argument);
    }
BOOST_AUTO_TEST_SUITE_END()
