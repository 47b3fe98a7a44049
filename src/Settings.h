//
// Process wide settings, read from the environment
//

#ifndef SDS_ARCHIVE_SERVER_SETTINGS_H
#define SDS_ARCHIVE_SERVER_SETTINGS_H

#include <cstdint>
#include <cstdlib>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

inline auto GET_ENV_BOOL(const std::string &variable, bool _default) -> bool {
    auto value = GET_ENV(variable, _default ? "on" : "off");
    return value == "on" || value == "true" || value == "1" || value == "yes";
}

#define DATABASE_USER                   GET_ENV("DATABASE_USER", "sds")
#define DATABASE_PASSWORD               GET_ENV("DATABASE_PASSWORD", "sds")
#define DATABASE_SCHEMA                 GET_ENV("DATABASE_SCHEMA", "sds")
#define DATABASE_HOST                   GET_ENV("DATABASE_HOST", "localhost")
#define DATABASE_PORT                   std::stoi(GET_ENV("DATABASE_PORT", "3306"))

#define ARCHIVE_TOOL_PATH               GET_ENV("ARCHIVE_TOOL_PATH", "/opt/hpss/bin/hsi")
#define ARCHIVE_TOOL_KEYTAB             GET_ENV("ARCHIVE_TOOL_KEYTAB", "/etc/sds/sds.keytab")
#define ARCHIVE_TOOL_USER               GET_ENV("ARCHIVE_TOOL_USER", "sds")
#define ARCHIVE_TOOL_FIREWALL           GET_ENV_BOOL("ARCHIVE_TOOL_FIREWALL", true)
#define ARCHIVE_TOOL_TIMEOUT_SECONDS    std::stoi(GET_ENV("ARCHIVE_TOOL_TIMEOUT_SECONDS", "3300"))

#define QUEUE_NAME                      GET_ENV("QUEUE_NAME", "isdp_task_queue")
#define QUEUE_REDELIVERY_SECONDS        std::stoi(GET_ENV("QUEUE_REDELIVERY_SECONDS", std::to_string(60*60*4)))
#define MINIMUM_JOB_INTERVAL_MINUTES    std::stoi(GET_ENV("MINIMUM_JOB_INTERVAL_MINUTES", "360"))
#define DENY_LIST_PATH                  GET_ENV("DENY_LIST_PATH", "")

#define STAGING_DIR                     GET_ENV("STAGING_DIR", "/var/www/html/staging")
#define STAGING_USAGE_THRESHOLD_GB      std::stod(GET_ENV("STAGING_USAGE_THRESHOLD_GB", "950"))
#define CACHE_POLL_INTERVAL_SECONDS     std::stoi(GET_ENV("CACHE_POLL_INTERVAL_SECONDS", "60"))
#define CACHE_ZERO_SIZE_LIMIT_SECONDS   std::stoi(GET_ENV("CACHE_ZERO_SIZE_LIMIT_SECONDS", "600"))

#define SMTP_SERVER                     GET_ENV("SMTP_SERVER", "localhost")
#define EMAIL_SENDER                    GET_ENV("EMAIL_SENDER", "noreply.sds@localhost")
#define CONTACT_EMAIL                   GET_ENV("CONTACT_EMAIL", "rdsadmin@localhost")
#define HTTP_DOWNLOAD_BASE              GET_ENV("HTTP_DOWNLOAD_BASE", "https://localhost/staging")

#define TOKEN_MAX_DOWNLOADS             static_cast<uint32_t>(std::stoul(GET_ENV("TOKEN_MAX_DOWNLOADS", "3")))
#define TOKEN_EXPIRY_HOURS              static_cast<uint32_t>(std::stoul(GET_ENV("TOKEN_EXPIRY_HOURS", "24")))
#define TOKEN_SWEEP_INTERVAL_SECONDS    std::stoi(GET_ENV("TOKEN_SWEEP_INTERVAL_SECONDS", "300"))

#define HOUSEKEEPING_TTL_MINUTES        std::stoi(GET_ENV("HOUSEKEEPING_TTL_MINUTES", std::to_string(60*24)))
#define HOUSEKEEPING_ALLOW_LIST_PATH    GET_ENV("HOUSEKEEPING_ALLOW_LIST_PATH", "")

constexpr const char* ACCESS_SECRET_ENV_VARIABLE = "ACCESS_SECRET_CONFIG";

#ifndef BUILD_TESTS
    const uint16_t HTTP_PORT = 8000;
#else
    const uint16_t HTTP_PORT = 23456;
#endif

const uint32_t HTTP_WORKER_POOL_SIZE = 32;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = 300;

const uint32_t SESSION_CACHE_IDLE_SECONDS = 60*10;

const uint32_t WORKER_IDLE_POLL_MILLISECONDS = 1000;

#endif //SDS_ARCHIVE_SERVER_SETTINGS_H
