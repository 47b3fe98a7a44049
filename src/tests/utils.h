//
// Helpers shared by the test suites
//

#ifndef SDS_ARCHIVE_SERVER_TEST_UTILS_H
#define SDS_ARCHIVE_SERVER_TEST_UTILS_H

#include <boost/filesystem.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <client_http.hpp>

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>;

// Writes `size` random bytes to `path`, replacing any existing file
void writeFile(const boost::filesystem::path& path, uint64_t size);
void writeTextFile(const boost::filesystem::path& path, const std::string& content);

// Writes an executable /bin/sh script
void writeScript(const boost::filesystem::path& path, const std::string& body);

void setFileTimes(const boost::filesystem::path& path, std::chrono::system_clock::time_point accessTime,
                  std::chrono::system_clock::time_point modificationTime);
auto getAccessTime(const boost::filesystem::path& path) -> std::chrono::system_clock::time_point;
auto getModificationTime(const boost::filesystem::path& path) -> std::chrono::system_clock::time_point;

/**
 * RAII class for a uniquely named directory under the system temp directory, removed with its contents
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory()
    {
        directory = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("sds_test_%%%%-%%%%-%%%%");
        boost::filesystem::create_directories(directory);
    }

    ~TemporaryDirectory()
    {
        boost::system::error_code errorCode;
        boost::filesystem::remove_all(directory, errorCode);
    }

    TemporaryDirectory(const TemporaryDirectory&)            = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&)                 = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&)      = delete;

    [[nodiscard]] auto path() const -> const boost::filesystem::path&
    {
        return directory;
    }

private:
    boost::filesystem::path directory;
};

/**
 * RAII class for a temporary file holding `content`
 */
class TemporaryFile
{
public:
    explicit TemporaryFile(const std::string& content, const std::string& extension = ".csv")
    {
        filepath = boost::filesystem::temp_directory_path()
                   / boost::filesystem::unique_path("sds_test_%%%%-%%%%-%%%%" + extension);
        writeTextFile(filepath, content);
    }

    ~TemporaryFile()
    {
        boost::system::error_code errorCode;
        boost::filesystem::remove(filepath, errorCode);
    }

    TemporaryFile(const TemporaryFile&)            = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;
    TemporaryFile(TemporaryFile&&)                 = delete;
    TemporaryFile& operator=(TemporaryFile&&)      = delete;

    [[nodiscard]] auto path() const -> std::string
    {
        return filepath.string();
    }

private:
    boost::filesystem::path filepath;
};

using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // SDS_ARCHIVE_SERVER_TEST_UTILS_H
