#include "utils.h"

#include <algorithm>
#include <array>
#include <fcntl.h>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>
#include <sys/stat.h>

std::shared_ptr<std::default_random_engine> rng =
    nullptr;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

namespace
{
auto toTimespec(std::chrono::system_clock::time_point timestamp) -> timespec
{
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(timestamp.time_since_epoch()).count();
    timespec result{};
    result.tv_sec  = static_cast<time_t>(nanos / 1000000000);
    result.tv_nsec = static_cast<long>(nanos % 1000000000);
    return result;
}

auto fromTimespec(const timespec& value) -> std::chrono::system_clock::time_point
{
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::seconds(value.tv_sec) + std::chrono::nanoseconds(value.tv_nsec)));
}

auto statFile(const boost::filesystem::path& path) -> struct stat
{
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0)
    {
        throw std::runtime_error("Unable to stat " + path.string());
    }
    return info;
}
}  // namespace

auto randomInt(uint64_t start, uint64_t end) -> uint64_t
{
    if (!rng)
    {
        rng = std::make_shared<std::default_random_engine>(std::chrono::system_clock::now().time_since_epoch().count());
    }

    std::uniform_int_distribution<uint64_t> rng_dist(start, end);
    return rng_dist(*rng);
}

auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>
{
    auto result = std::make_shared<std::vector<uint8_t>>();
    result->reserve(count);

    for (uint32_t i = 0; i < count; i++)
    {
        result->push_back(randomInt(0, std::numeric_limits<uint8_t>::max()));
    }

    return result;
}

void writeFile(const boost::filesystem::path& path, uint64_t size)
{
    std::ofstream file(path.string(), std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to create file: " + path.string());
    }

    // Written in blocks so large files don't need a buffer of the full size
    constexpr uint64_t blockSize = 1024 * 64;
    auto block                   = generateRandomData(static_cast<uint32_t>(std::min(size, blockSize)));
    for (uint64_t written = 0; written < size;)
    {
        auto count = std::min(size - written, blockSize);
        file.write(reinterpret_cast<const char*>(block->data()), static_cast<std::streamsize>(count));
        written += count;
    }
}

void writeTextFile(const boost::filesystem::path& path, const std::string& content)
{
    std::ofstream file(path.string(), std::ios::trunc);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to create file: " + path.string());
    }
    file << content;
}

void writeScript(const boost::filesystem::path& path, const std::string& body)
{
    writeTextFile(path, "#!/bin/sh\n" + body + "\n");
    boost::filesystem::permissions(path, boost::filesystem::owner_all | boost::filesystem::group_read |
                                             boost::filesystem::group_exe | boost::filesystem::others_read |
                                             boost::filesystem::others_exe);
}

void setFileTimes(const boost::filesystem::path& path, std::chrono::system_clock::time_point accessTime,
                  std::chrono::system_clock::time_point modificationTime)
{
    std::array<timespec, 2> times = {toTimespec(accessTime), toTimespec(modificationTime)};
    if (::utimensat(AT_FDCWD, path.c_str(), times.data(), 0) != 0)
    {
        throw std::runtime_error("Unable to set times on " + path.string());
    }
}

auto getAccessTime(const boost::filesystem::path& path) -> std::chrono::system_clock::time_point
{
    return fromTimespec(statFile(path).st_atim);
}

auto getModificationTime(const boost::filesystem::path& path) -> std::chrono::system_clock::time_point
{
    return fromTimespec(statFile(path).st_mtim);
}
