#include "StagingArea.h"
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <utility>

StagingArea::StagingArea(boost::filesystem::path directory, std::chrono::milliseconds pollInterval,
                         std::chrono::milliseconds zeroSizeLimit) :
        directory(std::move(directory)), pollInterval(pollInterval), zeroSizeLimit(zeroSizeLimit) {
}

auto StagingArea::pathFor(const std::string& collectionPath) const -> boost::filesystem::path {
    return directory / collectionBasename(collectionPath);
}

auto StagingArea::isInCache(const std::string& collectionPath, const InterruptableTimer& timer) const -> bool {
    auto localFile = pathFor(collectionPath);

    if (!boost::filesystem::is_regular_file(localFile)) {
        return false;
    }

    boost::system::error_code sizeError;
    auto fileSize = boost::filesystem::file_size(localFile, sizeError);
    if (sizeError) {
        return false;
    }

    std::chrono::milliseconds zeroSizeWait{0};

    while (true) {
        if (!timer.wait_for(pollInterval)) {
            std::cout << "WORKER: Cache check for " << localFile.string() << " interrupted" << std::endl;
            return false;
        }

        // Another worker or the housekeeper may have removed it
        auto currentSize = boost::filesystem::file_size(localFile, sizeError);
        if (sizeError || !boost::filesystem::is_regular_file(localFile)) {
            std::cout << "WORKER: " << localFile.string() << " disappeared during the cache check" << std::endl;
            return false;
        }

        // A retrieval in progress elsewhere sits at zero bytes for a while
        if (currentSize == 0) {
            zeroSizeWait += pollInterval;
            if (zeroSizeWait < zeroSizeLimit) {
                continue;
            }

            std::cout << "WORKER: Removing " << localFile.string() << ", it stayed empty for "
                      << zeroSizeWait.count() << "ms" << std::endl;

            boost::system::error_code errorCode;
            boost::filesystem::remove(localFile, errorCode);
            return false;
        }

        if (currentSize == fileSize) {
            break;
        }

        fileSize = currentSize;
    }

    // False if it was removed between the last poll and the refresh
    return refreshAccessTime(localFile);
}

auto StagingArea::usageBytes() const -> uint64_t {
    uint64_t total = 0;
    for (const auto& entry : boost::filesystem::directory_iterator(directory)) {
        struct stat info {};
        if (::stat(entry.path().c_str(), &info) != 0) {
            // Removed between listing and stat
            continue;
        }
        total += static_cast<uint64_t>(info.st_size);
    }
    return total;
}

auto StagingArea::hasEnoughSpace(uint64_t thresholdBytes) const -> bool {
    auto used = usageBytes();
    std::cout << "WORKER: Staging usage " << used << " bytes, threshold " << thresholdBytes << " bytes" << std::endl;
    return used < thresholdBytes;
}

auto StagingArea::refreshAccessTime(const boost::filesystem::path& path) -> bool {
    std::array<timespec, 2> times{};
    times[0].tv_nsec = UTIME_NOW;
    times[1].tv_nsec = UTIME_OMIT;

    if (::utimensat(AT_FDCWD, path.c_str(), times.data(), 0) != 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw std::runtime_error("Unable to update the access time of " + path.string() + ": " + std::strerror(errno));
    }
    return true;
}
