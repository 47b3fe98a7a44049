//
// The local directory that caches artifacts retrieved from the archive
//

#ifndef SDS_ARCHIVE_SERVER_STAGINGAREA_H
#define SDS_ARCHIVE_SERVER_STAGINGAREA_H

#include "../Lib/GeneralUtils.h"
#include <boost/filesystem.hpp>
#include <chrono>
#include <cstdint>
#include <string>

class StagingArea {
public:
    StagingArea(boost::filesystem::path directory, std::chrono::milliseconds pollInterval,
                std::chrono::milliseconds zeroSizeLimit);

    [[nodiscard]] auto getDirectory() const -> const boost::filesystem::path& { return directory; }

    // Where the artifact for an archive path lives once staged: <staging>/<basename>
    [[nodiscard]] auto pathFor(const std::string& collectionPath) const -> boost::filesystem::path;

    // True once the staged file's size holds steady across two polls. A file that vanishes, or that stays empty
    // for zeroSizeLimit, is a miss (the empty file is removed). Stopping `timer` also reports a miss.
    // A hit refreshes the file's access time and leaves its modification time alone.
    auto isInCache(const std::string& collectionPath, const InterruptableTimer& timer) const -> bool;

    // Sum of the sizes of the directory's immediate entries
    [[nodiscard]] auto usageBytes() const -> uint64_t;
    [[nodiscard]] auto hasEnoughSpace(uint64_t thresholdBytes) const -> bool;

    // False if the file no longer exists
    static auto refreshAccessTime(const boost::filesystem::path& path) -> bool;

private:
    boost::filesystem::path directory;
    std::chrono::milliseconds pollInterval;
    std::chrono::milliseconds zeroSizeLimit;
};

#endif //SDS_ARCHIVE_SERVER_STAGINGAREA_H
