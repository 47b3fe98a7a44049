//
// Time to live purge of staged artifacts
//

#ifndef SDS_ARCHIVE_SERVER_HOUSEKEEPER_H
#define SDS_ARCHIVE_SERVER_HOUSEKEEPER_H

#include <boost/filesystem.hpp>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>

class Housekeeper {
public:
    Housekeeper(boost::filesystem::path stagingDir, std::chrono::minutes ttl, std::set<std::string> allowList);

    // Loads the 'file' column of a CSV file. An empty path gives an empty list.
    static auto loadAllowList(const std::string& path) -> std::set<std::string>;

    // Removes every regular file below the staging directory that was last read at least ttl ago, unless its name
    // is on the allow list. Hidden files are left alone. Returns how many files were removed.
    auto purge(std::chrono::system_clock::time_point now) const -> uint64_t;

private:
    boost::filesystem::path stagingDir;
    std::chrono::minutes ttl;
    std::set<std::string> allowList;
};

#endif //SDS_ARCHIVE_SERVER_HOUSEKEEPER_H
