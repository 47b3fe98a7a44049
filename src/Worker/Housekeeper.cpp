#include "../Lib/CsvColumn.h"
#include "../Lib/GeneralUtils.h"
#include "Housekeeper.h"
#include <iostream>
#include <sys/stat.h>
#include <utility>

namespace {
auto accessTime(const boost::filesystem::path& path) -> std::chrono::system_clock::time_point {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        throw std::runtime_error("Unable to stat " + path.string());
    }

    return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    std::chrono::seconds(info.st_atim.tv_sec) + std::chrono::nanoseconds(info.st_atim.tv_nsec)
            )
    );
}
}

Housekeeper::Housekeeper(boost::filesystem::path stagingDir, std::chrono::minutes ttl,
                         std::set<std::string> allowList) :
        stagingDir(std::move(stagingDir)), ttl(ttl), allowList(std::move(allowList)) {
}

auto Housekeeper::loadAllowList(const std::string& path) -> std::set<std::string> {
    if (path.empty()) {
        return {};
    }

    auto values = readCsvColumn(path, "file");
    return {values.begin(), values.end()};
}

auto Housekeeper::purge(std::chrono::system_clock::time_point now) const -> uint64_t {
    std::cout << "HOUSEKEEPER: Purging files in " << stagingDir.string() << " not accessed for " << ttl.count()
              << " minutes" << std::endl;

    uint64_t removed = 0;
    for (auto iter = boost::filesystem::recursive_directory_iterator(stagingDir);
         iter != boost::filesystem::recursive_directory_iterator(); ++iter) {
        const auto& path = iter->path();
        auto name = path.filename().string();

        if (!name.empty() && name.front() == '.') {
            if (boost::filesystem::is_directory(path)) {
                iter.disable_recursion_pending();
            }
            continue;
        }

        if (!boost::filesystem::is_regular_file(path) || allowList.contains(name)) {
            continue;
        }

        try {
            if (now - accessTime(path) < ttl) {
                continue;
            }

            boost::filesystem::remove(path);
            removed++;
            std::cout << "HOUSEKEEPER: Removed " << path.string() << std::endl;
        } catch (std::exception& e) {
            // Another process may have removed it first
            dumpExceptions(e);
        }
    }

    std::cout << "HOUSEKEEPER: Removed " << removed << " files" << std::endl;
    return removed;
}
