//
// Requesters whose submissions are refused outright
//

#ifndef SDS_ARCHIVE_SERVER_DENYLIST_H
#define SDS_ARCHIVE_SERVER_DENYLIST_H

#include <cstddef>
#include <set>
#include <string>

class DenyList {
public:
    DenyList() = default;
    explicit DenyList(std::set<std::string> emails);

    // Loads the 'email' column of a CSV file. An empty path gives an empty list.
    static auto fromCsv(const std::string& path) -> DenyList;

    [[nodiscard]] auto contains(const std::string& email) const -> bool;
    [[nodiscard]] auto size() const -> size_t { return emails.size(); }

private:
    std::set<std::string> emails;
};

#endif //SDS_ARCHIVE_SERVER_DENYLIST_H
