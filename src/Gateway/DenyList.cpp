#include "../Lib/CsvColumn.h"
#include "DenyList.h"
#include <iostream>
#include <utility>

DenyList::DenyList(std::set<std::string> emails) : emails(std::move(emails)) {
}

auto DenyList::fromCsv(const std::string& path) -> DenyList {
    if (path.empty()) {
        return DenyList{};
    }

    auto values = readCsvColumn(path, "email");
    DenyList denyList(std::set<std::string>(values.begin(), values.end()));

    std::cout << "GATEWAY: Loaded " << denyList.size() << " deny listed addresses from " << path << std::endl;
    return denyList;
}

auto DenyList::contains(const std::string& email) const -> bool {
    return emails.contains(email);
}
