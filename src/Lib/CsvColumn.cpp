#include "CsvColumn.h"
#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <stdexcept>

namespace {
auto splitRow(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> cells;
    boost::split(cells, line, boost::is_any_of(","));
    for (auto& cell : cells) {
        boost::trim(cell);
        // Quoted cells carry no embedded separators in these lists
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
            cell = cell.substr(1, cell.size() - 2);
            boost::trim(cell);
        }
    }
    return cells;
}
}

auto readCsvColumn(const std::string& path, const std::string& column) -> std::vector<std::string> {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error(path + " is empty, expected a header row with a '" + column + "' column");
    }

    auto header = splitRow(line);
    auto position = std::find(header.begin(), header.end(), column);
    if (position == header.end()) {
        throw std::runtime_error(path + " has no '" + column + "' column");
    }
    auto index = static_cast<size_t>(std::distance(header.begin(), position));

    std::vector<std::string> values;
    while (std::getline(file, line)) {
        auto cells = splitRow(line);
        if (index < cells.size() && !cells[index].empty()) {
            values.push_back(cells[index]);
        }
    }

    return values;
}
