//
// Reads one named column out of a CSV file with a header row
//

#ifndef SDS_ARCHIVE_SERVER_CSVCOLUMN_H
#define SDS_ARCHIVE_SERVER_CSVCOLUMN_H

#include <string>
#include <vector>

// Values are trimmed and empty values skipped. Throws std::runtime_error if the file can't be opened or has no
// column named `column`.
auto readCsvColumn(const std::string& path, const std::string& column) -> std::vector<std::string>;

#endif //SDS_ARCHIVE_SERVER_CSVCOLUMN_H
