//
// Runs the tape archive's command line client to stage one file
//

#ifndef SDS_ARCHIVE_SERVER_ARCHIVETOOL_H
#define SDS_ARCHIVE_SERVER_ARCHIVETOOL_H

#include "../Interfaces/IArchiveTool.h"
#include <string>

struct sArchiveToolSettings {
    std::string binary;
    std::string keytab;
    std::string user;
    bool firewall = true;
};

class ArchiveTool : public IArchiveTool {
public:
    explicit ArchiveTool(sArchiveToolSettings settings);

    // Runs the command under /bin/sh in its own process group. A non zero exit raises eRetrievalError, running past
    // `timeout` kills the group and raises eRetrievalTimeout. Either way the partial local file is removed.
    void retrieve(const std::string& remotePath, const std::string& localPath,
                  std::chrono::seconds timeout) override;

    // The shell command line for one retrieval. The paths are inserted unquoted.
    [[nodiscard]] auto buildCommand(const std::string& remotePath, const std::string& localPath) const
            -> std::string;

private:
    sArchiveToolSettings settings;
};

#endif //SDS_ARCHIVE_SERVER_ARCHIVETOOL_H
