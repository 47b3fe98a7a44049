//
// Interface for the external tool that copies a file out of the tape archive
//

#ifndef SDS_ARCHIVE_SERVER_I_ARCHIVE_TOOL_H
#define SDS_ARCHIVE_SERVER_I_ARCHIVE_TOOL_H

#include <chrono>
#include <stdexcept>
#include <string>

class eRetrievalError : public std::runtime_error {
public:
    explicit eRetrievalError(const std::string& what) : std::runtime_error(what) {}
};

class eRetrievalTimeout : public eRetrievalError {
public:
    explicit eRetrievalTimeout(const std::string& what) : eRetrievalError(what) {}
};

class IArchiveTool {
public:
    virtual ~IArchiveTool() = default;

    // Copies `remotePath` from the archive to `localPath`. On failure or timeout no partial file is left behind.
    virtual void retrieve(const std::string& remotePath, const std::string& localPath,
                          std::chrono::seconds timeout) = 0;
};

#endif //SDS_ARCHIVE_SERVER_I_ARCHIVE_TOOL_H
