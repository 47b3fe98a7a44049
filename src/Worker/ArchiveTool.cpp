#include "ArchiveTool.h"
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <iostream>
#include <utility>

namespace {
void removePartialFile(const std::string& localPath) {
    boost::system::error_code errorCode;
    if (boost::filesystem::remove(localPath, errorCode)) {
        std::cout << "WORKER: Removed partial file " << localPath << std::endl;
    }
}
}

ArchiveTool::ArchiveTool(sArchiveToolSettings settings) : settings(std::move(settings)) {
}

auto ArchiveTool::buildCommand(const std::string& remotePath, const std::string& localPath) const -> std::string {
    auto command = settings.binary + " -d2 -A keytab -k " + settings.keytab + " -l " + settings.user + " ";
    auto transfer = "get " + localPath + " : " + remotePath;

    if (settings.firewall) {
        return command + "\"firewall -on; " + transfer + "\"";
    }

    return command + transfer;
}

void ArchiveTool::retrieve(const std::string& remotePath, const std::string& localPath,
                           std::chrono::seconds timeout) {
    auto command = buildCommand(remotePath, localPath);
    std::cout << "WORKER: Running " << command << std::endl;

    boost::process::group group;
    boost::process::child child(
            boost::process::exe = "/bin/sh",
            boost::process::args = {"-c", command},
            group
    );

    if (!child.wait_for(timeout)) {
        std::error_code errorCode;
        group.terminate(errorCode);
        child.wait(errorCode);
        removePartialFile(localPath);

        throw eRetrievalTimeout(
                "Retrieval of " + remotePath + " did not finish within " + std::to_string(timeout.count())
                + " seconds"
        );
    }

    if (child.exit_code() != 0) {
        removePartialFile(localPath);

        throw eRetrievalError(
                "Retrieval of " + remotePath + " exited with code " + std::to_string(child.exit_code())
        );
    }
}
