#include "workspace.h"
#include "constants.h"
#include "dataset_stager.h"
#include "errors.h"
#include "file_utils.h"
#include "source_scanner.h"
#include <filesystem>
#include <iostream>
#include <vector>
#include <cerrno>
#include <cstring>
#include <cstdlib>

namespace fs = std::filesystem;

namespace liverun {

WorkspaceProvisioner::WorkspaceProvisioner(std::string root, DatasetStager* stager)
    : root_(std::move(root)), stager_(stager) {}

Workspace WorkspaceProvisioner::provision(const std::string& execution_id,
                                          const std::string& source,
                                          const std::string& session_id) const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw LaunchFailure("cannot create workspace root " + root_ + ": " + ec.message());
    }

    // mkdtemp needs a mutable, NUL-terminated template
    std::string name = std::string(WORKSPACE_PREFIX) + execution_id.substr(0, 8) + "_XXXXXX";
    std::string pattern = (fs::path(root_) / name).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw LaunchFailure("cannot create workspace in " + root_ + ": " + std::strerror(errno));
    }

    Workspace workspace;
    workspace.directory = buffer.data();
    workspace.source_file = (fs::path(workspace.directory) / SOURCE_FILENAME).string();

    if (!FileUtils::write_file(workspace.source_file,
                               SourceScanner::normalize_path_literals(source))) {
        remove(workspace);
        throw LaunchFailure("cannot write program file " + workspace.source_file);
    }

    if (stager_ && !session_id.empty()) {
        try {
            workspace.datasets_staged = stager_->materialize(session_id, workspace.directory);
        } catch (const std::exception& e) {
            std::cerr << "[Workspace] Dataset staging failed for " << execution_id
                      << ": " << e.what() << std::endl;
        }
    }

    return workspace;
}

bool WorkspaceProvisioner::remove(const Workspace& workspace) {
    bool clean = true;
    std::error_code ec;

    if (!workspace.source_file.empty()) {
        fs::remove(workspace.source_file, ec);
        if (ec) {
            std::cerr << "[Workspace] Failed to remove " << workspace.source_file
                      << ": " << ec.message() << std::endl;
            clean = false;
        }
    }

    if (!workspace.directory.empty()) {
        std::string error;
        if (!FileUtils::remove_tree(workspace.directory, error)) {
            std::cerr << "[Workspace] Failed to remove " << workspace.directory
                      << ": " << error << std::endl;
            clean = false;
        }
    }

    return clean;
}

} // namespace liverun
