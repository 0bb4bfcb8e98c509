#pragma once

#include <string>
#include <cstddef>

namespace liverun {

class DatasetStager;

// Isolated directory holding one execution's program and staged datasets
struct Workspace {
    std::string directory;
    std::string source_file;         // Absolute path of the written program
    size_t datasets_staged = 0;      // Files copied in by the dataset stager

    bool empty() const { return directory.empty(); }
};

class WorkspaceProvisioner {
public:
    // root: parent directory for per-execution workspaces (created on demand)
    // stager: optional, not owned; must outlive the provisioner
    explicit WorkspaceProvisioner(std::string root, DatasetStager* stager = nullptr);

    // Create a uniquely named directory, write the normalized source into it
    // and stage the session's datasets. Throws LaunchFailure when the
    // directory or the source file cannot be created. Dataset staging
    // problems are logged and ignored.
    Workspace provision(const std::string& execution_id,
                        const std::string& source,
                        const std::string& session_id) const;

    // Delete the source file and the directory tree. Never throws; returns
    // false (after logging) if anything was left behind.
    static bool remove(const Workspace& workspace);

    const std::string& root() const { return root_; }

private:
    std::string root_;
    DatasetStager* stager_;
};

} // namespace liverun
