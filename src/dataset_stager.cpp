#include "dataset_stager.h"
#include "file_utils.h"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace liverun {

DirectoryDatasetStager::DirectoryDatasetStager(std::string root) : root_(std::move(root)) {}

bool DirectoryDatasetStager::is_safe_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id == "." || session_id == "..") {
        return false;
    }
    return session_id.find('/') == std::string::npos &&
           session_id.find('\\') == std::string::npos &&
           session_id.find("..") == std::string::npos &&
           session_id.find('\0') == std::string::npos;
}

size_t DirectoryDatasetStager::materialize(const std::string& session_id,
                                           const std::string& workspace_path) {
    if (!is_safe_session_id(session_id)) {
        return 0;
    }

    fs::path session_dir = fs::path(root_) / session_id;
    std::error_code ec;
    if (!fs::is_directory(session_dir, ec)) {
        return 0;
    }

    const fs::path targets[] = {
        fs::path(workspace_path) / "data",
        fs::path(workspace_path) / "datasets" / session_id,
    };

    size_t staged = 0;
    for (const auto& target : targets) {
        CopyReport report = FileUtils::copy_tree(session_dir.string(), target.string());
        staged = std::max(staged, report.files_copied);
        for (const auto& error : report.errors) {
            std::cerr << "[Datasets] Skipped while staging session " << session_id
                      << ": " << error << std::endl;
        }
    }

    return staged;
}

} // namespace liverun
