#pragma once

#include <string>
#include <cstddef>

namespace liverun {

// Collaborator that places a session's uploaded files into a workspace.
// Best effort: implementations log and skip what they cannot copy.
class DatasetStager {
public:
    virtual ~DatasetStager() = default;

    // Returns the number of files placed into the workspace (0 = no-op)
    virtual size_t materialize(const std::string& session_id,
                               const std::string& workspace_path) = 0;
};

// Reads <root>/<session_id>/ and copies it, never moves or links, into
// <workspace>/data/ and <workspace>/datasets/<session_id>/.
class DirectoryDatasetStager : public DatasetStager {
public:
    explicit DirectoryDatasetStager(std::string root);

    size_t materialize(const std::string& session_id,
                       const std::string& workspace_path) override;

    const std::string& root() const { return root_; }

    // Rejects empty ids and anything that could escape the root
    static bool is_safe_session_id(const std::string& session_id);

private:
    std::string root_;
};

} // namespace liverun
