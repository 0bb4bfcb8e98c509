#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace liverun {

// Outcome of a best-effort recursive copy
struct CopyReport {
    size_t files_copied = 0;
    size_t files_failed = 0;
    std::vector<std::string> errors;     // One entry per failed file
};

class FileUtils {
public:
    // Hex encoding (lowercase)
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Cryptographically random bytes, hex encoded. Throws std::runtime_error
    // if the OpenSSL generator is not seeded.
    static std::string random_hex(size_t num_bytes);

    // Random RFC 4122 version 4 identifier (e.g. "3f2b...-....-4...-....-...")
    static std::string generate_uuid();

    // Resolve an executable name against PATH (names containing '/' are
    // checked directly). Returns an empty string when not found.
    static std::string find_executable(const std::string& name);

    // Write a whole file, truncating. Returns false on any I/O error.
    static bool write_file(const std::string& path, const std::string& content);

    // Read a whole file; empty string if it cannot be opened
    static std::string read_file(const std::string& path);

    // Copy every regular file under src_dir into dst_dir, preserving the
    // relative layout. Symlinks and special files are skipped. Never throws;
    // failures are collected in the report.
    static CopyReport copy_tree(const std::string& src_dir, const std::string& dst_dir);

    // Recursively remove a path. Returns false and fills error on failure.
    static bool remove_tree(const std::string& path, std::string& error);

    // Quote a string for safe interpolation into a POSIX shell command line
    static std::string shell_quote(const std::string& value);
};

} // namespace liverun
