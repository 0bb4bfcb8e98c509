#include "file_utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cstdlib>
#include <unistd.h>
#include <openssl/rand.h>

namespace fs = std::filesystem;

namespace liverun {

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> buffer(num_bytes);
    if (num_bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(num_bytes)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

std::string FileUtils::generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }

    // Version 4, variant 10xx
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::string hex = bytes_to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string FileUtils::find_executable(const std::string& name) {
    if (name.empty()) {
        return "";
    }

    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string search_path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

bool FileUtils::write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    out.flush();
    return static_cast<bool>(out);
}

std::string FileUtils::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

CopyReport FileUtils::copy_tree(const std::string& src_dir, const std::string& dst_dir) {
    CopyReport report;
    std::error_code ec;

    if (!fs::is_directory(src_dir, ec)) {
        return report;
    }

    fs::create_directories(dst_dir, ec);
    if (ec) {
        report.errors.push_back(dst_dir + ": " + ec.message());
        return report;
    }

    fs::recursive_directory_iterator it(src_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        report.errors.push_back(src_dir + ": " + ec.message());
        return report;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            report.errors.push_back(ec.message());
            break;
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || !entry.is_regular_file(entry_ec)) {
            continue;
        }

        fs::path relative = fs::relative(entry.path(), src_dir, entry_ec);
        fs::path target = fs::path(dst_dir) / relative;
        fs::create_directories(target.parent_path(), entry_ec);
        if (!entry_ec) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, entry_ec);
        }

        if (entry_ec) {
            report.files_failed++;
            report.errors.push_back(entry.path().string() + ": " + entry_ec.message());
        } else {
            report.files_copied++;
        }
    }

    return report;
}

bool FileUtils::remove_tree(const std::string& path, std::string& error) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

std::string FileUtils::shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace liverun
