/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: atomic_file.cpp
 * ============================================================================
 */

#include "atomic_file.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace tally {

namespace fs = std::filesystem;

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

// Flushes the directory entry so the rename itself survives a power cut.
void sync_directory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        log_event("WARN", "Cannot open directory for fsync: " + dir.string() + " (" + errno_text() + ")");
        return;
    }
    if (::fsync(fd) != 0) {
        log_event("WARN", "Directory fsync failed: " + dir.string() + " (" + errno_text() + ")");
    }
    ::close(fd);
}

} // namespace

std::optional<std::string> read_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw IOFailure("Cannot stat " + path + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOFailure("Cannot open " + path + " for reading.");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IOFailure("Read error on " + path + ".");
    }
    return buffer.str();
}

void write_file_atomic(const std::string& path, const std::string& content) {
    fs::path target(path);
    fs::path dir = target.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOFailure("Cannot create directory " + dir.string() + ": " + ec.message());
    }

    std::string pattern = (dir / ("." + target.filename().string() + ".tmpXXXXXX")).string();
    std::vector<char> tmp_name(pattern.begin(), pattern.end());
    tmp_name.push_back('\0');

    int fd = ::mkstemp(tmp_name.data());
    if (fd < 0) {
        throw IOFailure("Cannot create temporary file in " + dir.string() + ": " + errno_text());
    }
    const std::string tmp_path(tmp_name.data());

    auto fail = [&](const std::string& what) {
        std::string reason = what + ": " + errno_text();
        ::unlink(tmp_path.c_str());
        throw IOFailure(reason);
    };

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            fail("Write to " + tmp_path + " failed");
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        ::close(fd);
        fail("fsync of " + tmp_path + " failed");
    }
    if (::close(fd) != 0) {
        fail("close of " + tmp_path + " failed");
    }
    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        fail("Rename onto " + path + " failed");
    }

    sync_directory(dir);
}

std::string quarantine_file(const std::string& path) {
    std::string aside = path + ".corrupt-" + std::to_string(now_epoch_ms());
    if (::rename(path.c_str(), aside.c_str()) != 0) {
        throw IOFailure("Cannot move " + path + " aside: " + errno_text());
    }
    return aside;
}

size_t remove_stale_temp_files(const std::string& path) {
    fs::path target(path);
    fs::path dir = target.parent_path();
    if (dir.empty()) dir = ".";
    const std::string prefix = "." + target.filename().string() + ".tmp";

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return 0;

    size_t removed = 0;
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        // mkstemp appends exactly six characters.
        if (name.size() != prefix.size() + 6 || name.compare(0, prefix.size(), prefix) != 0) continue;
        std::error_code rm_ec;
        if (fs::remove(it->path(), rm_ec)) {
            log_event("WARN", "Removed leftover temporary file " + it->path().string());
            ++removed;
        } else if (rm_ec) {
            log_event("WARN", "Cannot remove leftover temporary file " + it->path().string() + ": " + rm_ec.message());
        }
    }
    return removed;
}

} // namespace tally
