/**
 * FileUtils.cpp
 *
 * File helpers for credential documents.
 */

#include "FileUtils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace keyrotor::utils {

namespace {

void setError(std::string* error, const std::string& message) {
    if (error) *error = message;
}

} // namespace

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::createPrivateDirectories(const fs::path& path, std::string* error) {
    if (path.empty()) return true;

    std::error_code ec;
    if (fs::is_directory(path, ec)) return true;

    // Create ancestors first so each level we add gets restricted permissions
    if (path.has_parent_path() && path.parent_path() != path) {
        if (!createPrivateDirectories(path.parent_path(), error)) {
            return false;
        }
    }

    if (!fs::create_directory(path, ec) && ec) {
        setError(error, "cannot create " + path.string() + ": " + ec.message());
        return false;
    }

    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    return true;
}

bool FileUtils::writeFileSecure(const fs::path& path, const std::string& content, std::string* error) {
    if (!createPrivateDirectories(path.parent_path(), error)) {
        return false;
    }

    fs::path tempPath = path;
    tempPath += ".tmp";

#ifdef _WIN32
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            setError(error, "cannot open " + tempPath.string() + " for writing");
            return false;
        }
        file << content;
        if (!file.good()) {
            setError(error, "write to " + tempPath.string() + " failed");
            return false;
        }
    }
#else
    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        setError(error, "cannot open " + tempPath.string() + ": " + std::strerror(errno));
        return false;
    }

    // open() honours the umask and keeps the mode of a stale temp file
    ::fchmod(fd, S_IRUSR | S_IWUSR);

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = ::write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            setError(error, "write to " + tempPath.string() + " failed: " + std::strerror(errno));
            ::close(fd);
            ::unlink(tempPath.c_str());
            return false;
        }
        offset += static_cast<size_t>(written);
    }

    bool synced = ::fsync(fd) == 0;
    bool closed = ::close(fd) == 0;
    if (!synced || !closed) {
        setError(error, "flush of " + tempPath.string() + " failed: " + std::strerror(errno));
        ::unlink(tempPath.c_str());
        return false;
    }
#endif

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        setError(error, "cannot replace " + path.string() + ": " + ec.message());
        fs::remove(tempPath, ec);
        return false;
    }

    return true;
}

} // namespace keyrotor::utils
