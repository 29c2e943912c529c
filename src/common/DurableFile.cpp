#include "DurableFile.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace crawl_archiver {

namespace {

std::string errnoText(const std::string& step, const std::filesystem::path& path) {
    return step + " " + path.string() + ": " + std::strerror(errno);
}

bool writeAll(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

void fsyncDirectory(const std::filesystem::path& dir) {
    int dirFd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        return;
    }
    // Some filesystems reject fsync on directories; the rename already happened.
    ::fsync(dirFd);
    ::close(dirFd);
}

} // namespace

bool writeFileDurably(const std::filesystem::path& target,
                      const std::string& content,
                      std::string& error) {
    std::filesystem::path tmpPath = target;
    tmpPath += ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = errnoText("open", tmpPath);
        return false;
    }

    if (!writeAll(fd, content)) {
        error = errnoText("write", tmpPath);
        ::close(fd);
        ::unlink(tmpPath.c_str());
        return false;
    }

    if (::fsync(fd) != 0) {
        error = errnoText("fsync", tmpPath);
        ::close(fd);
        ::unlink(tmpPath.c_str());
        return false;
    }

    if (::close(fd) != 0) {
        error = errnoText("close", tmpPath);
        ::unlink(tmpPath.c_str());
        return false;
    }

    if (::rename(tmpPath.c_str(), target.c_str()) != 0) {
        error = errnoText("rename", tmpPath);
        ::unlink(tmpPath.c_str());
        return false;
    }

    std::filesystem::path parent = target.parent_path();
    fsyncDirectory(parent.empty() ? std::filesystem::path(".") : parent);
    return true;
}

bool copyFileDurably(const std::filesystem::path& source,
                     const std::filesystem::path& target,
                     std::string& error) {
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open " + source.string();
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        error = "cannot read " + source.string();
        return false;
    }
    return writeFileDurably(target, buffer.str(), error);
}

} // namespace crawl_archiver
