/**
 * @file file_io.cpp
 * @brief Positional file I/O for concurrent part transfers
 */

#include "edgefirst/sync/core/file_io.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace edgefirst::sync {

namespace {

auto errno_message(const std::string& what, const std::filesystem::path& path) -> std::string {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

}  // namespace

file_handle::~file_handle() {
    close();
}

file_handle::file_handle(file_handle&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

auto file_handle::operator=(file_handle&& other) noexcept -> file_handle& {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

void file_handle::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto file_handle::open_read(const std::filesystem::path& path) -> result<file_handle> {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        auto code = errno == ENOENT ? error_code::file_not_found : error_code::file_open_error;
        return unexpected{error{code, errno_message("cannot open", path)}};
    }
    return file_handle(fd, path);
}

auto file_handle::create(const std::filesystem::path& path, uint64_t size)
    -> result<file_handle> {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected{error{error_code::file_open_error, errno_message("cannot create", path)}};
    }
    file_handle handle(fd, path);
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return unexpected{error{error_code::file_write_error, errno_message("cannot size", path)}};
    }
    return handle;
}

auto file_handle::read_at(uint64_t offset, uint64_t length) const
    -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> buffer(static_cast<std::size_t>(length));
    uint64_t done = 0;
    while (done < length) {
        auto n = ::pread(fd_, buffer.data() + done, static_cast<std::size_t>(length - done),
                         static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return unexpected{error{error_code::file_read_error, errno_message("read failed on", path_)}};
        }
        if (n == 0) {
            return unexpected{error{error_code::file_read_error,
                "unexpected end of file in " + path_.string() + " at offset " +
                std::to_string(offset + done)}};
        }
        done += static_cast<uint64_t>(n);
    }
    return buffer;
}

auto file_handle::write_at(uint64_t offset, const std::vector<uint8_t>& data) const
    -> result<void> {
    std::size_t done = 0;
    while (done < data.size()) {
        auto n = ::pwrite(fd_, data.data() + done, data.size() - done,
                          static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return unexpected{error{error_code::file_write_error, errno_message("write failed on", path_)}};
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

auto file_handle::sync() const -> result<void> {
    if (::fsync(fd_) != 0) {
        return unexpected{error{error_code::file_write_error, errno_message("fsync failed on", path_)}};
    }
    return {};
}

auto file_handle::size() const -> result<uint64_t> {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return unexpected{error{error_code::file_read_error, errno_message("stat failed on", path_)}};
    }
    return static_cast<uint64_t>(st.st_size);
}

}  // namespace edgefirst::sync
