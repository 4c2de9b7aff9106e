// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/disk/file.hpp>
#include <summon/core/config.hpp>
#include <cerrno>
#include <filesystem>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace summon::disk {

std::error_code errno_error(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        case ESPIPE:        return make_error_code(DiskErrc::seek_error);
        default:            return make_error_code(fallback);   // EIO, EINTR, ...
    }
}

//=============================================================================
// File
//=============================================================================

std::expected<File, std::error_code>
File::open(std::string_view path, OpenMode mode) noexcept {
    File file;
    try {
        file.path_ = path;
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    flags |= (mode == OpenMode::truncate) ? O_TRUNC : O_APPEND;

    file.fd_ = ::open(file.path_.c_str(), flags, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(errno_error(errno, DiskErrc::invalid_path));
    }
    return file;
}

std::expected<File, std::error_code>
File::create_temp(std::string_view dir, std::string_view name) noexcept {
    File file;
    try {
        file.path_ = (dir.empty() ? std::string(".") : std::string(dir)) + "/." + std::string(name) + ".XXXXXX";
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    file.fd_ = ::mkstemp(file.path_.data());
    if (file.fd_ < 0) {
        return std::unexpected(errno_error(errno, DiskErrc::invalid_path));
    }
    // mkstemp creates 0600; the temp file becomes the user's output
    (void)::fchmod(file.fd_, 0644);
    return file;
}

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code File::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, bytes, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_error(errno, DiskErrc::write_error);
        }
        bytes += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::expected<std::size_t, std::error_code>
File::read(void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return std::unexpected(errno_error(errno, DiskErrc::read_error));
        }
    }
}

std::error_code File::rewind() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::lseek(fd_, 0, SEEK_SET) < 0) {
        return errno_error(errno, DiskErrc::seek_error);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code> File::size() const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_error(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::expected<std::uint64_t, std::error_code> File::copy_to(File& dest) noexcept {
    std::vector<char> buffer;
    try {
        buffer.resize(core::COPY_BUFFER_SIZE);
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }

    std::uint64_t copied = 0;
    while (true) {
        auto n = read(buffer.data(), buffer.size());
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            return copied;
        }
        if (auto ec = dest.write(buffer.data(), *n)) {
            return std::unexpected(ec);
        }
        copied += *n;
    }
}

std::error_code File::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_error(errno, DiskErrc::write_error);
    }
    return {};
}

void File::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Path helpers
//=============================================================================

std::expected<std::uint64_t, std::error_code> file_size(std::string_view path) noexcept {
    try {
        struct stat st{};
        if (::stat(std::string(path).c_str(), &st) != 0) {
            return std::unexpected(errno_error(errno, DiskErrc::read_error));
        }
        return static_cast<std::uint64_t>(st.st_size);
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
}

std::error_code remove_file(std::string_view path) noexcept {
    try {
        std::error_code ec;
        std::filesystem::remove(std::filesystem::path(path), ec);
        return ec;
    } catch (...) {
        return make_error_code(DiskErrc::invalid_path);
    }
}

} // namespace summon::disk
