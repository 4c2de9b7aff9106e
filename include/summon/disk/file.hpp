// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <summon/disk/error.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <expected>

namespace summon::disk {

enum class OpenMode : std::uint8_t {
    truncate,  // Create or empty the file
    append,    // Create if missing, keep existing bytes, write at the end
};

// Owning handle to a file opened for sequential read/write
class File {
public:
    static std::expected<File, std::error_code>
    open(std::string_view path, OpenMode mode) noexcept;

    // Create a uniquely named hidden file "<dir>/.<name>.XXXXXX"
    static std::expected<File, std::error_code>
    create_temp(std::string_view dir, std::string_view name) noexcept;

    ~File();

    // Non-copyable, movable
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    // Write the whole buffer at the current position
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Read up to size bytes; 0 means end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(void* buffer, std::size_t size) noexcept;

    // Move the cursor back to offset 0
    [[nodiscard]] std::error_code rewind() noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    // Copy everything from the current position to the end into dest
    [[nodiscard]] std::expected<std::uint64_t, std::error_code> copy_to(File& dest) noexcept;

    // Flush buffers to disk
    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    File() = default;

    int fd_{-1};
    std::string path_;
};

// Map an errno value; codes without a dedicated DiskErrc become `fallback`,
// the error of the operation that failed (read, write, seek)
[[nodiscard]] std::error_code errno_error(int err, DiskErrc fallback) noexcept;

// Size of the file at path, file_not_found if it does not exist
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
file_size(std::string_view path) noexcept;

[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

} // namespace summon::disk
