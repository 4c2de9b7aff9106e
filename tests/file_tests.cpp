// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <summon/disk/file.hpp>
#include "test_support.hpp"
#include <filesystem>
#include <cerrno>
#include <sys/stat.h>

using namespace summon::disk;
using summon::test::TempDir;
using summon::test::read_file;
using summon::test::write_file;

namespace fs = std::filesystem;

TEST_CASE("File::open modes", "[disk]") {
    TempDir dir;
    const auto path = dir.file("data.bin");
    write_file(path, "hello");

    SECTION("truncate empties the file") {
        auto file = File::open(path, OpenMode::truncate);
        REQUIRE(file.has_value());
        CHECK(*file->size() == 0);
    }

    SECTION("append keeps existing bytes") {
        auto file = File::open(path, OpenMode::append);
        REQUIRE(file.has_value());
        REQUIRE_FALSE(file->write(" world", 6));
        file->close();
        CHECK(read_file(path) == "hello world");
    }

    SECTION("Missing directory") {
        auto file = File::open(dir.file("missing/data.bin"), OpenMode::truncate);
        REQUIRE_FALSE(file.has_value());
        CHECK(file.error() == make_error_code(DiskErrc::file_not_found));
    }
}

TEST_CASE("File read after rewind", "[disk]") {
    TempDir dir;
    auto file = File::open(dir.file("data.bin"), OpenMode::truncate);
    REQUIRE(file.has_value());
    REQUIRE_FALSE(file->write("0123456789", 10));

    REQUIRE_FALSE(file->rewind());
    char buffer[4]{};
    auto n = file->read(buffer, sizeof(buffer));
    REQUIRE(n.has_value());
    CHECK(*n == 4);
    CHECK(std::string(buffer, 4) == "0123");

    SECTION("copy_to copies the rest") {
        auto dest = File::open(dir.file("copy.bin"), OpenMode::truncate);
        REQUIRE(dest.has_value());
        auto copied = file->copy_to(*dest);
        REQUIRE(copied.has_value());
        CHECK(*copied == 6);
        dest->close();
        CHECK(read_file(dir.file("copy.bin")) == "456789");
    }
}

TEST_CASE("File::create_temp", "[disk]") {
    TempDir dir;
    auto temp = File::create_temp(dir.path().string(), "movie.mkv");
    REQUIRE(temp.has_value());

    const fs::path path(temp->path());
    CHECK(path.parent_path() == dir.path());
    CHECK(path.filename().string().starts_with(".movie.mkv."));
    CHECK(fs::exists(path));

    struct stat st{};
    REQUIRE(::stat(temp->path().c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0644);

    auto other = File::create_temp(dir.path().string(), "movie.mkv");
    REQUIRE(other.has_value());
    CHECK(other->path() != temp->path());
}

TEST_CASE("File is movable", "[disk]") {
    TempDir dir;
    auto file = File::open(dir.file("a.bin"), OpenMode::truncate);
    REQUIRE(file.has_value());

    File moved = std::move(*file);
    CHECK(moved.is_open());
    CHECK_FALSE(file->is_open());
    CHECK(file->write("x", 1) == make_error_code(DiskErrc::handle_invalid));
}

TEST_CASE("file_size and remove_file", "[disk]") {
    TempDir dir;
    const auto path = dir.file("sized.bin");

    auto missing = file_size(path);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error() == make_error_code(DiskErrc::file_not_found));

    write_file(path, std::string(1234, 'z'));
    CHECK(*file_size(path) == 1234);

    CHECK_FALSE(remove_file(path));
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("errno_error maps by operation", "[disk]") {
    CHECK(errno_error(EIO, DiskErrc::read_error) == make_error_code(DiskErrc::read_error));
    CHECK(errno_error(EIO, DiskErrc::write_error) == make_error_code(DiskErrc::write_error));
    CHECK(errno_error(ENOSPC, DiskErrc::read_error) == make_error_code(DiskErrc::disk_full));
    CHECK(errno_error(ENOENT, DiskErrc::write_error) == make_error_code(DiskErrc::file_not_found));

    SECTION("A failed stat is not a write error") {
        TempDir dir;
        fs::create_symlink(dir.path() / "b", dir.path() / "a");
        fs::create_symlink(dir.path() / "a", dir.path() / "b");

        auto size = file_size(dir.file("a"));
        REQUIRE_FALSE(size.has_value());
        CHECK(size.error() == make_error_code(DiskErrc::invalid_path));
    }
}
