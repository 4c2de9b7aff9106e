// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <summon/cli/commands.hpp>
#include <summon/core/config.hpp>
#include <filesystem>
#include <string>
#include <vector>

using namespace summon::cli;
using namespace summon::core;

namespace {

CliArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    static std::string program = "summon";
    argv.push_back(program.data());
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args options", "[cli]") {
    SECTION("URL only") {
        auto args = parse({"https://example.com/a.iso"});
        CHECK(args.error.empty());
        CHECK(args.url == "https://example.com/a.iso");
        CHECK(args.connections == 0);
        CHECK_FALSE(args.resume);
    }

    SECTION("All download options") {
        auto args = parse({"-c", "8", "-o", "out.iso", "--resume", "-V", "https://example.com/a.iso"});
        CHECK(args.error.empty());
        CHECK(args.connections == 8);
        CHECK(args.output_file == "out.iso");
        CHECK(args.resume);
        CHECK(args.verbose);
    }

    SECTION("Long forms") {
        auto args = parse({"--connections", "2", "--output", "x", "--info", "--quiet", "http://h/x"});
        CHECK(args.connections == 2);
        CHECK(args.output_file == "x");
        CHECK(args.info);
        CHECK(args.quiet);
    }

    SECTION("Connections are capped") {
        auto args = parse({"-c", "500", "http://h/x"});
        CHECK(args.error.empty());
        CHECK(args.connections == MAX_CONNECTIONS);
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"-h", "--bogus"}).help);
        CHECK(parse({"--version"}).version);
    }
}

TEST_CASE("parse_args errors", "[cli]") {
    CHECK_FALSE(parse({"-c", "zero", "http://h/x"}).error.empty());
    CHECK_FALSE(parse({"-c", "0", "http://h/x"}).error.empty());
    CHECK_FALSE(parse({"-c"}).error.empty());
    CHECK_FALSE(parse({"http://h/x", "-o"}).error.empty());
    CHECK_FALSE(parse({"--frobnicate", "http://h/x"}).error.empty());
    CHECK_FALSE(parse({"http://h/x", "http://h/y"}).error.empty());
}

TEST_CASE("resolve_output_path", "[cli]") {
    namespace fs = std::filesystem;
    auto url = *Url::parse("https://example.com/files/archive.tar.gz?sig=1");
    ResourceInfo resource;

    SECTION("URL filename in the current directory") {
        CHECK(resolve_output_path("", resource, url) == (fs::current_path() / "archive.tar.gz").string());
    }

    SECTION("Server filename wins over the URL") {
        resource.filename = "release.tar.gz";
        CHECK(resolve_output_path("", resource, url) == (fs::current_path() / "release.tar.gz").string());
    }

    SECTION("Explicit path wins over both") {
        resource.filename = "release.tar.gz";
        CHECK(resolve_output_path("/tmp/x/../out.bin", resource, url) == "/tmp/out.bin");
    }
}
