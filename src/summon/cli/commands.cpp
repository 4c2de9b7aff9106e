// Copyright (c) 2026 changcheng967. All rights reserved.

#include <summon/cli/commands.hpp>
#include <summon/cli/progress_bar.hpp>
#include <summon/core/config.hpp>
#include <summon/core/download_engine.hpp>
#include <summon/core/error.hpp>
#include <summon/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace summon::core;

namespace chrono = std::chrono;

namespace summon::cli {

namespace {

std::atomic<bool> g_stop_signal{false};

extern "C" void on_stop_signal(int) {
    g_stop_signal.store(true, std::memory_order_relaxed);
}

// SIGINT/SIGTERM only raise a flag; a watcher thread turns it into a stop request
class SignalGuard {
public:
    explicit SignalGuard(std::stop_source source)
        : watcher_([source](std::stop_token st) mutable {
              while (!st.stop_requested()) {
                  if (g_stop_signal.load(std::memory_order_relaxed)) {
                      spdlog::warn("Interrupted, stopping all connections");
                      source.request_stop();
                      return;
                  }
                  std::this_thread::sleep_for(chrono::milliseconds(100));
              }
          }) {
        g_stop_signal.store(false, std::memory_order_relaxed);
        struct sigaction action{};
        action.sa_handler = on_stop_signal;
        sigemptyset(&action.sa_mask);
        ::sigaction(SIGINT, &action, &old_int_);
        ::sigaction(SIGTERM, &action, &old_term_);
    }

    ~SignalGuard() {
        ::sigaction(SIGINT, &old_int_, nullptr);
        ::sigaction(SIGTERM, &old_term_, nullptr);
    }

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

private:
    struct sigaction old_int_{};
    struct sigaction old_term_{};
    std::jthread watcher_;
};

bool parse_connections(std::string_view text, std::uint32_t& out) noexcept {
    std::uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }
            if (arg == "-V" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-q" || arg == "--quiet") {
                args.quiet = true;
            } else if (arg == "-r" || arg == "--resume") {
                args.resume = true;
            } else if (arg == "-i" || arg == "--info") {
                args.info = true;
            } else if (arg == "-o" || arg == "--output") {
                if (i + 1 >= argc) {
                    args.error = "missing value for " + arg;
                    return args;
                }
                args.output_file = argv[++i];
            } else if (arg == "-c" || arg == "--connections") {
                if (i + 1 >= argc) {
                    args.error = "missing value for " + arg;
                    return args;
                }
                std::string value = argv[++i];
                if (!parse_connections(value, args.connections) || args.connections == 0) {
                    args.error = "invalid number of connections: " + value;
                    return args;
                }
            } else if (arg.starts_with("-") && arg.size() > 1) {
                args.error = "unknown option: " + arg;
                return args;
            } else if (args.url.empty()) {
                args.url = arg;
            } else {
                args.error = "only one URL can be downloaded at a time";
                return args;
            }
        }

        if (args.connections > MAX_CONNECTIONS) {
            spdlog::warn("Limiting connections to {}", MAX_CONNECTIONS);
            args.connections = MAX_CONNECTIONS;
        }
    } catch (const std::exception& e) {
        args.error = e.what();
    }

    return args;
}

void setup_logging(bool verbose, bool quiet) noexcept {
    try {
        auto logger = spdlog::stderr_color_mt("summon");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger setup failed: " << e.what() << std::endl;
    }

    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

std::string resolve_output_path(std::string_view explicit_path,
                                const ResourceInfo& resource,
                                const Url& url) {
    std::filesystem::path path;
    if (!explicit_path.empty()) {
        path = std::filesystem::path(explicit_path);
    } else if (!resource.filename.empty()) {
        path = resource.filename;
    } else {
        path = url.filename();
    }
    return std::filesystem::absolute(path).lexically_normal().string();
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    auto url = Url::parse(args.url);
    if (!url) {
        spdlog::error("{}: {}", url.error().message(), args.url);
        return std::unexpected(url.error());
    }

    HttpSession::global_init();

    HttpSession session;
    auto resource = probe(session, url->str());
    if (!resource) {
        HttpSession::global_cleanup();
        return std::unexpected(resource.error());
    }
    if (!resource->accepts_ranges) {
        spdlog::warn("Server does not accept byte ranges, downloading with a single connection");
    }

    DownloadOptions options;
    try {
        options.url = url->str();
        options.output_path = resolve_output_path(args.output_file, *resource, *url);
        options.resource = *resource;
    } catch (const std::exception& e) {
        spdlog::error("Cannot resolve output path: {}", e.what());
        HttpSession::global_cleanup();
        return std::unexpected(make_error_code(DownloadErrc::invalid_input));
    }
    if (args.connections > 0) {
        options.connections = args.connections;
    } else {
        spdlog::info("Using default number of connections: {}", DEFAULT_CONNECTIONS);
    }
    options.resume = args.resume;

    DownloadEngine engine(session, std::move(options));

    ProgressBar bar(std::cout);
    if (!args.quiet) {
        engine.callback([&bar](std::span<const ChunkProgress> frame, bool final) {
            bar.draw(frame, final);
        });
    }

    std::stop_source stop;
    std::expected<std::uint64_t, JobError> result;
    {
        SignalGuard guard(stop);
        result = engine.run(stop.get_token());
    }

    HttpSession::global_cleanup();

    if (!result) {
        if (result.error().cancelled()) {
            std::cout << "Download interrupted; run again with --resume to continue" << std::endl;
            return EXIT_CANCELLED;
        }
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error().code);
    }

    std::cout << "Wrote to file: " << engine.options().output_path
              << ", written: " << ProgressBar::format_bytes(*result) << std::endl;
    return EXIT_OK;
}

CliResult info(const std::string& url) noexcept {
    auto parsed = Url::parse(url);
    if (!parsed) {
        spdlog::error("{}: {}", parsed.error().message(), url);
        return std::unexpected(parsed.error());
    }

    HttpSession::global_init();

    HttpSession session;
    auto response = session.head(parsed->str());

    HttpSession::global_cleanup();

    if (!response) {
        std::cerr << "Error: " << response.error().message() << std::endl;
        return std::unexpected(response.error());
    }

    std::cout << "URL: " << parsed->str() << std::endl;
    std::cout << "Status: " << response->status_code << std::endl;
    if (response->has_content_length) {
        std::cout << "Content-Length: " << response->content_length
                  << " (" << ProgressBar::format_bytes(response->content_length) << ")" << std::endl;
    } else {
        std::cout << "Content-Length: unknown" << std::endl;
    }
    std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;
    if (!response->filename.empty()) {
        std::cout << "Filename: " << response->filename << std::endl;
    }

    return EXIT_OK;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Summon " << summon::version.to_string() << " - concurrent ranged HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -c, --connections <N>   Number of parallel connections (default: "
              << DEFAULT_CONNECTIONS << ", max: " << MAX_CONNECTIONS << ")\n";
    std::cout << "  -o, --output <FILE>     Save to specified file\n";
    std::cout << "  -r, --resume            Continue an interrupted download\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -c 8 -o large.iso https://example.com/large.iso\n";
    std::cout << "  " << program_name << " -r -o large.iso https://example.com/large.iso\n";
}

void print_version() noexcept {
    std::cout << "Summon " << summon::version.to_string() << " (built " << summon::BUILD_DATE << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog\n";
}

} // namespace summon::cli
