#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shardfetch::cli {

struct FetchOpts {
    // Inputs (one logical resource, parts in order)
    std::vector<std::string> urls;
    std::string config_path;

    // Fetch behaviour; unset values fall back to config, then defaults
    std::optional<int> max_parallel;
    bool no_cache{false};
    std::optional<std::string> cache_dir;
    std::optional<std::string> cache_namespace;
    std::optional<int> timeout_ms;
    std::vector<std::string> headers;
    std::optional<std::string> proxy;
    bool tls_insecure{false};
    std::optional<std::string> tls_ca;

    // Output
    bool join{false};
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> output_dir;
    std::string progress{"human"}; // "human" | "json" | "none"
    bool emit_json{false};
    bool verbose{false};
    bool quiet{false};
};

/**
 * Parse argv, fetch, write outputs. Returns the process exit code:
 * 0 success, 1 fetch/output failure, 2 incompatible environment.
 */
int runFetchCli(int argc, char* argv[]);

// "trace|debug|info|warn|error|critical|off" (plus a few aliases)
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value);

// "Name: value" → Header; std::nullopt without a colon or with an empty name
std::optional<fetch::Header> parseHeader(std::string_view raw);

// Last path segment of the URL without query/fragment; "part-<index>" when empty
std::string outputNameForUrl(std::string_view url, std::size_t index);

// outputNameForUrl for every URL, prefixing "<index>-" until each name is unique
std::vector<std::string> outputNamesForUrls(const std::vector<std::string>& urls);

// Human readable byte count ("1.5 MiB")
std::string formatBytes(std::uint64_t bytes);

// Overlay command-line choices on a loaded configuration
void applyOverrides(const FetchOpts& opts, fetch::FetcherConfig& cfg);

} // namespace shardfetch::cli
