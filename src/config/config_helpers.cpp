#include <shardfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace shardfetch::config {

namespace {

// Drop a trailing "# comment", leaving '#' inside a quoted value alone.
void strip_inline_comment(std::string& v) {
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
        auto close = v.find(v.front(), 1);
        if (close != std::string::npos) {
            v.erase(close + 1);
        }
        return;
    }
    size_t comment = v.find('#');
    if (comment != std::string::npos) {
        v = v.substr(0, comment);
        trim(v);
    }
}

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::optional<long long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    long long out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size() || out < 0)
        return std::nullopt;
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);
        strip_inline_comment(v);

        // Support both "fetch.max_parallel" at top level and "[fetch] max_parallel"
        const bool sectionMatch = section.empty() ? currentSection.empty()
                                                  : currentSection == section;
        if ((sectionMatch && k == key) ||
            (!section.empty() && currentSection.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = env_or_null("SHARDFETCH_CONFIG")) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "shardfetch" / "config.toml";
    }

    return configHome / "shardfetch" / "config.toml";
}

std::filesystem::path get_cache_dir() {
#if defined(_WIN32)
    if (const char* local = std::getenv("LOCALAPPDATA")) {
        return std::filesystem::path(local) / "shardfetch" / "cache";
    }
#else
    if (const char* xdg_cache = env_or_null("XDG_CACHE_HOME")) {
        return std::filesystem::path(xdg_cache) / "shardfetch";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".cache" / "shardfetch";
    }
#endif
    return std::filesystem::temp_directory_path() / "shardfetch-cache";
}

std::filesystem::path resolve_cache_dir_from_config(const std::filesystem::path& config_path) {
    // 1) SHARDFETCH_CACHE_DIR env
    if (const char* env = env_or_null("SHARDFETCH_CACHE_DIR")) {
        return expand_tilde(env);
    }

    // 2) config.toml cache.dir
    if (!config_path.empty()) {
        if (auto v = parse_config_value(config_path, "cache", "dir"); !v.empty()) {
            return expand_tilde(v);
        }
    }

    // 3) XDG/HOME defaults
    return get_cache_dir();
}

fetch::FetcherConfig load_fetcher_config(const std::filesystem::path& config_path) {
    fetch::FetcherConfig cfg;

    std::error_code ec;
    const bool haveFile = !config_path.empty() && std::filesystem::exists(config_path, ec);
    if (haveFile) {
        spdlog::debug("Loading config from {}", config_path.string());
    }
    auto value = [&](const char* section, const char* key) -> std::string {
        return haveFile ? parse_config_value(config_path, section, key) : std::string{};
    };
    auto warnBad = [](const char* what, const std::string& raw) {
        spdlog::warn("Ignoring invalid config value {} = '{}'", what, raw);
    };

    // [fetch]
    if (auto raw = value("fetch", "max_parallel"); !raw.empty()) {
        if (auto n = parse_int(raw); n && *n >= 1)
            cfg.maxParallel = static_cast<int>(std::min<long long>(*n, 256));
        else
            warnBad("fetch.max_parallel", raw);
    }
    if (auto raw = value("fetch", "timeout_ms"); !raw.empty()) {
        if (auto n = parse_int(raw); n && *n > 0)
            cfg.transport.timeout = std::chrono::milliseconds(*n);
        else
            warnBad("fetch.timeout_ms", raw);
    }
    if (auto raw = value("fetch", "follow_redirects"); !raw.empty()) {
        if (auto b = parse_bool(raw))
            cfg.transport.followRedirects = *b;
        else
            warnBad("fetch.follow_redirects", raw);
    }
    if (auto raw = value("fetch", "proxy"); !raw.empty()) {
        cfg.transport.proxy = raw;
    }
    if (auto raw = value("fetch", "user_agent"); !raw.empty()) {
        cfg.transport.userAgent = raw;
    }

    // [tls]
    if (auto raw = value("tls", "insecure"); !raw.empty()) {
        if (auto b = parse_bool(raw))
            cfg.transport.tls.insecure = *b;
        else
            warnBad("tls.insecure", raw);
    }
    if (auto raw = value("tls", "ca_path"); !raw.empty()) {
        cfg.transport.tls.caPath = expand_tilde(raw).string();
    }

    // [cache]
    if (auto raw = value("cache", "enabled"); !raw.empty()) {
        if (auto b = parse_bool(raw))
            cfg.cache.enabled = *b;
        else
            warnBad("cache.enabled", raw);
    }
    if (auto raw = value("cache", "namespace"); !raw.empty()) {
        cfg.cache.nameSpace = raw;
    }
    cfg.cache.directory = resolve_cache_dir_from_config(haveFile ? config_path
                                                                 : std::filesystem::path{});

    // Environment overrides
    if (const char* env = env_or_null("SHARDFETCH_MAX_PARALLEL")) {
        if (auto n = parse_int(env); n && *n >= 1)
            cfg.maxParallel = static_cast<int>(std::min<long long>(*n, 256));
        else
            warnBad("SHARDFETCH_MAX_PARALLEL", env);
    }
    if (const char* env = env_or_null("SHARDFETCH_CACHE_NAMESPACE")) {
        cfg.cache.nameSpace = env;
    }

    return cfg;
}

} // namespace shardfetch::config
