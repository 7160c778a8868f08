/*
 * shardfetch/src/fetch/file_cache_store.cpp
 *
 * Durable on-disk cache namespace:
 * - <directory>/<namespace>/<aa>/<sha256(identifier)>.blob   part bytes
 * - <directory>/<namespace>/<aa>/<sha256(identifier)>.json   sidecar (identifier, size, stored_at)
 * - Writes go to <directory>/<namespace>/.staging with restrictive permissions, are fsync'd and
 *   atomically renamed into place; the sidecar is renamed last so a lookup never sees a
 *   half-written entry
 * - A sidecar whose identifier differs from the requested one is a miss (no key normalization)
 *
 * Sidecar layout:
 * {
 *   "identifier": "https://example.com/model-00001-of-00003.gguf",
 *   "size": 1048576,
 *   "stored_at": 1760000000
 * }
 */

#include <shardfetch/fetch/cache_gateway.hpp>
#include <shardfetch/fetch/fetcher.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace shardfetch::fetch {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kBlobSuffix = ".blob";
constexpr const char* kSidecarSuffix = ".json";
constexpr const char* kStagingDirName = ".staging";

Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    (void)p;
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

void ensure_dir_perms(const fs::path& dir, bool private_dir) {
#if !defined(_WIN32)
    std::error_code ec;
    if (private_dir) {
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    } else {
        fs::permissions(dir,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                            fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
    }
    if (ec) {
        spdlog::debug("Failed to set permissions for dir {}: {}", dir.string(), ec.message());
    }
#else
    (void)dir;
    (void)private_dir;
#endif
}

void ensure_file_private(const fs::path& p) {
#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::debug("Failed to set private file perms on {}: {}", p.string(), ec.message());
    }
#else
    (void)p;
#endif
}

std::string unique_staging_name(std::string_view digest, std::string_view suffix) {
    static std::atomic<std::uint64_t> counter{0};
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    std::string fn(digest);
    fn.push_back('.');
    fn.append(std::to_string(now_ns));
    fn.push_back('.');
    fn.append(std::to_string(tid));
    fn.push_back('.');
    fn.append(std::to_string(counter.fetch_add(1, std::memory_order_relaxed)));
    fn.append(suffix);
    fn.append(".part");
    return fn;
}

} // namespace

class FileCacheStore final : public ICacheStore {
public:
    FileCacheStore(fs::path directory, std::string nameSpace)
        : nameSpace_(std::move(nameSpace)), root_(std::move(directory) / nameSpace_) {}
    ~FileCacheStore() override = default;

    Expected<std::optional<ByteBuffer>> lookup(std::string_view identifier) override {
        if (identifier.empty()) {
            return Error{ErrorCode::InvalidArgument, "CacheStore.lookup: empty identifier"};
        }
        try {
            const auto digest = cacheKeyDigest(identifier);
            const auto sidecar = entryPath(digest, kSidecarSuffix);
            const auto blob = entryPath(digest, kBlobSuffix);

            std::shared_lock lk(mutex_);
            std::error_code ec;
            if (!fs::exists(sidecar, ec)) {
                return std::optional<ByteBuffer>{std::nullopt};
            }

            json meta;
            {
                std::ifstream in(sidecar);
                if (!in) {
                    return Error{ErrorCode::CacheReadFailed,
                                 "Failed to open cache sidecar: " + sidecar.string()};
                }
                in >> meta;
            }
            if (!meta.is_object() || !meta.contains("identifier") ||
                !meta["identifier"].is_string() ||
                meta["identifier"].get<std::string>() != identifier) {
                spdlog::debug("Cache[{}]: sidecar for '{}' names a different identifier",
                              nameSpace_, identifier);
                return std::optional<ByteBuffer>{std::nullopt};
            }

            std::ifstream in(blob, std::ios::binary);
            if (!in) {
                spdlog::debug("Cache[{}]: blob missing for '{}'", nameSpace_, identifier);
                return std::optional<ByteBuffer>{std::nullopt};
            }
            const auto size = fs::file_size(blob, ec);
            if (ec) {
                return Error{ErrorCode::CacheReadFailed,
                             "Failed to stat cache blob: " + blob.string()};
            }
            if (meta.contains("size") && meta["size"].is_number_unsigned() &&
                meta["size"].get<std::uint64_t>() != static_cast<std::uint64_t>(size)) {
                spdlog::debug("Cache[{}]: size mismatch for '{}' (sidecar {}, blob {})",
                              nameSpace_, identifier, meta["size"].get<std::uint64_t>(), size);
                return std::optional<ByteBuffer>{std::nullopt};
            }

            ByteBuffer bytes(static_cast<std::size_t>(size));
            if (size > 0) {
                in.read(reinterpret_cast<char*>(bytes.data()),
                        static_cast<std::streamsize>(bytes.size()));
                if (in.gcount() != static_cast<std::streamsize>(bytes.size())) {
                    return Error{ErrorCode::CacheReadFailed,
                                 "Short read from cache blob: " + blob.string()};
                }
            }
            return std::optional<ByteBuffer>{std::move(bytes)};
        } catch (const std::exception& ex) {
            return Error{ErrorCode::CacheReadFailed,
                         std::string("Cache lookup exception: ") + ex.what()};
        }
    }

    Expected<void> store(std::string_view identifier, std::span<const std::byte> bytes) override {
        if (identifier.empty()) {
            return Error{ErrorCode::InvalidArgument, "CacheStore.store: empty identifier"};
        }
        try {
            const auto digest = cacheKeyDigest(identifier);
            const auto blob = entryPath(digest, kBlobSuffix);
            const auto sidecar = entryPath(digest, kSidecarSuffix);

            std::error_code ec;
            const auto stagingDir = root_ / kStagingDirName;
            fs::create_directories(stagingDir, ec);
            if (ec) {
                return Error{ErrorCode::CacheWriteFailed,
                             "Failed to create staging dir: " + stagingDir.string()};
            }
            ensure_dir_perms(stagingDir, /*private_dir=*/true);
            fs::create_directories(blob.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::CacheWriteFailed,
                             "Failed to create cache dir: " + blob.parent_path().string()};
            }
            ensure_dir_perms(blob.parent_path(), /*private_dir=*/false);

            json meta = json::object();
            meta["identifier"] = std::string(identifier);
            meta["size"] = static_cast<std::uint64_t>(bytes.size());
            meta["stored_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                                    std::chrono::system_clock::now().time_since_epoch())
                                    .count();
            const auto metaText = meta.dump(2);

            const auto stagedBlob = stagingDir / unique_staging_name(digest, kBlobSuffix);
            const auto stagedMeta = stagingDir / unique_staging_name(digest, kSidecarSuffix);

            auto wb = writeStaged(stagedBlob, bytes);
            if (!wb.ok())
                return wb;
            auto wm = writeStaged(stagedMeta,
                                  std::span<const std::byte>(
                                      reinterpret_cast<const std::byte*>(metaText.data()),
                                      metaText.size()));
            if (!wm.ok()) {
                cleanup(stagedBlob);
                return wm;
            }

            std::unique_lock lk(mutex_);
            fs::rename(stagedBlob, blob, ec);
            if (ec) {
                cleanup(stagedBlob);
                cleanup(stagedMeta);
                return Error{ErrorCode::CacheWriteFailed, "rename() failed (" + ec.message() +
                                                              ") to " + blob.string()};
            }
            fs::rename(stagedMeta, sidecar, ec);
            if (ec) {
                cleanup(stagedMeta);
                return Error{ErrorCode::CacheWriteFailed, "rename() failed (" + ec.message() +
                                                              ") to " + sidecar.string()};
            }
            lk.unlock();

            spdlog::debug("Cache[{}]: stored '{}' ({} bytes) as {}", nameSpace_, identifier,
                          bytes.size(), blob.string());
            return Expected<void>{};
        } catch (const std::exception& ex) {
            return Error{ErrorCode::CacheWriteFailed,
                         std::string("Cache store exception: ") + ex.what()};
        }
    }

    [[nodiscard]] std::string_view nameSpace() const noexcept override { return nameSpace_; }

private:
    fs::path entryPath(const std::string& digest, const char* suffix) const {
        return root_ / digest.substr(0, 2) / (digest + suffix);
    }

    static Expected<void> writeStaged(const fs::path& path, std::span<const std::byte> data) {
        {
            std::ofstream os(path, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::CacheWriteFailed,
                             "Failed to create staging file: " + path.string()};
            }
            if (!data.empty()) {
                os.write(reinterpret_cast<const char*>(data.data()),
                         static_cast<std::streamsize>(data.size()));
            }
            if (!os.good()) {
                cleanup(path);
                return Error{ErrorCode::CacheWriteFailed, "write failed on: " + path.string()};
            }
        }
        ensure_file_private(path);
        auto r = fsync_file(path);
        if (!r.ok()) {
            cleanup(path);
            return Error{ErrorCode::CacheWriteFailed, r.error().message};
        }
        return Expected<void>{};
    }

    static void cleanup(const fs::path& stagingFile) noexcept {
        std::error_code ec;
        fs::remove(stagingFile, ec);
        if (ec) {
            spdlog::debug("cleanup: failed to remove staging file {}: {}", stagingFile.string(),
                          ec.message());
        }
    }

    std::string nameSpace_;
    fs::path root_;
    mutable std::shared_mutex mutex_;
};

std::unique_ptr<ICacheStore> makeFileCacheStore(const fs::path& directory, std::string nameSpace) {
    return std::make_unique<FileCacheStore>(directory, std::move(nameSpace));
}

} // namespace shardfetch::fetch
