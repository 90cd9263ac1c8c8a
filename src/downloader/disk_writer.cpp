/*
 * disk_writer.cpp
 *
 * DiskWriter implementation:
 * - Uniquely named temp files (<uuid><ext>) created exclusively under the temp directory
 * - Temp file fsynced before the rename, destination directory fsynced after it
 * - Atomic rename into the destination when on the same filesystem
 * - EXDEV fallback: copy + fsync into a sibling of the destination, then rename over it
 * - Modification time and "downloaded from the internet" provenance on the final file
 */

#include <webget/core/uuid.h>
#include <webget/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_WIN32)
#define NOMINMAX
#include <Windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(__APPLE__) || defined(__linux__)
#include <sys/xattr.h>
#endif
#endif

namespace webget::downloader {

namespace fs = std::filesystem;

namespace {

#if defined(__APPLE__)
constexpr const char* kQuarantineAttr = "com.apple.quarantine";
#elif defined(__linux__)
// freedesktop.org shared attribute for the origin of a downloaded file
constexpr const char* kOriginUrlAttr = "user.xdg.origin.url";
#endif

std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

} // namespace

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_file(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
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

static Expected<void> fsync_dir(const fs::path& dir) {
#if defined(_WIN32)
    HANDLE h =
        CreateFileW(dir.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                    FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING,
                    FILE_FLAG_BACKUP_SEMANTICS, // allow opening a directory
                    nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile (directory) failed for: " + dir.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError,
                     "FlushFileBuffers (directory) failed for: " + dir.string()};
    }
    CloseHandle(h);
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
    ::close(fd);
    return Expected<void>{};
#else
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return Error{ErrorCode::IoError, "fsync() failed for directory: " + dir.string()};
    }
    return Expected<void>{};
#endif
#endif
}

// ---------- Temp file ----------

class TempFile final : public ITempFile {
public:
    explicit TempFile(fs::path path) : path_(std::move(path)) {}

    ~TempFile() override {
        if (file_ != nullptr) {
            std::fclose(file_);
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // Exclusive create; fails if the name is already taken.
    Expected<void> open() {
#if defined(_WIN32)
        file_ = _wfopen(path_.c_str(), L"wbx");
#else
        file_ = std::fopen(path_.c_str(), "wbx");
#endif
        if (file_ == nullptr) {
            return Error{ErrorCode::IoError,
                         "failed to create temp file " + path_.string() + ": " +
                             errno_message(errno)};
        }
        return Expected<void>{};
    }

    [[nodiscard]] const fs::path& path() const override { return path_; }

    Expected<void> write(std::span<const std::byte> data) override {
        if (file_ == nullptr) {
            return Error{ErrorCode::IoError, "temp file is closed: " + path_.string()};
        }
        if (data.empty())
            return Expected<void>{};
        const auto n = std::fwrite(data.data(), 1, data.size(), file_);
        if (n != data.size()) {
            return Error{ErrorCode::IoError,
                         "write failed on " + path_.string() + ": " + errno_message(errno)};
        }
        return Expected<void>{};
    }

    Expected<void> close() override {
        if (file_ == nullptr)
            return Expected<void>{};
        const int rc = std::fclose(file_);
        file_ = nullptr;
        if (rc != 0) {
            return Error{ErrorCode::IoError,
                         "close failed on " + path_.string() + ": " + errno_message(errno)};
        }
        return Expected<void>{};
    }

private:
    fs::path path_;
    std::FILE* file_{nullptr};
};

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    Expected<void> ensureDirectory(const fs::path& dir) override {
        if (dir.empty())
            return Expected<void>{};
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "failed to create directory " + dir.string() + ": " + ec.message()};
        }
        if (!fs::is_directory(dir, ec)) {
            return Error{ErrorCode::IoError, "not a directory: " + dir.string()};
        }
        return Expected<void>{};
    }

    Expected<std::unique_ptr<ITempFile>> createTempFile(const fs::path& tempDir,
                                                        std::string_view extension) override {
        std::string fn = core::generateUUID();
        if (!extension.empty()) {
            if (extension.front() != '.')
                fn.push_back('.');
            fn += std::string(extension);
        }

        auto file = std::make_unique<TempFile>(tempDir / fn);
        auto r = file->open();
        if (!r.ok()) {
            return r.error();
        }
        spdlog::debug("created temp file {}", file->path().string());
        return std::unique_ptr<ITempFile>(std::move(file));
    }

    Expected<void> moveIntoPlace(const fs::path& tempFile, const fs::path& destination) override {
        // Content must be on disk before the name points at it
        auto synced = fsync_file(tempFile);
        if (!synced.ok()) {
            return Error{synced.error().code, "failed to fsync temp file: " + tempFile.string()};
        }

        std::error_code ec;
        fs::rename(tempFile, destination, ec);
        if (!ec) {
            sync_parent(destination);
            return Expected<void>{};
        }
        if (ec != std::errc::cross_device_link) {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 tempFile.string() + " to " +
                                                 destination.string()};
        }

        spdlog::debug("cross-device rename; copying {} next to {}", tempFile.string(),
                      destination.string());
        auto copied = copy_file_fsync_replace(tempFile, destination);
        if (!copied.ok()) {
            return copied;
        }
        std::error_code del_ec;
        fs::remove(tempFile, del_ec);
        if (del_ec) {
            spdlog::warn("failed to remove temp file {} after copy: {}", tempFile.string(),
                         del_ec.message());
        }
        sync_parent(destination);
        return Expected<void>{};
    }

    Expected<void> setModificationTime(const fs::path& file,
                                       std::chrono::system_clock::time_point when) override {
#if defined(_WIN32)
        // FILETIME counts 100ns ticks since 1601-01-01
        constexpr std::int64_t kEpochDelta = 116444736000000000LL;
        const auto ticks =
            std::chrono::duration_cast<std::chrono::nanoseconds>(when.time_since_epoch()).count() /
                100 +
            kEpochDelta;
        FILETIME ft;
        ft.dwLowDateTime = static_cast<DWORD>(ticks & 0xFFFFFFFF);
        ft.dwHighDateTime = static_cast<DWORD>(static_cast<std::uint64_t>(ticks) >> 32);
        HANDLE h = CreateFileW(file.wstring().c_str(), FILE_WRITE_ATTRIBUTES,
                               FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                               OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            return Error{ErrorCode::IoError, "CreateFile failed for " + file.string()};
        }
        const BOOL ok = SetFileTime(h, nullptr, nullptr, &ft);
        CloseHandle(h);
        if (!ok) {
            return Error{ErrorCode::IoError, "SetFileTime failed for " + file.string()};
        }
        return Expected<void>{};
#else
        const auto ns =
            std::chrono::duration_cast<std::chrono::nanoseconds>(when.time_since_epoch()).count();
        struct timespec times[2];
        times[0].tv_sec = 0;
        times[0].tv_nsec = UTIME_NOW;
        times[1].tv_sec = static_cast<time_t>(ns / 1000000000LL);
        times[1].tv_nsec = static_cast<long>(ns % 1000000000LL);
        if (times[1].tv_nsec < 0) {
            times[1].tv_sec -= 1;
            times[1].tv_nsec += 1000000000L;
        }
        if (::utimensat(AT_FDCWD, file.c_str(), times, 0) != 0) {
            return Error{ErrorCode::IoError,
                         "utimensat failed for " + file.string() + ": " + errno_message(errno)};
        }
        return Expected<void>{};
#endif
    }

    Expected<void> applyProvenance(const fs::path& file, bool untrusted,
                                   std::string_view sourceUrl) override {
#if defined(_WIN32)
        // Alternate data stream read by the shell's attachment manager
        const std::wstring ads = file.wstring() + L":Zone.Identifier";
        if (untrusted) {
            std::string zone = "[ZoneTransfer]\r\nZoneId=3\r\n";
            if (!sourceUrl.empty()) {
                zone += "HostUrl=" + std::string(sourceUrl) + "\r\n";
            }
            std::ofstream os(ads, std::ios::binary | std::ios::trunc);
            os.write(zone.data(), static_cast<std::streamsize>(zone.size()));
            if (!os.good()) {
                return Error{ErrorCode::IoError, "failed to write Zone.Identifier for " +
                                                     file.string()};
            }
        } else if (!DeleteFileW(ads.c_str()) && GetLastError() != ERROR_FILE_NOT_FOUND) {
            return Error{ErrorCode::IoError,
                         "failed to remove Zone.Identifier for " + file.string()};
        }
        return Expected<void>{};
#elif defined(__APPLE__)
        if (untrusted) {
            // flags;timestamp;agent;uuid
            const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count();
            char value[128];
            std::snprintf(value, sizeof(value), "0081;%08llx;webget;",
                          static_cast<unsigned long long>(secs));
            if (::setxattr(file.c_str(), kQuarantineAttr, value, std::strlen(value), 0, 0) != 0) {
                return Error{ErrorCode::IoError, "setxattr(" + std::string(kQuarantineAttr) +
                                                     ") failed: " + errno_message(errno)};
            }
            (void)sourceUrl;
        } else if (::removexattr(file.c_str(), kQuarantineAttr, 0) != 0 && errno != ENOATTR) {
            return Error{ErrorCode::IoError, "removexattr(" + std::string(kQuarantineAttr) +
                                                 ") failed: " + errno_message(errno)};
        }
        return Expected<void>{};
#elif defined(__linux__)
        if (untrusted) {
            const std::string value = sourceUrl.empty() ? std::string("about:internet")
                                                        : std::string(sourceUrl);
            if (::setxattr(file.c_str(), kOriginUrlAttr, value.data(), value.size(), 0) != 0) {
                return Error{ErrorCode::IoError, "setxattr(" + std::string(kOriginUrlAttr) +
                                                     ") failed: " + errno_message(errno)};
            }
        } else if (::removexattr(file.c_str(), kOriginUrlAttr) != 0 && errno != ENODATA &&
                   errno != ENOTSUP) {
            return Error{ErrorCode::IoError, "removexattr(" + std::string(kOriginUrlAttr) +
                                                 ") failed: " + errno_message(errno)};
        }
        return Expected<void>{};
#else
        (void)file;
        (void)untrusted;
        (void)sourceUrl;
        return Expected<void>{};
#endif
    }

    void cleanup(const fs::path& tempFile) noexcept override {
        std::error_code ec;
        fs::remove(tempFile, ec);
        if (ec) {
            spdlog::warn("cleanup: failed to remove temp file {}: {}", tempFile.string(),
                         ec.message());
        }
    }

private:
    // Persist the directory entry created by a rename (best-effort)
    static void sync_parent(const fs::path& file) {
        const auto dir = file.has_parent_path() ? file.parent_path() : fs::path(".");
        auto r = fsync_dir(dir);
        if (!r.ok()) {
            spdlog::debug("fsync on {} failed (continuing): {}", dir.string(), r.error().message);
        }
    }

    // Copy into a sibling of dst, fsync it, then rename over dst. dst is untouched on failure.
    static Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
        const fs::path staged = dst.parent_path() / (core::generateUUID() + ".copy");
        std::error_code ec;

        {
            std::ifstream is(src, std::ios::binary);
            if (!is.good()) {
                return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
            }
            std::ofstream os(staged, std::ios::binary | std::ios::trunc);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "copy: failed to open destination: " + staged.string()};
            }
            std::vector<char> buffer(1 << 20);
            while (is.good()) {
                is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = is.gcount();
                if (got > 0) {
                    os.write(buffer.data(), got);
                    if (!os.good()) {
                        os.close();
                        fs::remove(staged, ec);
                        return Error{ErrorCode::IoError,
                                     "copy: write failed for destination: " + staged.string()};
                    }
                }
            }
            if (!is.eof()) {
                os.close();
                fs::remove(staged, ec);
                return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
            }
        }

        auto rf = fsync_file(staged);
        if (!rf.ok()) {
            fs::remove(staged, ec);
            return rf;
        }

        fs::rename(staged, dst, ec);
        if (ec) {
            std::error_code del_ec;
            fs::remove(staged, del_ec);
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 staged.string() + " to " + dst.string()};
        }
        return Expected<void>{};
    }
};

std::unique_ptr<IDiskWriter> makeDiskWriter() {
    return std::make_unique<DiskWriter>();
}

} // namespace webget::downloader
