#include "unbox/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace unbox {

namespace fs = std::filesystem;

Error filesystem_error(const std::error_code& ec, const std::string& path) {
    ErrorCode code = ErrorCode::IO_ERROR;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PERMISSION_DENIED;
    } else if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::FILE_NOT_FOUND;
    }
    return Error(code, path + ": " + ec.message());
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) return path;
    std::string result = to_portable_path(abs.lexically_normal().string());
    // "dir/." normalizes to "dir/"
    if (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

// ============================================================================
// Directory Operations
// ============================================================================

Result<std::vector<std::string>> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    std::error_code ec;

    fs::directory_iterator it(path, ec);
    if (ec) {
        return Result<std::vector<std::string>>::err(filesystem_error(ec, path));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }
    if (ec) {
        return Result<std::vector<std::string>>::err(filesystem_error(ec, path));
    }

    std::sort(entries.begin(), entries.end());
    return Result<std::vector<std::string>>::ok(std::move(entries));
}

Result<void> ensure_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result<void>::err(filesystem_error(ec, path));
    }
    if (!fs::is_directory(path, ec)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, path + ": not a directory"));
    }
    return Result<void>::ok();
}

Result<void> remove_path(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return Result<void>::err(filesystem_error(ec, path));
    }
    return Result<void>::ok();
}

Result<void> copy_recursive(const std::string& src, const std::string& dst) {
    std::error_code ec;
    auto src_status = fs::symlink_status(src, ec);
    if (ec) {
        return Result<void>::err(filesystem_error(ec, src));
    }

    auto dst_status = fs::symlink_status(dst, ec);
    bool dst_exists = fs::exists(dst_status);

    // A type clash (file over directory, directory over file) replaces dst
    if (dst_exists && fs::is_directory(src_status) != fs::is_directory(dst_status)) {
        auto removed = remove_path(dst);
        if (removed.isErr()) return removed;
        dst_exists = false;
    }

    if (fs::is_symlink(src_status)) {
        if (dst_exists) {
            auto removed = remove_path(dst);
            if (removed.isErr()) return removed;
        }
        fs::copy_symlink(src, dst, ec);
        if (ec) {
            return Result<void>::err(filesystem_error(ec, dst));
        }
        return Result<void>::ok();
    }

    if (fs::is_directory(src_status)) {
        auto created = ensure_directory(dst);
        if (created.isErr()) return created;

        auto entries = list_directory(src);
        if (entries.isErr()) {
            return Result<void>::err(entries.error());
        }
        for (const auto& name : entries.value()) {
            auto copied = copy_recursive(join_path(src, name), join_path(dst, name));
            if (copied.isErr()) return copied;
        }
        return Result<void>::ok();
    }

    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<void>::err(filesystem_error(ec, dst));
    }
    return Result<void>::ok();
}

// ============================================================================
// File Contents
// ============================================================================

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// ============================================================================
// Temporary Directories
// ============================================================================

Result<std::string> create_temp_directory(const std::string& root, const std::string& prefix) {
    std::string base = root;
    if (base.empty()) {
        std::error_code ec;
        base = fs::temp_directory_path(ec).string();
        if (ec) {
            return Result<std::string>::err(filesystem_error(ec, "temp directory"));
        }
    }

    auto base_ready = ensure_directory(base);
    if (base_ready.isErr()) {
        return Result<std::string>::err(base_ready.error());
    }

    std::string path = join_path(base, prefix + generate_uuid());
    std::error_code ec;
    if (!fs::create_directory(path, ec)) {
        if (!ec) {
            return Result<std::string>::err(
                Error(ErrorCode::IO_ERROR, path + ": temp directory already exists"));
        }
        return Result<std::string>::err(filesystem_error(ec, path));
    }
    return Result<std::string>::ok(path);
}

ScopedDirectory::~ScopedDirectory() {
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace unbox
