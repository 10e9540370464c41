#include "unbox/archive.hpp"
#include "unbox/path_utils.hpp"
#include "unbox/platform.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <zlib.h>

namespace fs = std::filesystem;

namespace unbox {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_PREFIX_SIZE = 155;

// Tar type flags
static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char PAX_EXTENDED = 'x';
static constexpr char PAX_GLOBAL = 'g';
static constexpr char GNU_LONGNAME = 'L';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// ============================================================================
// Helper Functions
// ============================================================================

// Parse octal value from tar header field
static uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

static size_t padded_size(uint64_t size) {
    return static_cast<size_t>((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE;
}

static bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

// Extract the "path" record from a pax extended header body.
// Records are "<len> <key>=<value>\n".
static std::string pax_path(const uint8_t* data, size_t size) {
    std::string body(reinterpret_cast<const char*>(data), size);
    size_t pos = 0;
    while (pos < body.size()) {
        size_t space = body.find(' ', pos);
        if (space == std::string::npos) break;

        size_t len = 0;
        try {
            len = std::stoul(body.substr(pos, space - pos));
        } catch (const std::exception&) {
            break;
        }
        if (len == 0 || pos + len > body.size()) break;

        std::string record = body.substr(space + 1, len - (space - pos) - 2);
        if (record.rfind("path=", 0) == 0) {
            return record.substr(5);
        }
        pos += len;
    }
    return "";
}

static std::string strip_leading(const std::string& path, size_t components) {
    size_t pos = 0;
    for (size_t i = 0; i < components; ++i) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) return "";
        pos = slash + 1;
    }
    return path.substr(pos);
}

// ============================================================================
// Gzip
// ============================================================================

std::optional<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& compressed) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    // 16 + MAX_WBITS tells zlib to handle gzip format
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> decompressed;
    const size_t CHUNK = 16384;
    uint8_t out[CHUNK];

    int ret;
    do {
        stream.avail_out = CHUNK;
        stream.next_out = out;

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            inflateEnd(&stream);
            return std::nullopt;
        }

        size_t have = CHUNK - stream.avail_out;
        decompressed.insert(decompressed.end(), out, out + have);
    } while (ret != Z_STREAM_END && (stream.avail_out == 0 || stream.avail_in > 0));

    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }

    return decompressed;
}

// ============================================================================
// Tar Extraction
// ============================================================================

UnpackResult extract_tarball(const std::vector<uint8_t>& archive_data,
                             const std::string& dest_dir,
                             size_t strip_components) {
    UnpackResult result;

    auto decompressed = gzip_decompress(archive_data);
    if (!decompressed || decompressed->empty()) {
        result.error = "failed to decompress archive";
        return result;
    }
    const std::vector<uint8_t>& tar_data = *decompressed;

    auto fail = [&result, &dest_dir](const std::string& error) {
        std::error_code ec;
        fs::remove_all(dest_dir, ec);
        result.error = error;
        result.entries.clear();
        return result;
    };

    if (ensure_directory(dest_dir).isErr()) {
        result.error = "failed to create extraction directory: " + dest_dir;
        return result;
    }

    std::string long_name;   // from a preceding pax 'x' or GNU 'L' entry
    size_t offset = 0;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const uint8_t* block = tar_data.data() + offset;
        if (is_zero_block(block)) break;

        const TarHeader* header = reinterpret_cast<const TarHeader*>(block);
        offset += TAR_BLOCK_SIZE;

        uint64_t size = parse_octal(header->size, TAR_SIZE_SIZE);
        size_t data_span = padded_size(size);
        if (offset + data_span > tar_data.size() && size > 0) {
            return fail("truncated archive");
        }
        const uint8_t* data = tar_data.data() + offset;
        char typeflag = header->typeflag;

        // Metadata entries describe the next header
        if (typeflag == PAX_GLOBAL) {
            offset += data_span;
            continue;
        }
        if (typeflag == PAX_EXTENDED) {
            long_name = pax_path(data, static_cast<size_t>(size));
            offset += data_span;
            continue;
        }
        if (typeflag == GNU_LONGNAME) {
            long_name.assign(reinterpret_cast<const char*>(data),
                             strnlen(reinterpret_cast<const char*>(data), static_cast<size_t>(size)));
            offset += data_span;
            continue;
        }

        std::string path;
        if (!long_name.empty()) {
            path = long_name;
            long_name.clear();
        } else {
            if (header->prefix[0] != '\0') {
                path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
                path += '/';
            }
            path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));
        }

        if (path.rfind("./", 0) == 0) {
            path = path.substr(2);
        }

        if (!path.empty() && (path[0] == '/' || path[0] == '\\')) {
            return fail("absolute path not allowed: " + path);
        }

        auto normalized = normalize_relative_path(path);
        if (!normalized.ok) {
            return fail(std::string(path_error_to_string(normalized.error)) + ": " + path);
        }

        std::string relative = strip_leading(normalized.path, strip_components);
        offset += data_span;

        if (relative.empty()) {
            continue;
        }

        if (typeflag == TAR_SYMTYPE || typeflag == TAR_LNKTYPE) {
            result.warnings.push_back("skipped link entry: " + relative);
            continue;
        }
        if (typeflag == TAR_AREGTYPE || typeflag == TAR_CONTTYPE) {
            typeflag = TAR_REGTYPE;
        }
        if (typeflag != TAR_REGTYPE && typeflag != TAR_DIRTYPE) {
            result.warnings.push_back("skipped unsupported entry: " + relative);
            continue;
        }

        std::string full_path = join_path(dest_dir, relative);

        if (typeflag == TAR_DIRTYPE) {
            if (ensure_directory(full_path).isErr()) {
                return fail("failed to create directory: " + relative);
            }
            result.entries.push_back(relative);
            continue;
        }

        if (ensure_directory(get_parent_directory(full_path)).isErr()) {
            return fail("failed to create parent directory for: " + relative);
        }

        std::ofstream file(full_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return fail("failed to create file: " + relative);
        }
        file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        file.close();
        if (!file) {
            return fail("failed to write file: " + relative);
        }

        uint64_t mode = parse_octal(header->mode, TAR_MODE_SIZE);
        std::error_code ec;
        if ((mode & 0111) != 0) {
            fs::permissions(full_path, fs::perms::owner_all | fs::perms::group_read |
                           fs::perms::group_exec | fs::perms::others_read |
                           fs::perms::others_exec, ec);
        } else {
            fs::permissions(full_path, fs::perms::owner_read | fs::perms::owner_write |
                           fs::perms::group_read | fs::perms::others_read, ec);
        }
        if (ec) {
            result.warnings.push_back("could not set permissions on " + relative + ": " + ec.message());
        }

        result.entries.push_back(relative);
    }

    result.ok = true;
    return result;
}

} // namespace unbox
