#include "binwheel/tar.hpp"
#include "binwheel/platform.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace binwheel {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_PREFIX_SIZE = 155;

// Tar type flags
static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char TAR_GNU_LONGNAME = 'L';
static constexpr char TAR_GNU_LONGLINK = 'K';
static constexpr char TAR_PAX_HEADER = 'x';
static constexpr char TAR_PAX_GLOBAL = 'g';

// Upper bound for metadata blocks ('L', 'x') we are willing to buffer
static constexpr uint64_t TAR_MAX_META_SIZE = 1024 * 1024;

static constexpr size_t COPY_CHUNK = 64 * 1024;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];         // 0
    char mode[TAR_MODE_SIZE];         // 100
    char uid[8];                      // 108
    char gid[8];                      // 116
    char size[TAR_SIZE_SIZE];         // 124
    char mtime[12];                   // 136
    char chksum[TAR_CHKSUM_SIZE];     // 148
    char typeflag;                    // 156
    char linkname[100];               // 157
    char magic[6];                    // 257
    char version[2];                  // 263
    char uname[32];                   // 265
    char gname[32];                   // 297
    char devmajor[8];                 // 329
    char devminor[8];                 // 337
    char prefix[TAR_PREFIX_SIZE];     // 345
    char padding[12];                 // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

namespace {

// Parse octal value from tar header field
uint64_t parse_octal(const char* data, size_t size) {
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

// Numeric field: octal, or GNU base-256 when the high bit of the first byte is set
uint64_t parse_numeric(const char* data, size_t size) {
    auto first = static_cast<unsigned char>(data[0]);
    if ((first & 0x80) == 0) {
        return parse_octal(data, size);
    }
    uint64_t result = first & 0x7f;
    for (size_t i = 1; i < size; ++i) {
        result = (result << 8) | static_cast<unsigned char>(data[i]);
    }
    return result;
}

bool checksum_matches(const TarHeader& header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    const auto* signed_bytes = reinterpret_cast<const signed char*>(&header);
    uint32_t unsigned_sum = 0;
    int32_t signed_sum = 0;

    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // Checksum field is treated as spaces during calculation
        if (i >= 148 && i < 156) {
            unsigned_sum += ' ';
            signed_sum += ' ';
        } else {
            unsigned_sum += bytes[i];
            signed_sum += signed_bytes[i];
        }
    }

    uint64_t stored = parse_octal(header.chksum, TAR_CHKSUM_SIZE);
    return stored == unsigned_sum || static_cast<int64_t>(stored) == signed_sum;
}

bool is_zero_block(const TarHeader& header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    return std::all_of(bytes, bytes + TAR_BLOCK_SIZE, [](unsigned char b) { return b == 0; });
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

TarMemberType member_type(char typeflag) {
    switch (typeflag) {
        case TAR_REGTYPE:
        case TAR_AREGTYPE:
        case TAR_CONTTYPE:
            return TarMemberType::RegularFile;
        case TAR_DIRTYPE:
            return TarMemberType::Directory;
        case TAR_SYMTYPE:
            return TarMemberType::Symlink;
        case TAR_LNKTYPE:
            return TarMemberType::Hardlink;
        default:
            return TarMemberType::Other;
    }
}

// Extract one key from a PAX extended header ("<len> <key>=<value>\n" records)
std::string pax_value(const std::string& data, const std::string& key) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) break;

        uint64_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') return {};
            len = len * 10 + static_cast<uint64_t>(data[i] - '0');
        }
        if (len == 0 || pos + len > data.size()) break;

        std::string record = data.substr(space + 1, pos + len - space - 1);
        if (!record.empty() && record.back() == '\n') {
            record.pop_back();
        }
        auto eq = record.find('=');
        if (eq != std::string::npos && record.compare(0, eq, key) == 0 && eq == key.size()) {
            return record.substr(eq + 1);
        }
        pos += len;
    }
    return {};
}

// RAII wrapper for a zlib gzFile opened for reading
class GzFile {
public:
    explicit GzFile(const std::string& path) : file_(gzopen(path.c_str(), "rb")) {}
    ~GzFile() { if (file_) gzclose(file_); }

    GzFile(const GzFile&) = delete;
    GzFile& operator=(const GzFile&) = delete;

    gzFile get() { return file_; }
    explicit operator bool() const { return file_ != nullptr; }

private:
    gzFile file_;
};

enum class NextStatus {
    Member,
    End,
    Error
};

// Sequential reader over the members of a .tar.gz stream
class TarReader {
public:
    explicit TarReader(const std::string& path) : path_(path), gz_(path) {
        if (!gz_) {
            error_ = "failed to open archive: " + path;
        }
    }

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

    NextStatus next(TarMember& member) {
        if (!ok()) return NextStatus::Error;

        // Discard whatever the caller did not consume of the previous member
        if (!skip(remaining_ + padding_)) return NextStatus::Error;
        remaining_ = 0;
        padding_ = 0;

        std::string long_name;
        std::string pax_path;

        while (true) {
            TarHeader header;
            size_t got = 0;
            if (!read_some(&header, sizeof(header), got)) return NextStatus::Error;
            if (got == 0) return NextStatus::End;  // no end-of-archive blocks
            if (got != sizeof(header)) {
                error_ = "truncated tar header in " + path_;
                return NextStatus::Error;
            }
            if (is_zero_block(header)) return NextStatus::End;

            if (!checksum_matches(header)) {
                error_ = "corrupt tar header (checksum mismatch) in " + path_;
                return NextStatus::Error;
            }

            uint64_t size = parse_numeric(header.size, TAR_SIZE_SIZE);
            uint64_t padding = (TAR_BLOCK_SIZE - (size % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;

            if (header.typeflag == TAR_GNU_LONGNAME || header.typeflag == TAR_PAX_HEADER) {
                std::string data;
                if (!read_meta(size, padding, data)) return NextStatus::Error;
                if (header.typeflag == TAR_GNU_LONGNAME) {
                    long_name = field_string(data.data(), data.size());
                } else {
                    pax_path = pax_value(data, "path");
                }
                continue;
            }

            if (header.typeflag == TAR_GNU_LONGLINK || header.typeflag == TAR_PAX_GLOBAL) {
                if (!skip(size + padding)) return NextStatus::Error;
                continue;
            }

            if (!pax_path.empty()) {
                member.path = pax_path;
            } else if (!long_name.empty()) {
                member.path = long_name;
            } else {
                member.path.clear();
                if (std::memcmp(header.magic, "ustar", 5) == 0 && header.prefix[0] != '\0') {
                    member.path = field_string(header.prefix, TAR_PREFIX_SIZE) + "/";
                }
                member.path += field_string(header.name, TAR_NAME_SIZE);
            }

            while (member.path.size() > 1 && member.path.back() == '/') {
                member.path.pop_back();
            }

            member.type = member_type(header.typeflag);
            member.size = size;
            member.mode = static_cast<uint32_t>(parse_octal(header.mode, TAR_MODE_SIZE));

            remaining_ = size;
            padding_ = padding;
            return NextStatus::Member;
        }
    }

    // Stream the current member's content into `out`
    bool copy_data(std::ofstream& out) {
        char buffer[COPY_CHUNK];
        while (remaining_ > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, sizeof(buffer)));
            if (!read_exact(buffer, want)) return false;
            out.write(buffer, static_cast<std::streamsize>(want));
            if (!out) {
                error_ = "write failed while extracting from " + path_;
                return false;
            }
            remaining_ -= want;
        }
        if (!skip(padding_)) return false;
        padding_ = 0;
        return true;
    }

private:
    bool read_some(void* buffer, size_t len, size_t& got) {
        got = 0;
        auto* out = static_cast<char*>(buffer);
        while (got < len) {
            int n = gzread(gz_.get(), out + got, static_cast<unsigned>(len - got));
            if (n < 0) {
                int errnum = 0;
                const char* msg = gzerror(gz_.get(), &errnum);
                error_ = "failed to decompress " + path_ + ": " + (msg ? msg : "unknown error");
                return false;
            }
            if (n == 0) break;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    bool read_exact(void* buffer, size_t len) {
        size_t got = 0;
        if (!read_some(buffer, len, got)) return false;
        if (got != len) {
            error_ = "truncated archive: " + path_;
            return false;
        }
        return true;
    }

    bool skip(uint64_t len) {
        char buffer[COPY_CHUNK];
        while (len > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(len, sizeof(buffer)));
            if (!read_exact(buffer, want)) return false;
            len -= want;
        }
        return true;
    }

    bool read_meta(uint64_t size, uint64_t padding, std::string& data) {
        if (size > TAR_MAX_META_SIZE) {
            error_ = "oversized tar extended header in " + path_;
            return false;
        }
        data.resize(static_cast<size_t>(size));
        if (size > 0 && !read_exact(&data[0], data.size())) return false;
        return skip(padding);
    }

    std::string path_;
    GzFile gz_;
    std::string error_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
};

} // namespace

// ============================================================================
// Public API Implementation
// ============================================================================

TarListResult list_tar_members(const std::string& archive_path) {
    TarListResult result;

    TarReader reader(archive_path);
    TarMember member;
    while (true) {
        NextStatus status = reader.next(member);
        if (status == NextStatus::End) break;
        if (status == NextStatus::Error) {
            result.error = reader.error();
            return result;
        }
        result.members.push_back(member);
    }

    result.ok = true;
    return result;
}

TarExtractResult extract_first_tar_member(const std::string& archive_path,
                                          const std::string& base_name,
                                          const std::string& dest_path) {
    TarExtractResult result;

    TarReader reader(archive_path);
    TarMember member;
    while (true) {
        NextStatus status = reader.next(member);
        if (status == NextStatus::End) break;
        if (status == NextStatus::Error) {
            result.error = reader.error();
            return result;
        }

        if (member.type != TarMemberType::RegularFile || binwheel::base_name(member.path) != base_name) {
            continue;
        }

        spdlog::debug("extracting {} ({} bytes) from {}", member.path, member.size, archive_path);

        std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.error = "failed to create file: " + dest_path;
            return result;
        }
        if (!reader.copy_data(out)) {
            out.close();
            remove_file(dest_path);
            result.error = reader.error();
            return result;
        }
        out.close();
        if (out.fail()) {
            remove_file(dest_path);
            result.error = "failed to write file: " + dest_path;
            return result;
        }

        result.member = member;
        result.found = true;
        result.ok = true;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace binwheel
