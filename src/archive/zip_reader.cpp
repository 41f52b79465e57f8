#include "binwheel/zip.hpp"
#include "binwheel/platform.hpp"

#include <algorithm>
#include <cstring>

#include <zlib.h>

namespace binwheel {

// ============================================================================
// Zip Format Constants
// ============================================================================

static constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
static constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;
static constexpr uint32_t ZIP64_EOCD_SIG = 0x06064b50;
static constexpr uint32_t ZIP64_LOCATOR_SIG = 0x07064b50;

static constexpr size_t ZIP_LOCAL_HEADER_SIZE = 30;
static constexpr size_t ZIP_CENTRAL_HEADER_SIZE = 46;
static constexpr size_t ZIP_EOCD_SIZE = 22;
static constexpr size_t ZIP64_LOCATOR_SIZE = 20;
static constexpr size_t ZIP64_EOCD_SIZE = 56;
static constexpr size_t ZIP_MAX_COMMENT = 0xFFFF;

static constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;
static constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;

static constexpr size_t READ_CHUNK = 64 * 1024;

namespace {

uint16_t le16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t le64(const unsigned char* p) {
    return static_cast<uint64_t>(le32(p)) | (static_cast<uint64_t>(le32(p + 4)) << 32);
}

bool read_at(std::ifstream& in, uint64_t offset, unsigned char* buffer, size_t len) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) return false;
    in.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(len));
    return static_cast<size_t>(in.gcount()) == len;
}

// Overwrite 0xFFFFFFFF placeholders with values from a zip64 extra field
void apply_zip64_extra(const unsigned char* extra, size_t extra_len, ZipEntry& entry) {
    size_t pos = 0;
    while (pos + 4 <= extra_len) {
        uint16_t id = le16(extra + pos);
        uint16_t size = le16(extra + pos + 2);
        if (pos + 4 + size > extra_len) return;

        if (id == ZIP64_EXTRA_ID) {
            const unsigned char* field = extra + pos + 4;
            size_t used = 0;
            if (entry.uncompressed_size == 0xFFFFFFFFu && used + 8 <= size) {
                entry.uncompressed_size = le64(field + used);
                used += 8;
            }
            if (entry.compressed_size == 0xFFFFFFFFu && used + 8 <= size) {
                entry.compressed_size = le64(field + used);
                used += 8;
            }
            if (entry.local_header_offset == 0xFFFFFFFFu && used + 8 <= size) {
                entry.local_header_offset = le64(field + used);
            }
            return;
        }
        pos += 4 + size;
    }
}

// RAII wrapper for an inflate stream (raw deflate, no zlib header)
class Inflater {
public:
    Inflater() {
        std::memset(&strm_, 0, sizeof(strm_));
        initialized_ = inflateInit2(&strm_, -MAX_WBITS) == Z_OK;
    }
    ~Inflater() { if (initialized_) inflateEnd(&strm_); }

    Inflater(const Inflater&) = delete;
    Inflater& operator=(const Inflater&) = delete;

    z_stream* get() { return &strm_; }
    explicit operator bool() const { return initialized_; }

private:
    z_stream strm_;
    bool initialized_ = false;
};

} // namespace

// ============================================================================
// Central Directory
// ============================================================================

ZipListResult list_zip_entries(const std::string& archive_path) {
    ZipListResult result;

    std::ifstream in(archive_path, std::ios::binary);
    if (!in) {
        result.error = "failed to open archive: " + archive_path;
        return result;
    }

    in.seekg(0, std::ios::end);
    auto end_pos = in.tellg();
    if (end_pos < 0) {
        result.error = "failed to read archive: " + archive_path;
        return result;
    }
    uint64_t file_size = static_cast<uint64_t>(end_pos);
    if (file_size < ZIP_EOCD_SIZE) {
        result.error = "not a zip archive (too small): " + archive_path;
        return result;
    }

    // The end-of-central-directory record sits within the last 64 KiB + 22 bytes
    size_t tail_len = static_cast<size_t>(std::min<uint64_t>(file_size, ZIP_EOCD_SIZE + ZIP_MAX_COMMENT));
    uint64_t tail_start = file_size - tail_len;
    std::vector<unsigned char> tail(tail_len);
    if (!read_at(in, tail_start, tail.data(), tail_len)) {
        result.error = "failed to read archive: " + archive_path;
        return result;
    }

    size_t eocd = std::string::npos;
    for (size_t i = tail_len - ZIP_EOCD_SIZE + 1; i-- > 0;) {
        if (le32(tail.data() + i) == ZIP_EOCD_SIG &&
            i + ZIP_EOCD_SIZE + le16(tail.data() + i + 20) <= tail_len) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        result.error = "not a zip archive (no end of central directory): " + archive_path;
        return result;
    }

    const unsigned char* e = tail.data() + eocd;
    uint64_t total_entries = le16(e + 10);
    uint64_t cd_size = le32(e + 12);
    uint64_t cd_offset = le32(e + 16);

    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFFu || cd_offset == 0xFFFFFFFFu) {
        uint64_t eocd_abs = tail_start + eocd;
        unsigned char locator[ZIP64_LOCATOR_SIZE];
        if (eocd_abs < ZIP64_LOCATOR_SIZE ||
            !read_at(in, eocd_abs - ZIP64_LOCATOR_SIZE, locator, sizeof(locator)) ||
            le32(locator) != ZIP64_LOCATOR_SIG) {
            result.error = "missing zip64 end of central directory locator: " + archive_path;
            return result;
        }

        unsigned char record[ZIP64_EOCD_SIZE];
        if (!read_at(in, le64(locator + 8), record, sizeof(record)) ||
            le32(record) != ZIP64_EOCD_SIG) {
            result.error = "corrupt zip64 end of central directory: " + archive_path;
            return result;
        }
        total_entries = le64(record + 32);
        cd_size = le64(record + 40);
        cd_offset = le64(record + 48);
    }

    if (cd_offset > file_size || cd_size > file_size - cd_offset) {
        result.error = "central directory out of bounds: " + archive_path;
        return result;
    }

    std::vector<unsigned char> cd(static_cast<size_t>(cd_size));
    if (cd_size > 0 && !read_at(in, cd_offset, cd.data(), cd.size())) {
        result.error = "failed to read central directory: " + archive_path;
        return result;
    }

    size_t pos = 0;
    for (uint64_t i = 0; i < total_entries; ++i) {
        if (pos + ZIP_CENTRAL_HEADER_SIZE > cd.size() || le32(cd.data() + pos) != ZIP_CENTRAL_HEADER_SIG) {
            result.error = "corrupt central directory entry " + std::to_string(i) + " in " + archive_path;
            return result;
        }

        const unsigned char* h = cd.data() + pos;
        uint16_t name_len = le16(h + 28);
        uint16_t extra_len = le16(h + 30);
        uint16_t comment_len = le16(h + 32);
        size_t record_len = ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (pos + record_len > cd.size()) {
            result.error = "truncated central directory in " + archive_path;
            return result;
        }

        ZipEntry entry;
        entry.version_made_by = le16(h + 4);
        entry.flags = le16(h + 8);
        entry.method = le16(h + 10);
        entry.crc32 = le32(h + 16);
        entry.compressed_size = le32(h + 20);
        entry.uncompressed_size = le32(h + 24);
        entry.external_attributes = le32(h + 38);
        entry.local_header_offset = le32(h + 42);
        entry.name.assign(reinterpret_cast<const char*>(h + ZIP_CENTRAL_HEADER_SIZE), name_len);
        apply_zip64_extra(h + ZIP_CENTRAL_HEADER_SIZE + name_len, extra_len, entry);

        result.entries.push_back(std::move(entry));
        pos += record_len;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Entry Data
// ============================================================================

ZipReadResult read_zip_entry(const std::string& archive_path,
                             const ZipEntry& entry,
                             const ZipDataSink& sink) {
    ZipReadResult result;

    if (entry.flags & ZIP_FLAG_ENCRYPTED) {
        result.error = "encrypted zip entries are not supported: " + entry.name;
        return result;
    }
    if (entry.method != static_cast<uint16_t>(ZipMethod::Store) &&
        entry.method != static_cast<uint16_t>(ZipMethod::Deflate)) {
        result.error = "unsupported compression method " + std::to_string(entry.method) +
                       " for " + entry.name;
        return result;
    }

    std::ifstream in(archive_path, std::ios::binary);
    if (!in) {
        result.error = "failed to open archive: " + archive_path;
        return result;
    }

    unsigned char local[ZIP_LOCAL_HEADER_SIZE];
    if (!read_at(in, entry.local_header_offset, local, sizeof(local)) ||
        le32(local) != ZIP_LOCAL_HEADER_SIG) {
        result.error = "corrupt local header for " + entry.name + " in " + archive_path;
        return result;
    }

    uint64_t data_offset = entry.local_header_offset + ZIP_LOCAL_HEADER_SIZE +
                           le16(local + 26) + le16(local + 28);
    in.clear();
    in.seekg(static_cast<std::streamoff>(data_offset));
    if (!in) {
        result.error = "failed to seek to data of " + entry.name;
        return result;
    }

    std::vector<unsigned char> input(READ_CHUNK);
    std::vector<unsigned char> output(READ_CHUNK);
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t remaining = entry.compressed_size;
    uint64_t produced = 0;

    auto deliver = [&](const unsigned char* data, size_t len) {
        if (len == 0) return true;
        crc = crc32(crc, data, static_cast<uInt>(len));
        produced += len;
        return sink(data, len);
    };

    if (entry.method == static_cast<uint16_t>(ZipMethod::Store)) {
        while (remaining > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, input.size()));
            in.read(reinterpret_cast<char*>(input.data()), static_cast<std::streamsize>(want));
            if (static_cast<size_t>(in.gcount()) != want) {
                result.error = "truncated data for " + entry.name + " in " + archive_path;
                return result;
            }
            if (!deliver(input.data(), want)) {
                result.error = "output rejected while reading " + entry.name;
                return result;
            }
            remaining -= want;
        }
    } else {
        Inflater inflater;
        if (!inflater) {
            result.error = "inflateInit2 failed";
            return result;
        }
        z_stream* strm = inflater.get();

        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            if (strm->avail_in == 0 && remaining > 0) {
                size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, input.size()));
                in.read(reinterpret_cast<char*>(input.data()), static_cast<std::streamsize>(want));
                if (static_cast<size_t>(in.gcount()) != want) {
                    result.error = "truncated data for " + entry.name + " in " + archive_path;
                    return result;
                }
                remaining -= want;
                strm->next_in = input.data();
                strm->avail_in = static_cast<uInt>(want);
            }

            strm->next_out = output.data();
            strm->avail_out = static_cast<uInt>(output.size());
            ret = inflate(strm, Z_NO_FLUSH);
            if (ret == Z_BUF_ERROR) {
                // No progress possible and no compressed bytes left
                result.error = "truncated deflate stream for " + entry.name;
                return result;
            }
            if (ret != Z_OK && ret != Z_STREAM_END) {
                result.error = "corrupt deflate data for " + entry.name + " in " + archive_path;
                return result;
            }
            if (!deliver(output.data(), output.size() - strm->avail_out)) {
                result.error = "output rejected while reading " + entry.name;
                return result;
            }
        }
    }

    if (produced != entry.uncompressed_size) {
        result.error = "size mismatch for " + entry.name + ": expected " +
                       std::to_string(entry.uncompressed_size) + ", got " + std::to_string(produced);
        return result;
    }
    if (static_cast<uint32_t>(crc) != entry.crc32) {
        result.error = "CRC-32 mismatch for " + entry.name + " in " + archive_path;
        return result;
    }

    result.bytes = produced;
    result.ok = true;
    return result;
}

ZipReadResult extract_zip_entry(const std::string& archive_path,
                                const ZipEntry& entry,
                                const std::string& dest_path) {
    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        ZipReadResult result;
        result.error = "failed to create file: " + dest_path;
        return result;
    }

    auto result = read_zip_entry(archive_path, entry,
        [&out](const unsigned char* data, size_t len) {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
            return static_cast<bool>(out);
        });

    out.close();
    if (result.ok && out.fail()) {
        result.ok = false;
        result.error = "failed to write file: " + dest_path;
    }
    if (!result.ok) {
        remove_file(dest_path);
    }
    return result;
}

} // namespace binwheel
