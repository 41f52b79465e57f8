#include "binwheel/zip.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>

#include <zlib.h>

namespace binwheel {

static constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
static constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;

static constexpr uint16_t ZIP_VERSION_NEEDED = 20;                    // 2.0: deflate
static constexpr uint16_t ZIP_VERSION_MADE_BY = (3 << 8) | 20;        // Unix, 2.0
static constexpr uint16_t ZIP_FLAG_UTF8 = 0x0800;
static constexpr uint32_t UNIX_REGULAR_FILE = 0100000;

static constexpr size_t WRITE_CHUNK = 64 * 1024;

namespace {

void put16(std::string& buf, uint16_t v) {
    buf.push_back(static_cast<char>(v & 0xff));
    buf.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put32(std::string& buf, uint32_t v) {
    put16(buf, static_cast<uint16_t>(v & 0xffff));
    put16(buf, static_cast<uint16_t>((v >> 16) & 0xffff));
}

bool is_ascii(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0x80) == 0;
    });
}

// RAII wrapper for a raw deflate stream
class Deflater {
public:
    explicit Deflater(int level) {
        std::memset(&strm_, 0, sizeof(strm_));
        initialized_ = deflateInit2(&strm_, level, Z_DEFLATED, -MAX_WBITS, 8,
                                    Z_DEFAULT_STRATEGY) == Z_OK;
    }
    ~Deflater() { if (initialized_) deflateEnd(&strm_); }

    Deflater(const Deflater&) = delete;
    Deflater& operator=(const Deflater&) = delete;

    z_stream* get() { return &strm_; }
    explicit operator bool() const { return initialized_; }

private:
    z_stream strm_;
    bool initialized_ = false;
};

} // namespace

DosTimestamp dos_timestamp_from_unix(std::int64_t seconds) {
    DosTimestamp stamp;
    if (seconds < 315532800) {  // 1980-01-01T00:00:00Z
        return stamp;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif

    int year = tm_buf.tm_year + 1900;
    if (year > 2107) {
        stamp.date = static_cast<uint16_t>((127 << 9) | (12 << 5) | 31);
        stamp.time = static_cast<uint16_t>((23 << 11) | (59 << 5) | 29);
        return stamp;
    }

    stamp.date = static_cast<uint16_t>(((year - 1980) << 9) | ((tm_buf.tm_mon + 1) << 5) | tm_buf.tm_mday);
    stamp.time = static_cast<uint16_t>((tm_buf.tm_hour << 11) | (tm_buf.tm_min << 5) | (tm_buf.tm_sec / 2));
    return stamp;
}

// ============================================================================
// ZipWriter
// ============================================================================

ZipWriter::ZipWriter(const std::string& path, ZipWriteOptions options)
    : path_(path), options_(options), out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_) {
        error_ = "failed to create archive: " + path;
    }
}

ZipWriter::~ZipWriter() = default;

bool ZipWriter::fail(const std::string& message) {
    if (error_.empty()) {
        error_ = message;
    }
    return false;
}

bool ZipWriter::add_file(const std::string& name, const std::string& source_path, std::uint32_t mode) {
    std::ifstream in(source_path, std::ios::binary);
    if (!in) {
        return fail("failed to open " + source_path);
    }

    return add_entry(name, mode, [&in, &source_path, this](std::vector<unsigned char>& chunk, bool& eof) {
        chunk.resize(WRITE_CHUNK);
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (in.bad()) {
            return fail("failed to read " + source_path);
        }
        chunk.resize(static_cast<size_t>(in.gcount()));
        eof = in.eof();
        return true;
    });
}

bool ZipWriter::add_bytes(const std::string& name, const std::string& data, std::uint32_t mode) {
    return add_entry(name, mode, [&data](std::vector<unsigned char>& chunk, bool& eof) {
        chunk.assign(data.begin(), data.end());
        eof = true;
        return true;
    });
}

bool ZipWriter::add_entry(const std::string& name, std::uint32_t mode, const ChunkSource& source) {
    if (!ok()) return false;
    if (closed_) return fail("archive already closed: " + path_);

    if (name.empty() || name.front() == '/') {
        return fail("invalid archive member name: '" + name + "'");
    }
    if (name.find('\\') != std::string::npos) {
        return fail("archive member names must use '/' separators: " + name);
    }
    if (name.size() > 0xFFFF) {
        return fail("archive member name too long: " + name);
    }
    if (entries_.size() >= 0xFFFF) {
        return fail("too many entries for a non-zip64 archive: " + path_);
    }

    auto start = out_.tellp();
    if (start < 0 || static_cast<uint64_t>(start) > 0xFFFFFFFFu) {
        return fail("archive exceeds 4 GiB (zip64 output is not supported): " + path_);
    }

    ZipEntry entry;
    entry.name = name;
    entry.version_made_by = ZIP_VERSION_MADE_BY;
    entry.flags = is_ascii(name) ? 0 : ZIP_FLAG_UTF8;
    entry.method = static_cast<uint16_t>(options_.method);
    entry.local_header_offset = static_cast<uint64_t>(start);
    entry.external_attributes = (UNIX_REGULAR_FILE | (mode & 07777)) << 16;

    // Local header with CRC and sizes patched in once the data is written
    std::string header;
    put32(header, ZIP_LOCAL_HEADER_SIG);
    put16(header, ZIP_VERSION_NEEDED);
    put16(header, entry.flags);
    put16(header, entry.method);
    put16(header, options_.timestamp.time);
    put16(header, options_.timestamp.date);
    put32(header, 0);
    put32(header, 0);
    put32(header, 0);
    put16(header, static_cast<uint16_t>(name.size()));
    put16(header, 0);
    header += name;
    out_.write(header.data(), static_cast<std::streamsize>(header.size()));

    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t compressed = 0;
    uint64_t uncompressed = 0;
    std::vector<unsigned char> chunk;
    std::vector<unsigned char> output(WRITE_CHUNK);

    if (options_.method == ZipMethod::Store) {
        bool eof = false;
        while (!eof) {
            if (!source(chunk, eof)) return false;
            crc = crc32(crc, chunk.data(), static_cast<uInt>(chunk.size()));
            uncompressed += chunk.size();
            compressed += chunk.size();
            out_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        }
    } else {
        Deflater deflater(options_.level);
        if (!deflater) {
            return fail("deflateInit2 failed");
        }
        z_stream* strm = deflater.get();

        bool eof = false;
        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            if (!source(chunk, eof)) return false;
            crc = crc32(crc, chunk.data(), static_cast<uInt>(chunk.size()));
            uncompressed += chunk.size();

            strm->next_in = chunk.data();
            strm->avail_in = static_cast<uInt>(chunk.size());
            int flush = eof ? Z_FINISH : Z_NO_FLUSH;

            do {
                strm->next_out = output.data();
                strm->avail_out = static_cast<uInt>(output.size());
                ret = deflate(strm, flush);
                if (ret == Z_STREAM_ERROR) {
                    return fail("deflate failed for " + name);
                }
                size_t have = output.size() - strm->avail_out;
                compressed += have;
                out_.write(reinterpret_cast<const char*>(output.data()), static_cast<std::streamsize>(have));
            } while (strm->avail_out == 0);
        }
    }

    if (!out_) {
        return fail("failed to write archive: " + path_);
    }
    if (compressed > 0xFFFFFFFFu || uncompressed > 0xFFFFFFFFu) {
        return fail("entry exceeds 4 GiB (zip64 output is not supported): " + name);
    }

    entry.crc32 = static_cast<uint32_t>(crc);
    entry.compressed_size = compressed;
    entry.uncompressed_size = uncompressed;

    std::string sizes;
    put32(sizes, entry.crc32);
    put32(sizes, static_cast<uint32_t>(compressed));
    put32(sizes, static_cast<uint32_t>(uncompressed));

    auto end = out_.tellp();
    out_.seekp(start + static_cast<std::streamoff>(14));
    out_.write(sizes.data(), static_cast<std::streamsize>(sizes.size()));
    out_.seekp(end);
    if (!out_) {
        return fail("failed to finalize entry " + name + " in " + path_);
    }

    entries_.push_back(std::move(entry));
    return true;
}

bool ZipWriter::close() {
    if (!ok()) return false;
    if (closed_) return true;

    auto cd_start = out_.tellp();
    if (cd_start < 0 || static_cast<uint64_t>(cd_start) > 0xFFFFFFFFu) {
        return fail("archive exceeds 4 GiB (zip64 output is not supported): " + path_);
    }

    std::string cd;
    for (const auto& entry : entries_) {
        put32(cd, ZIP_CENTRAL_HEADER_SIG);
        put16(cd, entry.version_made_by);
        put16(cd, ZIP_VERSION_NEEDED);
        put16(cd, entry.flags);
        put16(cd, entry.method);
        put16(cd, options_.timestamp.time);
        put16(cd, options_.timestamp.date);
        put32(cd, entry.crc32);
        put32(cd, static_cast<uint32_t>(entry.compressed_size));
        put32(cd, static_cast<uint32_t>(entry.uncompressed_size));
        put16(cd, static_cast<uint16_t>(entry.name.size()));
        put16(cd, 0);   // extra
        put16(cd, 0);   // comment
        put16(cd, 0);   // disk number
        put16(cd, 0);   // internal attributes
        put32(cd, entry.external_attributes);
        put32(cd, static_cast<uint32_t>(entry.local_header_offset));
        cd += entry.name;
    }

    if (cd.size() > 0xFFFFFFFFu) {
        return fail("central directory too large: " + path_);
    }

    std::string eocd;
    put32(eocd, ZIP_EOCD_SIG);
    put16(eocd, 0);
    put16(eocd, 0);
    put16(eocd, static_cast<uint16_t>(entries_.size()));
    put16(eocd, static_cast<uint16_t>(entries_.size()));
    put32(eocd, static_cast<uint32_t>(cd.size()));
    put32(eocd, static_cast<uint32_t>(cd_start));
    put16(eocd, 0);

    out_.write(cd.data(), static_cast<std::streamsize>(cd.size()));
    out_.write(eocd.data(), static_cast<std::streamsize>(eocd.size()));
    out_.close();
    closed_ = true;

    if (out_.fail()) {
        return fail("failed to write archive: " + path_);
    }
    return true;
}

} // namespace binwheel
