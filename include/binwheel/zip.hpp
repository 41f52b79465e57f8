#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// Zip Reading
// ============================================================================

// Compression methods understood by the reader and writer
enum class ZipMethod : std::uint16_t {
    Store = 0,
    Deflate = 8
};

// One central-directory record
struct ZipEntry {
    std::string name;
    std::uint16_t version_made_by = 0;
    std::uint16_t flags = 0;
    std::uint16_t method = 0;
    std::uint32_t crc32 = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t local_header_offset = 0;
    std::uint32_t external_attributes = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }

    // st_mode stored by Unix writers in the high half of the external attributes
    std::uint32_t unix_mode() const { return external_attributes >> 16; }
};

struct ZipListResult {
    bool ok = false;
    std::string error;
    std::vector<ZipEntry> entries;  // Central directory order
};

// List entries in central-directory order (zip64 aware)
ZipListResult list_zip_entries(const std::string& archive_path);

// Receives decompressed bytes; return false to abort the read
using ZipDataSink = std::function<bool(const unsigned char* data, std::size_t len)>;

struct ZipReadResult {
    bool ok = false;
    std::string error;
    std::uint64_t bytes = 0;
};

// Decompress one entry into `sink`, checking its CRC-32 and size
ZipReadResult read_zip_entry(const std::string& archive_path,
                             const ZipEntry& entry,
                             const ZipDataSink& sink);

// Decompress one entry into a file at `dest_path`
ZipReadResult extract_zip_entry(const std::string& archive_path,
                                const ZipEntry& entry,
                                const std::string& dest_path);

// ============================================================================
// Deterministic Zip Writing
// ============================================================================

// MS-DOS date/time pair as stored in zip headers
struct DosTimestamp {
    std::uint16_t time = 0;
    std::uint16_t date = (1 << 5) | 1;  // 1980-01-01
};

// Convert a Unix timestamp (UTC) to DOS form, clamped to the zip epoch
DosTimestamp dos_timestamp_from_unix(std::int64_t seconds);

struct ZipWriteOptions {
    ZipMethod method = ZipMethod::Deflate;
    int level = -1;             // zlib level, -1 = Z_DEFAULT_COMPRESSION
    DosTimestamp timestamp;     // Applied to every entry
};

// Writes entries in exactly the order they are added. Every entry gets the
// same timestamp, so identical inputs yield byte-identical archives.
class ZipWriter {
public:
    explicit ZipWriter(const std::string& path, ZipWriteOptions options = {});
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

    // Add a file from disk under `name`. `mode` holds Unix permission bits.
    bool add_file(const std::string& name, const std::string& source_path, std::uint32_t mode);

    // Add in-memory content under `name`
    bool add_bytes(const std::string& name, const std::string& data, std::uint32_t mode);

    // Write the central directory and close the file
    bool close();

    std::size_t entry_count() const { return entries_.size(); }

private:
    using ChunkSource = std::function<bool(std::vector<unsigned char>& chunk, bool& eof)>;

    bool add_entry(const std::string& name, std::uint32_t mode, const ChunkSource& source);
    bool fail(const std::string& message);

    std::string path_;
    ZipWriteOptions options_;
    std::ofstream out_;
    std::vector<ZipEntry> entries_;
    bool closed_ = false;
    std::string error_;
};

} // namespace binwheel
