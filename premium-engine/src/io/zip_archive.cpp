#include "zip_archive.hpp"
#include <zlib.h>
#include <fstream>
#include <iterator>
#include <limits>

namespace premium {
namespace io {

namespace {

constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;

constexpr size_t EOCD_SIZE = 22;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr uint16_t FLAG_ENCRYPTED = 0x0001;

// Owns an initialised inflate stream
class InflateStream {
public:
    InflateStream() : stream_() {
        if (inflateInit2(&stream_, -MAX_WBITS) != Z_OK) {
            throw ZipError("Failed to initialise zlib inflate");
        }
    }

    ~InflateStream() { inflateEnd(&stream_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &stream_; }

private:
    z_stream stream_;
};

std::string inflate_raw(const uint8_t* src, size_t src_size, size_t expected_size,
                        const std::string& name) {
    if (expected_size == 0) {
        return std::string();
    }
    if (src_size > std::numeric_limits<uInt>::max() ||
        expected_size > std::numeric_limits<uInt>::max()) {
        throw ZipError("Entry too large: " + name);
    }

    std::string out(expected_size, '\0');

    InflateStream inflater;
    z_stream* zs = inflater.get();
    zs->next_in = const_cast<Bytef*>(src);
    zs->avail_in = static_cast<uInt>(src_size);
    zs->next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs->avail_out = static_cast<uInt>(expected_size);

    int rc = inflate(zs, Z_FINISH);
    if (rc != Z_STREAM_END) {
        std::string detail = zs->msg ? zs->msg : ("zlib error " + std::to_string(rc));
        throw ZipError("Failed to inflate " + name + ": " + detail);
    }
    if (zs->total_out != expected_size) {
        throw ZipError("Size mismatch after inflating " + name);
    }
    return out;
}

} // anonymous namespace

ZipArchive::ZipArchive(std::vector<uint8_t> data)
    : data_(std::move(data)) {
    read_central_directory();
}

ZipArchive ZipArchive::open(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw ZipError("Cannot open archive: " + filepath);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ZipError("Failed to read archive: " + filepath);
    }

    try {
        return ZipArchive(std::move(data));
    } catch (const ZipError& e) {
        throw ZipError(filepath + ": " + e.what());
    }
}

bool ZipArchive::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

const ZipEntry& ZipArchive::entry(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw ZipError("No such entry: " + name);
    }
    return it->second;
}

std::string ZipArchive::read(const std::string& name) const {
    const ZipEntry& e = entry(name);

    if (e.flags & FLAG_ENCRYPTED) {
        throw ZipError("Encrypted entries are not supported: " + name);
    }

    size_t header = e.local_header_offset;
    require(header, LOCAL_HEADER_SIZE, "local header");
    if (read_u32(header) != LOCAL_HEADER_SIGNATURE) {
        throw ZipError("Bad local header signature for " + name);
    }

    size_t data_offset = header + LOCAL_HEADER_SIZE + read_u16(header + 26) + read_u16(header + 28);
    require(data_offset, e.compressed_size, "entry data");
    const uint8_t* src = data_.data() + data_offset;

    std::string contents;
    if (e.method == METHOD_STORED) {
        if (e.compressed_size != e.uncompressed_size) {
            throw ZipError("Size mismatch for stored entry " + name);
        }
        contents.assign(reinterpret_cast<const char*>(src), e.compressed_size);
    } else if (e.method == METHOD_DEFLATE) {
        contents = inflate_raw(src, e.compressed_size, e.uncompressed_size, name);
    } else {
        throw ZipError("Unsupported compression method " + std::to_string(e.method) +
                       " for " + name);
    }

    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(contents.data()),
                  static_cast<uInt>(contents.size()));
    if (static_cast<uint32_t>(crc) != e.crc32) {
        throw ZipError("CRC mismatch for " + name);
    }

    return contents;
}

void ZipArchive::read_central_directory() {
    size_t eocd = find_end_of_central_directory();

    uint16_t entry_count = read_u16(eocd + 10);
    uint32_t directory_size = read_u32(eocd + 12);
    uint32_t directory_offset = read_u32(eocd + 16);

    if (entry_count == 0xFFFF || directory_offset == 0xFFFFFFFF) {
        throw ZipError("ZIP64 archives are not supported");
    }
    require(directory_offset, directory_size, "central directory");

    size_t pos = directory_offset;
    for (uint16_t i = 0; i < entry_count; ++i) {
        require(pos, CENTRAL_HEADER_SIZE, "central directory header");
        if (read_u32(pos) != CENTRAL_HEADER_SIGNATURE) {
            throw ZipError("Bad central directory signature");
        }

        ZipEntry e;
        e.flags = read_u16(pos + 8);
        e.method = read_u16(pos + 10);
        e.crc32 = read_u32(pos + 16);
        e.compressed_size = read_u32(pos + 20);
        e.uncompressed_size = read_u32(pos + 24);
        uint16_t name_length = read_u16(pos + 28);
        uint16_t extra_length = read_u16(pos + 30);
        uint16_t comment_length = read_u16(pos + 32);
        e.local_header_offset = read_u32(pos + 42);

        require(pos + CENTRAL_HEADER_SIZE, name_length, "entry name");
        e.name.assign(reinterpret_cast<const char*>(data_.data() + pos + CENTRAL_HEADER_SIZE),
                      name_length);

        entries_[e.name] = e;
        pos += CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
    }
}

size_t ZipArchive::find_end_of_central_directory() const {
    if (data_.size() < EOCD_SIZE) {
        throw ZipError("Not a zip archive (too small)");
    }

    size_t last = data_.size() - EOCD_SIZE;
    size_t first = last > MAX_COMMENT_SIZE ? last - MAX_COMMENT_SIZE : 0;

    for (size_t pos = last + 1; pos-- > first;) {
        if (read_u32(pos) == EOCD_SIGNATURE) {
            return pos;
        }
    }
    throw ZipError("Not a zip archive (end of central directory not found)");
}

uint16_t ZipArchive::read_u16(size_t offset) const {
    require(offset, 2, "field");
    return static_cast<uint16_t>(data_[offset] | (data_[offset + 1] << 8));
}

uint32_t ZipArchive::read_u32(size_t offset) const {
    require(offset, 4, "field");
    return static_cast<uint32_t>(data_[offset]) |
           (static_cast<uint32_t>(data_[offset + 1]) << 8) |
           (static_cast<uint32_t>(data_[offset + 2]) << 16) |
           (static_cast<uint32_t>(data_[offset + 3]) << 24);
}

void ZipArchive::require(size_t offset, size_t length, const char* what) const {
    if (offset > data_.size() || length > data_.size() - offset) {
        throw ZipError(std::string("Truncated archive: ") + what + " out of bounds");
    }
}

} // namespace io
} // namespace premium
