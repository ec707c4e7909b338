#ifndef PREMIUM_IO_ZIP_ARCHIVE_HPP
#define PREMIUM_IO_ZIP_ARCHIVE_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace premium {
namespace io {

class ZipError : public std::runtime_error {
public:
    explicit ZipError(const std::string& message)
        : std::runtime_error(message) {}
};

// Entry of the zip central directory
struct ZipEntry {
    std::string name;
    uint16_t method;             // 0 = stored, 8 = deflate
    uint16_t flags;
    uint32_t crc32;
    uint32_t compressed_size;
    uint32_t uncompressed_size;
    uint32_t local_header_offset;
};

// Read-only zip archive held in memory. Supports the stored and deflate
// methods used by Office Open XML packages; ZIP64 archives and encrypted
// entries are rejected.
class ZipArchive {
public:
    static constexpr uint16_t METHOD_STORED = 0;
    static constexpr uint16_t METHOD_DEFLATE = 8;

    explicit ZipArchive(std::vector<uint8_t> data);

    static ZipArchive open(const std::string& filepath);

    bool contains(const std::string& name) const;
    const ZipEntry& entry(const std::string& name) const;

    // Decompressed contents, CRC-32 checked. Throws ZipError.
    std::string read(const std::string& name) const;

private:
    std::vector<uint8_t> data_;
    std::map<std::string, ZipEntry> entries_;

    void read_central_directory();
    size_t find_end_of_central_directory() const;
    uint16_t read_u16(size_t offset) const;
    uint32_t read_u32(size_t offset) const;
    void require(size_t offset, size_t length, const char* what) const;
};

} // namespace io
} // namespace premium

#endif // PREMIUM_IO_ZIP_ARCHIVE_HPP
