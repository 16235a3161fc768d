#pragma once

/**
 * @file husk_zip.hpp
 * @brief Minimal ZIP reader/writer for application packages (zlib backed)
 */

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace husk {

/**
 * @brief Malformed or unsupported archive
 */
class ZipError : public std::runtime_error {
public:
    explicit ZipError(const std::string& what) : std::runtime_error(what) {}
};

constexpr uint16_t ZIP_STORED = 0;
constexpr uint16_t ZIP_DEFLATED = 8;

/**
 * @brief Central directory record of one archive member
 */
struct ZipEntry {
    std::string name;
    uint16_t method = ZIP_STORED;
    uint16_t flags = 0;
    uint16_t mod_time = 0;
    uint16_t mod_date = 0x0021;  // 1980-01-01
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
    uint32_t external_attributes = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/**
 * @brief Read-only view over a ZIP archive
 *
 * The archive is either owned in memory or memory-mapped from disk.
 */
class ZipReader {
public:
    explicit ZipReader(std::vector<uint8_t> archive);

    /**
     * @brief Map an archive file read-only
     * @throws ZipError if the file cannot be opened or parsed
     */
    static ZipReader open(const std::string& path);

    ZipReader(ZipReader&&) noexcept;
    ZipReader& operator=(ZipReader&&) noexcept;
    ~ZipReader();

    const std::vector<ZipEntry>& entries() const { return entries_; }
    const ZipEntry* find(std::string_view name) const;

    /**
     * @brief Inflate an entry and verify its CRC-32
     */
    std::vector<uint8_t> read(const ZipEntry& entry) const;

    /**
     * @brief Compressed bytes of an entry exactly as stored
     */
    std::span<const uint8_t> raw(const ZipEntry& entry) const;

private:
    class Mapping;

    ZipReader(std::unique_ptr<Mapping> mapping);
    void parse();

    std::unique_ptr<Mapping> mapping_;
    std::vector<uint8_t> owned_;
    std::span<const uint8_t> data_;
    std::vector<ZipEntry> entries_;
};

/**
 * @brief Sequential archive writer with deterministic output
 *
 * Entries written with add() get a fixed timestamp. Stored entries can be
 * aligned by padding the local header extra field, as zipalign does.
 */
class ZipWriter {
public:
    /**
     * @brief Add a file, compressing it when method is ZIP_DEFLATED
     * @param alignment Data alignment for stored entries (0 = none)
     */
    void add(const std::string& name, std::span<const uint8_t> data,
             uint16_t method = ZIP_DEFLATED, uint32_t alignment = 0);

    /**
     * @brief Copy an entry from another archive without recompressing it
     */
    void add_raw(const ZipEntry& entry, std::span<const uint8_t> compressed,
                 uint32_t alignment = 0);

    void add_directory(const std::string& name);

    bool contains(std::string_view name) const;
    size_t count() const { return central_.size(); }

    /**
     * @brief Append the central directory and return the archive bytes
     */
    std::vector<uint8_t> finish();

private:
    void write_entry(ZipEntry entry, std::span<const uint8_t> compressed, uint32_t alignment);

    std::vector<uint8_t> out_;
    std::vector<ZipEntry> central_;
    bool finished_ = false;
};

/**
 * @brief Raw DEFLATE helpers
 */
std::vector<uint8_t> deflate_raw(std::span<const uint8_t> data);
std::vector<uint8_t> inflate_raw(std::span<const uint8_t> data, size_t expected_size);

uint32_t crc32_of(std::span<const uint8_t> data);

} // namespace husk
