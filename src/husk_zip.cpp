/**
 * @file husk_zip.cpp
 * @brief ZIP container codec used to unpack and re-assemble packages
 */

#include "../include/husk_zip.hpp"
#include "../include/husk_bytes.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <limits>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace husk {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t END_OF_CENTRAL_SIZE = 22;
constexpr uint16_t ALIGNMENT_EXTRA_ID = 0xD935;
constexpr uint16_t FLAG_UTF8 = 0x0800;

bool is_unsafe_name(const std::string& name) {
    if (!name.empty() && name[0] == '/') return true;
    if (name == ".." || name.rfind("../", 0) == 0) return true;
    if (name.find("/../") != std::string::npos) return true;
    return name.size() >= 3 && name.compare(name.size() - 3, 3, "/..") == 0;
}

} // namespace

// Read-only memory mapping of an archive on disk
class ZipReader::Mapping {
public:
    explicit Mapping(const std::string& path) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            throw ZipError("Failed to open archive: " + path);
        }

        struct stat st;
        if (fstat(fd, &st) != 0 || st.st_size <= 0) {
            ::close(fd);
            throw ZipError("Archive is empty or unreadable: " + path);
        }

        size_ = static_cast<size_t>(st.st_size);
        void* addr = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        ::close(fd);
        if (addr == MAP_FAILED) {
            throw ZipError("Failed to map archive: " + path);
        }
        addr_ = static_cast<const uint8_t*>(addr);
    }

    ~Mapping() {
        munmap(const_cast<uint8_t*>(addr_), size_);
    }

    Mapping(const Mapping&) = delete;
    Mapping& operator=(const Mapping&) = delete;

    std::span<const uint8_t> bytes() const { return {addr_, size_}; }

private:
    const uint8_t* addr_ = nullptr;
    size_t size_ = 0;
};

ZipReader::ZipReader(std::vector<uint8_t> archive)
    : owned_(std::move(archive)) {
    data_ = owned_;
    parse();
}

ZipReader::ZipReader(std::unique_ptr<Mapping> mapping)
    : mapping_(std::move(mapping)) {
    data_ = mapping_->bytes();
    parse();
}

ZipReader::ZipReader(ZipReader&&) noexcept = default;
ZipReader& ZipReader::operator=(ZipReader&&) noexcept = default;
ZipReader::~ZipReader() = default;

ZipReader ZipReader::open(const std::string& path) {
    return ZipReader(std::make_unique<Mapping>(path));
}

void ZipReader::parse() {
    if (data_.size() < END_OF_CENTRAL_SIZE) {
        throw ZipError("Archive too small");
    }

    // End of central directory sits within the last 64 KiB + record size
    size_t search_floor = data_.size() > END_OF_CENTRAL_SIZE + 0xFFFF
        ? data_.size() - END_OF_CENTRAL_SIZE - 0xFFFF
        : 0;
    size_t eocd = std::numeric_limits<size_t>::max();
    for (size_t pos = data_.size() - END_OF_CENTRAL_SIZE + 1; pos-- > search_floor;) {
        if (ByteReader(data_, pos).u32() == END_OF_CENTRAL_SIG) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::numeric_limits<size_t>::max()) {
        throw ZipError("End of central directory not found");
    }

    try {
        ByteReader r(data_, eocd + 4);
        uint16_t disk = r.u16();
        uint16_t cd_disk = r.u16();
        r.u16();  // entries on this disk
        uint16_t total = r.u16();
        uint32_t cd_size = r.u32();
        uint32_t cd_offset = r.u32();

        if (disk != 0 || cd_disk != 0) {
            throw ZipError("Multi-disk archives are not supported");
        }
        if (total == 0xFFFF || cd_offset == 0xFFFFFFFF || cd_size == 0xFFFFFFFF) {
            throw ZipError("ZIP64 archives are not supported");
        }
        if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
            throw ZipError("Central directory overlaps end record");
        }

        ByteReader cd(data_, cd_offset);
        entries_.reserve(total);
        for (uint16_t i = 0; i < total; ++i) {
            if (cd.u32() != CENTRAL_HEADER_SIG) {
                throw ZipError("Bad central directory signature at entry " + std::to_string(i));
            }
            ZipEntry entry;
            cd.u16();  // version made by
            cd.u16();  // version needed
            entry.flags = cd.u16();
            entry.method = cd.u16();
            entry.mod_time = cd.u16();
            entry.mod_date = cd.u16();
            entry.crc32 = cd.u32();
            entry.compressed_size = cd.u32();
            entry.uncompressed_size = cd.u32();
            uint16_t name_len = cd.u16();
            uint16_t extra_len = cd.u16();
            uint16_t comment_len = cd.u16();
            cd.u16();  // disk number start
            cd.u16();  // internal attributes
            entry.external_attributes = cd.u32();
            entry.local_header_offset = cd.u32();
            entry.name = cd.str(name_len);
            cd.skip(extra_len);
            cd.skip(comment_len);

            if (is_unsafe_name(entry.name)) {
                throw ZipError("Unsafe entry name: " + entry.name);
            }
            entries_.push_back(std::move(entry));
        }
    } catch (const TruncatedInput& e) {
        throw ZipError(std::string("Truncated central directory: ") + e.what());
    }
}

const ZipEntry* ZipReader::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::span<const uint8_t> ZipReader::raw(const ZipEntry& entry) const {
    try {
        ByteReader r(data_, entry.local_header_offset);
        if (r.u32() != LOCAL_HEADER_SIG) {
            throw ZipError("Bad local header signature for " + entry.name);
        }
        r.skip(LOCAL_HEADER_SIZE - 4 - 4);
        uint16_t name_len = r.u16();
        uint16_t extra_len = r.u16();
        r.skip(name_len);
        r.skip(extra_len);
        return r.bytes(entry.compressed_size);
    } catch (const TruncatedInput&) {
        throw ZipError("Entry data out of bounds: " + entry.name);
    }
}

std::vector<uint8_t> ZipReader::read(const ZipEntry& entry) const {
    auto compressed = raw(entry);

    std::vector<uint8_t> data;
    switch (entry.method) {
        case ZIP_STORED:
            data.assign(compressed.begin(), compressed.end());
            break;
        case ZIP_DEFLATED:
            data = inflate_raw(compressed, entry.uncompressed_size);
            break;
        default:
            throw ZipError("Unsupported compression method " + std::to_string(entry.method) +
                           " for " + entry.name);
    }

    if (data.size() != entry.uncompressed_size) {
        throw ZipError("Size mismatch for " + entry.name);
    }
    if (crc32_of(data) != entry.crc32) {
        throw ZipError("CRC mismatch for " + entry.name);
    }
    return data;
}

void ZipWriter::add(const std::string& name, std::span<const uint8_t> data,
                    uint16_t method, uint32_t alignment) {
    ZipEntry entry;
    entry.name = name;
    entry.method = method;
    entry.crc32 = crc32_of(data);
    entry.uncompressed_size = data.size();

    if (method == ZIP_DEFLATED) {
        auto compressed = deflate_raw(data);
        entry.compressed_size = compressed.size();
        write_entry(std::move(entry), compressed, 0);
    } else if (method == ZIP_STORED) {
        entry.compressed_size = data.size();
        write_entry(std::move(entry), data, alignment);
    } else {
        throw ZipError("Unsupported compression method " + std::to_string(method));
    }
}

void ZipWriter::add_raw(const ZipEntry& entry, std::span<const uint8_t> compressed,
                        uint32_t alignment) {
    if (compressed.size() != entry.compressed_size) {
        throw ZipError("Raw copy size mismatch for " + entry.name);
    }
    write_entry(entry, compressed, entry.method == ZIP_STORED ? alignment : 0);
}

void ZipWriter::add_directory(const std::string& name) {
    ZipEntry entry;
    entry.name = name.empty() || name.back() == '/' ? name : name + "/";
    entry.external_attributes = 0x10;
    write_entry(std::move(entry), {}, 0);
}

bool ZipWriter::contains(std::string_view name) const {
    return std::any_of(central_.begin(), central_.end(),
                       [&](const ZipEntry& e) { return e.name == name; });
}

void ZipWriter::write_entry(ZipEntry entry, std::span<const uint8_t> compressed, uint32_t alignment) {
    if (finished_) {
        throw ZipError("Archive already finished");
    }
    if (contains(entry.name)) {
        throw ZipError("Duplicate entry: " + entry.name);
    }
    if (out_.size() > 0xFFFFFFFFull || entry.compressed_size > 0xFFFFFFFFull ||
        entry.uncompressed_size > 0xFFFFFFFFull) {
        throw ZipError("Entry requires ZIP64: " + entry.name);
    }

    entry.flags &= FLAG_UTF8;
    entry.local_header_offset = out_.size();

    std::vector<uint8_t> extra;
    if (alignment > 1) {
        size_t base = out_.size() + LOCAL_HEADER_SIZE + entry.name.size() + 6;
        size_t pad = (alignment - base % alignment) % alignment;
        ByteWriter x(extra);
        x.u16(ALIGNMENT_EXTRA_ID);
        x.u16(static_cast<uint16_t>(2 + pad));
        x.u16(static_cast<uint16_t>(alignment));
        x.zeros(pad);
    }

    ByteWriter w(out_);
    w.u32(LOCAL_HEADER_SIG);
    w.u16(20);
    w.u16(entry.flags);
    w.u16(entry.method);
    w.u16(entry.mod_time);
    w.u16(entry.mod_date);
    w.u32(entry.crc32);
    w.u32(static_cast<uint32_t>(entry.compressed_size));
    w.u32(static_cast<uint32_t>(entry.uncompressed_size));
    w.u16(static_cast<uint16_t>(entry.name.size()));
    w.u16(static_cast<uint16_t>(extra.size()));
    w.str(entry.name);
    w.bytes(extra);
    w.bytes(compressed);

    central_.push_back(std::move(entry));
}

std::vector<uint8_t> ZipWriter::finish() {
    if (finished_) {
        throw ZipError("Archive already finished");
    }
    finished_ = true;

    size_t cd_offset = out_.size();
    ByteWriter w(out_);
    for (const auto& entry : central_) {
        w.u32(CENTRAL_HEADER_SIG);
        w.u16(20);  // version made by
        w.u16(20);  // version needed
        w.u16(entry.flags);
        w.u16(entry.method);
        w.u16(entry.mod_time);
        w.u16(entry.mod_date);
        w.u32(entry.crc32);
        w.u32(static_cast<uint32_t>(entry.compressed_size));
        w.u32(static_cast<uint32_t>(entry.uncompressed_size));
        w.u16(static_cast<uint16_t>(entry.name.size()));
        w.u16(0);  // extra
        w.u16(0);  // comment
        w.u16(0);  // disk
        w.u16(0);  // internal attributes
        w.u32(entry.external_attributes);
        w.u32(static_cast<uint32_t>(entry.local_header_offset));
        w.str(entry.name);
    }
    size_t cd_size = out_.size() - cd_offset;

    if (central_.size() >= 0xFFFF || out_.size() > 0xFFFFFFFFull) {
        throw ZipError("Archive requires ZIP64");
    }

    w.u32(END_OF_CENTRAL_SIG);
    w.u16(0);
    w.u16(0);
    w.u16(static_cast<uint16_t>(central_.size()));
    w.u16(static_cast<uint16_t>(central_.size()));
    w.u32(static_cast<uint32_t>(cd_size));
    w.u32(static_cast<uint32_t>(cd_offset));
    w.u16(0);

    return std::move(out_);
}

std::vector<uint8_t> deflate_raw(std::span<const uint8_t> data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate (negative window bits), fixed settings for reproducible output
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw ZipError("deflateInit2 failed");
    }

    std::vector<uint8_t> compressed(deflateBound(&strm, data.size()));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw ZipError("deflate failed");
    }

    compressed.resize(strm.total_out);
    return compressed;
}

std::vector<uint8_t> inflate_raw(std::span<const uint8_t> data, size_t expected_size) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, -15) != Z_OK) {
        throw ZipError("inflateInit2 failed");
    }

    // One spare byte so an empty or oversized stream still makes progress
    std::vector<uint8_t> out(expected_size + 1);
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&strm, Z_FINISH);
    size_t produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw ZipError("inflate failed: stream " + std::string(ret == Z_BUF_ERROR ? "larger than declared" : "corrupt"));
    }
    out.resize(produced);
    return out;
}

uint32_t crc32_of(std::span<const uint8_t> data) {
    return static_cast<uint32_t>(crc32(0L, data.data(), static_cast<uInt>(data.size())));
}

} // namespace husk
