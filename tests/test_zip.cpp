/**
 * @file test_zip.cpp
 * @brief Tests for the package archive reader and writer
 */

#undef NDEBUG

#include "../include/husk_zip.hpp"
#include "fixtures.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace husk;

namespace {

uint16_t le16(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

size_t data_offset(const std::vector<uint8_t>& archive, const ZipEntry& entry) {
    size_t off = static_cast<size_t>(entry.local_header_offset);
    return off + 30 + le16(archive, off + 26) + le16(archive, off + 28);
}

size_t central_header_offset(const std::vector<uint8_t>& archive) {
    for (size_t i = 0; i + 4 <= archive.size(); ++i) {
        if (archive[i] == 'P' && archive[i + 1] == 'K' && archive[i + 2] == 1 && archive[i + 3] == 2) {
            return i;
        }
    }
    throw std::runtime_error("no central directory header");
}

template <typename Fn>
bool throws_zip_error(Fn&& fn) {
    try {
        fn();
    } catch (const ZipError&) {
        return true;
    }
    return false;
}

} // namespace

void test_write_and_read() {
    std::cout << "Test: Write and read...";

    std::vector<uint8_t> text = fixtures::bytes(std::string(4096, 'a') + "tail");
    std::vector<uint8_t> binary = fixtures::bytes("\x01\x02\x03 stored bytes");

    ZipWriter writer;
    writer.add("res/values.txt", text);
    writer.add("lib/x86_64/libfoo.so", binary, ZIP_STORED);
    writer.add_directory("assets/empty");
    assert(writer.count() == 3);
    assert(writer.contains("res/values.txt"));
    assert(!writer.contains("res/other.txt"));

    ZipReader reader(writer.finish());
    assert(reader.entries().size() == 3);

    // Central directory order follows insertion order
    assert(reader.entries()[0].name == "res/values.txt");
    assert(reader.entries()[1].name == "lib/x86_64/libfoo.so");
    assert(reader.entries()[2].name == "assets/empty/");
    assert(reader.entries()[2].is_directory());

    const ZipEntry* deflated = reader.find("res/values.txt");
    assert(deflated != nullptr);
    assert(deflated->method == ZIP_DEFLATED);
    assert(deflated->compressed_size < text.size());
    assert(reader.read(*deflated) == text);

    const ZipEntry* stored = reader.find("lib/x86_64/libfoo.so");
    assert(stored->method == ZIP_STORED);
    assert(reader.read(*stored) == binary);
    assert(reader.find("missing") == nullptr);

    std::cout << " PASSED" << std::endl;
}

void test_stored_alignment() {
    std::cout << "Test: Stored alignment...";

    ZipWriter writer;
    writer.add("a.txt", fixtures::bytes("odd length prefix"));
    writer.add("lib/arm64-v8a/libhusk.so", fixtures::bytes("library"), ZIP_STORED, 16384);
    writer.add("assets/husk/payload.bin", fixtures::bytes("payload"), ZIP_STORED, 4);
    auto archive = writer.finish();

    ZipReader reader(archive);
    size_t lib = data_offset(archive, *reader.find("lib/arm64-v8a/libhusk.so"));
    size_t payload = data_offset(archive, *reader.find("assets/husk/payload.bin"));
    assert(lib % 16384 == 0);
    assert(payload % 4 == 0);
    assert(reader.read(*reader.find("lib/arm64-v8a/libhusk.so")) == fixtures::bytes("library"));

    std::cout << " PASSED" << std::endl;
}

void test_raw_copy() {
    std::cout << "Test: Raw copy...";

    ZipWriter source;
    source.add("classes.dex", fixtures::bytes(std::string(1000, 'x')));
    ZipReader src(source.finish());
    const ZipEntry* entry = src.find("classes.dex");

    ZipWriter copy;
    copy.add_raw(*entry, src.raw(*entry));
    ZipReader dst(copy.finish());
    const ZipEntry* copied = dst.find("classes.dex");
    assert(copied->crc32 == entry->crc32);
    assert(copied->compressed_size == entry->compressed_size);
    assert(dst.read(*copied) == src.read(*entry));

    ZipEntry wrong = *entry;
    wrong.compressed_size += 1;
    ZipWriter bad;
    assert(throws_zip_error([&] { bad.add_raw(wrong, src.raw(*entry)); }));

    std::cout << " PASSED" << std::endl;
}

void test_writer_errors() {
    std::cout << "Test: Writer errors...";

    ZipWriter writer;
    writer.add("one", fixtures::bytes("1"));
    assert(throws_zip_error([&] { writer.add("one", fixtures::bytes("again")); }));
    assert(throws_zip_error([&] { writer.add("two", fixtures::bytes("2"), 12); }));
    writer.finish();
    assert(throws_zip_error([&] { writer.add("three", fixtures::bytes("3")); }));
    assert(throws_zip_error([&] { writer.finish(); }));

    std::cout << " PASSED" << std::endl;
}

void test_reader_rejects_bad_archives() {
    std::cout << "Test: Reader rejects bad archives...";

    assert(throws_zip_error([] { ZipReader r(fixtures::bytes("not an archive")); }));
    assert(throws_zip_error([] { ZipReader r(std::vector<uint8_t>(64, 0)); }));

    for (const char* name : {"../escape.so", "/abs/path", "lib/../../up", "assets/.."}) {
        ZipWriter writer;
        writer.add(name, fixtures::bytes("x"));
        auto archive = writer.finish();
        assert(throws_zip_error([&] { ZipReader r(archive); }));
    }

    // Stored data modified after writing fails the CRC check
    ZipWriter writer;
    writer.add("data.bin", fixtures::bytes("checksummed contents"), ZIP_STORED);
    auto archive = writer.finish();
    ZipReader clean(archive);
    archive[data_offset(archive, clean.entries()[0])] ^= 0xFF;
    ZipReader damaged(archive);
    assert(throws_zip_error([&] { damaged.read(damaged.entries()[0]); }));

    // Local header offsets pointing past the end of the archive
    for (uint32_t offset : {0x40000000u, 0xFFFFFFF0u}) {
        ZipWriter one;
        one.add("data.bin", fixtures::bytes("contents"), ZIP_STORED);
        auto bytes = one.finish();
        size_t cd = central_header_offset(bytes);
        for (int i = 0; i < 4; ++i) {
            bytes[cd + 42 + i] = static_cast<uint8_t>(offset >> (8 * i));
        }
        ZipReader reader(bytes);
        assert(reader.entries()[0].local_header_offset == offset);
        assert(throws_zip_error([&] { reader.read(reader.entries()[0]); }));
        assert(throws_zip_error([&] { reader.raw(reader.entries()[0]); }));
    }

    std::cout << " PASSED" << std::endl;
}

void test_open_file() {
    std::cout << "Test: Open file...";

    fixtures::TempDir dir;
    ZipWriter writer;
    writer.add("AndroidManifest.xml", fixtures::bytes("manifest bytes"));
    fixtures::write_file(dir.file("app.apk"), writer.finish());

    auto reader = ZipReader::open(dir.file("app.apk"));
    assert(reader.entries().size() == 1);
    assert(reader.read(reader.entries()[0]) == fixtures::bytes("manifest bytes"));

    // Moving keeps the mapping valid
    ZipReader moved = std::move(reader);
    assert(moved.read(*moved.find("AndroidManifest.xml")) == fixtures::bytes("manifest bytes"));

    assert(throws_zip_error([&] { ZipReader::open(dir.file("missing.apk")); }));
    fixtures::write_file(dir.file("empty.apk"), {});
    assert(throws_zip_error([&] { ZipReader::open(dir.file("empty.apk")); }));

    std::cout << " PASSED" << std::endl;
}

int main() {
    std::cout << "Running archive tests...\n" << std::endl;

    try {
        test_write_and_read();
        test_stored_alignment();
        test_raw_copy();
        test_writer_errors();
        test_reader_rejects_bad_archives();
        test_open_file();

        std::cout << "\nAll tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
