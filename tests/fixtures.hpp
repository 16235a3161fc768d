#pragma once

/**
 * @file fixtures.hpp
 * @brief Builders for fixture packages, stub material and scratch directories
 */

#include "../include/husk_axml.hpp"
#include "../include/husk_bundle.hpp"
#include "../include/husk_key_slot.hpp"
#include "../include/husk_zip.hpp"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace fixtures {

namespace fs = std::filesystem;
namespace axml = husk::axml;

/**
 * @brief Scratch directory removed with its contents on scope exit
 */
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "husk-test-XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
        for (auto it = fs::recursive_directory_iterator(path_, ec); it != fs::recursive_directory_iterator(); ++it) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        }
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

inline std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

/**
 * @brief Code unit bytes mentioning the given type descriptors
 */
inline std::vector<uint8_t> make_dex(const std::vector<std::string>& descriptors, const std::string& tag) {
    std::string body("dex\n035\0", 8);
    for (const auto& d : descriptors) {
        body += d;
        body.push_back('\0');
    }
    body += "unit:" + tag;
    return bytes(body);
}

struct ManifestOptions {
    std::string package = "com.example.app";
    std::string application = ".ExampleApp";  // empty: no android:name
    std::string factory;                      // empty: no appComponentFactory
    bool debuggable = true;
    int min_sdk = 24;
    int target_sdk = 34;
    std::string split;                        // non-empty: split package
    bool split_required = false;
};

inline axml::Document make_manifest(const ManifestOptions& options = {}) {
    axml::Document doc;
    doc.root.name = "manifest";
    doc.root.line = 2;
    doc.root.namespaces.push_back({"android", axml::ANDROID_NS});
    doc.root.set_attribute(axml::Attribute::string("", "package", 0, options.package));
    if (!options.split.empty()) {
        doc.root.set_attribute(axml::Attribute::string("", "split", 0, options.split));
    }

    axml::Element uses_sdk;
    uses_sdk.name = "uses-sdk";
    uses_sdk.line = 3;
    uses_sdk.set_attribute(axml::Attribute::integer(axml::ANDROID_NS, "minSdkVersion",
                                                    axml::attr::MIN_SDK_VERSION, options.min_sdk));
    uses_sdk.set_attribute(axml::Attribute::integer(axml::ANDROID_NS, "targetSdkVersion",
                                                    axml::attr::TARGET_SDK_VERSION, options.target_sdk));
    doc.root.append_child(std::move(uses_sdk));

    axml::Element application;
    application.name = "application";
    application.line = 4;
    if (!options.application.empty()) {
        application.set_attribute(axml::Attribute::string(axml::ANDROID_NS, "name", axml::attr::NAME,
                                                          options.application));
    }
    if (!options.factory.empty()) {
        application.set_attribute(axml::Attribute::string(axml::ANDROID_NS, "appComponentFactory",
                                                          axml::attr::APP_COMPONENT_FACTORY, options.factory));
    }
    if (options.debuggable) {
        application.set_attribute(axml::Attribute::boolean(axml::ANDROID_NS, "debuggable",
                                                           axml::attr::DEBUGGABLE, true));
    }
    if (options.split_required) {
        application.set_attribute(axml::Attribute::boolean(axml::ANDROID_NS, "isSplitRequired", 0x01010591, true));
    }

    axml::Element activity;
    activity.name = "activity";
    activity.line = 5;
    activity.set_attribute(axml::Attribute::string(axml::ANDROID_NS, "name", axml::attr::NAME, ".MainActivity"));
    activity.set_attribute(axml::Attribute::boolean(axml::ANDROID_NS, "exported", axml::attr::EXPORTED, true));
    application.append_child(std::move(activity));

    doc.root.append_child(std::move(application));
    return doc;
}

/**
 * @brief Archive member for make_package
 */
struct Member {
    std::string name;
    std::vector<uint8_t> data;
    uint16_t method = husk::ZIP_DEFLATED;
};

/**
 * @brief Write a package with a compiled manifest followed by the members
 */
inline void make_package(const std::string& path, const axml::Document& manifest,
                         const std::vector<Member>& members) {
    husk::ZipWriter zip;
    zip.add(husk::MANIFEST_PATH, axml::encode(manifest));
    for (const auto& m : members) {
        zip.add(m.name, m.data, m.method);
    }
    write_file(path, zip.finish());
}

/**
 * @brief The standard fixture: two code units, one native library per ABI,
 * resources and an asset
 */
inline std::vector<Member> standard_members() {
    return {
        {"classes.dex", make_dex({"Lcom/example/app/ExampleApp;", "Lcom/example/app/MainActivity;"}, "one")},
        {"classes2.dex", make_dex({"Lcom/example/app/feature/Worker;"}, "two")},
        {"lib/arm64-v8a/libexample.so", bytes("\x7f" "ELF arm64 example library"), husk::ZIP_STORED},
        {"lib/x86_64/libexample.so", bytes("\x7f" "ELF x86_64 example library"), husk::ZIP_STORED},
        {"res/layout/main.xml", bytes("compiled layout")},
        {"resources.arsc", bytes("resource table"), husk::ZIP_STORED},
        {"assets/config.json", bytes("{\"endpoint\":\"https://example.invalid\"}")},
        {"META-INF/MANIFEST.MF", bytes("Manifest-Version: 1.0\n")},
        {"META-INF/CERT.SF", bytes("signature file")},
        {"META-INF/CERT.RSA", bytes("signature block")},
    };
}

/**
 * @brief Twelve code units stored in name order, so classes10.dex precedes
 * classes2.dex in the archive, plus one native library per ABI
 */
inline std::vector<Member> many_code_unit_members() {
    std::vector<Member> members;
    for (const char* name : {"classes.dex", "classes10.dex", "classes11.dex", "classes12.dex",
                             "classes2.dex", "classes3.dex", "classes4.dex", "classes5.dex",
                             "classes6.dex", "classes7.dex", "classes8.dex", "classes9.dex"}) {
        std::string unit(name);
        std::string descriptor = unit == "classes.dex" ? "Lcom/example/app/ExampleApp;"
                                                        : "Lcom/example/app/part/" + unit.substr(0, unit.size() - 4) + ";";
        members.push_back({unit, make_dex({descriptor}, unit)});
    }
    members.push_back({"lib/arm64-v8a/libexample.so", bytes("\x7f" "ELF arm64 example library"), husk::ZIP_STORED});
    members.push_back({"lib/x86_64/libexample.so", bytes("\x7f" "ELF x86_64 example library"), husk::ZIP_STORED});
    return members;
}

/**
 * @brief Stub library image: a rodata copy of the marker plus one empty slot
 */
inline std::vector<uint8_t> make_stub_library(const std::string& abi) {
    std::vector<uint8_t> image = bytes("\x7f" "ELF stub for " + abi);
    image.resize(64, 0);

    // A string constant that happens to contain the marker, with no state word
    image.insert(image.end(), husk::KEY_SLOT_MARKER, husk::KEY_SLOT_MARKER + sizeof(husk::KEY_SLOT_MARKER));
    image.resize(image.size() + 12, 0);

    husk::KeySlot slot = HUSK_KEY_SLOT_INIT;
    const auto* raw = reinterpret_cast<const uint8_t*>(&slot);
    image.insert(image.end(), raw, raw + sizeof(slot));
    image.resize(image.size() + 32, 0xCC);
    return image;
}

/**
 * @brief Stub dex and per-ABI stub libraries under `dir`
 */
struct StubFiles {
    std::string dex_path;
    std::string library_dir;
};

inline StubFiles make_stub(const fs::path& dir, const std::vector<std::string>& abis) {
    StubFiles files;
    files.dex_path = (dir / "stub.dex").string();
    files.library_dir = (dir / "stub-libs").string();
    write_file(files.dex_path, make_dex({"Lio/husk/stub/ShellApplication;"}, "stub"));
    for (const auto& abi : abis) {
        write_file((dir / "stub-libs" / abi / husk::STUB_LIBRARY_NAME).string(), make_stub_library(abi));
    }
    return files;
}

/**
 * @brief Copy of the first provisioned slot in a library image
 */
inline std::optional<husk::KeySlot> find_provisioned_slot(const std::vector<uint8_t>& image) {
    const char* marker = husk::KEY_SLOT_MARKER;
    for (size_t i = 0; i + sizeof(husk::KeySlot) <= image.size(); ++i) {
        if (std::memcmp(image.data() + i, marker, sizeof(husk::KEY_SLOT_MARKER)) != 0) {
            continue;
        }
        husk::KeySlot slot;
        std::memcpy(&slot, image.data() + i, sizeof(slot));
        if (slot.state == husk::KEY_SLOT_PROVISIONED) {
            return slot;
        }
    }
    return std::nullopt;
}

/**
 * @brief Key provider over a copy of a slot
 */
class SlotKeyProvider : public husk::KeyProvider {
public:
    explicit SlotKeyProvider(husk::KeySlot slot) : slot_(slot) {}
    husk::crypto::Key resolve() override { return husk::unseal_key_slot(slot_); }

private:
    husk::KeySlot slot_;
};

/**
 * @brief Key provider returning a fixed key
 */
class FixedKeyProvider : public husk::KeyProvider {
public:
    explicit FixedKeyProvider(husk::crypto::Key key) : key_(key) {}
    husk::crypto::Key resolve() override { return key_; }

private:
    husk::crypto::Key key_;
};

} // namespace fixtures
