/**
 * @file husk_bundle.cpp
 * @brief Input package parsing and protect/keep classification
 */

#include "../include/husk_bundle.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_payload.hpp"
#include <algorithm>
#include <charconv>
#include <fnmatch.h>
#include <set>

namespace husk {

namespace {

// "lib/<abi>/<file>.so" with exactly three components
bool split_library_path(const std::string& path, std::string& abi, std::string& name) {
    if (path.rfind("lib/", 0) != 0) {
        return false;
    }
    size_t slash = path.find('/', 4);
    if (slash == std::string::npos || slash == 4) {
        return false;
    }
    if (path.find('/', slash + 1) != std::string::npos) {
        return false;
    }
    abi = path.substr(4, slash - 4);
    name = path.substr(slash + 1);
    return name.size() > 3 && name.compare(name.size() - 3, 3, ".so") == 0;
}

std::string to_descriptor_path(std::string_view dotted) {
    std::string out(dotted);
    std::replace(out.begin(), out.end(), '.', '/');
    return out;
}

} // namespace

int code_unit_index(std::string_view name) {
    constexpr std::string_view prefix = "classes";
    constexpr std::string_view suffix = ".dex";
    if (name.size() < prefix.size() + suffix.size() ||
        name.substr(0, prefix.size()) != prefix ||
        name.substr(name.size() - suffix.size()) != suffix) {
        return 0;
    }

    auto digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (digits.empty()) {
        return 1;
    }
    if (digits.front() == '0') {
        return 0;
    }
    int index = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (result.ec != std::errc() || result.ptr != digits.data() + digits.size() || index < 2) {
        return 0;
    }
    return index;
}

std::string code_unit_name(int index) {
    return index <= 1 ? "classes.dex" : "classes" + std::to_string(index) + ".dex";
}

TargetBundle TargetBundle::parse(const std::string& path) {
    try {
        return parse(ZipReader::open(path));
    } catch (const ZipError& e) {
        throw PackError(BuildError::ParseError, "Cannot read package " + path + ": " + e.what());
    }
}

TargetBundle TargetBundle::parse(ZipReader archive) {
    if (archive.find("BundleConfig.pb") || archive.find("base/manifest/AndroidManifest.xml")) {
        throw PackError(BuildError::UnsupportedSplitConfiguration,
                        "Input is an app bundle; build a universal APK first");
    }

    if (!archive.find(MANIFEST_PATH)) {
        throw PackError(BuildError::ParseError, "Package has no AndroidManifest.xml");
    }

    TargetBundle bundle{std::move(archive), {}, {}, {}, {}, {}, {}};

    try {
        auto manifest_bytes = bundle.archive.read(*bundle.archive.find(MANIFEST_PATH));
        if (!axml::looks_like_axml(manifest_bytes)) {
            throw PackError(BuildError::ParseError, "AndroidManifest.xml is not compiled XML");
        }
        bundle.manifest = axml::decode(manifest_bytes);
    } catch (const axml::AxmlError& e) {
        throw PackError(BuildError::ParseError, std::string("Invalid AndroidManifest.xml: ") + e.what());
    } catch (const ZipError& e) {
        throw PackError(BuildError::ParseError, std::string("Cannot read AndroidManifest.xml: ") + e.what());
    }

    check_split_configuration(bundle.manifest);
    bundle.summary = summarize_manifest(bundle.manifest);
    if (bundle.summary.application_class == STUB_APPLICATION_CLASS ||
        bundle.archive.find(PAYLOAD_ASSET_PATH)) {
        throw PackError(BuildError::ParseError, "Package is already hardened");
    }

    std::set<std::string> abis;
    for (const auto& entry : bundle.archive.entries()) {
        if (entry.is_directory()) {
            continue;
        }
        if (int index = code_unit_index(entry.name); index > 0) {
            bundle.code_units.push_back({entry, index});
            continue;
        }
        std::string abi, name;
        if (split_library_path(entry.name, abi, name)) {
            abis.insert(abi);
            bundle.native_libraries.push_back({entry, abi, name});
            continue;
        }
        if (entry.name.rfind("assets/", 0) == 0) {
            bundle.assets.push_back(entry);
        }
    }

    std::sort(bundle.code_units.begin(), bundle.code_units.end(),
              [](const CodeUnit& a, const CodeUnit& b) { return a.index < b.index; });
    std::sort(bundle.native_libraries.begin(), bundle.native_libraries.end(),
              [](const NativeLibrary& a, const NativeLibrary& b) {
                  return a.abi != b.abi ? a.abi < b.abi : a.name < b.name;
              });
    std::sort(bundle.assets.begin(), bundle.assets.end(),
              [](const ZipEntry& a, const ZipEntry& b) { return a.name < b.name; });
    bundle.abis.assign(abis.begin(), abis.end());

    return bundle;
}

KeepRules::KeepRules(const std::vector<std::string>& classes,
                     const std::vector<std::string>& prefixes,
                     const std::vector<std::string>& libraries,
                     const std::vector<std::string>& asset_patterns)
    : libraries_(libraries), asset_patterns_(asset_patterns) {
    for (const auto& cls : classes) {
        if (!cls.empty()) {
            descriptors_.push_back("L" + to_descriptor_path(cls) + ";");
        }
    }
    for (const auto& prefix : prefixes) {
        if (prefix.empty()) {
            continue;
        }
        std::string path = to_descriptor_path(prefix);
        if (path.back() != '/') {
            path.push_back('/');
        }
        descriptors_.push_back("L" + path);
    }
}

bool KeepRules::keep_code(std::span<const uint8_t> dex) const {
    for (const auto& descriptor : descriptors_) {
        auto it = std::search(dex.begin(), dex.end(), descriptor.begin(), descriptor.end(),
                              [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); });
        if (it != dex.end()) {
            return true;
        }
    }
    return false;
}

bool KeepRules::keep_library(std::string_view file_name) const {
    for (const auto& name : libraries_) {
        if (file_name == name || file_name == "lib" + name + ".so" || file_name == name + ".so") {
            return true;
        }
    }
    return false;
}

bool KeepRules::encrypt_asset(std::string_view path) const {
    std::string full(path);
    std::string relative = full.rfind("assets/", 0) == 0 ? full.substr(7) : full;
    for (const auto& pattern : asset_patterns_) {
        if (fnmatch(pattern.c_str(), full.c_str(), 0) == 0 ||
            fnmatch(pattern.c_str(), relative.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace husk
