#pragma once

/**
 * @file husk_bundle.hpp
 * @brief Parsed view of an input application package
 */

#include "husk_axml.hpp"
#include "husk_manifest.hpp"
#include "husk_zip.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace husk {

constexpr const char* MANIFEST_PATH = "AndroidManifest.xml";
constexpr const char* STUB_LIBRARY_NAME = "libhusk.so";

struct CodeUnit {
    ZipEntry entry;
    int index;  // 1 for classes.dex, N for classesN.dex
};

struct NativeLibrary {
    ZipEntry entry;
    std::string abi;
    std::string name;  // file name, "libfoo.so"
};

/**
 * @brief Read-only view of the input package, derived once per pack run
 */
struct TargetBundle {
    ZipReader archive;
    axml::Document manifest;
    ManifestSummary summary;
    std::vector<CodeUnit> code_units;            // load order
    std::vector<NativeLibrary> native_libraries; // by (abi, name)
    std::vector<ZipEntry> assets;                // by path
    std::vector<std::string> abis;               // sorted, unique

    /**
     * @brief Open and index a package
     * @throws PackError(ParseError) for an unreadable archive or manifest
     * @throws PackError(UnsupportedSplitConfiguration) for split or bundle inputs
     */
    static TargetBundle parse(const std::string& path);

    /**
     * @brief Same as parse() for an archive already in memory
     */
    static TargetBundle parse(ZipReader archive);
};

/**
 * @brief Index of a root code unit name, or 0 if the name is not one
 *
 * "classes.dex" is 1, "classes2.dex" is 2 and so on.
 */
int code_unit_index(std::string_view name);

/**
 * @brief Name of the code unit with the given index
 */
std::string code_unit_name(int index);

/**
 * @brief Decide which entries stay in cleartext
 */
class KeepRules {
public:
    KeepRules(const std::vector<std::string>& classes,
              const std::vector<std::string>& prefixes,
              const std::vector<std::string>& libraries,
              const std::vector<std::string>& asset_patterns);

    /**
     * @brief True if the code unit defines or references a kept class or package
     */
    bool keep_code(std::span<const uint8_t> dex) const;

    /**
     * @brief True if the library matches "name", "libname.so" or "name.so"
     */
    bool keep_library(std::string_view file_name) const;

    /**
     * @brief True if an asset matches one of the extra encryption patterns
     */
    bool encrypt_asset(std::string_view path) const;

private:
    std::vector<std::string> descriptors_;  // "Lcom/x/Y;" and "Lcom/x/"
    std::vector<std::string> libraries_;
    std::vector<std::string> asset_patterns_;
};

} // namespace husk
