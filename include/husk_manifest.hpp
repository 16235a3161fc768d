#pragma once

/**
 * @file husk_manifest.hpp
 * @brief Reading and patching the compiled application manifest
 */

#include "husk_axml.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace husk {

constexpr const char* STUB_APPLICATION_CLASS = "io.husk.stub.ShellApplication";
constexpr const char* STUB_FACTORY_CLASS = "io.husk.stub.ShellComponentFactory";
constexpr const char* STUB_PROVIDER_CLASS = "io.husk.stub.BootstrapProvider";
constexpr const char* DEFAULT_APPLICATION_CLASS = "android.app.Application";
constexpr const char* BOOTSTRAP_AUTHORITY_SUFFIX = ".husk-bootstrap";
constexpr int32_t BOOTSTRAP_INIT_ORDER = 1000;

/**
 * @brief Manifest meta-data keys carrying run-time configuration
 */
namespace meta {
constexpr const char* ORIGINAL_APPLICATION = "husk.original_application";
constexpr const char* ORIGINAL_FACTORY = "husk.original_factory";
constexpr const char* MIN_SDK = "husk.min_sdk";
constexpr const char* TARGET_SDK = "husk.target_sdk";
constexpr const char* DEBUG_POLICY = "husk.debug_policy";
}

/**
 * @brief What the packer needs to know about the input manifest
 */
struct ManifestSummary {
    std::string package;
    std::string application_class;   // fully qualified, empty when undeclared
    std::string component_factory;   // fully qualified, empty when undeclared
    int min_sdk = 1;
    int target_sdk = 1;
    bool debuggable = false;
};

/**
 * @brief Expand a manifest class reference against the package name
 *
 * ".App" and "App" both become "<package>.App"; qualified names pass through.
 */
std::string qualify_class_name(std::string_view package, std::string_view name);

/**
 * @brief Extract the summary from a decoded manifest
 * @throws PackError(ParseError) when the root is not <manifest> or has no package
 */
ManifestSummary summarize_manifest(const axml::Document& doc);

/**
 * @brief Reject manifests of split or split-dependent packages
 * @throws PackError(UnsupportedSplitConfiguration)
 */
void check_split_configuration(const axml::Document& doc);

/**
 * @brief Value of an <application> meta-data entry
 */
std::optional<std::string> find_meta_data(const axml::Document& doc, std::string_view key);

/**
 * @brief Delegation metadata written into the hardened manifest
 */
struct ManifestPatch {
    std::string original_application;
    std::string original_factory;  // empty when none was declared
    int min_sdk = 1;
    int target_sdk = 1;
    std::string debug_policy;
};

/**
 * @brief Route application start-up through the stub
 *
 * Points the application and component factory at the stub classes,
 * records the delegation metadata, registers the bootstrap provider and
 * strips android:debuggable.
 */
void patch_manifest(axml::Document& doc, const ManifestPatch& patch);

} // namespace husk
