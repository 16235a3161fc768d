#pragma once

/**
 * @file android_environment.hpp
 * @brief RuntimeEnvironment over ART class loaders
 */

#include "../../include/husk_loader.hpp"
#include "jni_util.hpp"

namespace husk {
namespace android {

constexpr const char* MEMORY_LOADER_CLASS = "io/husk/stub/ShellMemoryLoader";
constexpr const char* FILE_LOADER_CLASS = "io/husk/stub/ShellFileLoader";

/**
 * @brief Where the package lives, taken from ApplicationInfo
 */
struct PackageLocation {
    int sdk_int = 0;
    std::string source_dir;
    std::string data_dir;
    std::string native_library_dir;
};

PackageLocation locate_package(JNIEnv* env, jobject application_info, int sdk_int);

/**
 * @brief Run-time configuration from the installed package's manifest
 *
 * ApplicationInfo.metaData is not populated this early, so the binary
 * manifest is read from the package file instead.
 */
LoaderOptions read_options(const PackageLocation& location);

class AndroidEnvironment : public RuntimeEnvironment {
public:
    AndroidEnvironment(PackageLocation location, Handle parent_loader);

    int capability_level() const override { return location_.sdk_int; }
    std::vector<uint8_t> read_payload() override;
    std::string code_cache_dir() const override;
    void register_in_memory(const std::vector<std::span<const uint8_t>>& units,
                            const std::string& library_dir) override;
    void register_files(const std::vector<std::string>& paths,
                        const std::string& library_dir) override;

    /**
     * @brief Class loader created by the last register call
     */
    const Handle& class_loader() const { return loader_; }

private:
    std::string library_path(const std::string& library_dir) const;

    PackageLocation location_;
    Handle parent_;
    Handle loader_;
};

/**
 * @brief Make `loader` the class loader of the package behind `base_context`
 *
 * Used when the loader was created after the platform had already built
 * the package's own class loader.
 */
void replace_package_class_loader(JNIEnv* env, jobject base_context, jobject loader);

} // namespace android
} // namespace husk
