#pragma once

/**
 * @file husk_packer.hpp
 * @brief Host-side pipeline turning an application package into a hardened one
 */

#include "husk_errors.hpp"
#include "husk_manifest.hpp"
#include "husk_payload.hpp"
#include "husk_verify.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace husk {

/**
 * @brief Cooperative cancellation, checked between pipeline stages
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Signing credentials; an empty keystore selects a debug keystore
 */
struct SigningConfig {
    std::string keystore_path;
    std::string store_password;
    std::string key_alias;
    std::string key_password;

    std::string apksigner = "apksigner";
    std::string zipalign = "zipalign";
    std::string keytool = "keytool";
};

/**
 * @brief Everything one pack run consumes
 */
struct PackConfig {
    std::string target_path;
    std::string output_path;

    std::vector<std::string> stub_dex_paths;   // stub code units, in load order
    std::string stub_library_dir;              // contains <abi>/libhusk.so

    std::vector<std::string> keep_classes;     // "com.example.Foo"
    std::vector<std::string> keep_prefixes;    // "com.example.thirdparty"
    std::vector<std::string> keep_libraries;   // "foo", "libfoo.so"
    std::vector<std::string> encrypt_assets;   // glob patterns

    bool skip_signing = false;
    SigningConfig signing;

    unsigned workers = 0;  // 0 = hardware concurrency
    verify::DebuggerPolicy debugger_policy = verify::DebuggerPolicy::LogOnly;
    std::shared_ptr<CancellationToken> cancel;
};

enum class SigningStatus : uint8_t {
    Skipped = 0,
    Signed,
    Unavailable
};

const char* to_string(SigningStatus status) noexcept;

struct PackWarning {
    BuildError code;
    std::string message;
};

/**
 * @brief Outcome of a pack run
 */
struct PackReport {
    ManifestSummary manifest;
    std::string delegate_application;
    std::vector<std::string> protected_paths;
    std::vector<std::string> kept_paths;
    std::vector<std::string> abis;
    size_t payload_size = 0;
    SigningStatus signing = SigningStatus::Skipped;
    std::vector<PackWarning> warnings;

    bool has_warning(BuildError code) const;
};

/**
 * @brief Boundary to the external signing tool
 */
class Signer {
public:
    virtual ~Signer() = default;

    /**
     * @brief Produce a signed copy of an unsigned package
     * @throws PackError(SigningUnavailable)
     */
    virtual void sign(const std::string& unsigned_path, const std::string& signed_path,
                      const SigningConfig& config) = 0;
};

/**
 * @brief Signs with the SDK's zipalign and apksigner command line tools
 */
class ApkSignerTool : public Signer {
public:
    void sign(const std::string& unsigned_path, const std::string& signed_path,
              const SigningConfig& config) override;
};

/**
 * @brief Result of re-opening a hardened package
 */
struct InspectReport {
    bool has_payload = false;
    std::vector<PayloadIndexEntry> entries;
    std::vector<std::string> stub_abis;
    bool keys_provisioned = false;
    std::vector<std::string> cleartext_leaks;  // entries whose bytes match a protected digest
    std::string original_application;
    std::string error;

    bool ok() const { return error.empty() && has_payload && keys_provisioned && cleartext_leaks.empty(); }
};

/**
 * @brief Hardening packer
 *
 * The output is written to a sibling temporary file and renamed into place
 * only after the package is complete, so a failed or cancelled run never
 * leaves a partial file at the output path.
 */
class Packer {
public:
    explicit Packer(PackConfig config);
    Packer(PackConfig config, std::unique_ptr<Signer> signer);
    ~Packer();

    Packer(const Packer&) = delete;
    Packer& operator=(const Packer&) = delete;

    /**
     * @brief Run the pipeline
     * @return true on success; on failure get_error() and get_error_code() say why
     */
    bool pack();

    const std::string& get_error() const { return error_; }
    BuildError get_error_code() const { return error_code_; }
    const std::string& get_log() const { return log_; }
    const PackReport& report() const { return report_; }

    /**
     * @brief Check a hardened package for payload, provisioned keys and leaks
     */
    static InspectReport inspect(const std::string& path);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::string log_;
    std::string error_;
    BuildError error_code_ = BuildError::None;
    PackReport report_;
};

} // namespace husk
