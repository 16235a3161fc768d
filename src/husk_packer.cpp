/**
 * @file husk_packer.cpp
 * @brief Hardening pipeline: parse, classify, encrypt, patch, assemble, sign
 */

#include "../include/husk_packer.hpp"
#include "../include/husk_bundle.hpp"
#include "../include/husk_key_slot.hpp"
#include "../include/husk_zip.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

namespace husk {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t STORED_ALIGNMENT = 4;
constexpr uint32_t LIBRARY_ALIGNMENT = 16384;

struct EncryptionJob {
    EntryKind kind;
    std::string path;
    std::string abi;
    ZipEntry source;
    crypto::Nonce nonce{};
};

struct StubMaterial {
    std::vector<std::vector<uint8_t>> code_units;
    std::vector<std::pair<std::string, std::vector<uint8_t>>> libraries;  // (abi, image)
};

/**
 * @brief Removes a file on scope exit unless released
 */
class TempFile {
public:
    explicit TempFile(fs::path path) : path_(std::move(path)) {}
    ~TempFile() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const fs::path& path() const { return path_; }
    void release() { path_.clear(); }

private:
    fs::path path_;
};

std::vector<uint8_t> read_file(const fs::path& path, BuildError code) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw PackError(code, "Failed to read " + path.string());
    }
    file.seekg(0, std::ios::end);
    auto size = static_cast<size_t>(file.tellg());
    file.seekg(0);

    std::vector<uint8_t> data(size);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (!file) {
        throw PackError(code, "Failed to read " + path.string());
    }
    return data;
}

void write_file(const fs::path& path, std::span<const uint8_t> data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PackError(BuildError::IoError, "Failed to create " + path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw PackError(BuildError::IoError, "Failed to write " + path.string());
    }
}

bool is_signature_file(const std::string& name) {
    if (name.rfind("META-INF/", 0) != 0 || name.find('/', 9) != std::string::npos) {
        return false;
    }
    if (name == "META-INF/MANIFEST.MF") {
        return true;
    }
    for (const char* ext : {".SF", ".RSA", ".DSA", ".EC"}) {
        std::string_view e(ext);
        if (name.size() > e.size() && name.compare(name.size() - e.size(), e.size(), e) == 0) {
            return true;
        }
    }
    return false;
}

bool is_library_path(const std::string& name) {
    return name.rfind("lib/", 0) == 0 && name.size() > 3 &&
           name.compare(name.size() - 3, 3, ".so") == 0;
}

std::string library_path(const std::string& abi, const std::string& name) {
    return "lib/" + abi + "/" + name;
}

} // namespace

const char* to_string(SigningStatus status) noexcept {
    switch (status) {
        case SigningStatus::Skipped: return "skipped";
        case SigningStatus::Signed: return "signed";
        case SigningStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

bool PackReport::has_warning(BuildError code) const {
    return std::any_of(warnings.begin(), warnings.end(),
                       [code](const PackWarning& w) { return w.code == code; });
}

class Packer::Impl {
public:
    Impl(PackConfig cfg, std::unique_ptr<Signer> s)
        : config(std::move(cfg)), signer(std::move(s)) {}

    void run(std::string& log, PackReport& report) {
        if (config.target_path.empty() || config.output_path.empty()) {
            throw PackError(BuildError::IoError, "Target and output paths are required");
        }

        // Stage 1: parse
        log += "Parsing " + config.target_path + "\n";
        TargetBundle bundle = TargetBundle::parse(config.target_path);
        report.manifest = bundle.summary;
        log += "  Package: " + bundle.summary.package + "\n";
        log += "  Code units: " + std::to_string(bundle.code_units.size()) +
               ", native libraries: " + std::to_string(bundle.native_libraries.size()) + "\n";

        report.delegate_application = bundle.summary.application_class;
        if (report.delegate_application.empty()) {
            report.delegate_application = DEFAULT_APPLICATION_CLASS;
            warn(report, log, BuildError::ManifestIncomplete,
                 std::string("No application class declared; delegating to ") + DEFAULT_APPLICATION_CLASS);
        }
        checkpoint("parse");

        // Stage 2: classify
        KeepRules rules(config.keep_classes, config.keep_prefixes,
                        config.keep_libraries, config.encrypt_assets);
        std::vector<EncryptionJob> jobs;
        std::vector<CodeUnit> kept_code;
        std::set<std::string> removed;

        for (const auto& unit : bundle.code_units) {
            auto dex = read_entry(bundle, unit.entry);
            if (rules.keep_code(dex)) {
                kept_code.push_back(unit);
                report.kept_paths.push_back(unit.entry.name);
            } else {
                jobs.push_back({EntryKind::Code, unit.entry.name, "", unit.entry});
            }
        }
        for (const auto& lib : bundle.native_libraries) {
            if (lib.name == STUB_LIBRARY_NAME) {
                throw PackError(BuildError::ParseError, "Package already ships " + lib.entry.name);
            }
            if (rules.keep_library(lib.name)) {
                report.kept_paths.push_back(lib.entry.name);
            } else {
                jobs.push_back({EntryKind::NativeLib, library_path(lib.abi, lib.name), lib.abi, lib.entry});
            }
        }
        for (const auto& asset : bundle.assets) {
            if (rules.encrypt_asset(asset.name)) {
                jobs.push_back({EntryKind::Asset, asset.name, "", asset});
            }
        }
        for (const auto& job : jobs) {
            removed.insert(job.source.name);
            report.protected_paths.push_back(job.path);
        }
        if (jobs.empty()) {
            warn(report, log, BuildError::NothingToProtect, "Every entry is keep-listed; payload is empty");
        }

        StubMaterial stub = load_stub(bundle);
        for (const auto& [abi, image] : stub.libraries) {
            report.abis.push_back(abi);
        }
        log += "  Protecting " + std::to_string(jobs.size()) + " entries, keeping " +
               std::to_string(report.kept_paths.size()) + "\n";
        checkpoint("classify");

        // Stage 3: encrypt
        crypto::Key key = crypto::generate_key();
        crypto::NonceSequence nonces;
        for (auto& job : jobs) {
            job.nonce = nonces.next();
        }
        std::vector<PayloadEntry> sealed = encrypt_all(bundle, jobs, key);
        log += "  Encrypted " + std::to_string(sealed.size()) + " entries\n";
        checkpoint("encrypt");

        // Stage 4: payload
        PayloadWriter writer;
        for (auto& entry : sealed) {
            writer.add(std::move(entry));
        }
        std::vector<uint8_t> payload = writer.finish();
        report.payload_size = payload.size();
        log += "  Payload: " + std::to_string(payload.size()) + " bytes\n";

        for (auto& [abi, image] : stub.libraries) {
            provision_key_slots(image, key);
        }
        crypto::secure_clear(key);
        checkpoint("payload");

        // Stage 5: manifest
        ManifestPatch patch;
        patch.original_application = report.delegate_application;
        patch.original_factory = bundle.summary.component_factory;
        patch.min_sdk = bundle.summary.min_sdk;
        patch.target_sdk = bundle.summary.target_sdk;
        patch.debug_policy = verify::to_string(config.debugger_policy);
        patch_manifest(bundle.manifest, patch);
        std::vector<uint8_t> manifest = axml::encode(bundle.manifest);
        if (bundle.summary.debuggable) {
            log += "  Stripped android:debuggable\n";
        }
        log += "  Manifest delegates to " + report.delegate_application + "\n";
        checkpoint("manifest");

        // Stages 6 and 7: assemble
        std::vector<uint8_t> archive = assemble(bundle, removed, kept_code, stub, manifest, payload);
        checkpoint("assemble");

        fs::path output(config.output_path);
        if (output.has_parent_path()) {
            fs::create_directories(output.parent_path());
        }
        TempFile unsigned_file(fs::path(config.output_path + ".husk-unsigned"));
        write_file(unsigned_file.path(), archive);
        log += "  Wrote " + std::to_string(archive.size()) + " bytes\n";
        checkpoint("write");

        // Stage 8: sign
        if (config.skip_signing) {
            report.signing = SigningStatus::Skipped;
            fs::rename(unsigned_file.path(), output);
            unsigned_file.release();
            log += "Signing skipped\n";
        } else {
            TempFile signed_file(fs::path(config.output_path + ".husk-signed"));
            try {
                signer->sign(unsigned_file.path().string(), signed_file.path().string(), config.signing);
                fs::rename(signed_file.path(), output);
                signed_file.release();
                report.signing = SigningStatus::Signed;
                log += "Signed " + config.output_path + "\n";
            } catch (const PackError& e) {
                if (e.code() != BuildError::SigningUnavailable) {
                    throw;
                }
                fs::rename(unsigned_file.path(), output);
                unsigned_file.release();
                report.signing = SigningStatus::Unavailable;
                warn(report, log, BuildError::SigningUnavailable, e.what());
            }
        }

        log += "Created hardened package: " + config.output_path + "\n";
    }

private:
    void checkpoint(const char* stage) {
        if (config.cancel && config.cancel->is_cancelled()) {
            throw PackError(BuildError::Cancelled, std::string("Cancelled after ") + stage);
        }
    }

    void warn(PackReport& report, std::string& log, BuildError code, const std::string& message) {
        report.warnings.push_back({code, message});
        log += std::string("  Warning (") + to_string(code) + "): " + message + "\n";
    }

    std::vector<uint8_t> read_entry(const TargetBundle& bundle, const ZipEntry& entry) {
        try {
            return bundle.archive.read(entry);
        } catch (const ZipError& e) {
            throw PackError(BuildError::ParseError, entry.name + ": " + e.what());
        }
    }

    StubMaterial load_stub(const TargetBundle& bundle) {
        StubMaterial stub;

        if (config.stub_dex_paths.empty()) {
            throw PackError(BuildError::StubMissing, "No stub code units configured");
        }
        for (const auto& path : config.stub_dex_paths) {
            stub.code_units.push_back(read_file(path, BuildError::StubMissing));
        }

        fs::path dir(config.stub_library_dir);
        std::vector<std::string> abis = bundle.abis;
        if (abis.empty()) {
            std::error_code ec;
            if (fs::is_directory(dir, ec)) {
                for (const auto& sub : fs::directory_iterator(dir)) {
                    if (fs::exists(sub.path() / STUB_LIBRARY_NAME)) {
                        abis.push_back(sub.path().filename().string());
                    }
                }
            }
            std::sort(abis.begin(), abis.end());
        }
        if (abis.empty()) {
            throw PackError(BuildError::StubMissing, "No stub native library found in " + dir.string());
        }

        for (const auto& abi : abis) {
            fs::path lib = dir / abi / STUB_LIBRARY_NAME;
            if (!fs::exists(lib)) {
                throw PackError(BuildError::StubMissing, "No stub native library for ABI " + abi);
            }
            stub.libraries.emplace_back(abi, read_file(lib, BuildError::StubMissing));
        }
        return stub;
    }

    std::vector<PayloadEntry> encrypt_all(const TargetBundle& bundle,
                                          const std::vector<EncryptionJob>& jobs,
                                          const crypto::Key& key) {
        std::vector<PayloadEntry> results(jobs.size());
        std::vector<std::exception_ptr> errors(jobs.size());
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (size_t i = next++; i < jobs.size(); i = next++) {
                if (config.cancel && config.cancel->is_cancelled()) {
                    return;
                }
                const auto& job = jobs[i];
                try {
                    auto plaintext = read_entry(bundle, job.source);
                    results[i] = seal_entry(key, job.nonce, job.kind, job.path, job.abi, plaintext);
                    crypto::secure_clear(plaintext);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        };

        unsigned workers = config.workers ? config.workers
                                          : std::max(1u, std::thread::hardware_concurrency());
        workers = static_cast<unsigned>(std::min<size_t>(workers, std::max<size_t>(jobs.size(), 1)));

        std::vector<std::thread> threads;
        for (unsigned i = 1; i < workers; ++i) {
            threads.emplace_back(worker);
        }
        worker();
        for (auto& t : threads) {
            t.join();
        }

        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
        return results;
    }

    std::vector<uint8_t> assemble(const TargetBundle& bundle,
                                  const std::set<std::string>& removed,
                                  const std::vector<CodeUnit>& kept_code,
                                  const StubMaterial& stub,
                                  const std::vector<uint8_t>& manifest,
                                  const std::vector<uint8_t>& payload) {
        ZipWriter zip;

        // Retained entries in original order
        for (const auto& entry : bundle.archive.entries()) {
            if (removed.count(entry.name) || code_unit_index(entry.name) > 0 ||
                is_signature_file(entry.name)) {
                continue;
            }
            if (entry.name == MANIFEST_PATH) {
                zip.add(entry.name, manifest, ZIP_DEFLATED);
            } else if (entry.is_directory()) {
                zip.add_directory(entry.name);
            } else {
                uint32_t alignment = 0;
                if (entry.method == ZIP_STORED) {
                    alignment = is_library_path(entry.name) ? LIBRARY_ALIGNMENT : STORED_ALIGNMENT;
                }
                zip.add_raw(entry, bundle.archive.raw(entry), alignment);
            }
        }

        // Stub code units first, kept ones renumbered after them
        int index = 1;
        for (const auto& dex : stub.code_units) {
            zip.add(code_unit_name(index++), dex, ZIP_DEFLATED);
        }
        for (const auto& unit : kept_code) {
            ZipEntry renamed = unit.entry;
            renamed.name = code_unit_name(index++);
            zip.add_raw(renamed, bundle.archive.raw(unit.entry),
                        renamed.method == ZIP_STORED ? STORED_ALIGNMENT : 0);
        }

        for (const auto& [abi, image] : stub.libraries) {
            zip.add(library_path(abi, STUB_LIBRARY_NAME), image, ZIP_STORED, LIBRARY_ALIGNMENT);
        }
        zip.add(PAYLOAD_ASSET_PATH, payload, ZIP_STORED, STORED_ALIGNMENT);

        return zip.finish();
    }

    PackConfig config;
    std::unique_ptr<Signer> signer;
};

Packer::Packer(PackConfig config)
    : Packer(std::move(config), std::make_unique<ApkSignerTool>()) {}

Packer::Packer(PackConfig config, std::unique_ptr<Signer> signer)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(signer))) {}

Packer::~Packer() = default;

bool Packer::pack() {
    log_.clear();
    error_.clear();
    error_code_ = BuildError::None;
    report_ = PackReport{};

    try {
        impl_->run(log_, report_);
    } catch (const PackError& e) {
        error_ = e.what();
        error_code_ = e.code();
        log_ += std::string("Failed (") + to_string(e.code()) + "): " + e.what() + "\n";
        return false;
    } catch (const std::exception& e) {
        error_ = "Pack failed: " + std::string(e.what());
        error_code_ = BuildError::IoError;
        log_ += error_ + "\n";
        return false;
    }

    if (report_.signing == SigningStatus::Unavailable) {
        error_code_ = BuildError::SigningUnavailable;
        for (const auto& w : report_.warnings) {
            if (w.code == BuildError::SigningUnavailable) {
                error_ = w.message;
            }
        }
        return false;
    }
    return true;
}

InspectReport Packer::inspect(const std::string& path) {
    InspectReport result;
    try {
        ZipReader archive = ZipReader::open(path);

        if (const ZipEntry* manifest = archive.find(MANIFEST_PATH)) {
            auto doc = axml::decode(archive.read(*manifest));
            result.original_application = find_meta_data(doc, meta::ORIGINAL_APPLICATION).value_or("");
        }

        const ZipEntry* payload_entry = archive.find(PAYLOAD_ASSET_PATH);
        if (!payload_entry) {
            result.error = "No payload at " + std::string(PAYLOAD_ASSET_PATH);
            return result;
        }
        result.has_payload = true;
        PayloadReader payload(archive.read(*payload_entry));
        result.entries = payload.entries();

        std::set<crypto::Digest> digests;
        for (const auto& entry : payload.entries()) {
            if (entry.size > 0) {
                digests.insert(entry.digest);
            }
        }

        bool provisioned = true;
        for (const auto& entry : archive.entries()) {
            if (entry.is_directory() || entry.name == PAYLOAD_ASSET_PATH) {
                continue;
            }
            auto bytes = archive.read(entry);
            if (is_library_path(entry.name) && entry.name.ends_with(std::string("/") + STUB_LIBRARY_NAME)) {
                result.stub_abis.push_back(entry.name.substr(4, entry.name.find('/', 4) - 4));
                provisioned = provisioned && key_slots_provisioned(bytes);
            }
            if (!bytes.empty() && digests.count(crypto::sha256(bytes))) {
                result.cleartext_leaks.push_back(entry.name);
            }
        }
        result.keys_provisioned = provisioned && !result.stub_abis.empty();
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace husk
