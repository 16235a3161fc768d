/**
 * @file husk_loader.cpp
 * @brief Runtime loader state machine
 */

#include "../include/husk_loader.hpp"
#include "../include/husk_log.hpp"
#include "../include/husk_manifest.hpp"
#include <charconv>
#include <mutex>
#include <stdexcept>

namespace husk {

namespace {

constexpr unsigned CODE_FILE_MODE = 0400;

int meta_int(const axml::Document& manifest, const char* key) {
    auto text = find_meta_data(manifest, key);
    int value = 0;
    if (text && std::from_chars(text->data(), text->data() + text->size(), value).ec != std::errc()) {
        HUSK_LOGW("Ignoring malformed %s '%s'", key, text->c_str());
        value = 0;
    }
    return value;
}

} // namespace

LoaderOptions options_from_manifest(const axml::Document& manifest) {
    LoaderOptions options;
    options.original_application =
        find_meta_data(manifest, meta::ORIGINAL_APPLICATION).value_or(DEFAULT_APPLICATION_CLASS);
    options.original_factory = find_meta_data(manifest, meta::ORIGINAL_FACTORY).value_or("");
    options.min_sdk = meta_int(manifest, meta::MIN_SDK);
    options.target_sdk = meta_int(manifest, meta::TARGET_SDK);

    if (auto text = find_meta_data(manifest, meta::DEBUG_POLICY)) {
        if (auto policy = verify::parse_debugger_policy(*text)) {
            options.debugger_policy = *policy;
        } else {
            HUSK_LOGW("Unknown debugger policy '%s'", text->c_str());
        }
    }
    return options;
}

const char* to_string(LoaderState state) noexcept {
    switch (state) {
        case LoaderState::Init: return "INIT";
        case LoaderState::KeyResolved: return "KEY_RESOLVED";
        case LoaderState::StrategySelected: return "STRATEGY_SELECTED";
        case LoaderState::CodeLoaded: return "CODE_LOADED";
        case LoaderState::NativeReady: return "NATIVE_READY";
        case LoaderState::Delegated: return "DELEGATED";
        case LoaderState::Running: return "RUNNING";
        case LoaderState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* to_string(LoadStrategy strategy) noexcept {
    switch (strategy) {
        case LoadStrategy::InMemory: return "in-memory";
        case LoadStrategy::FileBased: return "file-based";
    }
    return "unknown";
}

LoadStrategy select_strategy(int capability_level) noexcept {
    return capability_level >= IN_MEMORY_MIN_LEVEL ? LoadStrategy::InMemory : LoadStrategy::FileBased;
}

bool in_memory_takes_library_path(int capability_level) noexcept {
    return capability_level >= IN_MEMORY_LIBRARY_PATH_MIN_LEVEL;
}

class RuntimeLoader::Impl {
public:
    Impl(RuntimeEnvironment& env, std::unique_ptr<KeyProvider> keys, LoaderOptions options)
        : env_(env), keys_(std::move(keys)), options_(std::move(options)) {
        session_.abi = options_.abi;
    }

    ~Impl() {
        cache_.reset();
        crypto::secure_clear(key_);
    }

    void load() {
        advance(LoaderState::Init, LoaderState::KeyResolved, RunError::KeyUnavailable,
                [this] { resolve_key(); });
        advance(LoaderState::KeyResolved, LoaderState::StrategySelected, RunError::UnsupportedPlatformCapability,
                [this] { choose_strategy(); });
        advance(LoaderState::StrategySelected, LoaderState::CodeLoaded, RunError::IoError,
                [this] { load_code(); });
        advance(LoaderState::CodeLoaded, LoaderState::NativeReady, RunError::IoError,
                [this] { prepare_native(); });
    }

    void enter_delegated(const std::function<void()>& install) {
        advance(LoaderState::NativeReady, LoaderState::Delegated,
                RunError::OriginalApplicationConstructionFailed, install);
    }

    void enter_running(const std::function<void()>& start) {
        advance(LoaderState::Delegated, LoaderState::Running,
                RunError::OriginalApplicationConstructionFailed, start);
    }

    std::optional<std::string> find_library(std::string_view name) {
        NativeLibraryCache* cache = nullptr;
        {
            std::lock_guard<std::mutex> guard(state_lock_);
            cache = cache_.get();
        }
        if (!cache) {
            return std::nullopt;
        }
        return cache->find_library(name);
    }

    std::optional<std::vector<uint8_t>> open_asset(const std::string& path) {
        {
            std::lock_guard<std::mutex> guard(state_lock_);
            if (state_ == LoaderState::Failed || !payload_ || state_ < LoaderState::CodeLoaded) {
                throw LoadError(RunError::KeyUnavailable,
                                std::string("Assets are unavailable in state ") + to_string(state_));
            }
        }
        const PayloadIndexEntry* entry = payload_->find(EntryKind::Asset, path);
        if (!entry) {
            return std::nullopt;
        }
        return payload_->decrypt(*entry, key_);
    }

    LoaderState state() const {
        std::lock_guard<std::mutex> guard(state_lock_);
        return state_;
    }

    RunError failure() const {
        std::lock_guard<std::mutex> guard(state_lock_);
        return failure_;
    }

    const std::string& get_error() const { return error_; }
    const LoaderSession& session() const { return session_; }
    const LoaderOptions& options() const { return options_; }

private:
    /**
     * @brief Run one transition; any exception leaves the loader FAILED
     */
    void advance(LoaderState from, LoaderState to, RunError fallback, const std::function<void()>& step) {
        {
            std::lock_guard<std::mutex> guard(state_lock_);
            if (state_ != from) {
                throw std::logic_error(std::string("Loader cannot move to ") + to_string(to) +
                                       " from " + to_string(state_));
            }
        }

        try {
            step();
        } catch (const LoadError& e) {
            fail(e.reason(), e.what());
            throw;
        } catch (const std::exception& e) {
            fail(fallback, e.what());
            throw LoadError(fallback, e.what());
        }

        std::lock_guard<std::mutex> guard(state_lock_);
        state_ = to;
        HUSK_LOGD("Loader %s", to_string(to));
    }

    void fail(RunError reason, const std::string& message) {
        std::lock_guard<std::mutex> guard(state_lock_);
        HUSK_LOGE("Loader failed in %s: %s (%s)", to_string(state_), message.c_str(), to_string(reason));
        state_ = LoaderState::Failed;
        failure_ = reason;
        error_ = message;
    }

    void resolve_key() {
        session_.debugger_reported =
            verify::enforce_debugger_policy(options_.debugger_policy, options_.debugger_probe);

        if (!keys_) {
            throw LoadError(RunError::KeyUnavailable, "No key provider");
        }
        key_ = keys_->resolve();
        keys_.reset();

        payload_ = std::make_unique<PayloadReader>(env_.read_payload());
        HUSK_LOGI("Payload v%u with %zu entries", payload_->version(), payload_->entries().size());
    }

    void choose_strategy() {
        session_.capability_level = env_.capability_level();
        if (session_.capability_level <= 0) {
            throw LoadError(RunError::UnsupportedPlatformCapability,
                            "Unknown capability level " + std::to_string(session_.capability_level));
        }
        session_.strategy = select_strategy(session_.capability_level);
        HUSK_LOGI("Capability level %d, %s loading", session_.capability_level,
                  to_string(session_.strategy));
    }

    void load_code() {
        auto units = payload_->code_units();

        // Everything is authenticated before the platform sees any of it
        std::vector<memory::ProtectedBuffer> plaintexts;
        plaintexts.reserve(units.size());
        for (const auto* unit : units) {
            crypto::SecureBuffer decrypted(payload_->decrypt(*unit, key_));
            plaintexts.emplace_back(decrypted.data());
            session_.code_units.push_back(unit->path);
        }

        std::string library_dir = native_directory();

        if (session_.strategy == LoadStrategy::InMemory) {
            std::vector<std::span<const uint8_t>> views;
            views.reserve(plaintexts.size());
            for (const auto& buffer : plaintexts) {
                views.push_back(buffer.view());
            }
            if (!in_memory_takes_library_path(session_.capability_level)) {
                library_dir.clear();
            }
            env_.register_in_memory(views, library_dir);
        } else {
            std::string code_dir = env_.code_cache_dir() + "/husk-dex";
            make_private_directory(code_dir);
            for (size_t i = 0; i < plaintexts.size(); ++i) {
                std::string path = code_dir + "/" + session_.code_units[i];
                install_private_file(path, plaintexts[i].view(), CODE_FILE_MODE);
                session_.code_files.push_back(path);
            }
            env_.register_files(session_.code_files, library_dir);
        }

        HUSK_LOGI("Registered %zu code units", plaintexts.size());
    }

    void prepare_native() {
        auto cache = std::make_unique<NativeLibraryCache>(*payload_, key_, options_.abi, env_.code_cache_dir());
        std::lock_guard<std::mutex> guard(state_lock_);
        cache_ = std::move(cache);
    }

    std::string native_directory() const {
        return env_.code_cache_dir() + "/husk-native/" + options_.abi;
    }

    RuntimeEnvironment& env_;
    std::unique_ptr<KeyProvider> keys_;
    LoaderOptions options_;
    LoaderSession session_;

    crypto::Key key_{};
    std::unique_ptr<PayloadReader> payload_;
    std::unique_ptr<NativeLibraryCache> cache_;

    mutable std::mutex state_lock_;
    LoaderState state_ = LoaderState::Init;
    RunError failure_ = RunError::None;
    std::string error_;
};

RuntimeLoader::RuntimeLoader(RuntimeEnvironment& env, std::unique_ptr<KeyProvider> keys, LoaderOptions options)
    : impl_(std::make_unique<Impl>(env, std::move(keys), std::move(options))) {}

RuntimeLoader::~RuntimeLoader() = default;

void RuntimeLoader::load() {
    impl_->load();
}

void RuntimeLoader::enter_delegated(const std::function<void()>& install) {
    impl_->enter_delegated(install);
}

void RuntimeLoader::enter_running(const std::function<void()>& start) {
    impl_->enter_running(start);
}

LoaderState RuntimeLoader::state() const {
    return impl_->state();
}

RunError RuntimeLoader::failure() const {
    return impl_->failure();
}

const std::string& RuntimeLoader::get_error() const {
    return impl_->get_error();
}

const LoaderSession& RuntimeLoader::session() const {
    return impl_->session();
}

const LoaderOptions& RuntimeLoader::options() const {
    return impl_->options();
}

std::optional<std::string> RuntimeLoader::find_library(std::string_view name) {
    return impl_->find_library(name);
}

std::optional<std::vector<uint8_t>> RuntimeLoader::open_asset(const std::string& path) {
    return impl_->open_asset(path);
}

} // namespace husk
