/**
 * @file husk_signer.cpp
 * @brief Signing through the SDK command line tools
 */

#include "../include/husk_packer.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace husk {

namespace fs = std::filesystem;

namespace {

constexpr const char* DEBUG_STORE_PASSWORD = "android";
constexpr const char* DEBUG_KEY_ALIAS = "androiddebugkey";

std::string quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

int run(const std::string& command) {
    std::string quiet = command + " >/dev/null 2>&1";
    return std::system(quiet.c_str());
}

/**
 * @brief Run a tool with extra environment entries visible to it alone
 * @return Exit status, or -1 when it could not be started
 */
int run_with_env(const std::vector<std::string>& args, const std::vector<std::string>& extra_env) {
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        bool overridden = std::any_of(extra_env.begin(), extra_env.end(), [&](const std::string& extra) {
            return entry.substr(0, entry.find('=') + 1) == extra.substr(0, extra.find('=') + 1);
        });
        if (!overridden) {
            env_strings.emplace_back(entry);
        }
    }
    env_strings.insert(env_strings.end(), extra_env.begin(), extra_env.end());

    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (const auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    for (auto& entry : env_strings) {
        std::fill(entry.begin(), entry.end(), '\0');
    }
    if (rc != 0) {
        return -1;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool tool_available(const std::string& tool) {
    return run("command -v " + quote(tool)) == 0;
}

/**
 * @brief Credentials of the SDK debug keystore, creating one if needed
 */
SigningConfig debug_credentials(const SigningConfig& config) {
    SigningConfig debug = config;
    debug.store_password = DEBUG_STORE_PASSWORD;
    debug.key_password = DEBUG_STORE_PASSWORD;
    debug.key_alias = DEBUG_KEY_ALIAS;

    if (const char* home = std::getenv("HOME")) {
        fs::path sdk_store = fs::path(home) / ".android" / "debug.keystore";
        if (fs::exists(sdk_store)) {
            debug.keystore_path = sdk_store.string();
            return debug;
        }
    }

    fs::path store = fs::temp_directory_path() / "husk-debug.keystore";
    if (!fs::exists(store)) {
        if (!tool_available(config.keytool)) {
            throw PackError(BuildError::SigningUnavailable, "No debug keystore and keytool not found");
        }
        std::stringstream cmd;
        cmd << quote(config.keytool) << " -genkeypair -noprompt"
            << " -keystore " << quote(store.string())
            << " -storepass " << DEBUG_STORE_PASSWORD
            << " -keypass " << DEBUG_STORE_PASSWORD
            << " -alias " << DEBUG_KEY_ALIAS
            << " -keyalg RSA -keysize 2048 -validity 10000"
            << " -dname " << quote("CN=Android Debug,O=Android,C=US");
        if (run(cmd.str()) != 0) {
            throw PackError(BuildError::SigningUnavailable, "keytool failed to create a debug keystore");
        }
    }
    debug.keystore_path = store.string();
    return debug;
}

} // namespace

void ApkSignerTool::sign(const std::string& unsigned_path, const std::string& signed_path,
                         const SigningConfig& config) {
    if (!tool_available(config.apksigner)) {
        throw PackError(BuildError::SigningUnavailable, config.apksigner + " not found");
    }

    SigningConfig credentials = config.keystore_path.empty() ? debug_credentials(config) : config;
    if (!fs::exists(credentials.keystore_path)) {
        throw PackError(BuildError::SigningUnavailable, "Keystore not found: " + credentials.keystore_path);
    }

    // Entries are already aligned by the writer; zipalign is a second pass when present
    std::string input = unsigned_path;
    fs::path aligned = signed_path + ".aligned";
    if (tool_available(config.zipalign)) {
        std::string cmd = quote(config.zipalign) + " -p -f 4 " + quote(unsigned_path) + " " +
                          quote(aligned.string());
        if (run(cmd) == 0) {
            input = aligned.string();
        }
    }

    std::string key_password = credentials.key_password.empty() ? credentials.store_password
                                                                 : credentials.key_password;
    std::vector<std::string> args = {
        config.apksigner, "sign",
        "--ks", credentials.keystore_path,
        "--ks-pass", "env:HUSK_KS_PASS",
        "--key-pass", "env:HUSK_KEY_PASS",
        "--v4-signing-enabled", "false",
        "--out", signed_path,
    };
    if (!credentials.key_alias.empty()) {
        args.push_back("--ks-key-alias");
        args.push_back(credentials.key_alias);
    }
    args.push_back(input);

    // The passwords reach the signing tool's environment only
    int status = run_with_env(args, {"HUSK_KS_PASS=" + credentials.store_password,
                                     "HUSK_KEY_PASS=" + key_password});
    std::fill(key_password.begin(), key_password.end(), '\0');

    std::error_code ec;
    fs::remove(aligned, ec);

    if (status != 0) {
        throw PackError(BuildError::SigningUnavailable,
                        "apksigner failed with status " + std::to_string(status));
    }
}

} // namespace husk
