/**
 * @file husk_pack_tool.cpp
 * @brief Command-line front end of the hardening packer
 */

#include "../include/husk_packer.hpp"
#include <iostream>
#include <string>
#include <cstdlib>

namespace {

void print_usage(const char* program) {
    std::cout << "husk packer\n";
    std::cout << "===========\n\n";
    std::cout << "Usage: " << program << " [options] <input.apk> <output.apk>\n";
    std::cout << "       " << program << " --inspect <hardened.apk>\n";
    std::cout << "\nArguments:\n";
    std::cout << "  input.apk            Application package to harden\n";
    std::cout << "  output.apk           Where the hardened package is written\n";
    std::cout << "\nStub:\n";
    std::cout << "  --stub-dex <file>    Stub code unit (repeat in load order)\n";
    std::cout << "  --stub-libs <dir>    Directory holding <abi>/libhusk.so\n";
    std::cout << "\nProtection:\n";
    std::cout << "  --keep-class <name>  Leave the code unit defining this class in cleartext\n";
    std::cout << "  --keep-prefix <pkg>  Same, for every class under a package prefix\n";
    std::cout << "  --keep-lib <name>    Leave a native library in cleartext\n";
    std::cout << "  --encrypt-assets <glob>  Also encrypt matching assets\n";
    std::cout << "  --debug-policy <p>   ignore | log | abort (default log)\n";
    std::cout << "  --workers <n>        Encryption threads (default: all cores)\n";
    std::cout << "\nSigning:\n";
    std::cout << "  --no-sign            Leave the output unsigned\n";
    std::cout << "  --keystore <file>    Keystore (default: debug keystore)\n";
    std::cout << "  --ks-pass <pass>     Keystore password\n";
    std::cout << "  --key-alias <alias>  Key alias\n";
    std::cout << "  --key-pass <pass>    Key password (default: keystore password)\n";
    std::cout << "\nOther:\n";
    std::cout << "  --inspect <file>     Check a hardened package and exit\n";
    std::cout << "  -v, --verbose        Print the build log\n";
    std::cout << "  -h, --help           Show this help\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program << " --stub-dex stub.dex --stub-libs out/stub app.apk app-hardened.apk\n";
}

int inspect(const std::string& path) {
    auto report = husk::Packer::inspect(path);

    std::cout << "Package: " << path << "\n";
    if (!report.error.empty()) {
        std::cerr << "Error: " << report.error << "\n";
        return 1;
    }
    std::cout << "  Payload: " << (report.has_payload ? "present" : "missing") << "\n";
    std::cout << "  Delegates to: " << report.original_application << "\n";
    std::cout << "  Entries: " << report.entries.size() << "\n";
    for (const auto& entry : report.entries) {
        std::cout << "    " << husk::to_string(entry.kind) << "  " << entry.path;
        if (!entry.abi.empty()) {
            std::cout << "  (" << entry.abi << ")";
        }
        std::cout << "  " << entry.size << " bytes\n";
    }
    std::cout << "  Stub ABIs:";
    for (const auto& abi : report.stub_abis) {
        std::cout << " " << abi;
    }
    std::cout << "\n  Keys provisioned: " << (report.keys_provisioned ? "yes" : "no") << "\n";
    for (const auto& leak : report.cleartext_leaks) {
        std::cout << "  Cleartext copy of protected content: " << leak << "\n";
    }

    std::cout << (report.ok() ? "OK\n" : "FAILED\n");
    return report.ok() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    husk::PackConfig config;
    bool verbose = false;
    std::string inspect_path;

    int arg_idx = 1;
    while (arg_idx < argc) {
        std::string arg = argv[arg_idx];

        auto value = [&]() -> std::string {
            if (arg_idx + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                std::exit(1);
            }
            return argv[++arg_idx];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else if (arg == "--inspect") {
            inspect_path = value();
        }
        else if (arg == "--stub-dex") {
            config.stub_dex_paths.push_back(value());
        }
        else if (arg == "--stub-libs") {
            config.stub_library_dir = value();
        }
        else if (arg == "--keep-class") {
            config.keep_classes.push_back(value());
        }
        else if (arg == "--keep-prefix") {
            config.keep_prefixes.push_back(value());
        }
        else if (arg == "--keep-lib") {
            config.keep_libraries.push_back(value());
        }
        else if (arg == "--encrypt-assets") {
            config.encrypt_assets.push_back(value());
        }
        else if (arg == "--debug-policy") {
            std::string text = value();
            auto policy = husk::verify::parse_debugger_policy(text);
            if (!policy) {
                std::cerr << "Error: Unknown debug policy '" << text << "'\n";
                return 1;
            }
            config.debugger_policy = *policy;
        }
        else if (arg == "--workers") {
            std::string text = value();
            try {
                config.workers = static_cast<unsigned>(std::stoul(text));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count '" << text << "'\n";
                return 1;
            }
        }
        else if (arg == "--no-sign") {
            config.skip_signing = true;
        }
        else if (arg == "--keystore") {
            config.signing.keystore_path = value();
        }
        else if (arg == "--ks-pass") {
            config.signing.store_password = value();
        }
        else if (arg == "--key-alias") {
            config.signing.key_alias = value();
        }
        else if (arg == "--key-pass") {
            config.signing.key_password = value();
        }
        else if (arg[0] != '-' && config.target_path.empty()) {
            config.target_path = arg;
        }
        else if (arg[0] != '-' && config.output_path.empty()) {
            config.output_path = arg;
        }
        else {
            std::cerr << "Error: Unexpected argument " << arg << "\n";
            return 1;
        }

        ++arg_idx;
    }

    if (!inspect_path.empty()) {
        return inspect(inspect_path);
    }

    // Validate arguments
    if (config.target_path.empty() || config.output_path.empty()) {
        std::cerr << "Error: Input and output packages are required\n";
        return 1;
    }

    husk::Packer packer(config);

    std::cout << "Hardening " << config.target_path << "...\n";
    bool ok = packer.pack();

    if (verbose) {
        std::cout << "\n" << packer.get_log() << "\n";
    }

    const auto& report = packer.report();
    for (const auto& warning : report.warnings) {
        std::cout << "Warning (" << husk::to_string(warning.code) << "): " << warning.message << "\n";
    }

    if (!ok) {
        std::cerr << "Packing failed (" << husk::to_string(packer.get_error_code()) << "): "
                  << packer.get_error() << "\n";
        if (packer.get_error_code() == husk::BuildError::SigningUnavailable) {
            std::cerr << "The unsigned package was left at " << config.output_path << "\n";
        }
        return 1;
    }

    std::cout << "Protected " << report.protected_paths.size() << " entries ("
              << report.payload_size << " payload bytes), kept " << report.kept_paths.size() << "\n";
    std::cout << "Delegates to " << report.delegate_application << "\n";
    std::cout << "Signing: " << husk::to_string(report.signing) << "\n";
    std::cout << "Written: " << config.output_path << "\n";

    return 0;
}
