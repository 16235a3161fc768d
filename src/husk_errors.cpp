/**
 * @file husk_errors.cpp
 * @brief Names for the failure taxonomies
 */

#include "../include/husk_errors.hpp"

namespace husk {

const char* to_string(BuildError code) noexcept {
    switch (code) {
        case BuildError::None: return "None";
        case BuildError::ParseError: return "ParseError";
        case BuildError::ManifestIncomplete: return "ManifestIncomplete";
        case BuildError::UnsupportedSplitConfiguration: return "UnsupportedSplitConfiguration";
        case BuildError::SigningUnavailable: return "SigningUnavailable";
        case BuildError::StubMissing: return "StubMissing";
        case BuildError::NothingToProtect: return "NothingToProtect";
        case BuildError::IoError: return "IoError";
        case BuildError::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(RunError code) noexcept {
    switch (code) {
        case RunError::None: return "None";
        case RunError::PayloadCorrupt: return "PayloadCorrupt";
        case RunError::KeyUnavailable: return "KeyUnavailable";
        case RunError::AuthenticationFailure: return "AuthenticationFailure";
        case RunError::UnsupportedPlatformCapability: return "UnsupportedPlatformCapability";
        case RunError::NativeLibraryMissingForAbi: return "NativeLibraryMissingForAbi";
        case RunError::OriginalApplicationConstructionFailed: return "OriginalApplicationConstructionFailed";
        case RunError::DebuggerDetected: return "DebuggerDetected";
        case RunError::IoError: return "IoError";
    }
    return "Unknown";
}

} // namespace husk
