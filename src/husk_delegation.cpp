/**
 * @file husk_delegation.cpp
 * @brief Application delegation and reference swapping
 */

#include "../include/husk_delegation.hpp"
#include "../include/husk_loader.hpp"
#include "../include/husk_log.hpp"
#include <stdexcept>

namespace husk {

void DelegationStrategyTable::add(int first, int last, Factory factory) {
    if (first > last || !factory) {
        throw std::invalid_argument("Invalid delegation range");
    }
    for (const auto& range : ranges_) {
        if (first <= range.last && range.first <= last) {
            throw std::invalid_argument("Delegation range " + std::to_string(first) + ".." +
                                        std::to_string(last) + " overlaps an existing one");
        }
    }
    ranges_.push_back({first, last, std::move(factory)});
}

bool DelegationStrategyTable::supports(int level) const {
    for (const auto& range : ranges_) {
        if (level >= range.first && level <= range.last) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<DelegationStrategy> DelegationStrategyTable::select(int level) const {
    for (const auto& range : ranges_) {
        if (level >= range.first && level <= range.last) {
            return range.factory();
        }
    }
    throw LoadError(RunError::UnsupportedPlatformCapability,
                    "No delegation strategy for capability level " + std::to_string(level));
}

void swap_references(std::vector<std::unique_ptr<ReferenceSlot>>& slots,
                     const Handle& previous, const Handle& replacement) {
    std::vector<ReferenceSlot*> written;
    written.reserve(slots.size());

    for (auto& slot : slots) {
        try {
            slot->write(replacement);
            written.push_back(slot.get());
        } catch (const std::exception& e) {
            std::string failed = slot->describe();
            for (auto it = written.rbegin(); it != written.rend(); ++it) {
                try {
                    (*it)->write(previous);
                } catch (const std::exception& restore) {
                    HUSK_LOGE("Failed to restore %s: %s", (*it)->describe().c_str(), restore.what());
                }
            }
            throw LoadError(RunError::UnsupportedPlatformCapability,
                            "Reference swap failed at " + failed + ": " + e.what());
        }
    }
}

Delegator::Delegator(ReflectionBoundary& reflection, const DelegationStrategyTable& table)
    : reflection_(reflection), table_(table) {}

Handle Delegator::instantiate(const DelegationRequest& request) {
    Handle original;
    try {
        original = reflection_.construct(request.application_class);
    } catch (const std::exception& e) {
        throw LoadError(RunError::OriginalApplicationConstructionFailed,
                        "Cannot construct " + request.application_class + ": " + e.what());
    }
    if (!original) {
        throw LoadError(RunError::OriginalApplicationConstructionFailed,
                        "Cannot construct " + request.application_class);
    }

    try {
        reflection_.attach(original, request.base_context);
    } catch (const std::exception& e) {
        throw LoadError(RunError::OriginalApplicationConstructionFailed,
                        "Cannot attach " + request.application_class + ": " + e.what());
    }
    return original;
}

void Delegator::install(const DelegationRequest& request, const Handle& original) {
    auto strategy = table_.select(request.capability_level);
    auto slots = strategy->locate(request.stub);
    if (slots.empty()) {
        throw LoadError(RunError::UnsupportedPlatformCapability,
                        "Strategy " + strategy->name() + " found no application references");
    }

    swap_references(slots, request.stub, original);
    HUSK_LOGI("Swapped %zu references via %s", slots.size(), strategy->name().c_str());
}

void Delegator::finish(const Handle& original) {
    // Optional capability: absence or failure of the provider is not fatal
    try {
        Handle configuration = reflection_.probe_configuration_provider(original);
        if (configuration) {
            reflection_.complete_deferred_init(configuration);
        } else {
            HUSK_LOGD("Application offers no deferred configuration");
        }
    } catch (const std::exception& e) {
        HUSK_LOGW("Deferred initialization skipped: %s", e.what());
    }

    reflection_.start(original);
}

Handle Delegator::delegate(const DelegationRequest& request, RuntimeLoader& loader) {
    Handle original;
    loader.enter_delegated([&] {
        original = instantiate(request);
        install(request, original);
    });
    loader.enter_running([&] { finish(original); });
    return original;
}

ComponentFactoryDelegate::ComponentFactoryDelegate(ReflectionBoundary& reflection, std::string original_factory)
    : reflection_(reflection), original_factory_(std::move(original_factory)) {}

Handle ComponentFactoryDelegate::resolve() {
    if (!forwarding()) {
        return nullptr;
    }
    std::call_once(once_, [this] {
        try {
            factory_ = reflection_.construct(original_factory_);
        } catch (const std::exception& e) {
            HUSK_LOGW("Component factory %s unavailable: %s", original_factory_.c_str(), e.what());
            return;
        }
        if (!factory_) {
            HUSK_LOGW("Component factory %s unavailable, using platform default", original_factory_.c_str());
        }
    });
    return factory_;
}

} // namespace husk
