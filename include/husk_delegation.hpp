#pragma once

/**
 * @file husk_delegation.hpp
 * @brief Hand-off from the stub application to the original one
 *
 * The stub never links against the original application's classes, so
 * everything it does to them goes through ReflectionBoundary. The places
 * where the platform remembers "the current application" differ between
 * platform versions; each DelegationStrategy knows one family of them and
 * DelegationStrategyTable picks the strategy by capability level.
 */

#include "husk_errors.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace husk {

class RuntimeLoader;

/**
 * @brief Opaque platform object (application instance, context, factory)
 */
using Handle = std::shared_ptr<void>;

/**
 * @brief Reflective access to classes the stub was not compiled against
 */
class ReflectionBoundary {
public:
    virtual ~ReflectionBoundary() = default;

    /**
     * @brief Instantiate a class through the registered code loader
     */
    virtual Handle construct(const std::string& class_name) = 0;

    /**
     * @brief Platform-defined attach of an application to its base context
     */
    virtual void attach(const Handle& application, const Handle& base_context) = 0;

    /**
     * @brief Invoke the application's start hook
     */
    virtual void start(const Handle& application) = 0;

    /**
     * @brief Configuration the application offers for a deferred platform
     * subsystem, or null when it does not implement that capability
     */
    virtual Handle probe_configuration_provider(const Handle& application) = 0;

    virtual void complete_deferred_init(const Handle& configuration) = 0;
};

/**
 * @brief One platform field holding the current application
 */
class ReferenceSlot {
public:
    virtual ~ReferenceSlot() = default;

    virtual std::string describe() const = 0;
    virtual Handle read() const = 0;
    virtual void write(const Handle& value) = 0;
};

/**
 * @brief Locates every reference to the stub on one family of platform versions
 */
class DelegationStrategy {
public:
    virtual ~DelegationStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Slots that currently hold `stub`
     * @throws LoadError(UnsupportedPlatformCapability) when the expected fields are missing
     */
    virtual std::vector<std::unique_ptr<ReferenceSlot>> locate(const Handle& stub) = 0;
};

/**
 * @brief Capability level ranges mapped to delegation strategies
 */
class DelegationStrategyTable {
public:
    using Factory = std::function<std::unique_ptr<DelegationStrategy>()>;

    /**
     * @brief Register a strategy for levels first..last inclusive
     * @throws std::invalid_argument when the range overlaps an existing one
     */
    void add(int first, int last, Factory factory);

    bool supports(int level) const;

    /**
     * @throws LoadError(UnsupportedPlatformCapability) for an unlisted level
     */
    std::unique_ptr<DelegationStrategy> select(int level) const;

private:
    struct Range {
        int first;
        int last;
        Factory factory;
    };
    std::vector<Range> ranges_;
};

/**
 * @brief Replace every slot's value, restoring all of them if any write fails
 * @throws LoadError(UnsupportedPlatformCapability) after a rollback
 */
void swap_references(std::vector<std::unique_ptr<ReferenceSlot>>& slots,
                     const Handle& previous, const Handle& replacement);

struct DelegationRequest {
    std::string application_class;
    Handle stub;
    Handle base_context;
    int capability_level = 0;
};

/**
 * @brief Constructs the original application and makes it current
 */
class Delegator {
public:
    Delegator(ReflectionBoundary& reflection, const DelegationStrategyTable& table);

    /**
     * @brief Construct and attach the original application
     * @throws LoadError(OriginalApplicationConstructionFailed)
     */
    Handle instantiate(const DelegationRequest& request);

    /**
     * @brief Point every platform reference at `original` instead of the stub
     */
    void install(const DelegationRequest& request, const Handle& original);

    /**
     * @brief Complete optional deferred initialization, then start the application
     */
    void finish(const Handle& original);

    /**
     * @brief All of the above, recording DELEGATED and RUNNING on the loader
     */
    Handle delegate(const DelegationRequest& request, RuntimeLoader& loader);

private:
    ReflectionBoundary& reflection_;
    const DelegationStrategyTable& table_;
};

/**
 * @brief Lazily constructed original component factory
 *
 * Instantiation requests are forwarded to the original factory when the
 * manifest declared one and it can be constructed; otherwise resolve() is
 * null and the platform default applies.
 */
class ComponentFactoryDelegate {
public:
    ComponentFactoryDelegate(ReflectionBoundary& reflection, std::string original_factory);

    Handle resolve();

    bool forwarding() const { return !original_factory_.empty(); }
    const std::string& original_factory() const { return original_factory_; }

private:
    ReflectionBoundary& reflection_;
    std::string original_factory_;
    std::once_flag once_;
    Handle factory_;
};

} // namespace husk
