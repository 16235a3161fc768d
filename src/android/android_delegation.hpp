#pragma once

/**
 * @file android_delegation.hpp
 * @brief Delegation boundaries implemented with JNI reflection
 */

#include "../../include/husk_delegation.hpp"
#include "jni_util.hpp"

namespace husk {
namespace android {

/**
 * @brief ReflectionBoundary over the class loader holding the protected code
 *
 * The deferred subsystem is the background work scheduler: an application
 * implementing androidx.work.Configuration.Provider gets WorkManager
 * initialized with the configuration it returns.
 */
class JniReflection : public ReflectionBoundary {
public:
    explicit JniReflection(Handle class_loader);

    Handle construct(const std::string& class_name) override;
    void attach(const Handle& application, const Handle& base_context) override;
    void start(const Handle& application) override;
    Handle probe_configuration_provider(const Handle& application) override;
    void complete_deferred_init(const Handle& configuration) override;

private:
    Handle loader_;
    Handle configured_application_;
};

/**
 * @brief Application references held by ActivityThread and LoadedApk
 *
 * Covers mInitialApplication, every mAllApplications element, the bound
 * LoadedApk's mApplication and the base context's outer context.
 */
class ActivityThreadStrategy : public DelegationStrategy {
public:
    std::string name() const override { return "activity-thread"; }
    std::vector<std::unique_ptr<ReferenceSlot>> locate(const Handle& stub) override;
};

/**
 * @brief Strategies for every supported platform level
 */
DelegationStrategyTable platform_strategies();

} // namespace android
} // namespace husk
