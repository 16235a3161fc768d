/**
 * @file test_delegation.cpp
 * @brief Tests for application delegation, component factory forwarding and bootstrap
 */

#undef NDEBUG

#include "../include/husk_bootstrap.hpp"
#include "../include/husk_delegation.hpp"
#include "../include/husk_loader.hpp"
#include "fakes.hpp"
#include "fixtures.hpp"
#include <atomic>
#include <chrono>
#include <cassert>
#include <iostream>
#include <thread>

using namespace husk;
using fakes::FakeApplication;
using fakes::FakePlatform;
using fakes::FakeReflection;

namespace {

const char* ORIGINAL = "com.example.app.ExampleApp";

DelegationRequest make_request(const Handle& stub, int level = 30) {
    DelegationRequest request;
    request.application_class = ORIGINAL;
    request.stub = stub;
    request.base_context = std::make_shared<std::string>("base context");
    request.capability_level = level;
    return request;
}

template <typename Fn>
RunError load_error_of(Fn&& fn) {
    try {
        fn();
    } catch (const LoadError& e) {
        return e.reason();
    }
    return RunError::None;
}

/**
 * @brief A loader at NATIVE_READY over an empty payload
 */
struct ReadyLoader {
    fixtures::TempDir dir;
    crypto::Key key = crypto::generate_key();
    fakes::FakeEnvironment env{30, PayloadWriter().finish(), dir.file("cache")};
    RuntimeLoader loader{env, std::make_unique<fixtures::FixedKeyProvider>(key), [] {
        LoaderOptions options;
        options.abi = "x86_64";
        options.debugger_probe = [] { return false; };
        return options;
    }()};

    ReadyLoader() { loader.load(); }
};

} // namespace

void test_strategy_table() {
    std::cout << "Test: Strategy table...";

    FakePlatform platform;
    auto table = fakes::fake_strategies(platform, 21, 27);
    table.add(28, 36, [&platform] { return std::make_unique<fakes::FakeStrategy>(platform, "modern"); });

    assert(table.supports(21) && table.supports(27) && table.supports(36));
    assert(!table.supports(20) && !table.supports(37));
    assert(table.select(27)->name() == "fake");
    assert(table.select(28)->name() == "modern");
    assert(load_error_of([&] { table.select(19); }) == RunError::UnsupportedPlatformCapability);

    bool threw = false;
    try {
        table.add(30, 40, [&platform] { return std::make_unique<fakes::FakeStrategy>(platform, "overlap"); });
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASSED" << std::endl;
}

void test_swap_replaces_every_reference() {
    std::cout << "Test: Swap replaces every reference...";

    FakePlatform platform;
    Handle stub = std::make_shared<std::string>("stub");
    fakes::seed_platform(platform, stub);
    auto table = fakes::fake_strategies(platform);

    FakeReflection reflection;
    reflection.known_classes = {ORIGINAL};
    Delegator delegator(reflection, table);

    auto request = make_request(stub);
    Handle original = delegator.instantiate(request);
    delegator.install(request, original);

    assert(platform.fields["ActivityThread.mInitialApplication"] == original);
    assert(platform.fields["ActivityThread.mAllApplications[0]"] == original);
    assert(platform.fields["LoadedApk.mApplication"] == original);
    // Unrelated fields are left alone
    assert(*std::static_pointer_cast<std::string>(platform.fields["ContextImpl.mOuterContext"]) == "activity");

    auto& app = FakeReflection::as_app(original);
    assert(app.class_name == ORIGINAL);
    assert(app.base_context == request.base_context);
    assert(app.starts == 0);

    std::cout << " PASSED" << std::endl;
}

void test_swap_rolls_back() {
    std::cout << "Test: Swap rolls back...";

    FakePlatform platform;
    Handle stub = std::make_shared<std::string>("stub");
    fakes::seed_platform(platform, stub);
    platform.read_only.insert("LoadedApk.mApplication");
    auto table = fakes::fake_strategies(platform);

    FakeReflection reflection;
    reflection.known_classes = {ORIGINAL};
    Delegator delegator(reflection, table);

    auto request = make_request(stub);
    Handle original = delegator.instantiate(request);
    assert(load_error_of([&] { delegator.install(request, original); }) ==
           RunError::UnsupportedPlatformCapability);

    // Fields written before the failure point at the stub again
    assert(platform.fields["ActivityThread.mInitialApplication"] == stub);
    assert(platform.fields["ActivityThread.mAllApplications[0]"] == stub);
    assert(platform.fields["LoadedApk.mApplication"] == stub);

    std::cout << " PASSED" << std::endl;
}

void test_unsupported_level() {
    std::cout << "Test: Unsupported level...";

    FakePlatform platform;
    Handle stub = std::make_shared<std::string>("stub");
    fakes::seed_platform(platform, stub);
    auto table = fakes::fake_strategies(platform, 21, 34);

    FakeReflection reflection;
    reflection.known_classes = {ORIGINAL};
    Delegator delegator(reflection, table);

    auto request = make_request(stub, 40);
    Handle original = delegator.instantiate(request);
    assert(load_error_of([&] { delegator.install(request, original); }) ==
           RunError::UnsupportedPlatformCapability);
    assert(platform.fields["LoadedApk.mApplication"] == stub);

    // A strategy that finds nothing to swap is no better
    FakePlatform empty;
    auto empty_table = fakes::fake_strategies(empty);
    Delegator nothing(reflection, empty_table);
    assert(load_error_of([&] { nothing.install(make_request(stub), original); }) ==
           RunError::UnsupportedPlatformCapability);

    std::cout << " PASSED" << std::endl;
}

void test_construction_failures() {
    std::cout << "Test: Construction failures...";

    FakePlatform platform;
    auto table = fakes::fake_strategies(platform);
    Handle stub = std::make_shared<std::string>("stub");

    FakeReflection missing;
    Delegator missing_delegator(missing, table);
    assert(load_error_of([&] { missing_delegator.instantiate(make_request(stub)); }) ==
           RunError::OriginalApplicationConstructionFailed);

    FakeReflection throwing;
    throwing.throwing_classes = {ORIGINAL};
    Delegator throwing_delegator(throwing, table);
    assert(load_error_of([&] { throwing_delegator.instantiate(make_request(stub)); }) ==
           RunError::OriginalApplicationConstructionFailed);

    FakeReflection attach;
    attach.known_classes = {ORIGINAL};
    attach.fail_attach = true;
    Delegator attach_delegator(attach, table);
    assert(load_error_of([&] { attach_delegator.instantiate(make_request(stub)); }) ==
           RunError::OriginalApplicationConstructionFailed);

    std::cout << " PASSED" << std::endl;
}

void test_finish_deferred_init() {
    std::cout << "Test: Finish with deferred init...";

    FakePlatform platform;
    auto table = fakes::fake_strategies(platform);
    Handle stub = std::make_shared<std::string>("stub");

    // Deferred configuration completes before the start hook
    FakeReflection offering;
    offering.known_classes = {ORIGINAL};
    offering.configuration_classes = {ORIGINAL};
    Delegator with_config(offering, table);
    Handle app = with_config.instantiate(make_request(stub));
    with_config.finish(app);
    assert((offering.events == std::vector<std::string>{"attach", "probe", "deferred:configuration", "start"}));

    // Absent capability is not an error
    FakeReflection plain;
    plain.known_classes = {ORIGINAL};
    Delegator without(plain, table);
    Handle plain_app = without.instantiate(make_request(stub));
    without.finish(plain_app);
    assert((plain.events == std::vector<std::string>{"attach", "probe", "start"}));

    // Neither is a provider that throws
    FakeReflection failing;
    failing.known_classes = {ORIGINAL};
    failing.fail_probe = true;
    Delegator tolerant(failing, table);
    Handle failing_app = tolerant.instantiate(make_request(stub));
    tolerant.finish(failing_app);
    assert(FakeReflection::as_app(failing_app).starts == 1);

    std::cout << " PASSED" << std::endl;
}

void test_delegate_records_states() {
    std::cout << "Test: Delegate records states...";

    FakePlatform platform;
    Handle stub = std::make_shared<std::string>("stub");
    fakes::seed_platform(platform, stub);
    auto table = fakes::fake_strategies(platform);

    FakeReflection reflection;
    reflection.known_classes = {ORIGINAL};
    LoaderState state_at_start = LoaderState::Init;
    ReadyLoader ready;
    reflection.on_start = [&](FakeApplication&) { state_at_start = ready.loader.state(); };

    Delegator delegator(reflection, table);
    Handle original = delegator.delegate(make_request(stub), ready.loader);

    assert(ready.loader.state() == LoaderState::Running);
    assert(state_at_start == LoaderState::Delegated);
    assert(FakeReflection::as_app(original).starts == 1);
    assert(platform.fields["LoadedApk.mApplication"] == original);

    // A failed construction leaves the loader FAILED with that reason
    FakeReflection broken;
    ReadyLoader failed;
    Delegator broken_delegator(broken, table);
    assert(load_error_of([&] { broken_delegator.delegate(make_request(stub), failed.loader); }) ==
           RunError::OriginalApplicationConstructionFailed);
    assert(failed.loader.state() == LoaderState::Failed);
    assert(failed.loader.failure() == RunError::OriginalApplicationConstructionFailed);

    std::cout << " PASSED" << std::endl;
}

void test_component_factory_delegate() {
    std::cout << "Test: Component factory delegate...";

    FakeReflection reflection;
    reflection.known_classes = {"androidx.core.app.CoreComponentFactory"};

    ComponentFactoryDelegate none(reflection, "");
    assert(!none.forwarding());
    assert(none.resolve() == nullptr);
    assert(reflection.constructions == 0);

    ComponentFactoryDelegate declared(reflection, "androidx.core.app.CoreComponentFactory");
    assert(declared.forwarding());
    Handle first = declared.resolve();
    Handle second = declared.resolve();
    assert(first != nullptr && first == second);
    assert(reflection.constructions == 1);

    // An unconstructible factory falls back to the platform default
    ComponentFactoryDelegate missing(reflection, "com.example.MissingFactory");
    assert(missing.resolve() == nullptr);
    assert(missing.resolve() == nullptr);
    assert(reflection.constructions == 2);

    reflection.throwing_classes = {"com.example.BrokenFactory"};
    ComponentFactoryDelegate broken(reflection, "com.example.BrokenFactory");
    assert(broken.resolve() == nullptr);

    std::cout << " PASSED" << std::endl;
}

void test_bootstrap_once() {
    std::cout << "Test: Bootstrap once...";

    // A throwing start propagates and may be retried
    bool threw = false;
    try {
        bootstrap::ensure_started([] { throw LoadError(RunError::KeyUnavailable, "not yet"); });
    } catch (const LoadError& e) {
        threw = e.reason() == RunError::KeyUnavailable;
    }
    assert(threw);
    assert(!bootstrap::started());

    std::atomic<int> runs{0};
    bool nested_result = true;
    auto init = [&] {
        ++runs;
        // A hook reached while loading must not start a second load
        nested_result = bootstrap::ensure_started([&] { ++runs; });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    };

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            if (bootstrap::ensure_started(init)) {
                ++winners;
            }
            // Every caller returns only after the load finished
            assert(bootstrap::started());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(runs == 1);
    assert(winners == 1);
    assert(!nested_result);
    assert(bootstrap::started());
    assert(!bootstrap::ensure_started(init));
    assert(runs == 1);

    std::cout << " PASSED" << std::endl;
}

int main() {
    std::cout << "Running delegation tests...\n" << std::endl;

    try {
        test_strategy_table();
        test_swap_replaces_every_reference();
        test_swap_rolls_back();
        test_unsupported_level();
        test_construction_failures();
        test_finish_deferred_init();
        test_delegate_records_states();
        test_component_factory_delegate();
        test_bootstrap_once();

        std::cout << "\nAll tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
