#pragma once

/**
 * @file fakes.hpp
 * @brief In-process stand-ins for the platform services the runtime uses
 */

#include "../include/husk_delegation.hpp"
#include "../include/husk_errors.hpp"
#include "../include/husk_loader.hpp"
#include "fixtures.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace fakes {

/**
 * @brief Process services that record what was registered
 */
class FakeEnvironment : public husk::RuntimeEnvironment {
public:
    FakeEnvironment(int level, std::vector<uint8_t> payload, std::string cache_dir)
        : level_(level), payload_(std::move(payload)), cache_dir_(std::move(cache_dir)) {}

    int capability_level() const override { return level_; }

    std::vector<uint8_t> read_payload() override {
        if (payload_.empty()) {
            throw husk::LoadError(husk::RunError::PayloadCorrupt, "No payload in package");
        }
        return payload_;
    }

    std::string code_cache_dir() const override { return cache_dir_; }

    void register_in_memory(const std::vector<std::span<const uint8_t>>& units,
                            const std::string& library_dir) override {
        ++registrations;
        for (const auto& unit : units) {
            memory_units.emplace_back(unit.begin(), unit.end());
        }
        this->library_dir = library_dir;
    }

    void register_files(const std::vector<std::string>& paths, const std::string& library_dir) override {
        ++registrations;
        files = paths;
        for (const auto& path : paths) {
            file_contents.push_back(fixtures::read_file(path));
        }
        this->library_dir = library_dir;
    }

    /**
     * @brief Code units in registration order, whichever strategy ran
     */
    const std::vector<std::vector<uint8_t>>& registered_units() const {
        return memory_units.empty() ? file_contents : memory_units;
    }

    int registrations = 0;
    std::vector<std::vector<uint8_t>> memory_units;
    std::vector<std::string> files;
    std::vector<std::vector<uint8_t>> file_contents;
    std::string library_dir;

private:
    int level_;
    std::vector<uint8_t> payload_;
    std::string cache_dir_;
};

/**
 * @brief An application object created through FakeReflection
 */
struct FakeApplication {
    std::string class_name;
    husk::Handle base_context;
    int starts = 0;
    bool offers_configuration = false;
};

/**
 * @brief Named fields of a simulated platform, each holding an object
 */
struct FakePlatform {
    std::map<std::string, husk::Handle> fields;
    std::set<std::string> read_only;  // writes to these fail
};

class FakeSlot : public husk::ReferenceSlot {
public:
    FakeSlot(FakePlatform& platform, std::string field) : platform_(platform), field_(std::move(field)) {}

    std::string describe() const override { return field_; }
    husk::Handle read() const override { return platform_.fields.at(field_); }
    void write(const husk::Handle& value) override {
        if (platform_.read_only.count(field_)) {
            throw std::runtime_error("field " + field_ + " is final");
        }
        platform_.fields[field_] = value;
    }

private:
    FakePlatform& platform_;
    std::string field_;
};

/**
 * @brief Finds every platform field currently holding the stub
 */
class FakeStrategy : public husk::DelegationStrategy {
public:
    FakeStrategy(FakePlatform& platform, std::string name) : platform_(platform), name_(std::move(name)) {}

    std::string name() const override { return name_; }

    std::vector<std::unique_ptr<husk::ReferenceSlot>> locate(const husk::Handle& stub) override {
        std::vector<std::unique_ptr<husk::ReferenceSlot>> slots;
        for (const auto& [field, value] : platform_.fields) {
            if (value == stub) {
                slots.push_back(std::make_unique<FakeSlot>(platform_, field));
            }
        }
        return slots;
    }

private:
    FakePlatform& platform_;
    std::string name_;
};

/**
 * @brief Reflection over a fixed set of constructible class names
 */
class FakeReflection : public husk::ReflectionBoundary {
public:
    husk::Handle construct(const std::string& class_name) override {
        ++constructions;
        if (throwing_classes.count(class_name)) {
            throw std::runtime_error("constructor of " + class_name + " threw");
        }
        if (!known_classes.count(class_name)) {
            return nullptr;
        }
        auto app = std::make_shared<FakeApplication>();
        app->class_name = class_name;
        app->offers_configuration = configuration_classes.count(class_name) > 0;
        created.push_back(app);
        return app;
    }

    void attach(const husk::Handle& application, const husk::Handle& base_context) override {
        events.push_back("attach");
        if (fail_attach) {
            throw std::runtime_error("attach failed");
        }
        as_app(application).base_context = base_context;
    }

    void start(const husk::Handle& application) override {
        events.push_back("start");
        auto& app = as_app(application);
        ++app.starts;
        if (on_start) {
            on_start(app);
        }
    }

    husk::Handle probe_configuration_provider(const husk::Handle& application) override {
        events.push_back("probe");
        if (fail_probe) {
            throw std::runtime_error("provider threw");
        }
        if (!as_app(application).offers_configuration) {
            return nullptr;
        }
        return std::make_shared<std::string>("configuration");
    }

    void complete_deferred_init(const husk::Handle& configuration) override {
        events.push_back("deferred:" + *std::static_pointer_cast<std::string>(configuration));
    }

    static FakeApplication& as_app(const husk::Handle& handle) {
        return *std::static_pointer_cast<FakeApplication>(handle);
    }

    std::set<std::string> known_classes;
    std::set<std::string> throwing_classes;
    std::set<std::string> configuration_classes;
    bool fail_attach = false;
    bool fail_probe = false;
    std::function<void(FakeApplication&)> on_start;

    int constructions = 0;
    std::vector<std::string> events;
    std::vector<std::shared_ptr<FakeApplication>> created;
};

/**
 * @brief A platform with the stub recorded in three places
 */
inline void seed_platform(FakePlatform& platform, const husk::Handle& stub) {
    platform.fields["ActivityThread.mInitialApplication"] = stub;
    platform.fields["ActivityThread.mAllApplications[0]"] = stub;
    platform.fields["LoadedApk.mApplication"] = stub;
    platform.fields["ContextImpl.mOuterContext"] = std::make_shared<std::string>("activity");
}

inline husk::DelegationStrategyTable fake_strategies(FakePlatform& platform, int first = 21, int last = 36) {
    husk::DelegationStrategyTable table;
    table.add(first, last, [&platform] { return std::make_unique<FakeStrategy>(platform, "fake"); });
    return table;
}

} // namespace fakes
