/**
 * @file husk_manifest.cpp
 * @brief Reading and patching the compiled application manifest
 */

#include "../include/husk_manifest.hpp"
#include "../include/husk_errors.hpp"
#include <charconv>

namespace husk {

using axml::ANDROID_NS;
using axml::Attribute;
using axml::Element;

namespace {

std::string string_attribute(const Element& element, std::string_view name) {
    const Attribute* a = element.find_attribute(ANDROID_NS, name);
    return a && a->is_string() ? a->string_value : std::string();
}

bool boolean_attribute(const Element& element, std::string_view ns, std::string_view name) {
    const Attribute* a = element.find_attribute(ns, name);
    if (!a) {
        return false;
    }
    if (a->type == axml::ValueType::IntBoolean) {
        return a->data != 0;
    }
    return a->is_string() && a->string_value == "true";
}

// minSdkVersion may be compiled as an integer or, for preview codenames, a string
std::optional<int> sdk_attribute(const Element& element, std::string_view name) {
    const Attribute* a = element.find_attribute(ANDROID_NS, name);
    if (!a) {
        return std::nullopt;
    }
    if (a->is_integer()) {
        return static_cast<int>(static_cast<int32_t>(a->data));
    }
    if (a->is_string()) {
        int value = 0;
        const auto& s = a->string_value;
        auto result = std::from_chars(s.data(), s.data() + s.size(), value);
        if (result.ec == std::errc() && result.ptr == s.data() + s.size()) {
            return value;
        }
    }
    return std::nullopt;
}

Element* find_meta_element(Element& application, std::string_view key) {
    for (auto* meta : application.children_named("meta-data")) {
        if (string_attribute(*meta, "name") == key) {
            return meta;
        }
    }
    return nullptr;
}

void set_meta_data(Element& application, const std::string& key, const std::string& value) {
    Element* meta = find_meta_element(application, key);
    if (!meta) {
        Element fresh;
        fresh.name = "meta-data";
        fresh.line = application.line;
        meta = &application.append_child(std::move(fresh));
    }
    meta->set_attribute(Attribute::string(ANDROID_NS, "name", axml::attr::NAME, key));
    meta->set_attribute(Attribute::string(ANDROID_NS, "value", axml::attr::VALUE, value));
}

void ensure_bootstrap_provider(Element& application, const std::string& package) {
    for (auto* provider : application.children_named("provider")) {
        if (string_attribute(*provider, "name") == STUB_PROVIDER_CLASS) {
            return;
        }
    }

    Element provider;
    provider.name = "provider";
    provider.line = application.line;
    provider.set_attribute(Attribute::string(ANDROID_NS, "name", axml::attr::NAME, STUB_PROVIDER_CLASS));
    provider.set_attribute(Attribute::boolean(ANDROID_NS, "exported", axml::attr::EXPORTED, false));
    provider.set_attribute(Attribute::string(ANDROID_NS, "authorities", axml::attr::AUTHORITIES,
                                             package + BOOTSTRAP_AUTHORITY_SUFFIX));
    provider.set_attribute(Attribute::integer(ANDROID_NS, "initOrder", axml::attr::INIT_ORDER,
                                              BOOTSTRAP_INIT_ORDER));
    application.append_child(std::move(provider));
}

} // namespace

std::string qualify_class_name(std::string_view package, std::string_view name) {
    if (name.empty()) {
        return {};
    }
    if (name.front() == '.') {
        return std::string(package) + std::string(name);
    }
    if (name.find('.') == std::string_view::npos) {
        return std::string(package) + "." + std::string(name);
    }
    return std::string(name);
}

ManifestSummary summarize_manifest(const axml::Document& doc) {
    const Element& root = doc.root;
    if (root.name != "manifest") {
        throw PackError(BuildError::ParseError, "Manifest root element is <" + root.name + ">");
    }

    ManifestSummary summary;
    if (const Attribute* package = root.find_attribute("", "package"); package && package->is_string()) {
        summary.package = package->string_value;
    }
    if (summary.package.empty()) {
        throw PackError(BuildError::ParseError, "Manifest declares no package name");
    }

    if (const Element* uses_sdk = root.first_child("uses-sdk")) {
        summary.min_sdk = sdk_attribute(*uses_sdk, "minSdkVersion").value_or(1);
        summary.target_sdk = sdk_attribute(*uses_sdk, "targetSdkVersion").value_or(summary.min_sdk);
    }

    if (const Element* application = root.first_child("application")) {
        summary.application_class =
            qualify_class_name(summary.package, string_attribute(*application, "name"));
        summary.component_factory =
            qualify_class_name(summary.package, string_attribute(*application, "appComponentFactory"));
        summary.debuggable = boolean_attribute(*application, ANDROID_NS, "debuggable");
    }
    return summary;
}

void check_split_configuration(const axml::Document& doc) {
    const Element& root = doc.root;

    if (const Attribute* split = root.find_attribute("", "split"); split && !split->text().empty()) {
        throw PackError(BuildError::UnsupportedSplitConfiguration,
                        "Input is a split package (" + split->text() + ")");
    }

    const Element* application = root.first_child("application");
    for (const Element* element : {&root, application}) {
        if (!element) {
            continue;
        }
        if (boolean_attribute(*element, ANDROID_NS, "isSplitRequired")) {
            throw PackError(BuildError::UnsupportedSplitConfiguration,
                            "Package requires split APKs (isSplitRequired)");
        }
        if (const Attribute* types = element->find_attribute(ANDROID_NS, "requiredSplitTypes");
            types && !types->text().empty()) {
            throw PackError(BuildError::UnsupportedSplitConfiguration,
                            "Package requires split types: " + types->text());
        }
    }
}

std::optional<std::string> find_meta_data(const axml::Document& doc, std::string_view key) {
    const Element* application = doc.root.first_child("application");
    if (!application) {
        return std::nullopt;
    }
    for (const auto& child : application->children) {
        if (child.name == "meta-data" && string_attribute(child, "name") == key) {
            const Attribute* value = child.find_attribute(ANDROID_NS, "value");
            return value ? value->text() : std::string();
        }
    }
    return std::nullopt;
}

void patch_manifest(axml::Document& doc, const ManifestPatch& patch) {
    Element& root = doc.root;
    std::string package;
    if (const Attribute* p = root.find_attribute("", "package"); p && p->is_string()) {
        package = p->string_value;
    }

    Element* application = root.first_child("application");
    if (!application) {
        Element fresh;
        fresh.name = "application";
        fresh.line = root.line;
        application = &root.append_child(std::move(fresh));
    }

    application->set_attribute(
        Attribute::string(ANDROID_NS, "name", axml::attr::NAME, STUB_APPLICATION_CLASS));
    application->set_attribute(
        Attribute::string(ANDROID_NS, "appComponentFactory", axml::attr::APP_COMPONENT_FACTORY,
                          STUB_FACTORY_CLASS));
    application->remove_attribute(ANDROID_NS, "debuggable");

    set_meta_data(*application, meta::ORIGINAL_APPLICATION, patch.original_application);
    if (!patch.original_factory.empty()) {
        set_meta_data(*application, meta::ORIGINAL_FACTORY, patch.original_factory);
    }
    set_meta_data(*application, meta::MIN_SDK, std::to_string(patch.min_sdk));
    set_meta_data(*application, meta::TARGET_SDK, std::to_string(patch.target_sdk));
    if (!patch.debug_policy.empty()) {
        set_meta_data(*application, meta::DEBUG_POLICY, patch.debug_policy);
    }

    ensure_bootstrap_provider(*application, package);
}

} // namespace husk
