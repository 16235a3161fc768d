/**
 * @file husk_jni.cpp
 * @brief Native entry points of the stub library
 *
 * The first early hook to run (component factory, stub application or
 * bootstrap provider) loads the protected code. Run-time errors end the
 * process through JNIEnv::FatalError.
 */

#include "android_delegation.hpp"
#include "android_environment.hpp"
#include "../../include/husk_bootstrap.hpp"
#include "../../include/husk_key_slot.hpp"
#include "../../include/husk_log.hpp"
#include <atomic>

extern "C" {
__attribute__((used, visibility("default")))
volatile husk::KeySlot husk_key_slot = HUSK_KEY_SLOT_INIT;
}

namespace husk {
namespace {

constexpr int FACTORY_MIN_LEVEL = 28;

struct Runtime {
    std::unique_ptr<android::AndroidEnvironment> environment;
    std::unique_ptr<RuntimeLoader> loader;
    std::unique_ptr<android::JniReflection> reflection;
    std::unique_ptr<ComponentFactoryDelegate> factory;
    DelegationStrategyTable strategies = android::platform_strategies();
    std::atomic<bool> loader_installed{false};
};

Runtime& runtime() {
    static Runtime instance;
    return instance;
}

// Logs and ends the process; nothing may unwind into the VM
auto fatal(JNIEnv* env) {
    return [env](RunError reason, const char* what) {
        HUSK_LOGE("Fatal %s: %s", reason == RunError::None ? "internal error" : to_string(reason), what);
        env->FatalError(what);
    };
}

int sdk_int(JNIEnv* env) {
    jni::LocalRef<jclass> version(env, jni::find_class(env, "android/os/Build$VERSION",
                                                       RunError::UnsupportedPlatformCapability));
    jfieldID id = env->GetStaticFieldID(version.get(), "SDK_INT", "I");
    jni::check(env, RunError::UnsupportedPlatformCapability, "Build.VERSION.SDK_INT");
    return env->GetStaticIntField(version.get(), id);
}

jobject call_object(JNIEnv* env, jobject target, const char* name, const char* sig) {
    jni::LocalRef<jclass> cls(env, env->GetObjectClass(target));
    jmethodID id = jni::method(env, cls.get(), name, sig, RunError::UnsupportedPlatformCapability);
    jobject result = env->CallObjectMethod(target, id);
    jni::check(env, RunError::UnsupportedPlatformCapability, name);
    return result;
}

void start_runtime(JNIEnv* env, jobject application_info, jobject parent_loader) {
    bootstrap::ensure_started([&] {
        auto& rt = runtime();
        auto location = android::locate_package(env, application_info, sdk_int(env));
        auto options = android::read_options(location);

        rt.environment = std::make_unique<android::AndroidEnvironment>(
            std::move(location), jni::make_handle(env, parent_loader));
        rt.loader = std::make_unique<RuntimeLoader>(
            *rt.environment, std::make_unique<EmbeddedKeyProvider>(husk_key_slot), std::move(options));
        rt.loader->load();

        rt.reflection = std::make_unique<android::JniReflection>(rt.environment->class_loader());
        rt.factory = std::make_unique<ComponentFactoryDelegate>(*rt.reflection,
                                                                rt.loader->options().original_factory);
    });
}

/**
 * @brief Load from a context and make the new loader the package's loader
 */
void start_from_context(JNIEnv* env, jobject context) {
    jni::LocalRef<jobject> info(env, call_object(env, context, "getApplicationInfo",
                                                 "()Landroid/content/pm/ApplicationInfo;"));
    jni::LocalRef<jobject> parent(env, call_object(env, context, "getClassLoader", "()Ljava/lang/ClassLoader;"));
    start_runtime(env, info.get(), parent.get());

    auto& rt = runtime();
    if (rt.environment && !rt.loader_installed.exchange(true)) {
        android::replace_package_class_loader(env, context, jni::object_of(rt.environment->class_loader()));
    }
}

jobject JNICALL factory_instantiate_class_loader(JNIEnv* env, jclass, jobject parent, jobject info) {
    return guard_boundary([&]() -> jobject {
        start_runtime(env, info, parent);
        auto& rt = runtime();
        if (!rt.environment) {
            return parent;
        }
        // Returned to the platform, which installs it as the package loader
        rt.loader_installed = true;
        return env->NewLocalRef(jni::object_of(rt.environment->class_loader()));
    }, fatal(env));
}

jobject JNICALL factory_original_factory(JNIEnv* env, jclass) {
    return guard_boundary([&]() -> jobject {
        auto& rt = runtime();
        if (!rt.factory) {
            return nullptr;
        }
        return env->NewLocalRef(jni::object_of(rt.factory->resolve()));
    }, fatal(env));
}

void JNICALL application_attach(JNIEnv* env, jobject, jobject base) {
    guard_boundary([&] { start_from_context(env, base); }, fatal(env));
}

void JNICALL application_create(JNIEnv* env, jobject stub, jobject base) {
    guard_boundary([&] {
        auto& rt = runtime();
        if (!rt.loader) {
            throw LoadError(RunError::KeyUnavailable, "Application created before the loader ran");
        }
        DelegationRequest request;
        request.application_class = rt.loader->options().original_application;
        request.stub = jni::make_handle(env, stub);
        request.base_context = jni::make_handle(env, base);
        request.capability_level = rt.loader->session().capability_level;

        Delegator delegator(*rt.reflection, rt.strategies);
        delegator.delegate(request, *rt.loader);
        HUSK_LOGI("Delegated to %s", request.application_class.c_str());
    }, fatal(env));
}

jbyteArray JNICALL application_open_asset(JNIEnv* env, jclass, jstring path) {
    return guard_boundary([&]() -> jbyteArray {
        auto& rt = runtime();
        if (!rt.loader) {
            return nullptr;
        }
        auto data = rt.loader->open_asset(jni::to_string(env, path));
        if (!data) {
            return nullptr;
        }
        jbyteArray out = env->NewByteArray(static_cast<jsize>(data->size()));
        env->SetByteArrayRegion(out, 0, static_cast<jsize>(data->size()),
                                reinterpret_cast<const jbyte*>(data->data()));
        crypto::secure_clear(*data);
        return out;
    }, fatal(env));
}

void JNICALL provider_bootstrap(JNIEnv* env, jclass, jobject context) {
    guard_boundary([&] { start_from_context(env, context); }, fatal(env));
}

jstring JNICALL loader_find_library(JNIEnv* env, jclass, jstring name) {
    return guard_boundary([&]() -> jstring {
        auto& rt = runtime();
        if (!rt.loader) {
            return nullptr;
        }
        auto path = rt.loader->find_library(jni::to_string(env, name));
        return path ? env->NewStringUTF(path->c_str()) : nullptr;
    }, fatal(env));
}

const JNINativeMethod APPLICATION_METHODS[] = {
    {"nativeAttach", "(Landroid/content/Context;)V", reinterpret_cast<void*>(application_attach)},
    {"nativeCreate", "(Landroid/content/Context;)V", reinterpret_cast<void*>(application_create)},
    {"openProtectedAsset", "(Ljava/lang/String;)[B", reinterpret_cast<void*>(application_open_asset)},
};

const JNINativeMethod PROVIDER_METHODS[] = {
    {"nativeBootstrap", "(Landroid/content/Context;)V", reinterpret_cast<void*>(provider_bootstrap)},
};

const JNINativeMethod FACTORY_METHODS[] = {
    {"nativeInstantiateClassLoader",
     "(Ljava/lang/ClassLoader;Landroid/content/pm/ApplicationInfo;)Ljava/lang/ClassLoader;",
     reinterpret_cast<void*>(factory_instantiate_class_loader)},
    {"nativeOriginalFactory", "()Landroid/app/AppComponentFactory;",
     reinterpret_cast<void*>(factory_original_factory)},
};

const JNINativeMethod LOADER_METHODS[] = {
    {"nativeFindLibrary", "(Ljava/lang/String;)Ljava/lang/String;", reinterpret_cast<void*>(loader_find_library)},
};

template <size_t N>
bool register_methods(JNIEnv* env, const char* class_name, const JNINativeMethod (&methods)[N]) {
    jni::LocalRef<jclass> cls(env, env->FindClass(class_name));
    if (!cls) {
        env->ExceptionClear();
        HUSK_LOGE("Stub class %s missing", class_name);
        return false;
    }
    if (env->RegisterNatives(cls.get(), methods, static_cast<jint>(N)) != JNI_OK) {
        env->ExceptionClear();
        HUSK_LOGE("RegisterNatives failed for %s", class_name);
        return false;
    }
    return true;
}

} // namespace
} // namespace husk

extern "C" JNIEXPORT jint JNICALL JNI_OnLoad(JavaVM* vm, void*) {
    using namespace husk;

    JNIEnv* env = nullptr;
    if (vm->GetEnv(reinterpret_cast<void**>(&env), JNI_VERSION_1_6) != JNI_OK) {
        return JNI_ERR;
    }
    jni::set_vm(vm);

    int level = 0;
    try {
        level = sdk_int(env);
    } catch (const std::exception& e) {
        HUSK_LOGE("%s", e.what());
        return JNI_ERR;
    }

    bool ok = register_methods(env, "io/husk/stub/ShellApplication", APPLICATION_METHODS) &&
              register_methods(env, "io/husk/stub/BootstrapProvider", PROVIDER_METHODS) &&
              register_methods(env, android::FILE_LOADER_CLASS, LOADER_METHODS);
    // These classes extend platform types that older levels do not have
    if (ok && level >= IN_MEMORY_MIN_LEVEL) {
        ok = register_methods(env, android::MEMORY_LOADER_CLASS, LOADER_METHODS);
    }
    if (ok && level >= FACTORY_MIN_LEVEL) {
        ok = register_methods(env, "io/husk/stub/ShellComponentFactory", FACTORY_METHODS);
    }
    if (!ok) {
        return JNI_ERR;
    }

    HUSK_LOGD("Stub runtime registered (level %d, abi %s)", level, platform::current_abi());
    return JNI_VERSION_1_6;
}
