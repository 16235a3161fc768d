/**
 * @file jni_util.cpp
 * @brief Small JNI helpers shared by the stub runtime
 */

#include "jni_util.hpp"
#include "../../include/husk_log.hpp"

namespace husk {
namespace jni {

namespace {

JavaVM* java_vm = nullptr;

std::string describe_exception(JNIEnv* env, jthrowable error) {
    LocalRef<jclass> cls(env, env->FindClass("java/lang/Throwable"));
    if (!cls) {
        env->ExceptionClear();
        return "unknown exception";
    }
    jmethodID to_string_id = env->GetMethodID(cls.get(), "toString", "()Ljava/lang/String;");
    LocalRef<jstring> text(env, static_cast<jstring>(env->CallObjectMethod(error, to_string_id)));
    if (env->ExceptionCheck()) {
        env->ExceptionClear();
        return "unknown exception";
    }
    return to_string(env, text.get());
}

} // namespace

void set_vm(JavaVM* vm) {
    java_vm = vm;
}

JNIEnv* current_env() {
    if (!java_vm) {
        throw LoadError(RunError::UnsupportedPlatformCapability, "JavaVM not registered");
    }
    JNIEnv* env = nullptr;
    if (java_vm->GetEnv(reinterpret_cast<void**>(&env), JNI_VERSION_1_6) == JNI_OK) {
        return env;
    }
    if (java_vm->AttachCurrentThread(&env, nullptr) != JNI_OK) {
        throw LoadError(RunError::UnsupportedPlatformCapability, "Cannot attach thread to the VM");
    }
    return env;
}

Handle make_handle(JNIEnv* env, jobject object) {
    if (!object) {
        return nullptr;
    }
    jobject global = env->NewGlobalRef(object);
    return Handle(global, [](void* ref) {
        if (java_vm) {
            JNIEnv* env = nullptr;
            if (java_vm->GetEnv(reinterpret_cast<void**>(&env), JNI_VERSION_1_6) == JNI_OK) {
                env->DeleteGlobalRef(static_cast<jobject>(ref));
            }
        }
    });
}

void check(JNIEnv* env, RunError reason, const std::string& what) {
    if (!env->ExceptionCheck()) {
        return;
    }
    LocalRef<jthrowable> error(env, env->ExceptionOccurred());
    env->ExceptionClear();
    throw LoadError(reason, what + ": " + describe_exception(env, error.get()));
}

std::string to_string(JNIEnv* env, jstring text) {
    if (!text) {
        return {};
    }
    const char* chars = env->GetStringUTFChars(text, nullptr);
    if (!chars) {
        return {};
    }
    std::string out(chars);
    env->ReleaseStringUTFChars(text, chars);
    return out;
}

jclass find_class(JNIEnv* env, const char* name, RunError reason) {
    jclass cls = env->FindClass(name);
    check(env, reason, std::string("Class ") + name);
    return cls;
}

jfieldID field(JNIEnv* env, jclass cls, const char* name, const char* sig, RunError reason) {
    jfieldID id = env->GetFieldID(cls, name, sig);
    check(env, reason, std::string("Field ") + name);
    return id;
}

jmethodID method(JNIEnv* env, jclass cls, const char* name, const char* sig, RunError reason) {
    jmethodID id = env->GetMethodID(cls, name, sig);
    check(env, reason, std::string("Method ") + name);
    return id;
}

jmethodID static_method(JNIEnv* env, jclass cls, const char* name, const char* sig, RunError reason) {
    jmethodID id = env->GetStaticMethodID(cls, name, sig);
    check(env, reason, std::string("Method ") + name);
    return id;
}

jclass load_class(JNIEnv* env, jobject loader, const std::string& name) {
    LocalRef<jclass> loader_class(env, find_class(env, "java/lang/ClassLoader", RunError::UnsupportedPlatformCapability));
    jmethodID load = method(env, loader_class.get(), "loadClass", "(Ljava/lang/String;)Ljava/lang/Class;",
                            RunError::UnsupportedPlatformCapability);
    LocalRef<jstring> jname(env, env->NewStringUTF(name.c_str()));
    jobject cls = env->CallObjectMethod(loader, load, jname.get());
    if (env->ExceptionCheck()) {
        HUSK_LOGD("Class %s not found", name.c_str());
        env->ExceptionClear();
        return nullptr;
    }
    return static_cast<jclass>(cls);
}

} // namespace jni
} // namespace husk
