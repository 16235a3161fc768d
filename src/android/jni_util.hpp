#pragma once

/**
 * @file jni_util.hpp
 * @brief Small JNI helpers shared by the stub runtime
 */

#include "../../include/husk_delegation.hpp"
#include "../../include/husk_errors.hpp"
#include <jni.h>
#include <string>

namespace husk {
namespace jni {

void set_vm(JavaVM* vm);

/**
 * @brief JNIEnv of the calling thread, attaching it if needed
 */
JNIEnv* current_env();

/**
 * @brief Owning local reference
 */
template <typename T = jobject>
class LocalRef {
public:
    LocalRef(JNIEnv* env, T object) : env_(env), object_(object) {}
    ~LocalRef() {
        if (object_) env_->DeleteLocalRef(object_);
    }

    LocalRef(const LocalRef&) = delete;
    LocalRef& operator=(const LocalRef&) = delete;

    T get() const { return object_; }
    void reset(T object) {
        if (object_) env_->DeleteLocalRef(object_);
        object_ = object;
    }
    explicit operator bool() const { return object_ != nullptr; }

private:
    JNIEnv* env_;
    T object_;
};

/**
 * @brief Global reference wrapped in a Handle, released when the last copy goes
 */
Handle make_handle(JNIEnv* env, jobject object);

inline jobject object_of(const Handle& handle) {
    return static_cast<jobject>(handle.get());
}

/**
 * @brief Convert a pending Java exception into LoadError(reason)
 */
void check(JNIEnv* env, RunError reason, const std::string& what);

std::string to_string(JNIEnv* env, jstring text);

jclass find_class(JNIEnv* env, const char* name, RunError reason);
jfieldID field(JNIEnv* env, jclass cls, const char* name, const char* sig, RunError reason);
jmethodID method(JNIEnv* env, jclass cls, const char* name, const char* sig, RunError reason);
jmethodID static_method(JNIEnv* env, jclass cls, const char* name, const char* sig, RunError reason);

/**
 * @brief Load a class by name through a specific class loader
 * @return null (no exception pending) when the class does not exist
 */
jclass load_class(JNIEnv* env, jobject loader, const std::string& name);

} // namespace jni
} // namespace husk
