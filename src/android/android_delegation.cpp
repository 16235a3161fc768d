/**
 * @file android_delegation.cpp
 * @brief Delegation boundaries implemented with JNI reflection
 */

#include "android_delegation.hpp"
#include "../../include/husk_log.hpp"

namespace husk {
namespace android {

namespace {

constexpr RunError PLATFORM = RunError::UnsupportedPlatformCapability;
constexpr RunError CONSTRUCTION = RunError::OriginalApplicationConstructionFailed;

constexpr int MIN_DELEGATION_LEVEL = 21;
constexpr int MAX_DELEGATION_LEVEL = 36;

constexpr const char* PROVIDER_CLASS = "androidx.work.Configuration$Provider";
constexpr const char* SCHEDULER_CLASS = "androidx.work.WorkManager";

class FieldSlot : public ReferenceSlot {
public:
    FieldSlot(Handle owner, jfieldID id, std::string name)
        : owner_(std::move(owner)), id_(id), name_(std::move(name)) {}

    std::string describe() const override { return name_; }

    Handle read() const override {
        JNIEnv* env = jni::current_env();
        jni::LocalRef<jobject> value(env, env->GetObjectField(jni::object_of(owner_), id_));
        return jni::make_handle(env, value.get());
    }

    void write(const Handle& value) override {
        JNIEnv* env = jni::current_env();
        env->SetObjectField(jni::object_of(owner_), id_, jni::object_of(value));
        jni::check(env, PLATFORM, "Write " + name_);
    }

private:
    Handle owner_;
    jfieldID id_;
    std::string name_;
};

class ListElementSlot : public ReferenceSlot {
public:
    ListElementSlot(Handle list, jint index, std::string name)
        : list_(std::move(list)), index_(index), name_(std::move(name) + "[" + std::to_string(index) + "]") {}

    std::string describe() const override { return name_; }

    Handle read() const override {
        JNIEnv* env = jni::current_env();
        jni::LocalRef<jclass> cls(env, env->GetObjectClass(jni::object_of(list_)));
        jmethodID get = jni::method(env, cls.get(), "get", "(I)Ljava/lang/Object;", PLATFORM);
        jni::LocalRef<jobject> value(env, env->CallObjectMethod(jni::object_of(list_), get, index_));
        jni::check(env, PLATFORM, "Read " + name_);
        return jni::make_handle(env, value.get());
    }

    void write(const Handle& value) override {
        JNIEnv* env = jni::current_env();
        jni::LocalRef<jclass> cls(env, env->GetObjectClass(jni::object_of(list_)));
        jmethodID set = jni::method(env, cls.get(), "set", "(ILjava/lang/Object;)Ljava/lang/Object;", PLATFORM);
        jni::LocalRef<jobject> previous(env, env->CallObjectMethod(jni::object_of(list_), set, index_,
                                                                   jni::object_of(value)));
        jni::check(env, PLATFORM, "Write " + name_);
    }

private:
    Handle list_;
    jint index_;
    std::string name_;
};

/**
 * @brief Add a slot for owner.field if it currently holds `stub`
 */
void add_if_holds(JNIEnv* env, std::vector<std::unique_ptr<ReferenceSlot>>& slots,
                  jobject owner, jclass cls, const char* field, const char* sig,
                  const Handle& stub, const std::string& name) {
    jfieldID id = jni::field(env, cls, field, sig, PLATFORM);
    jni::LocalRef<jobject> value(env, env->GetObjectField(owner, id));
    if (value && env->IsSameObject(value.get(), jni::object_of(stub))) {
        slots.push_back(std::make_unique<FieldSlot>(jni::make_handle(env, owner), id, name));
    }
}

} // namespace

JniReflection::JniReflection(Handle class_loader) : loader_(std::move(class_loader)) {}

Handle JniReflection::construct(const std::string& class_name) {
    JNIEnv* env = jni::current_env();
    jni::LocalRef<jclass> cls(env, jni::load_class(env, jni::object_of(loader_), class_name));
    if (!cls) {
        throw LoadError(CONSTRUCTION, "Class not found: " + class_name);
    }
    jmethodID ctor = jni::method(env, cls.get(), "<init>", "()V", CONSTRUCTION);
    jni::LocalRef<jobject> instance(env, env->NewObject(cls.get(), ctor));
    jni::check(env, CONSTRUCTION, "new " + class_name);
    return jni::make_handle(env, instance.get());
}

void JniReflection::attach(const Handle& application, const Handle& base_context) {
    JNIEnv* env = jni::current_env();
    jni::LocalRef<jclass> cls(env, jni::find_class(env, "android/app/Application", CONSTRUCTION));
    jmethodID attach_id = jni::method(env, cls.get(), "attach", "(Landroid/content/Context;)V", CONSTRUCTION);
    env->CallVoidMethod(jni::object_of(application), attach_id, jni::object_of(base_context));
    jni::check(env, CONSTRUCTION, "Application.attach");
}

void JniReflection::start(const Handle& application) {
    JNIEnv* env = jni::current_env();
    jni::LocalRef<jclass> cls(env, jni::find_class(env, "android/app/Application", CONSTRUCTION));
    jmethodID on_create = jni::method(env, cls.get(), "onCreate", "()V", CONSTRUCTION);
    env->CallVoidMethod(jni::object_of(application), on_create);
    jni::check(env, CONSTRUCTION, "Application.onCreate");
}

Handle JniReflection::probe_configuration_provider(const Handle& application) {
    JNIEnv* env = jni::current_env();
    jni::LocalRef<jclass> provider(env, jni::load_class(env, jni::object_of(loader_), PROVIDER_CLASS));
    if (!provider || !env->IsInstanceOf(jni::object_of(application), provider.get())) {
        return nullptr;
    }

    jmethodID get = jni::method(env, provider.get(), "getWorkManagerConfiguration",
                                "()Landroidx/work/Configuration;", PLATFORM);
    jni::LocalRef<jobject> configuration(env, env->CallObjectMethod(jni::object_of(application), get));
    jni::check(env, PLATFORM, "getWorkManagerConfiguration");

    configured_application_ = application;
    return jni::make_handle(env, configuration.get());
}

void JniReflection::complete_deferred_init(const Handle& configuration) {
    JNIEnv* env = jni::current_env();
    jni::LocalRef<jclass> scheduler(env, jni::load_class(env, jni::object_of(loader_), SCHEDULER_CLASS));
    if (!scheduler) {
        throw LoadError(PLATFORM, std::string(SCHEDULER_CLASS) + " is not packaged");
    }
    jmethodID initialize = jni::static_method(env, scheduler.get(), "initialize",
                                              "(Landroid/content/Context;Landroidx/work/Configuration;)V", PLATFORM);
    env->CallStaticVoidMethod(scheduler.get(), initialize, jni::object_of(configured_application_),
                              jni::object_of(configuration));
    jni::check(env, PLATFORM, "WorkManager.initialize");
    HUSK_LOGI("Background scheduler initialized with application configuration");
}

std::vector<std::unique_ptr<ReferenceSlot>> ActivityThreadStrategy::locate(const Handle& stub) {
    JNIEnv* env = jni::current_env();
    std::vector<std::unique_ptr<ReferenceSlot>> slots;

    jni::LocalRef<jclass> thread_class(env, jni::find_class(env, "android/app/ActivityThread", PLATFORM));
    jmethodID current = jni::static_method(env, thread_class.get(), "currentActivityThread",
                                           "()Landroid/app/ActivityThread;", PLATFORM);
    jni::LocalRef<jobject> thread(env, env->CallStaticObjectMethod(thread_class.get(), current));
    jni::check(env, PLATFORM, "currentActivityThread");
    if (!thread) {
        throw LoadError(PLATFORM, "No ActivityThread in this process");
    }

    add_if_holds(env, slots, thread.get(), thread_class.get(), "mInitialApplication",
                 "Landroid/app/Application;", stub, "ActivityThread.mInitialApplication");

    jfieldID all_id = jni::field(env, thread_class.get(), "mAllApplications", "Ljava/util/ArrayList;", PLATFORM);
    jni::LocalRef<jobject> all(env, env->GetObjectField(thread.get(), all_id));
    if (all) {
        jni::LocalRef<jclass> list_class(env, env->GetObjectClass(all.get()));
        jmethodID size = jni::method(env, list_class.get(), "size", "()I", PLATFORM);
        jmethodID get = jni::method(env, list_class.get(), "get", "(I)Ljava/lang/Object;", PLATFORM);
        jint count = env->CallIntMethod(all.get(), size);
        jni::check(env, PLATFORM, "mAllApplications.size");
        Handle list = jni::make_handle(env, all.get());
        for (jint i = 0; i < count; ++i) {
            jni::LocalRef<jobject> element(env, env->CallObjectMethod(all.get(), get, i));
            jni::check(env, PLATFORM, "mAllApplications.get");
            if (env->IsSameObject(element.get(), jni::object_of(stub))) {
                slots.push_back(std::make_unique<ListElementSlot>(list, i, "ActivityThread.mAllApplications"));
            }
        }
    }

    jfieldID bound_id = jni::field(env, thread_class.get(), "mBoundApplication",
                                   "Landroid/app/ActivityThread$AppBindData;", PLATFORM);
    jni::LocalRef<jobject> bound(env, env->GetObjectField(thread.get(), bound_id));
    if (bound) {
        jni::LocalRef<jclass> bind_class(env, env->GetObjectClass(bound.get()));
        jfieldID info_id = jni::field(env, bind_class.get(), "info", "Landroid/app/LoadedApk;", PLATFORM);
        jni::LocalRef<jobject> package_info(env, env->GetObjectField(bound.get(), info_id));
        if (package_info) {
            jni::LocalRef<jclass> apk_class(env, jni::find_class(env, "android/app/LoadedApk", PLATFORM));
            add_if_holds(env, slots, package_info.get(), apk_class.get(), "mApplication",
                         "Landroid/app/Application;", stub, "LoadedApk.mApplication");
        }
    }

    jni::LocalRef<jclass> wrapper_class(env, jni::find_class(env, "android/content/ContextWrapper", PLATFORM));
    jfieldID base_id = jni::field(env, wrapper_class.get(), "mBase", "Landroid/content/Context;", PLATFORM);
    jni::LocalRef<jobject> base(env, env->GetObjectField(jni::object_of(stub), base_id));
    if (base) {
        jni::LocalRef<jclass> impl_class(env, jni::find_class(env, "android/app/ContextImpl", PLATFORM));
        add_if_holds(env, slots, base.get(), impl_class.get(), "mOuterContext",
                     "Landroid/content/Context;", stub, "ContextImpl.mOuterContext");
    }

    return slots;
}

DelegationStrategyTable platform_strategies() {
    DelegationStrategyTable table;
    table.add(MIN_DELEGATION_LEVEL, MAX_DELEGATION_LEVEL,
              [] { return std::make_unique<ActivityThreadStrategy>(); });
    return table;
}

} // namespace android
} // namespace husk
