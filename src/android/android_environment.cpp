/**
 * @file android_environment.cpp
 * @brief RuntimeEnvironment over ART class loaders
 */

#include "android_environment.hpp"
#include "../../include/husk_log.hpp"
#include "../../include/husk_zip.hpp"

namespace husk {
namespace android {

namespace {

constexpr RunError PLATFORM = RunError::UnsupportedPlatformCapability;

std::string string_field(JNIEnv* env, jobject object, jclass cls, const char* name) {
    jfieldID id = jni::field(env, cls, name, "Ljava/lang/String;", PLATFORM);
    jni::LocalRef<jstring> value(env, static_cast<jstring>(env->GetObjectField(object, id)));
    return jni::to_string(env, value.get());
}

} // namespace

PackageLocation locate_package(JNIEnv* env, jobject application_info, int sdk_int) {
    jni::LocalRef<jclass> cls(env, env->GetObjectClass(application_info));
    PackageLocation location;
    location.sdk_int = sdk_int;
    location.source_dir = string_field(env, application_info, cls.get(), "sourceDir");
    location.data_dir = string_field(env, application_info, cls.get(), "dataDir");
    location.native_library_dir = string_field(env, application_info, cls.get(), "nativeLibraryDir");
    return location;
}

LoaderOptions read_options(const PackageLocation& location) {
    try {
        auto archive = ZipReader::open(location.source_dir);
        const ZipEntry* entry = archive.find("AndroidManifest.xml");
        if (!entry) {
            throw LoadError(RunError::PayloadCorrupt, "No manifest in " + location.source_dir);
        }
        auto manifest = axml::decode(archive.read(*entry));
        return options_from_manifest(manifest);
    } catch (const ZipError& e) {
        throw LoadError(RunError::PayloadCorrupt, e.what());
    } catch (const axml::AxmlError& e) {
        throw LoadError(RunError::PayloadCorrupt, e.what());
    }
}

AndroidEnvironment::AndroidEnvironment(PackageLocation location, Handle parent_loader)
    : location_(std::move(location)), parent_(std::move(parent_loader)) {}

std::vector<uint8_t> AndroidEnvironment::read_payload() {
    try {
        auto archive = ZipReader::open(location_.source_dir);
        const ZipEntry* entry = archive.find(PAYLOAD_ASSET_PATH);
        if (!entry) {
            throw LoadError(RunError::PayloadCorrupt, "No payload in " + location_.source_dir);
        }
        return archive.read(*entry);
    } catch (const ZipError& e) {
        throw LoadError(RunError::PayloadCorrupt, e.what());
    }
}

std::string AndroidEnvironment::code_cache_dir() const {
    return location_.data_dir + "/code_cache";
}

std::string AndroidEnvironment::library_path(const std::string& library_dir) const {
    // Unprotected libraries still resolve from the installed package
    return library_dir + ":" + location_.native_library_dir;
}

void AndroidEnvironment::register_in_memory(const std::vector<std::span<const uint8_t>>& units,
                                            const std::string& library_dir) {
    JNIEnv* env = jni::current_env();

    jni::LocalRef<jclass> buffer_class(env, jni::find_class(env, "java/nio/ByteBuffer", PLATFORM));
    jni::LocalRef<jobjectArray> buffers(
        env, env->NewObjectArray(static_cast<jsize>(units.size()), buffer_class.get(), nullptr));
    jni::check(env, RunError::IoError, "ByteBuffer[]");

    for (size_t i = 0; i < units.size(); ++i) {
        // The class loader copies the bytes while opening them
        jni::LocalRef<jobject> buffer(
            env, env->NewDirectByteBuffer(const_cast<uint8_t*>(units[i].data()),
                                          static_cast<jlong>(units[i].size())));
        jni::check(env, RunError::IoError, "NewDirectByteBuffer");
        env->SetObjectArrayElement(buffers.get(), static_cast<jsize>(i), buffer.get());
    }

    jni::LocalRef<jclass> loader_class(env, jni::find_class(env, MEMORY_LOADER_CLASS, PLATFORM));
    jni::LocalRef<jobject> loader(env, nullptr);
    if (library_dir.empty()) {
        // API 27 and 28 only have the (ByteBuffer[], ClassLoader) constructor
        jmethodID ctor = jni::method(env, loader_class.get(), "<init>",
                                     "([Ljava/nio/ByteBuffer;Ljava/lang/ClassLoader;)V", PLATFORM);
        loader.reset(env->NewObject(loader_class.get(), ctor, buffers.get(), jni::object_of(parent_)));
    } else {
        jmethodID ctor = jni::method(env, loader_class.get(), "<init>",
                                     "([Ljava/nio/ByteBuffer;Ljava/lang/String;Ljava/lang/ClassLoader;)V",
                                     PLATFORM);
        jni::LocalRef<jstring> libs(env, env->NewStringUTF(library_path(library_dir).c_str()));
        loader.reset(env->NewObject(loader_class.get(), ctor, buffers.get(), libs.get(),
                                    jni::object_of(parent_)));
    }
    jni::check(env, PLATFORM, "InMemoryDexClassLoader");

    loader_ = jni::make_handle(env, loader.get());
}

void AndroidEnvironment::register_files(const std::vector<std::string>& paths,
                                        const std::string& library_dir) {
    JNIEnv* env = jni::current_env();

    std::string dex_path;
    for (const auto& path : paths) {
        if (!dex_path.empty()) dex_path += ':';
        dex_path += path;
    }

    jni::LocalRef<jclass> loader_class(env, jni::find_class(env, FILE_LOADER_CLASS, PLATFORM));
    jmethodID ctor = jni::method(env, loader_class.get(), "<init>",
                                 "(Ljava/lang/String;Ljava/lang/String;Ljava/lang/ClassLoader;)V", PLATFORM);
    jni::LocalRef<jstring> jdex(env, env->NewStringUTF(dex_path.c_str()));
    jni::LocalRef<jstring> libs(env, env->NewStringUTF(library_path(library_dir).c_str()));
    jni::LocalRef<jobject> loader(
        env, env->NewObject(loader_class.get(), ctor, jdex.get(), libs.get(), jni::object_of(parent_)));
    jni::check(env, PLATFORM, "DexClassLoader");

    loader_ = jni::make_handle(env, loader.get());
}

void replace_package_class_loader(JNIEnv* env, jobject base_context, jobject loader) {
    jni::LocalRef<jclass> impl_class(env, jni::find_class(env, "android/app/ContextImpl", PLATFORM));
    jfieldID package_info_id = jni::field(env, impl_class.get(), "mPackageInfo", "Landroid/app/LoadedApk;", PLATFORM);
    jni::LocalRef<jobject> package_info(env, env->GetObjectField(base_context, package_info_id));
    if (!package_info) {
        throw LoadError(PLATFORM, "Base context has no package info");
    }

    jni::LocalRef<jclass> apk_class(env, jni::find_class(env, "android/app/LoadedApk", PLATFORM));
    jfieldID loader_id = jni::field(env, apk_class.get(), "mClassLoader", "Ljava/lang/ClassLoader;", PLATFORM);
    env->SetObjectField(package_info.get(), loader_id, loader);
    jni::check(env, PLATFORM, "LoadedApk.mClassLoader");

    HUSK_LOGI("Package class loader replaced");
}

} // namespace android
} // namespace husk
