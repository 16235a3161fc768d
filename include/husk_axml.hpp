#pragma once

/**
 * @file husk_axml.hpp
 * @brief Binary XML (compiled AndroidManifest.xml) decoder and encoder
 *
 * The document is decoded into a small DOM with every string reference
 * resolved. Encoding rebuilds the string pool and resource map from scratch,
 * so attributes can be added or removed freely.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace husk {
namespace axml {

constexpr const char* ANDROID_NS = "http://schemas.android.com/apk/res/android";

/**
 * @brief Framework attribute resource ids used by the manifest patcher
 */
namespace attr {
constexpr uint32_t NAME = 0x01010003;
constexpr uint32_t EXPORTED = 0x01010010;
constexpr uint32_t DEBUGGABLE = 0x0101000f;
constexpr uint32_t AUTHORITIES = 0x01010018;
constexpr uint32_t VALUE = 0x01010024;
constexpr uint32_t MIN_SDK_VERSION = 0x0101020c;
constexpr uint32_t TARGET_SDK_VERSION = 0x01010270;
constexpr uint32_t INIT_ORDER = 0x01010427;
constexpr uint32_t APP_COMPONENT_FACTORY = 0x0101057a;
}

/**
 * @brief Res_value data types
 */
enum class ValueType : uint8_t {
    Null = 0x00,
    Reference = 0x01,
    Attribute = 0x02,
    String = 0x03,
    Float = 0x04,
    Dimension = 0x05,
    Fraction = 0x06,
    IntDec = 0x10,
    IntHex = 0x11,
    IntBoolean = 0x12,
    IntColorArgb8 = 0x1c,
    IntColorRgb8 = 0x1d,
    IntColorArgb4 = 0x1e,
    IntColorRgb4 = 0x1f
};

class AxmlError : public std::runtime_error {
public:
    explicit AxmlError(const std::string& what) : std::runtime_error(what) {}
};

struct Attribute {
    std::string ns;  // namespace URI, empty when none
    std::string name;
    uint32_t resource_id = 0;
    ValueType type = ValueType::String;
    uint32_t data = 0;                 // for non-string types
    std::string string_value;          // for ValueType::String
    std::optional<std::string> raw;   // original raw text, if the compiler kept one

    static Attribute string(std::string ns, std::string name, uint32_t resource_id, std::string value);
    static Attribute integer(std::string ns, std::string name, uint32_t resource_id, int32_t value);
    static Attribute boolean(std::string ns, std::string name, uint32_t resource_id, bool value);

    bool is_string() const { return type == ValueType::String; }
    bool is_integer() const { return type == ValueType::IntDec || type == ValueType::IntHex; }

    /**
     * @brief Human-readable value ("true", "28", "@0x7f010000", ...)
     */
    std::string text() const;
};

struct Namespace {
    std::string prefix;
    std::string uri;
};

struct Text {
    std::string data;
    size_t position = 0;  // number of child elements preceding it
    uint32_t line = 0;
};

struct Element {
    std::string ns;
    std::string name;
    std::vector<Namespace> namespaces;  // declared on this element
    std::vector<Attribute> attributes;
    std::vector<Element> children;
    std::vector<Text> texts;
    uint32_t line = 0;

    Attribute* find_attribute(std::string_view ns, std::string_view name);
    const Attribute* find_attribute(std::string_view ns, std::string_view name) const;

    /**
     * @brief Replace an attribute with the same namespace and name, or insert it
     *
     * New attributes carrying a resource id are placed in resource id order,
     * the order the platform's compiler emits.
     */
    void set_attribute(Attribute attribute);

    bool remove_attribute(std::string_view ns, std::string_view name);

    Element* first_child(std::string_view name);
    const Element* first_child(std::string_view name) const;
    std::vector<Element*> children_named(std::string_view name);

    Element& append_child(Element child);
};

struct Document {
    Element root;
};

/**
 * @brief Decode a compiled XML document
 * @throws AxmlError on malformed input
 */
Document decode(std::span<const uint8_t> data);

/**
 * @brief Encode a document into compiled XML
 */
std::vector<uint8_t> encode(const Document& doc);

/**
 * @brief Quick check for the compiled XML chunk header
 */
bool looks_like_axml(std::span<const uint8_t> data);

} // namespace axml
} // namespace husk
