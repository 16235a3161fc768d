/**
 * @file husk_axml.cpp
 * @brief Compiled XML codec
 */

#include "../include/husk_axml.hpp"
#include "../include/husk_bytes.hpp"
#include <cstdio>
#include <map>
#include <unordered_map>
#include <utility>

namespace husk {
namespace axml {

namespace {

constexpr uint16_t RES_STRING_POOL_TYPE = 0x0001;
constexpr uint16_t RES_XML_TYPE = 0x0003;
constexpr uint16_t RES_XML_START_NAMESPACE_TYPE = 0x0100;
constexpr uint16_t RES_XML_END_NAMESPACE_TYPE = 0x0101;
constexpr uint16_t RES_XML_START_ELEMENT_TYPE = 0x0102;
constexpr uint16_t RES_XML_END_ELEMENT_TYPE = 0x0103;
constexpr uint16_t RES_XML_CDATA_TYPE = 0x0104;
constexpr uint16_t RES_XML_RESOURCE_MAP_TYPE = 0x0180;

constexpr uint32_t UTF8_FLAG = 1u << 8;
constexpr uint32_t NO_INDEX = 0xFFFFFFFF;

constexpr uint16_t NODE_HEADER_SIZE = 16;
constexpr uint16_t ATTRIBUTE_SIZE = 20;
constexpr uint16_t RES_VALUE_SIZE = 8;

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string read_utf16(ByteReader& r, size_t units) {
    std::string out;
    out.reserve(units);
    for (size_t i = 0; i < units; ++i) {
        uint32_t unit = r.u16();
        if (unit >= 0xD800 && unit < 0xDC00 && i + 1 < units) {
            uint32_t low = r.u16();
            ++i;
            if (low >= 0xDC00 && low < 0xE000) {
                append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
            } else {
                append_utf8(out, 0xFFFD);
                append_utf8(out, low);
            }
        } else {
            append_utf8(out, unit);
        }
    }
    return out;
}

std::u16string to_utf16(std::string_view s) {
    std::u16string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        uint32_t cp;
        size_t extra;
        if (c < 0x80) {
            cp = c;
            extra = 0;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        if (i + extra >= s.size()) {
            out.push_back(0xFFFD);
            break;
        }
        for (size_t k = 1; k <= extra; ++k) {
            cp = (cp << 6) | (static_cast<uint8_t>(s[i + k]) & 0x3F);
        }
        i += extra + 1;
        if (cp >= 0x10000) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
    }
    return out;
}

// Length prefix of a UTF-8 pool string: one byte, or two with the high bit set
size_t read_utf8_length(ByteReader& r) {
    size_t len = r.u8();
    if (len & 0x80) {
        len = ((len & 0x7F) << 8) | r.u8();
    }
    return len;
}

size_t read_utf16_length(ByteReader& r) {
    size_t len = r.u16();
    if (len & 0x8000) {
        len = ((len & 0x7FFF) << 16) | r.u16();
    }
    return len;
}

std::vector<std::string> read_string_pool(std::span<const uint8_t> chunk) {
    ByteReader r(chunk);
    r.u16();
    uint16_t header_size = r.u16();
    r.u32();
    uint32_t count = r.u32();
    r.u32();  // style count
    uint32_t flags = r.u32();
    uint32_t strings_start = r.u32();
    r.u32();  // styles start

    if (static_cast<uint64_t>(count) * 4 > chunk.size()) {
        throw AxmlError("string pool count exceeds chunk size");
    }

    r.seek(header_size);
    std::vector<uint32_t> offsets(count);
    for (auto& offset : offsets) {
        offset = r.u32();
    }

    bool utf8 = (flags & UTF8_FLAG) != 0;
    std::vector<std::string> strings;
    strings.reserve(count);
    for (uint32_t offset : offsets) {
        r.seek(static_cast<size_t>(strings_start) + offset);
        if (utf8) {
            read_utf8_length(r);  // length in UTF-16 units, unused
            strings.push_back(r.str(read_utf8_length(r)));
        } else {
            strings.push_back(read_utf16(r, read_utf16_length(r)));
        }
    }
    return strings;
}

/**
 * @brief String pool under construction
 *
 * Attribute names carrying a resource id occupy the first slots, one per
 * (id, name) pair, in the order of the resource map. A plain string that
 * happens to equal one of those names gets its own slot after them, so the
 * platform never attributes a resource id to it.
 */
class PoolBuilder {
public:
    void reserve_named(uint32_t resource_id, const std::string& name) {
        named_.emplace(std::make_pair(resource_id, name), 0);
    }

    void seal_names() {
        for (auto& [key, index] : named_) {
            index = static_cast<uint32_t>(strings_.size());
            strings_.push_back(key.second);
            resource_ids_.push_back(key.first);
        }
    }

    uint32_t attribute_name(uint32_t resource_id, const std::string& name) {
        if (resource_id != 0) {
            return named_.at(std::make_pair(resource_id, name));
        }
        return intern(name);
    }

    uint32_t intern(const std::string& s) {
        auto it = plain_.find(s);
        if (it != plain_.end()) {
            return it->second;
        }
        auto index = static_cast<uint32_t>(strings_.size());
        strings_.push_back(s);
        plain_.emplace(s, index);
        return index;
    }

    uint32_t optional(const std::string& s) {
        return s.empty() ? NO_INDEX : intern(s);
    }

    void write_pool(ByteWriter& w) const {
        size_t start = w.size();
        uint32_t count = static_cast<uint32_t>(strings_.size());
        uint32_t header_size = 28;

        w.u16(RES_STRING_POOL_TYPE);
        w.u16(static_cast<uint16_t>(header_size));
        w.u32(0);  // patched below
        w.u32(count);
        w.u32(0);
        w.u32(0);
        w.u32(header_size + count * 4);
        w.u32(0);

        std::vector<uint8_t> data;
        ByteWriter sw(data);
        for (const auto& s : strings_) {
            w.u32(static_cast<uint32_t>(data.size()));
            auto units = to_utf16(s);
            if (units.size() > 0x7FFF) {
                sw.u16(static_cast<uint16_t>(0x8000 | (units.size() >> 16)));
                sw.u16(static_cast<uint16_t>(units.size() & 0xFFFF));
            } else {
                sw.u16(static_cast<uint16_t>(units.size()));
            }
            for (char16_t unit : units) {
                sw.u16(static_cast<uint16_t>(unit));
            }
            sw.u16(0);
        }
        w.bytes(data);
        w.pad_to(4);
        w.put_u32_at(start + 4, static_cast<uint32_t>(w.size() - start));
    }

    void write_resource_map(ByteWriter& w) const {
        if (resource_ids_.empty()) {
            return;
        }
        w.u16(RES_XML_RESOURCE_MAP_TYPE);
        w.u16(8);
        w.u32(static_cast<uint32_t>(8 + resource_ids_.size() * 4));
        for (uint32_t id : resource_ids_) {
            w.u32(id);
        }
    }

private:
    std::map<std::pair<uint32_t, std::string>, uint32_t> named_;
    std::unordered_map<std::string, uint32_t> plain_;
    std::vector<std::string> strings_;
    std::vector<uint32_t> resource_ids_;
};

void collect_names(const Element& element, PoolBuilder& pool) {
    for (const auto& attribute : element.attributes) {
        if (attribute.resource_id != 0) {
            pool.reserve_named(attribute.resource_id, attribute.name);
        }
    }
    for (const auto& child : element.children) {
        collect_names(child, pool);
    }
}

void write_node_header(ByteWriter& w, uint16_t type, uint32_t size, uint32_t line) {
    w.u16(type);
    w.u16(NODE_HEADER_SIZE);
    w.u32(size);
    w.u32(line);
    w.u32(NO_INDEX);  // comment
}

void write_namespace(ByteWriter& w, PoolBuilder& pool, uint16_t type,
                     const Namespace& ns, uint32_t line) {
    write_node_header(w, type, NODE_HEADER_SIZE + 8, line);
    w.u32(pool.optional(ns.prefix));
    w.u32(pool.intern(ns.uri));
}

void write_text(ByteWriter& w, PoolBuilder& pool, const Text& text) {
    write_node_header(w, RES_XML_CDATA_TYPE, NODE_HEADER_SIZE + 4 + RES_VALUE_SIZE, text.line);
    uint32_t index = pool.intern(text.data);
    w.u32(index);
    w.u16(RES_VALUE_SIZE);
    w.u8(0);
    w.u8(static_cast<uint8_t>(ValueType::String));
    w.u32(index);
}

void write_element(ByteWriter& w, PoolBuilder& pool, const Element& element) {
    for (const auto& ns : element.namespaces) {
        write_namespace(w, pool, RES_XML_START_NAMESPACE_TYPE, ns, element.line);
    }

    uint32_t size = NODE_HEADER_SIZE + 20 +
                    static_cast<uint32_t>(element.attributes.size()) * ATTRIBUTE_SIZE;
    write_node_header(w, RES_XML_START_ELEMENT_TYPE, size, element.line);
    w.u32(pool.optional(element.ns));
    w.u32(pool.intern(element.name));
    w.u16(20);  // attribute start, relative to the extension
    w.u16(ATTRIBUTE_SIZE);
    w.u16(static_cast<uint16_t>(element.attributes.size()));

    uint16_t id_index = 0, class_index = 0, style_index = 0;
    for (size_t i = 0; i < element.attributes.size(); ++i) {
        const auto& attribute = element.attributes[i];
        if (!attribute.ns.empty()) {
            continue;
        }
        auto position = static_cast<uint16_t>(i + 1);
        if (attribute.name == "id") id_index = position;
        else if (attribute.name == "class") class_index = position;
        else if (attribute.name == "style") style_index = position;
    }
    w.u16(id_index);
    w.u16(class_index);
    w.u16(style_index);

    for (const auto& attribute : element.attributes) {
        w.u32(pool.optional(attribute.ns));
        w.u32(pool.attribute_name(attribute.resource_id, attribute.name));
        if (attribute.is_string()) {
            uint32_t value = pool.intern(attribute.string_value);
            w.u32(value);
            w.u16(RES_VALUE_SIZE);
            w.u8(0);
            w.u8(static_cast<uint8_t>(ValueType::String));
            w.u32(value);
        } else {
            w.u32(attribute.raw ? pool.intern(*attribute.raw) : NO_INDEX);
            w.u16(RES_VALUE_SIZE);
            w.u8(0);
            w.u8(static_cast<uint8_t>(attribute.type));
            w.u32(attribute.data);
        }
    }

    size_t next_text = 0;
    auto flush_texts = [&](size_t position) {
        while (next_text < element.texts.size() && element.texts[next_text].position <= position) {
            write_text(w, pool, element.texts[next_text++]);
        }
    };
    for (size_t i = 0; i < element.children.size(); ++i) {
        flush_texts(i);
        write_element(w, pool, element.children[i]);
    }
    flush_texts(SIZE_MAX);

    write_node_header(w, RES_XML_END_ELEMENT_TYPE, NODE_HEADER_SIZE + 8, element.line);
    w.u32(pool.optional(element.ns));
    w.u32(pool.intern(element.name));

    for (auto it = element.namespaces.rbegin(); it != element.namespaces.rend(); ++it) {
        write_namespace(w, pool, RES_XML_END_NAMESPACE_TYPE, *it, element.line);
    }
}

bool same_attribute(const Attribute& a, std::string_view ns, std::string_view name) {
    return a.ns == ns && a.name == name;
}

} // namespace

Attribute Attribute::string(std::string ns, std::string name, uint32_t resource_id, std::string value) {
    Attribute a;
    a.ns = std::move(ns);
    a.name = std::move(name);
    a.resource_id = resource_id;
    a.type = ValueType::String;
    a.string_value = std::move(value);
    return a;
}

Attribute Attribute::integer(std::string ns, std::string name, uint32_t resource_id, int32_t value) {
    Attribute a;
    a.ns = std::move(ns);
    a.name = std::move(name);
    a.resource_id = resource_id;
    a.type = ValueType::IntDec;
    a.data = static_cast<uint32_t>(value);
    return a;
}

Attribute Attribute::boolean(std::string ns, std::string name, uint32_t resource_id, bool value) {
    Attribute a;
    a.ns = std::move(ns);
    a.name = std::move(name);
    a.resource_id = resource_id;
    a.type = ValueType::IntBoolean;
    a.data = value ? 0xFFFFFFFF : 0;
    return a;
}

std::string Attribute::text() const {
    char buf[16];
    switch (type) {
        case ValueType::String:
            return string_value;
        case ValueType::Null:
            return {};
        case ValueType::IntBoolean:
            return data != 0 ? "true" : "false";
        case ValueType::IntDec:
            return std::to_string(static_cast<int32_t>(data));
        case ValueType::Reference:
            std::snprintf(buf, sizeof(buf), "@0x%08x", data);
            return buf;
        case ValueType::Attribute:
            std::snprintf(buf, sizeof(buf), "?0x%08x", data);
            return buf;
        default:
            if (raw) {
                return *raw;
            }
            std::snprintf(buf, sizeof(buf), "0x%08x", data);
            return buf;
    }
}

Attribute* Element::find_attribute(std::string_view ns, std::string_view name) {
    for (auto& attribute : attributes) {
        if (same_attribute(attribute, ns, name)) {
            return &attribute;
        }
    }
    return nullptr;
}

const Attribute* Element::find_attribute(std::string_view ns, std::string_view name) const {
    for (const auto& attribute : attributes) {
        if (same_attribute(attribute, ns, name)) {
            return &attribute;
        }
    }
    return nullptr;
}

void Element::set_attribute(Attribute attribute) {
    if (auto* existing = find_attribute(attribute.ns, attribute.name)) {
        *existing = std::move(attribute);
        return;
    }

    auto pos = attributes.end();
    if (attribute.resource_id != 0) {
        for (auto it = attributes.begin(); it != attributes.end(); ++it) {
            if (it->resource_id == 0 || it->resource_id > attribute.resource_id) {
                pos = it;
                break;
            }
        }
    }
    attributes.insert(pos, std::move(attribute));
}

bool Element::remove_attribute(std::string_view ns, std::string_view name) {
    for (auto it = attributes.begin(); it != attributes.end(); ++it) {
        if (same_attribute(*it, ns, name)) {
            attributes.erase(it);
            return true;
        }
    }
    return false;
}

Element* Element::first_child(std::string_view child_name) {
    for (auto& child : children) {
        if (child.name == child_name) {
            return &child;
        }
    }
    return nullptr;
}

const Element* Element::first_child(std::string_view child_name) const {
    for (const auto& child : children) {
        if (child.name == child_name) {
            return &child;
        }
    }
    return nullptr;
}

std::vector<Element*> Element::children_named(std::string_view child_name) {
    std::vector<Element*> found;
    for (auto& child : children) {
        if (child.name == child_name) {
            found.push_back(&child);
        }
    }
    return found;
}

Element& Element::append_child(Element child) {
    children.push_back(std::move(child));
    return children.back();
}

bool looks_like_axml(std::span<const uint8_t> data) {
    return data.size() >= 8 && data[0] == 0x03 && data[1] == 0x00 &&
           data[2] == 0x08 && data[3] == 0x00;
}

Document decode(std::span<const uint8_t> data) {
    try {
        ByteReader header(data);
        if (header.u16() != RES_XML_TYPE) {
            throw AxmlError("not a compiled XML document");
        }
        uint16_t header_size = header.u16();
        uint32_t total = header.u32();
        if (total > data.size() || header_size < 8 || header_size > total) {
            throw AxmlError("invalid document size");
        }

        std::vector<std::string> strings;
        std::vector<uint32_t> resource_ids;
        std::vector<Element> stack;
        std::vector<Namespace> pending_namespaces;
        Document doc;
        bool have_root = false;

        auto str = [&](uint32_t index) -> std::string {
            if (index == NO_INDEX) {
                return {};
            }
            if (index >= strings.size()) {
                throw AxmlError("string index " + std::to_string(index) + " out of range");
            }
            return strings[index];
        };

        size_t pos = header_size;
        while (pos + 8 <= total) {
            ByteReader h(data, pos);
            uint16_t type = h.u16();
            uint16_t chunk_header = h.u16();
            uint32_t chunk_size = h.u32();
            if (chunk_size < 8 || chunk_size > total - pos || chunk_header > chunk_size) {
                throw AxmlError("invalid chunk at offset " + std::to_string(pos));
            }
            auto chunk = data.subspan(pos, chunk_size);
            ByteReader c(chunk, 8);

            switch (type) {
                case RES_STRING_POOL_TYPE:
                    strings = read_string_pool(chunk);
                    break;

                case RES_XML_RESOURCE_MAP_TYPE:
                    c.seek(chunk_header);
                    resource_ids.clear();
                    while (c.remaining() >= 4) {
                        resource_ids.push_back(c.u32());
                    }
                    break;

                case RES_XML_START_NAMESPACE_TYPE: {
                    c.u32();  // line
                    c.u32();  // comment
                    c.seek(chunk_header);
                    Namespace ns;
                    ns.prefix = str(c.u32());
                    ns.uri = str(c.u32());
                    pending_namespaces.push_back(std::move(ns));
                    break;
                }

                case RES_XML_END_NAMESPACE_TYPE:
                    break;

                case RES_XML_START_ELEMENT_TYPE: {
                    Element element;
                    element.line = c.u32();
                    c.u32();
                    c.seek(chunk_header);
                    element.ns = str(c.u32());
                    element.name = str(c.u32());
                    uint16_t attribute_start = c.u16();
                    uint16_t attribute_size = c.u16();
                    uint16_t attribute_count = c.u16();
                    if (attribute_count > 0 && attribute_size < ATTRIBUTE_SIZE) {
                        throw AxmlError("attribute record too small");
                    }

                    for (uint16_t i = 0; i < attribute_count; ++i) {
                        ByteReader a(chunk, static_cast<size_t>(chunk_header) + attribute_start +
                                                static_cast<size_t>(i) * attribute_size);
                        Attribute attribute;
                        attribute.ns = str(a.u32());
                        uint32_t name_index = a.u32();
                        attribute.name = str(name_index);
                        if (name_index < resource_ids.size()) {
                            attribute.resource_id = resource_ids[name_index];
                        }
                        uint32_t raw = a.u32();
                        a.u16();
                        a.u8();
                        attribute.type = static_cast<ValueType>(a.u8());
                        attribute.data = a.u32();
                        if (attribute.type == ValueType::String) {
                            attribute.string_value = str(attribute.data);
                        } else if (raw != NO_INDEX) {
                            attribute.raw = str(raw);
                        }
                        element.attributes.push_back(std::move(attribute));
                    }

                    element.namespaces = std::move(pending_namespaces);
                    pending_namespaces.clear();
                    stack.push_back(std::move(element));
                    break;
                }

                case RES_XML_END_ELEMENT_TYPE: {
                    if (stack.empty()) {
                        throw AxmlError("unbalanced end element");
                    }
                    Element element = std::move(stack.back());
                    stack.pop_back();
                    if (!stack.empty()) {
                        stack.back().children.push_back(std::move(element));
                    } else if (!have_root) {
                        doc.root = std::move(element);
                        have_root = true;
                    } else {
                        throw AxmlError("multiple root elements");
                    }
                    break;
                }

                case RES_XML_CDATA_TYPE: {
                    Text text;
                    text.line = c.u32();
                    c.u32();
                    c.seek(chunk_header);
                    text.data = str(c.u32());
                    if (!stack.empty()) {
                        text.position = stack.back().children.size();
                        stack.back().texts.push_back(std::move(text));
                    }
                    break;
                }

                default:
                    // Unknown chunks are skipped
                    break;
            }

            pos += chunk_size;
        }

        if (!have_root || !stack.empty()) {
            throw AxmlError("document has no complete root element");
        }
        return doc;
    } catch (const TruncatedInput& e) {
        throw AxmlError(std::string("truncated compiled XML: ") + e.what());
    }
}

std::vector<uint8_t> encode(const Document& doc) {
    PoolBuilder pool;
    collect_names(doc.root, pool);
    pool.seal_names();

    std::vector<uint8_t> nodes;
    ByteWriter nw(nodes);
    write_element(nw, pool, doc.root);

    std::vector<uint8_t> out;
    ByteWriter w(out);
    w.u16(RES_XML_TYPE);
    w.u16(8);
    w.u32(0);
    pool.write_pool(w);
    pool.write_resource_map(w);
    w.bytes(nodes);
    w.put_u32_at(4, static_cast<uint32_t>(out.size()));
    return out;
}

} // namespace axml
} // namespace husk
