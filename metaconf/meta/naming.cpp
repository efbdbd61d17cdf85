#include "metaconf/meta/naming.h"

#include <cctype>
#include <set>
#include <sstream>
#include <string>

#include "metaconf/err/exceptions.h"

namespace {
std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::string cur;

    auto flush = [&]() {
        if (not cur.empty()) {
            words.push_back(cur);
            cur.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '_' or c == '-' or std::isspace(c)) {
            flush();
            continue;
        }

        if (std::isupper(c) and not cur.empty()) {
            const unsigned char prev = static_cast<unsigned char>(cur.back());
            const bool next_is_lower =
                    i + 1 < text.size() and std::islower(static_cast<unsigned char>(text[i + 1]));

            // "fooBar" -> foo|Bar, "HTTPServer" -> HTTP|Server, "U32Ref" -> U32|Ref
            if (std::islower(prev) or std::isdigit(prev) or (std::isupper(prev) and next_is_lower)) {
                flush();
            }
        }
        cur.push_back(char(c));
    }
    flush();
    return words;
}

std::string capitalize(const std::string& word) {
    std::string out = word;
    if (not out.empty()) {
        out[0] = char(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

std::string join_camel(std::string_view text, bool capitalize_first) {
    const auto words = split_words(text);
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i == 0 and not capitalize_first) {
            out += metaconf::string_lower_case(words[i]);
        } else {
            out += capitalize(words[i]);
        }
    }
    return out;
}

const std::set<std::string> GENERIC_CONTAINERS = {"Option", "Result", "Cow", "BTreeMap", "BTreeSet", "Box", "Vec"};
}  // namespace

namespace metaconf {
std::string string_camel_case(std::string_view text) { return join_camel(text, false); }

std::string string_pascal_case(std::string_view text) { return join_camel(text, true); }

std::string string_lower_case(std::string_view text) {
    std::string out(text);
    for (auto& c: out) {
        c = char(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}
}  // namespace metaconf

namespace metaconf::portable {
namespace {
std::string path_name(const std::vector<std::string>& path) {
    std::string name;
    for (const auto& segment: path) {
        if (segment == "pallet") {
            continue;
        }
        // "pallet_balances" -> "Balances"
        if (segment.starts_with("pallet_")) {
            name += string_pascal_case(segment.substr(7));
        } else {
            name += string_pascal_case(segment);
        }
    }
    return name;
}

std::string type_name(const PortableRegistry& registry, LookupId id, unsigned depth) {
    if (depth > 32) {
        return "Lookup" + std::to_string(id);
    }

    const Type& type = registry.at(id);
    const TypeDef& def = type.def;
    std::stringstream ss;

    switch (def.kind) {
        case TypeDef::Kind::HistoricMetaCompat:
            return def.historic;
        case TypeDef::Kind::Primitive:
            return primitive_expr_name(def.primitive);
        case TypeDef::Kind::Sequence: {
            const Type& elem = registry.at(def.type);
            if (elem.def.kind == TypeDef::Kind::Primitive and elem.def.primitive == Primitive::U8) {
                return "Bytes";
            }
            return "Vec<" + type_name(registry, def.type, depth + 1) + ">";
        }
        case TypeDef::Kind::Array:
            ss << "[" << type_name(registry, def.type, depth + 1) << ";" << def.len << "]";
            return ss.str();
        case TypeDef::Kind::Tuple:
            if (def.tuple.empty()) {
                return "Null";
            }
            ss << "(";
            for (size_t i = 0; i < def.tuple.size(); ++i) {
                ss << (i ? "," : "") << type_name(registry, def.tuple[i], depth + 1);
            }
            ss << ")";
            return ss.str();
        case TypeDef::Kind::Compact:
            return "Compact<" + type_name(registry, def.type, depth + 1) + ">";
        case TypeDef::Kind::BitSequence:
            return "BitVec";
        case TypeDef::Kind::Composite:
        case TypeDef::Kind::Variant:
            break;
    }

    if (not type.path.empty() and type.path.back() == "Option" and type.params.size() == 1 and
        type.params[0].type) {
        return "Option<" + type_name(registry, *type.params[0].type, depth + 1) + ">";
    }

    if (not type.path.empty()) {
        return path_name(type.path);
    }

    return "Lookup" + std::to_string(id);
}
}  // namespace

std::string lookup_type_name(const PortableRegistry& registry, LookupId id) { return type_name(registry, id, 0); }

std::optional<std::string> lookup_type_identity(const PortableRegistry& registry, LookupId id) {
    const Type& type = registry.at(id);
    if (type.def.kind == TypeDef::Kind::HistoricMetaCompat) {
        return type.def.historic;
    }

    if (type.path.empty() or GENERIC_CONTAINERS.contains(type.path.back())) {
        return std::nullopt;
    }

    return path_name(type.path);
}
}  // namespace metaconf::portable
