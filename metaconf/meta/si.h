#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "metaconf/codec/primitive.h"
#include "metaconf/codec/writer.h"
#include "metaconf/io/iobase.h"

#include <nlohmann/json.hpp>

/*
 * Portable type registry ("lookup") of the v14+ metadata: every type
 * used by the metadata is described once and referenced by its id.
 *
 * The converted legacy metadata use the HistoricMetaCompat definition
 * that holds a (normalized) legacy type expression instead of a
 * structural description.
 * */
namespace metaconf::portable {
typedef uint32_t LookupId;

struct Field {
    std::optional<std::string> name;
    LookupId type = 0;
    std::optional<std::string> type_name;
    std::vector<std::string> docs;
};

struct Variant {
    std::string name;
    std::vector<Field> fields;
    uint8_t index = 0;
    std::vector<std::string> docs;
};

struct TypeParam {
    std::string name;
    std::optional<LookupId> type;
};

struct TypeDef {
    enum class Kind : uint8_t {
        Composite = 0,
        Variant = 1,
        Sequence = 2,
        Array = 3,
        Tuple = 4,
        Primitive = 5,
        Compact = 6,
        BitSequence = 7,
        HistoricMetaCompat = 8,
    };

    Kind kind = Kind::Composite;

    // Composite
    std::vector<Field> fields;

    // Variant
    std::vector<Variant> variants;

    // Element type of Sequence, Array and Compact; store type of BitSequence
    LookupId type = 0;

    // Order type of BitSequence
    LookupId order_type = 0;

    // Array
    uint32_t len = 0;

    // Tuple
    std::vector<LookupId> tuple;

    Primitive primitive = Primitive::Bool;

    // HistoricMetaCompat
    std::string historic;
};

struct Type {
    std::vector<std::string> path;
    std::vector<TypeParam> params;
    TypeDef def;
    std::vector<std::string> docs;
};

struct PortableType {
    LookupId id = 0;
    Type type;
};

struct PortableRegistry {
    std::vector<PortableType> types;

    // nullptr if there is no type with that id
    const Type* find(LookupId id) const;

    // Like find() but throw DecodeError if the id is missing
    const Type& at(LookupId id) const;

    // Id for the next appended type
    LookupId next_id() const;
};

const char* typedef_kind_name(TypeDef::Kind kind);

PortableRegistry read_registry(IOBase& io);
void write_registry(Writer& wr, const PortableRegistry& registry);

// Encoding of the definition alone
void write_typedef(Writer& wr, const TypeDef& def);

LookupId read_lookup_id(IOBase& io);
void write_lookup_id(Writer& wr, LookupId id);

nlohmann::json to_json(const Field& field);
nlohmann::json to_json(const Variant& variant);
nlohmann::json to_json(const TypeDef& def);
nlohmann::json to_json(const Type& type);
nlohmann::json to_json(const PortableRegistry& registry);
}  // namespace metaconf::portable
