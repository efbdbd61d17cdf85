#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "metaconf/codec/primitive.h"

namespace metaconf {
struct TypeNode;
typedef std::shared_ptr<const TypeNode> TypeNodePtr;

/*
 * Decode strategy of a type: a tree describing how a value of that type
 * is laid out in bytes.
 *
 * The tree is shallow where the type system allows recursion: Lookup and
 * Named nodes are references resolved on demand by the SchemaContext
 * (see metaconf/codec/schema_context.h), so recursive types don't
 * require infinite trees.
 * */
struct TypeNode {
    enum class Kind {
        Null,         // unit, zero bytes
        Primitive,    // bool, fixed-width integers, char and Text
        Compact,      // compact-encoded integer; element in fields[0]
        Bytes,        // Vec<u8>
        Sequence,     // Vec<T>; element in fields[0]
        Array,        // [T; len]; element in fields[0]
        Tuple,        // elements in fields (unnamed)
        Option,       // Option<T>; element in fields[0]
        Composite,    // struct; fields in order
        Variant,      // enum; variants
        BitSequence,  // not decodable
        Lookup,       // reference to a portable lookup id
        Named,        // reference to a type registered by name
    };

    struct field_t {
        std::string name;
        TypeNodePtr type;
    };

    struct variant_t {
        std::string name;
        uint8_t index;
        std::vector<field_t> fields;
    };

    Kind kind = Kind::Null;
    Primitive primitive = Primitive::Bool;

    // Array length or lookup id
    uint32_t len = 0;

    // Named: the name to resolve. Composite/Variant: the type name, if any.
    std::string name;

    std::vector<field_t> fields;
    std::vector<variant_t> variants;

    /*
     * The type as written in a type expression: "u32", "Vec<AccountId>",
     * "Option<(u32,Balance)>", "[u8;32]", ...
     *
     * Composites and variants with a name are shown by their name.
     * */
    std::string display() const;

    const TypeNodePtr& elem() const;

    static TypeNodePtr make_null();
    static TypeNodePtr make_primitive(Primitive p);
    static TypeNodePtr make_bytes();
    static TypeNodePtr make_compact(TypeNodePtr elem);
    static TypeNodePtr make_sequence(TypeNodePtr elem);
    static TypeNodePtr make_array(TypeNodePtr elem, uint32_t len);
    static TypeNodePtr make_tuple(std::vector<TypeNodePtr> elems);
    static TypeNodePtr make_option(TypeNodePtr elem);
    static TypeNodePtr make_composite(std::string name, std::vector<field_t> fields);
    static TypeNodePtr make_variant(std::string name, std::vector<variant_t> variants);
    static TypeNodePtr make_bit_sequence();
    static TypeNodePtr make_lookup(uint32_t id);
    static TypeNodePtr make_named(std::string name);
};
}  // namespace metaconf
