#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "metaconf/mem/bytes.h"

#include <nlohmann/json.hpp>

namespace metaconf {
/*
 * Dynamic value decoded from bytes with a TypeNode.
 *
 * The value alone does not know its encoding: the same value re-encodes
 * differently with a u32 or with a Compact<u32>. See Instance
 * (metaconf/codec/value_codec.h) for the pair type + value.
 * */
struct Value {
    enum class Kind {
        Null,
        Bool,
        UInt,       // unsigned integer of any width (and char)
        Int,        // signed integer
        Text,
        Bytes,      // Vec<u8> and [u8; N]
        Sequence,   // Vec<T> and [T; N]
        Option,     // 0 items (None) or 1 item (Some)
        Composite,  // struct and tuple (tuple fields have no name)
        Variant,
    };

    Kind kind = Kind::Null;

    // Bool
    bool flag = false;

    // UInt: magnitude in little endian without trailing zeros (zero is empty)
    // Int: two's complement in little endian, full width
    // Bytes: the bytes
    bytes_t raw;

    // Text; Variant: name of the variant
    std::string text;

    // Sequence, Option, Composite and Variant
    std::vector<Value> items;

    // Names of the fields of Composite and Variant, empty if unnamed
    std::vector<std::string> names;

    // Variant
    uint8_t index = 0;

    static Value make_null();
    static Value make_bool(bool flag);
    static Value make_uint(bytes_t le_magnitude);
    static Value make_uint(uint64_t num);
    static Value make_int(bytes_t le_raw);
    static Value make_text(std::string text);
    static Value make_bytes(bytes_t data);
    static Value make_sequence(std::vector<Value> items);
    static Value make_none();
    static Value make_some(Value item);
    static Value make_composite(std::vector<std::string> names, std::vector<Value> items);
    static Value make_variant(uint8_t index, std::string name, std::vector<std::string> names,
                              std::vector<Value> items);

    const char* kind_name() const;

    bool is_none() const { return kind == Kind::Option and items.empty(); }

    /*
     * Value of an unsigned integer that fits in 64 bits.
     * Throw EncodeError otherwise.
     * */
    uint64_t as_u64() const;

    /*
     * Structural view of the value. Integers that fit in 64 bits are
     * numbers, larger ones are hexadecimal strings (big endian);
     * variants are {"<lowerCamelName>": <fields>}.
     * */
    nlohmann::json to_json() const;
};
}  // namespace metaconf
