#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace metaconf {
// The order is the one of the wire format (the index of the primitive in the lookup)
enum class Primitive : uint8_t {
    Bool = 0,
    Char = 1,
    Str = 2,
    U8 = 3,
    U16 = 4,
    U32 = 5,
    U64 = 6,
    U128 = 7,
    U256 = 8,
    I8 = 9,
    I16 = 10,
    I32 = 11,
    I64 = 12,
    I128 = 13,
    I256 = 14,
};

constexpr uint8_t PRIMITIVE_MAX_INDEX = 14;

// Name in a type expression: "bool", "u32", "Text", ...
const char* primitive_expr_name(Primitive p);

// Name in the JSON of a lookup: "Bool", "U32", "Str", ...
const char* primitive_json_name(Primitive p);

/*
 * Parse a primitive from its type expression name.
 * Aliases are accepted: "Text", "String" and "str" are all Str.
 * */
std::optional<Primitive> primitive_from_expr_name(std::string_view name);

// Size in bytes of the fixed-width encoding; 0 for Str (variable length).
uint32_t primitive_width(Primitive p);

bool primitive_is_unsigned(Primitive p);
bool primitive_is_signed(Primitive p);
}  // namespace metaconf
