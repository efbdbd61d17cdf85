#include "metaconf/codec/primitive.h"

#include <string_view>

#include "metaconf/err/exceptions.h"

namespace metaconf {
const char* primitive_expr_name(Primitive p) {
    switch (p) {
        case Primitive::Bool:
            return "bool";
        case Primitive::Char:
            return "char";
        case Primitive::Str:
            return "Text";
        case Primitive::U8:
            return "u8";
        case Primitive::U16:
            return "u16";
        case Primitive::U32:
            return "u32";
        case Primitive::U64:
            return "u64";
        case Primitive::U128:
            return "u128";
        case Primitive::U256:
            return "u256";
        case Primitive::I8:
            return "i8";
        case Primitive::I16:
            return "i16";
        case Primitive::I32:
            return "i32";
        case Primitive::I64:
            return "i64";
        case Primitive::I128:
            return "i128";
        case Primitive::I256:
            return "i256";
    }
    throw InternalError(F() << "Unknown primitive " << int(p) << ".");
}

const char* primitive_json_name(Primitive p) {
    switch (p) {
        case Primitive::Bool:
            return "Bool";
        case Primitive::Char:
            return "Char";
        case Primitive::Str:
            return "Str";
        case Primitive::U8:
            return "U8";
        case Primitive::U16:
            return "U16";
        case Primitive::U32:
            return "U32";
        case Primitive::U64:
            return "U64";
        case Primitive::U128:
            return "U128";
        case Primitive::U256:
            return "U256";
        case Primitive::I8:
            return "I8";
        case Primitive::I16:
            return "I16";
        case Primitive::I32:
            return "I32";
        case Primitive::I64:
            return "I64";
        case Primitive::I128:
            return "I128";
        case Primitive::I256:
            return "I256";
    }
    throw InternalError(F() << "Unknown primitive " << int(p) << ".");
}

std::optional<Primitive> primitive_from_expr_name(std::string_view name) {
    if (name == "bool") {
        return Primitive::Bool;
    }
    if (name == "char") {
        return Primitive::Char;
    }
    if (name == "Text" or name == "String" or name == "str") {
        return Primitive::Str;
    }

    for (uint8_t i = uint8_t(Primitive::U8); i <= PRIMITIVE_MAX_INDEX; ++i) {
        if (name == primitive_expr_name(Primitive(i))) {
            return Primitive(i);
        }
    }
    return std::nullopt;
}

uint32_t primitive_width(Primitive p) {
    switch (p) {
        case Primitive::Bool:
        case Primitive::U8:
        case Primitive::I8:
            return 1;
        case Primitive::U16:
        case Primitive::I16:
            return 2;
        case Primitive::Char:
        case Primitive::U32:
        case Primitive::I32:
            return 4;
        case Primitive::U64:
        case Primitive::I64:
            return 8;
        case Primitive::U128:
        case Primitive::I128:
            return 16;
        case Primitive::U256:
        case Primitive::I256:
            return 32;
        case Primitive::Str:
            return 0;
    }
    throw InternalError(F() << "Unknown primitive " << int(p) << ".");
}

bool primitive_is_unsigned(Primitive p) { return Primitive::U8 <= p and p <= Primitive::U256; }

bool primitive_is_signed(Primitive p) { return Primitive::I8 <= p and p <= Primitive::I256; }
}  // namespace metaconf
