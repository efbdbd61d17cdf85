#pragma once

#include "metaconf/codec/schema_context.h"
#include "metaconf/codec/type_node.h"
#include "metaconf/codec/value.h"
#include "metaconf/codec/writer.h"
#include "metaconf/mem/bytes.h"

#include <nlohmann/json.hpp>

namespace metaconf {
struct decode_options_t {
    /*
     * The bytes are an Option of the given type: a 0x00 flag (None) or
     * a 0x01 flag followed by the value (Some).
     * */
    bool is_optional = false;
};

/*
 * A decoded value and the type it was decoded with.
 * */
class Instance {
public:
    Instance(const SchemaContext& ctx, TypeNodePtr type, Value value);

    /*
     * Encode the value again.
     *
     * With full == true the whole encoding is produced. With
     * full == false (bare) the outermost length prefix (of Bytes, Text
     * and Vec) or Option flag is omitted.
     *
     * Throw EncodeError if the value does not match the type.
     * */
    bytes_t to_bytes(bool full = true) const;

    const TypeNodePtr& type() const { return ty; }
    const Value& value() const { return val; }

    nlohmann::json to_json() const { return val.to_json(); }

private:
    SchemaContext ctx;
    TypeNodePtr ty;
    Value val;
};

/*
 * Decode the bytes as a value of the given type. Bytes after the value
 * are ignored.
 *
 * Throw DecodeError if the bytes do not conform to the type (including
 * truncated input) or if the type cannot be resolved.
 * */
Instance decode_value(const SchemaContext& ctx, const TypeNodePtr& type, const bytes_t& data,
                      const decode_options_t& opts = {});

// Encode the value with the given type. Throw EncodeError on mismatch.
void encode_value(const SchemaContext& ctx, const TypeNodePtr& type, const Value& value, Writer& wr);
}  // namespace metaconf
