#include "metaconf/codec/value_codec.h"

#include <string>
#include <utility>
#include <vector>

#include "metaconf/codec/scale.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/io/iospan.h"
#include "metaconf/log/trace.h"

namespace metaconf {
namespace {
const unsigned MAX_NESTING = 256;

bool is_u8(const TypeNodePtr& node) {
    return node->kind == TypeNode::Kind::Primitive and node->primitive == Primitive::U8;
}

std::vector<std::string> field_names(const std::vector<TypeNode::field_t>& fields) {
    std::vector<std::string> names;
    for (const auto& field: fields) {
        names.push_back(field.name);
    }
    return names;
}

class ValueDecoder {
public:
    ValueDecoder(const SchemaContext& ctx, IOBase& io): ctx(ctx), io(io), depth(0) {}

    Value decode(const TypeNodePtr& node) {
        if (++depth > MAX_NESTING) {
            throw DecodeError(io.tell_rd(), F() << "Type " << node->display() << " is nested too deep.");
        }

        const auto type = ctx.resolve(node);
        Value val = decode_resolved(type);

        --depth;
        return val;
    }

private:
    const SchemaContext& ctx;
    IOBase& io;
    unsigned depth;

    bytes_t read_exact(uint32_t sz, const TypeNodePtr& type) {
        const uint32_t at = io.tell_rd();
        bytes_t raw;
        try {
            io.readall(raw, sz);
        } catch (const NotEnoughRoom& err) {
            throw DecodeError(at, F() << "Not enough bytes for " << type->display() << ". " << err.what());
        }
        return raw;
    }

    std::vector<Value> decode_fields(const std::vector<TypeNode::field_t>& fields) {
        std::vector<Value> items;
        for (const auto& field: fields) {
            items.push_back(decode(field.type));
        }
        return items;
    }

    Value decode_primitive(const TypeNodePtr& type) {
        switch (type->primitive) {
            case Primitive::Bool:
                return Value::make_bool(scale::read_bool(io));
            case Primitive::Char:
                return Value::make_uint(uint64_t(scale::read_u32(io)));
            case Primitive::Str:
                return Value::make_text(scale::read_text(io));
            default:
                break;
        }

        auto raw = read_exact(primitive_width(type->primitive), type);
        if (primitive_is_signed(type->primitive)) {
            return Value::make_int(std::move(raw));
        }
        return Value::make_uint(std::move(raw));
    }

    Value decode_compact(const TypeNodePtr& elem) {
        const auto inner = ctx.resolve(elem);
        if (inner->kind == TypeNode::Kind::Primitive and primitive_is_unsigned(inner->primitive)) {
            return Value::make_uint(scale::read_compact_magnitude(io));
        }

        // Compact<Perbill>-like wrappers: a single field struct or tuple
        if ((inner->kind == TypeNode::Kind::Composite or inner->kind == TypeNode::Kind::Tuple) and
            inner->fields.size() == 1) {
            return Value::make_composite(field_names(inner->fields), {decode_compact(inner->fields[0].type)});
        }

        throw DecodeError(io.tell_rd(), F() << "Compact encoding of " << inner->display() << " is not supported.");
    }

    Value decode_resolved(const TypeNodePtr& type) {
        switch (type->kind) {
            case TypeNode::Kind::Null:
                return Value::make_null();

            case TypeNode::Kind::Primitive:
                return decode_primitive(type);

            case TypeNode::Kind::Compact:
                return decode_compact(type->elem());

            case TypeNode::Kind::Bytes:
                return Value::make_bytes(scale::read_bytes(io));

            case TypeNode::Kind::Sequence: {
                const auto& elem = type->elem();
                return Value::make_sequence(scale::read_vec<Value>(io, [&](IOBase&) { return decode(elem); }));
            }

            case TypeNode::Kind::Array: {
                const auto elem = ctx.resolve(type->elem());
                if (is_u8(elem)) {
                    return Value::make_bytes(read_exact(type->len, type));
                }

                std::vector<Value> items;
                for (uint32_t i = 0; i < type->len; ++i) {
                    items.push_back(decode(elem));
                }
                return Value::make_sequence(std::move(items));
            }

            case TypeNode::Kind::Tuple:
            case TypeNode::Kind::Composite:
                return Value::make_composite(field_names(type->fields), decode_fields(type->fields));

            case TypeNode::Kind::Option: {
                const auto& elem = type->elem();
                auto item = scale::read_option<Value>(io, [&](IOBase&) { return decode(elem); });
                return item ? Value::make_some(std::move(*item)) : Value::make_none();
            }

            case TypeNode::Kind::Variant: {
                const uint32_t at = io.tell_rd();
                const uint8_t index = scale::read_u8(io);
                for (const auto& variant: type->variants) {
                    if (variant.index == index) {
                        return Value::make_variant(index, variant.name, field_names(variant.fields),
                                                   decode_fields(variant.fields));
                    }
                }
                throw DecodeError(at, F() << "Unknown variant index " << int(index) << " for "
                                          << type->display() << ".");
            }

            case TypeNode::Kind::BitSequence:
                throw DecodeError(io.tell_rd(), F() << "Decoding of bit sequences is not supported.");

            case TypeNode::Kind::Lookup:
            case TypeNode::Kind::Named:
                break;
        }
        throw InternalError(F() << "Type " << type->display() << " was not resolved before decoding.");
    }
};

class ValueEncoder {
public:
    ValueEncoder(const SchemaContext& ctx, Writer& wr): ctx(ctx), wr(wr) {}

    void encode(const TypeNodePtr& node, const Value& val) {
        const auto type = ctx.resolve(node);
        switch (type->kind) {
            case TypeNode::Kind::Null:
                expect(type, val, Value::Kind::Null);
                return;

            case TypeNode::Kind::Primitive:
                encode_primitive(type, val);
                return;

            case TypeNode::Kind::Compact:
                encode_compact(type->elem(), val);
                return;

            case TypeNode::Kind::Bytes:
                expect(type, val, Value::Kind::Bytes);
                wr.write_bytes(val.raw);
                return;

            case TypeNode::Kind::Sequence:
                expect(type, val, Value::Kind::Sequence);
                wr.write_compact(uint64_t(val.items.size()));
                for (const auto& item: val.items) {
                    encode(type->elem(), item);
                }
                return;

            case TypeNode::Kind::Array: {
                const auto elem = ctx.resolve(type->elem());
                if (is_u8(elem)) {
                    expect(type, val, Value::Kind::Bytes);
                    expect_count(type, val.raw.size(), type->len);
                    wr.writeall(val.raw);
                    return;
                }

                expect(type, val, Value::Kind::Sequence);
                expect_count(type, val.items.size(), type->len);
                for (const auto& item: val.items) {
                    encode(elem, item);
                }
                return;
            }

            case TypeNode::Kind::Tuple:
            case TypeNode::Kind::Composite:
                expect(type, val, Value::Kind::Composite);
                encode_fields(type, type->fields, val);
                return;

            case TypeNode::Kind::Option:
                expect(type, val, Value::Kind::Option);
                if (val.items.empty()) {
                    wr.write_u8_to_le(0);
                } else {
                    wr.write_u8_to_le(1);
                    encode(type->elem(), val.items[0]);
                }
                return;

            case TypeNode::Kind::Variant:
                expect(type, val, Value::Kind::Variant);
                for (const auto& variant: type->variants) {
                    if (variant.index == val.index) {
                        wr.write_u8_to_le(val.index);
                        encode_fields(type, variant.fields, val);
                        return;
                    }
                }
                throw EncodeError(F() << "Variant index " << int(val.index) << " does not exist in "
                                      << type->display() << ".");

            case TypeNode::Kind::BitSequence:
                throw EncodeError(F() << "Encoding of bit sequences is not supported.");

            case TypeNode::Kind::Lookup:
            case TypeNode::Kind::Named:
                break;
        }
        throw InternalError(F() << "Type " << type->display() << " was not resolved before encoding.");
    }

private:
    const SchemaContext& ctx;
    Writer& wr;

    void expect(const TypeNodePtr& type, const Value& val, Value::Kind kind) {
        if (val.kind != kind) {
            throw EncodeError(F() << "A value of kind " << val.kind_name() << " cannot be encoded as "
                                  << type->display() << ".");
        }
    }

    void expect_count(const TypeNodePtr& type, size_t actual, size_t expected) {
        if (actual != expected) {
            throw EncodeError(F() << "Expected " << expected << " elements for " << type->display() << " but got "
                                  << actual << ".");
        }
    }

    void encode_fields(const TypeNodePtr& type, const std::vector<TypeNode::field_t>& fields, const Value& val) {
        expect_count(type, val.items.size(), fields.size());
        for (size_t i = 0; i < fields.size(); ++i) {
            encode(fields[i].type, val.items[i]);
        }
    }

    void encode_primitive(const TypeNodePtr& type, const Value& val) {
        switch (type->primitive) {
            case Primitive::Bool:
                expect(type, val, Value::Kind::Bool);
                wr.write_bool(val.flag);
                return;
            case Primitive::Char:
                expect(type, val, Value::Kind::UInt);
                wr.write_u32_to_le(uint32_t(val.as_u64()));
                return;
            case Primitive::Str:
                expect(type, val, Value::Kind::Text);
                wr.write_text(val.text);
                return;
            default:
                break;
        }

        const uint32_t width = primitive_width(type->primitive);
        if (primitive_is_signed(type->primitive)) {
            expect(type, val, Value::Kind::Int);
            expect_count(type, val.raw.size(), width);
            wr.writeall(val.raw);
            return;
        }

        expect(type, val, Value::Kind::UInt);
        if (val.raw.size() > width) {
            throw EncodeError(F() << "Integer of " << val.raw.size() << " bytes does not fit in "
                                  << type->display() << ".");
        }
        bytes_t raw = val.raw;
        raw.resize(width, 0);
        wr.writeall(raw);
    }

    void encode_compact(const TypeNodePtr& elem, const Value& val) {
        const auto inner = ctx.resolve(elem);
        if (inner->kind == TypeNode::Kind::Primitive and primitive_is_unsigned(inner->primitive)) {
            expect(inner, val, Value::Kind::UInt);
            wr.write_compact(val.raw);
            return;
        }

        if ((inner->kind == TypeNode::Kind::Composite or inner->kind == TypeNode::Kind::Tuple) and
            inner->fields.size() == 1) {
            expect(inner, val, Value::Kind::Composite);
            expect_count(inner, val.items.size(), 1);
            encode_compact(inner->fields[0].type, val.items[0]);
            return;
        }

        throw EncodeError(F() << "Compact encoding of " << inner->display() << " is not supported.");
    }
};
}  // namespace

Instance::Instance(const SchemaContext& ctx, TypeNodePtr type, Value value):
        ctx(ctx), ty(std::move(type)), val(std::move(value)) {}

bytes_t Instance::to_bytes(bool full) const {
    Writer wr;
    if (full) {
        encode_value(ctx, ty, val, wr);
        return wr.take();
    }

    const auto type = ctx.resolve(ty);
    switch (type->kind) {
        case TypeNode::Kind::Option:
            if (not val.is_none()) {
                encode_value(ctx, type->elem(), val.items.at(0), wr);
            }
            break;
        case TypeNode::Kind::Bytes:
            wr.writeall(val.raw);
            break;
        case TypeNode::Kind::Primitive:
            if (type->primitive == Primitive::Str) {
                wr.writeall(bytes_t(val.text.begin(), val.text.end()));
            } else {
                encode_value(ctx, type, val, wr);
            }
            break;
        case TypeNode::Kind::Sequence:
            for (const auto& item: val.items) {
                encode_value(ctx, type->elem(), item, wr);
            }
            break;
        default:
            encode_value(ctx, type, val, wr);
            break;
    }
    return wr.take();
}

Instance decode_value(const SchemaContext& ctx, const TypeNodePtr& type, const bytes_t& data,
                      const decode_options_t& opts) {
    const TypeNodePtr effective = opts.is_optional ? TypeNode::make_option(type) : type;

    IOSpan io(data);
    ValueDecoder decoder(ctx, io);
    Value val;
    try {
        val = decoder.decode(effective);
    } catch (const NotEnoughRoom& err) {
        throw DecodeError(io.tell_rd(), F() << "Unexpected end of input. " << err.what());
    }

    TRACE_ON(METACONF_TRACE_CODEC) << "decoded " << effective->display() << " from " << io.tell_rd() << " of "
                                   << data.size() << " bytes" << TRACE_ENDL;
    return Instance(ctx, effective, std::move(val));
}

void encode_value(const SchemaContext& ctx, const TypeNodePtr& type, const Value& value, Writer& wr) {
    ValueEncoder encoder(ctx, wr);
    encoder.encode(type, value);
}
}  // namespace metaconf
