#include "metaconf/codec/registry.h"
#include "metaconf/codec/type_expr.h"
#include "metaconf/codec/value_codec.h"
#include "metaconf/err/exceptions.h"
#include "metaconf/meta/metadata.h"

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "test/testing_metaconf.h"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

using ::testing::HasSubstr;
using ::testing::ThrowsMessage;
using ::testing::AllOf;

using ::testing_metaconf::helpers::hexdump;
using ::testing_metaconf::helpers::sample_blob;

using namespace ::metaconf;

namespace {
    // Decode the bytes with the type expression and check that they re-encode
    // to the same bytes
    Instance decode_and_reencode(const SchemaContext& ctx, const std::string& expr, const bytes_t& data) {
        auto instance = decode_value(ctx, parse_type_expr(expr), data);
        EXPECT_EQ(hexdump(instance.to_bytes()), hexdump(data)) << expr;
        return instance;
    }

    TEST(ValueCodecTest, BaseTypesAccountInfo) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        auto instance = decode_and_reencode(ctx, "AccountInfo", bytes_t(80, 0));
        EXPECT_EQ(instance.value().kind, Value::Kind::Composite);
        EXPECT_EQ(instance.value().items.size(), (size_t)5);

        EXPECT_EQ(instance.to_json(), nlohmann::json::parse(R"({
            "nonce": 0, "consumers": 0, "providers": 0, "sufficients": 0,
            "data": {"free": 0, "reserved": 0, "miscFrozen": 0, "feeFrozen": 0}
        })"));
    }

    TEST(ValueCodecTest, Integers) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        auto u32 = decode_and_reencode(ctx, "u32", {0x60, 0x09, 0x00, 0x00});
        EXPECT_EQ(u32.value().as_u64(), uint64_t(2400));
        EXPECT_EQ(u32.to_json(), nlohmann::json(2400));

        auto i16 = decode_and_reencode(ctx, "i16", {0xfe, 0xff});
        EXPECT_EQ(i16.value().kind, Value::Kind::Int);
        EXPECT_EQ(i16.to_json(), nlohmann::json(-2));

        // 2^64 does not fit in a JSON number: it is shown in hexadecimal (big endian)
        bytes_t balance(16, 0);
        balance[8] = 0x01;
        auto large = decode_and_reencode(ctx, "Balance", balance);
        EXPECT_EQ(large.to_json(), nlohmann::json("0x010000000000000000"));
        EXPECT_THAT(
            [&]() { large.value().as_u64(); },
            ThrowsMessage<EncodeError>(HasSubstr("is not a 64 bits unsigned integer."))
        );

        // compact of a wrapper type
        auto prefs = decode_and_reencode(ctx, "ValidatorPrefs", {0x28, 0x01});
        EXPECT_EQ(prefs.to_json(), nlohmann::json::parse(R"({"commission": 10, "blocked": true})"));
    }

    TEST(ValueCodecTest, Containers) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        auto bytes = decode_and_reencode(ctx, "Vec<u8>", {0x08, 0xde, 0xad});
        EXPECT_EQ(bytes.to_json(), nlohmann::json("0xdead"));

        auto hash = decode_and_reencode(ctx, "H256", bytes_t(32, 0x11));
        EXPECT_EQ(hash.value().kind, Value::Kind::Bytes);

        auto members = decode_and_reencode(ctx, "Vec<(AccountId, BalanceOf<T>)>", {0x00});
        EXPECT_EQ(members.to_json(), nlohmann::json::array());

        auto rounds = decode_and_reencode(ctx, "Vec<Option<u16>>", {0x08, 0x00, 0x01, 0x05, 0x00});
        EXPECT_EQ(rounds.to_json(), nlohmann::json::parse("[null, 5]"));

        auto text = decode_and_reencode(ctx, "Text", {0x0c, 'f', 'o', 'o'});
        EXPECT_EQ(text.to_json(), nlohmann::json("foo"));
    }

    TEST(ValueCodecTest, Enums) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        auto apply = decode_and_reencode(ctx, "Phase", {0x00, 0x05, 0x00, 0x00, 0x00});
        EXPECT_EQ(apply.to_json(), nlohmann::json::parse(R"({"applyExtrinsic": 5})"));

        auto fin = decode_and_reencode(ctx, "Phase", {0x01});
        EXPECT_EQ(fin.to_json(), nlohmann::json::parse(R"({"finalization": null})"));

        auto forcing = decode_and_reencode(ctx, "Forcing", {0x03});
        EXPECT_EQ(forcing.value().text, "ForceAlways");

        EXPECT_THAT(
            [&]() { decode_value(ctx, parse_type_expr("Phase"), {0x03}); },
            ThrowsMessage<DecodeError>(HasSubstr("Unknown variant index 3 for Phase."))
        );
    }

    TEST(ValueCodecTest, OptionalAndBareEncoding) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        auto some = decode_value(ctx, parse_type_expr("bool"), {0x01, 0x01}, decode_options_t{.is_optional = true});
        EXPECT_EQ(some.value().kind, Value::Kind::Option);
        EXPECT_EQ(hexdump(some.to_bytes()), "0101");
        EXPECT_EQ(hexdump(some.to_bytes(false)), "01");

        auto none = decode_value(ctx, parse_type_expr("LastRuntimeUpgradeInfo"), {0x00},
                                 decode_options_t{.is_optional = true});
        EXPECT_TRUE(none.value().is_none());
        EXPECT_EQ(hexdump(none.to_bytes()), "00");
        EXPECT_EQ(hexdump(none.to_bytes(false)), "");

        auto bytes = decode_value(ctx, parse_type_expr("Bytes"), {0x08, 0xde, 0xad});
        EXPECT_EQ(hexdump(bytes.to_bytes(false)), "dead");
    }

    TEST(ValueCodecTest, TrailingBytesAreIgnored) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        auto u32 = decode_value(ctx, parse_type_expr("u32"), {0x01, 0x00, 0x00, 0x00, 0xff});
        EXPECT_EQ(hexdump(u32.to_bytes()), "0100 0000");
    }

    TEST(ValueCodecTest, DecodeErrors) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);

        EXPECT_THAT(
            [&]() { decode_value(ctx, parse_type_expr("u32"), {0x01, 0x00}); },
            ThrowsMessage<DecodeError>(HasSubstr("Not enough bytes for u32."))
        );

        EXPECT_THAT(
            [&]() { decode_value(ctx, parse_type_expr("T::Mystery"), {0x00}); },
            ThrowsMessage<DecodeError>(HasSubstr("Unable to resolve type Mystery, it is not a known type name."))
        );

        EXPECT_THAT(
            [&]() { decode_value(ctx, parse_type_expr("Option<u8>"), {0x02}); },
            ThrowsMessage<DecodeError>(HasSubstr("Invalid option flag 2, expected 0 or 1."))
        );

        EXPECT_THAT(
            [&]() { decode_value(ctx, parse_type_expr("Compact<Text>"), {0x00}); },
            ThrowsMessage<DecodeError>(HasSubstr("Compact encoding of Text is not supported."))
        );
    }

    TEST(ValueCodecTest, EncodeMismatch) {
        TypeRegistry registry;
        SchemaContext ctx(registry, nullptr);
        Writer wr;

        EXPECT_THAT(
            [&]() { encode_value(ctx, parse_type_expr("u32"), Value::make_text("x"), wr); },
            ThrowsMessage<EncodeError>(HasSubstr("A value of kind text cannot be encoded as u32."))
        );

        EXPECT_THAT(
            [&]() { encode_value(ctx, parse_type_expr("u8"), Value::make_uint(uint64_t(256)), wr); },
            ThrowsMessage<EncodeError>(HasSubstr("Integer of 2 bytes does not fit in u8."))
        );

        auto pair = Value::make_composite({}, {Value::make_uint(uint64_t(1))});
        EXPECT_THAT(
            [&]() { encode_value(ctx, parse_type_expr("(u8, u8)"), pair, wr); },
            ThrowsMessage<EncodeError>(HasSubstr("Expected 2 elements for (u8,u8) but got 1."))
        );

        encode_value(ctx, parse_type_expr("Compact<u32>"), Value::make_uint(uint64_t(64)), wr);
        EXPECT_EQ(hexdump(wr.data()), "0101");
    }

    TEST(TypeRegistryTest, RegisterDefinitions) {
        TypeRegistry registry;
        EXPECT_TRUE(registry.has_definition("AccountInfo"));
        EXPECT_FALSE(registry.has_definition("Foo"));

        registry.register_definitions(std::string(R"({
            "Foo": {"a": "u8", "b": "Vec<u16>"},
            "Bar": {"_enum": {"A": null, "B": "u8", "C": {"x": "bool"}}},
            "Baz": "Foo"
        })"));

        EXPECT_TRUE(registry.has_definition("Foo"));
        EXPECT_TRUE(registry.has_definition("Bar"));

        SchemaContext ctx(registry, nullptr);
        auto foo = decode_and_reencode(ctx, "Baz", {0x07, 0x04, 0x01, 0x00});
        EXPECT_EQ(foo.to_json(), nlohmann::json::parse(R"({"a": 7, "b": [1]})"));

        auto bar = decode_and_reencode(ctx, "Bar", {0x02, 0x01});
        EXPECT_EQ(bar.to_json(), nlohmann::json::parse(R"({"c": {"x": true}})"));

        // generic arguments are ignored when the base name is known
        auto foo2 = decode_and_reencode(ctx, "Foo<T>", {0x07, 0x00});
        EXPECT_EQ(foo2.value().items.size(), (size_t)2);
    }

    TEST(TypeRegistryTest, InvalidDefinitions) {
        TypeRegistry registry;

        EXPECT_THAT(
            [&]() { registry.register_definitions(std::string(R"({"Good": "u8", "Bad": {"_set": {"A": 1}}})")); },
            ThrowsMessage<DecodeError>(
                AllOf(
                    HasSubstr("Invalid definition of type 'Bad'."),
                    HasSubstr("uses the unsupported '_set'")
                    )
                )
        );

        // nothing was registered
        EXPECT_FALSE(registry.has_definition("Good"));

        EXPECT_THAT(
            [&]() { registry.register_definitions(std::string("{not json")); },
            ThrowsMessage<DecodeError>(HasSubstr("Type definitions are not valid JSON."))
        );

        EXPECT_THAT(
            [&]() { registry.register_definitions(std::string("[]")); },
            ThrowsMessage<DecodeError>(HasSubstr("Type definitions must be a JSON object, not array."))
        );
    }

    TEST(TypeRegistryTest, ReferenceLoop) {
        TypeRegistry registry;
        registry.register_definitions(std::string(R"({"Ping": "Pong", "Pong": "Ping"})"));

        SchemaContext ctx(registry, nullptr);
        EXPECT_THAT(
            [&]() { decode_value(ctx, parse_type_expr("Ping"), {0x00}); },
            ThrowsMessage<DecodeError>(HasSubstr("does not resolve to a concrete type after 64 references"))
        );
    }

    TEST(TypeRegistryTest, ActiveSchema) {
        TypeRegistry registry;

        EXPECT_THAT(
            [&]() { registry.active_schema(); },
            ThrowsMessage<InternalError>(HasSubstr("No active schema was set in the type registry."))
        );

        auto ctx = registry.set_active_schema(nullptr);
        EXPECT_FALSE(ctx.has_metadata());
        EXPECT_FALSE(registry.active_schema().has_metadata());

        EXPECT_THAT(
            [&]() { ctx.lookup(); },
            ThrowsMessage<InternalError>(HasSubstr("No metadata is bound to the schema context."))
        );
    }

    TEST(SchemaContextTest, PortableLookup) {
        TypeRegistry registry;
        auto metadata = std::make_shared<const Metadata>(Metadata::decode(sample_blob(14)));
        auto ctx = registry.set_active_schema(metadata);

        EXPECT_EQ(ctx.resolve_type(6)->kind, TypeNode::Kind::Composite);
        EXPECT_EQ(ctx.resolve_type(8)->kind, TypeNode::Kind::Option);
        EXPECT_EQ(ctx.resolve_type(11)->kind, TypeNode::Kind::Bytes);
        EXPECT_EQ(ctx.resolve_type(14)->kind, TypeNode::Kind::Null);

        auto array = ctx.resolve_type(1);
        EXPECT_EQ(array->kind, TypeNode::Kind::Array);
        EXPECT_EQ(array->len, uint32_t(32));

        EXPECT_EQ(ctx.type_name(6), "FrameSystemAccountInfo");

        auto info = decode_value(ctx, TypeNode::make_lookup(6), bytes_t(80, 0));
        EXPECT_EQ(hexdump(info.to_bytes()), hexdump(bytes_t(80, 0)));
        EXPECT_EQ(info.value().items.size(), (size_t)5);

        auto next = decode_value(ctx, TypeNode::make_lookup(8), {0x01, 0x2a, 0, 0, 0, 0, 0, 0, 0});
        EXPECT_EQ(next.to_json(), nlohmann::json(42));

        EXPECT_THAT(
            [&]() { ctx.resolve_type(99); },
            ThrowsMessage<DecodeError>(HasSubstr("Lookup id 99 not found"))
        );
    }
}
