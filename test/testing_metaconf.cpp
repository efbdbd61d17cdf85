#include "test/testing_metaconf.h"

#include <iomanip>
#include <sstream>

#include "metaconf/meta/metadata.h"

using namespace ::metaconf;

namespace {
legacy::StorageEntry plain_entry(const std::string& name, StorageModifier modifier, const std::string& value,
                                 const bytes_t& fallback) {
    legacy::StorageEntry entry;
    entry.name = name;
    entry.modifier = modifier;
    entry.type.kind = legacy::StorageEntryType::Kind::Plain;
    entry.type.value = value;
    entry.fallback = fallback;
    return entry;
}

legacy::StorageEntry map_entry(const std::string& name, StorageHasher hasher, const std::string& key,
                               const std::string& value, const bytes_t& fallback) {
    legacy::StorageEntry entry;
    entry.name = name;
    entry.modifier = StorageModifier::Default;
    entry.type.kind = legacy::StorageEntryType::Kind::Map;
    entry.type.hasher = hasher;
    entry.type.key = key;
    entry.type.value = value;
    entry.fallback = fallback;
    return entry;
}

legacy::StorageEntry voting_entry(uint8_t version) {
    legacy::StorageEntry entry;
    entry.name = "Voting";
    entry.modifier = StorageModifier::Default;
    entry.type.value = "BalanceOf<T>";
    entry.fallback = bytes_t(16, 0);
    entry.docs = {" Votes and locked stake of a particular voter."};

    if (version >= 13) {
        entry.type.kind = legacy::StorageEntryType::Kind::NMap;
        entry.type.keys = {"T::AccountId", "u32"};
        entry.type.hashers = {StorageHasher::Twox64Concat, StorageHasher::Blake2_128Concat};
    } else {
        entry.type.kind = legacy::StorageEntryType::Kind::DoubleMap;
        entry.type.hasher = StorageHasher::Twox64Concat;
        entry.type.key = "T::AccountId";
        entry.type.key2 = "u32";
        entry.type.key2_hasher = StorageHasher::Blake2_128Concat;
    }
    return entry;
}

legacy::Module system_module() {
    legacy::Module mod;
    mod.name = "System";
    mod.index = 0;

    legacy::Storage storage;
    storage.prefix = "System";
    storage.items.push_back(map_entry("Account", StorageHasher::Blake2_128Concat, "T::AccountId",
                                      "AccountInfo<T::Index, T::AccountData>", bytes_t(80, 0)));
    storage.items.back().docs = {" The full account information for a particular account ID."};
    storage.items.push_back(
            map_entry("BlockHash", StorageHasher::Twox64Concat, "T::BlockNumber", "T::Hash", bytes_t(32, 0)));
    storage.items.push_back(plain_entry("Number", StorageModifier::Default, "T::BlockNumber", bytes_t(4, 0)));
    storage.items.push_back(plain_entry("UpgradedToU32RefCount", StorageModifier::Default, "bool", {0x00}));
    storage.items.push_back(
            plain_entry("LastRuntimeUpgrade", StorageModifier::Optional, "LastRuntimeUpgradeInfo", {0x00}));
    storage.items.push_back(plain_entry("ExecutionPhase", StorageModifier::Optional, "Phase", {0x00}));
    mod.storage = storage;

    mod.calls = std::vector<legacy::Call>{
            {.name = "remark", .args = {{.name = "_remark", .type = "Vec<u8>"}}, .docs = {" Make some on-chain remark."}},
            {.name = "set_heap_pages", .args = {{.name = "pages", .type = "u64"}}, .docs = {}},
    };
    mod.events = std::vector<legacy::Event>{
            {.name = "ExtrinsicSuccess", .args = {"DispatchInfo"}, .docs = {" An extrinsic completed successfully."}},
            {.name = "NewAccount", .args = {"AccountId"}, .docs = {}},
    };
    mod.constants = {
            {.name = "BlockHashCount", .type = "T::BlockNumber", .value = {0x60, 0x09, 0x00, 0x00}, .docs = {}},
    };
    mod.errors = {
            {.name = "InvalidSpecName", .docs = {" The name of specification does not match between the current runtime"}},
            {.name = "NonDefaultComposite", .docs = {}},
    };
    return mod;
}

legacy::Module timestamp_module() {
    legacy::Module mod;
    mod.name = "Timestamp";
    mod.index = 2;

    legacy::Storage storage;
    storage.prefix = "Timestamp";
    storage.items.push_back(plain_entry("Now", StorageModifier::Default, "T::Moment", bytes_t(8, 0)));
    storage.items.push_back(plain_entry("DidUpdate", StorageModifier::Default, "bool", {0x00}));
    mod.storage = storage;

    mod.calls = std::vector<legacy::Call>{
            {.name = "set", .args = {{.name = "now", .type = "Compact<T::Moment>"}}, .docs = {}},
    };
    mod.constants = {
            {.name = "MinimumPeriod",
             .type = "T::Moment",
             .value = {0xb8, 0x0b, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
             .docs = {}},
    };
    return mod;
}

legacy::Module elections_module(uint8_t version) {
    legacy::Module mod;
    mod.name = "ElectionsPhragmen";
    mod.index = 3;

    legacy::Storage storage;
    storage.prefix = "PhragmenElection";
    storage.items.push_back(
            plain_entry("Members", StorageModifier::Default, "Vec<(T::AccountId, BalanceOf<T>)>", {0x00}));
    storage.items.push_back(plain_entry("ElectionRounds", StorageModifier::Default, "u32", bytes_t(4, 0)));
    storage.items.push_back(plain_entry("Candidates", StorageModifier::Default, "Vec<T::AccountId>", {0x00}));
    storage.items.push_back(voting_entry(version));
    mod.storage = storage;

    mod.calls = std::vector<legacy::Call>{
            {.name = "vote",
             .args = {{.name = "votes", .type = "Vec<T::AccountId>"},
                      {.name = "value", .type = "Compact<BalanceOf<T>>"}},
             .docs = {}},
    };
    mod.events = std::vector<legacy::Event>{
            {.name = "NewTerm", .args = {"Vec<(AccountId, Balance)>"}, .docs = {}},
    };
    mod.errors = {{.name = "UnableToVote", .docs = {}}};
    return mod;
}

portable::Type primitive_type(Primitive primitive) {
    portable::Type type;
    type.def.kind = portable::TypeDef::Kind::Primitive;
    type.def.primitive = primitive;
    return type;
}

portable::Type composite_type(std::vector<std::string> path, std::vector<portable::Field> fields) {
    portable::Type type;
    type.path = std::move(path);
    type.def.kind = portable::TypeDef::Kind::Composite;
    type.def.fields = std::move(fields);
    return type;
}

portable::Type variant_type(std::vector<std::string> path, std::vector<portable::Variant> variants) {
    portable::Type type;
    type.path = std::move(path);
    type.def.kind = portable::TypeDef::Kind::Variant;
    type.def.variants = std::move(variants);
    return type;
}

portable::Type elem_type(portable::TypeDef::Kind kind, portable::LookupId elem, uint32_t len = 0) {
    portable::Type type;
    type.def.kind = kind;
    type.def.type = elem;
    type.def.len = len;
    return type;
}

portable::Field field(const std::string& name, portable::LookupId type, const std::string& type_name) {
    return {.name = name, .type = type, .type_name = type_name, .docs = {}};
}

portable::PortableRegistry sample_lookup() {
    using portable::TypeDef;

    std::vector<portable::Type> types;
    types.push_back(primitive_type(Primitive::U8));                         // 0
    types.push_back(elem_type(TypeDef::Kind::Array, 0, 32));                // 1
    types.push_back(composite_type({"sp_core", "crypto", "AccountId32"},    // 2
                                   {{.name = std::nullopt, .type = 1, .type_name = "[u8; 32]", .docs = {}}}));
    types.push_back(primitive_type(Primitive::U32));                        // 3
    types.push_back(primitive_type(Primitive::U128));                       // 4

    auto account_data = composite_type({"pallet_balances", "AccountData"},  // 5
                                       {field("free", 4, "Balance"), field("reserved", 4, "Balance"),
                                        field("misc_frozen", 4, "Balance"), field("fee_frozen", 4, "Balance")});
    account_data.params = {{.name = "Balance", .type = 4}};
    types.push_back(account_data);

    types.push_back(composite_type({"frame_system", "AccountInfo"},         // 6
                                   {field("nonce", 3, "Index"), field("consumers", 3, "RefCount"),
                                    field("providers", 3, "RefCount"), field("sufficients", 3, "RefCount"),
                                    field("data", 5, "AccountData")}));
    types.push_back(primitive_type(Primitive::U64));                        // 7

    auto option = variant_type({"Option"},                                  // 8
                               {{.name = "None", .fields = {}, .index = 0, .docs = {}},
                                {.name = "Some",
                                 .fields = {{.name = std::nullopt, .type = 7, .type_name = std::nullopt, .docs = {}}},
                                 .index = 1,
                                 .docs = {}}});
    option.params = {{.name = "T", .type = 7}};
    types.push_back(option);

    types.push_back(elem_type(TypeDef::Kind::Compact, 7));                  // 9
    types.push_back(variant_type({"pallet_timestamp", "pallet", "Call"},    // 10
                                 {{.name = "set", .fields = {field("now", 9, "T::Moment")}, .index = 0,
                                   .docs = {" Set the current time."}}}));
    types.push_back(elem_type(TypeDef::Kind::Sequence, 0));                 // 11
    types.push_back(variant_type({"frame_system", "pallet", "Call"},        // 12
                                 {{.name = "remark", .fields = {field("remark", 11, "Vec<u8>")}, .index = 0,
                                   .docs = {}}}));
    types.push_back(variant_type({"frame_system", "pallet", "Error"},       // 13
                                 {{.name = "InvalidSpecName", .fields = {}, .index = 0, .docs = {}},
                                  {.name = "NonDefaultComposite", .fields = {}, .index = 1, .docs = {}}}));

    portable::Type unit;                                                    // 14
    unit.def.kind = TypeDef::Kind::Tuple;
    types.push_back(unit);

    types.push_back(primitive_type(Primitive::Bool));                       // 15
    types.push_back(variant_type({"node_runtime", "RuntimeCall"},           // 16
                                 {{.name = "System",
                                   .fields = {{.name = std::nullopt, .type = 12, .type_name = std::nullopt, .docs = {}}},
                                   .index = 0,
                                   .docs = {}},
                                  {.name = "Timestamp",
                                   .fields = {{.name = std::nullopt, .type = 10, .type_name = std::nullopt, .docs = {}}},
                                   .index = 3,
                                   .docs = {}}}));
    types.push_back(composite_type({"node_runtime", "Runtime"}, {}));       // 17

    portable::PortableRegistry registry;
    for (size_t i = 0; i < types.size(); ++i) {
        registry.types.push_back({.id = portable::LookupId(i), .type = types[i]});
    }
    return registry;
}

portable::StorageEntry portable_entry(const std::string& name, StorageModifier modifier, portable::LookupId value,
                                      const bytes_t& fallback) {
    portable::StorageEntry entry;
    entry.name = name;
    entry.modifier = modifier;
    entry.kind = portable::StorageEntry::Kind::Plain;
    entry.value = value;
    entry.fallback = fallback;
    return entry;
}
}  // namespace

std::string testing_metaconf::helpers::hexdump(const bytes_t& buf, unsigned at, unsigned len) {
    std::ostringstream out;

    // Avoid the wrap around
    if (at + len < at) {
        len = unsigned(-1) - at;
    }

    for (unsigned i = at; i < buf.size() and i < at + len; ++i) {
        out << std::setfill('0') << std::setw(2) << std::hex << (int)buf[i];
        if (i % 2 == 1 and i + 1 < buf.size() and i + 1 < at + len)
            out << " ";
    }

    return out.str();
}

legacy::MetadataBody testing_metaconf::helpers::sample_legacy_body(uint8_t version) {
    legacy::MetadataBody body;
    body.version = version;
    body.modules = {system_module(), timestamp_module(), elections_module(version)};

    if (version >= 11) {
        body.extrinsic.version = 4;
        body.extrinsic.signed_extensions = {"CheckSpecVersion", "CheckNonce"};
    }
    return body;
}

portable::MetadataBody testing_metaconf::helpers::sample_portable_body(uint8_t version) {
    portable::MetadataBody body;
    body.version = version;
    body.lookup = sample_lookup();

    portable::Pallet system;
    system.name = "System";
    system.index = 0;

    portable::StorageEntry account;
    account.name = "Account";
    account.modifier = StorageModifier::Default;
    account.kind = portable::StorageEntry::Kind::Map;
    account.hashers = {StorageHasher::Blake2_128Concat};
    account.key = 2;
    account.value = 6;
    account.fallback = bytes_t(80, 0);
    account.docs = {" The full account information for a particular account ID."};

    system.storage = portable::PalletStorage{
            .prefix = "System",
            .items = {account, portable_entry("Number", StorageModifier::Default, 3, bytes_t(4, 0)),
                      portable_entry("UpgradedToU32RefCount", StorageModifier::Default, 15, {0x00})}};
    system.calls = 12;
    system.constants = {{.name = "BlockHashCount", .type = 3, .value = {0x60, 0x09, 0x00, 0x00}, .docs = {}}};
    system.error = 13;

    portable::Pallet timestamp;
    timestamp.name = "Timestamp";
    timestamp.index = 3;
    timestamp.storage = portable::PalletStorage{
            .prefix = "Timestamp",
            .items = {portable_entry("Now", StorageModifier::Default, 7, bytes_t(8, 0)),
                      portable_entry("NextUpdate", StorageModifier::Optional, 7, {0x00})}};
    timestamp.calls = 10;

    if (version >= 15) {
        system.docs = {" The System pallet."};
    }

    body.pallets = {system, timestamp};
    body.extrinsic = {.type = 11,
                      .version = 4,
                      .signed_extensions = {{.identifier = "CheckNonce", .type = 14, .additional_signed = 14}}};
    body.type = 17;

    if (version >= 15) {
        body.apis = {{.name = "Core",
                      .methods = {{.name = "version", .inputs = {}, .output = 3, .docs = {" Returns the version."}}},
                      .docs = {}}};
        body.outer_enums = {.call_type = 16, .event_type = 14, .error_type = 13};
    }
    return body;
}

bytes_t testing_metaconf::helpers::sample_blob(uint8_t version) {
    if (version < 14) {
        return Metadata(sample_legacy_body(version)).to_bytes();
    }
    return Metadata(sample_portable_body(version)).to_bytes();
}

Check testing_metaconf::helpers::sample_check(uint8_t version, std::vector<Exemption> fails) {
    return Check{.data = sample_blob(version), .fails = std::move(fails)};
}
