#include "metaconf/codec/value.h"

#include <string>
#include <utility>

#include "metaconf/err/exceptions.h"
#include "metaconf/meta/naming.h"

namespace metaconf {
namespace {
Value make_kind(Value::Kind kind) {
    Value val;
    val.kind = kind;
    return val;
}

std::string be_hex(const bytes_t& le) {
    bytes_t be(le.rbegin(), le.rend());
    return to_hex(be);
}

nlohmann::json fields_to_json(const Value& val) {
    bool all_named = not val.names.empty();
    for (const auto& name: val.names) {
        all_named = all_named and not name.empty();
    }

    if (all_named) {
        auto obj = nlohmann::json::object();
        for (size_t i = 0; i < val.items.size(); ++i) {
            obj[val.names[i]] = val.items[i].to_json();
        }
        return obj;
    }

    auto arr = nlohmann::json::array();
    for (const auto& item: val.items) {
        arr.push_back(item.to_json());
    }
    return arr;
}
}  // namespace

Value Value::make_null() { return make_kind(Kind::Null); }

Value Value::make_bool(bool flag) {
    auto val = make_kind(Kind::Bool);
    val.flag = flag;
    return val;
}

Value Value::make_uint(bytes_t le_magnitude) {
    while (not le_magnitude.empty() and le_magnitude.back() == 0) {
        le_magnitude.pop_back();
    }

    auto val = make_kind(Kind::UInt);
    val.raw = std::move(le_magnitude);
    return val;
}

Value Value::make_uint(uint64_t num) {
    bytes_t le_magnitude;
    while (num) {
        le_magnitude.push_back(uint8_t(num & 0xff));
        num >>= 8;
    }
    return make_uint(std::move(le_magnitude));
}

Value Value::make_int(bytes_t le_raw) {
    auto val = make_kind(Kind::Int);
    val.raw = std::move(le_raw);
    return val;
}

Value Value::make_text(std::string text) {
    auto val = make_kind(Kind::Text);
    val.text = std::move(text);
    return val;
}

Value Value::make_bytes(bytes_t data) {
    auto val = make_kind(Kind::Bytes);
    val.raw = std::move(data);
    return val;
}

Value Value::make_sequence(std::vector<Value> items) {
    auto val = make_kind(Kind::Sequence);
    val.items = std::move(items);
    return val;
}

Value Value::make_none() { return make_kind(Kind::Option); }

Value Value::make_some(Value item) {
    auto val = make_kind(Kind::Option);
    val.items.push_back(std::move(item));
    return val;
}

Value Value::make_composite(std::vector<std::string> names, std::vector<Value> items) {
    auto val = make_kind(Kind::Composite);
    val.names = std::move(names);
    val.items = std::move(items);
    return val;
}

Value Value::make_variant(uint8_t index, std::string name, std::vector<std::string> names,
                          std::vector<Value> items) {
    auto val = make_kind(Kind::Variant);
    val.index = index;
    val.text = std::move(name);
    val.names = std::move(names);
    val.items = std::move(items);
    return val;
}

const char* Value::kind_name() const {
    switch (kind) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return "bool";
        case Kind::UInt:
            return "unsigned integer";
        case Kind::Int:
            return "signed integer";
        case Kind::Text:
            return "text";
        case Kind::Bytes:
            return "bytes";
        case Kind::Sequence:
            return "sequence";
        case Kind::Option:
            return "option";
        case Kind::Composite:
            return "composite";
        case Kind::Variant:
            return "variant";
    }
    throw InternalError(F() << "Unknown value kind " << int(kind) << ".");
}

uint64_t Value::as_u64() const {
    if (kind != Kind::UInt or raw.size() > 8) {
        throw EncodeError(F() << "Value of kind " << kind_name() << " (" << raw.size()
                              << " bytes) is not a 64 bits unsigned integer.");
    }

    uint64_t num = 0;
    for (size_t i = 0; i < raw.size(); ++i) {
        num |= uint64_t(raw[i]) << (8 * i);
    }
    return num;
}

nlohmann::json Value::to_json() const {
    switch (kind) {
        case Kind::Null:
            return nullptr;
        case Kind::Bool:
            return flag;
        case Kind::UInt:
            if (raw.size() <= 8) {
                return as_u64();
            }
            return be_hex(raw);
        case Kind::Int: {
            if (raw.empty() or raw.size() > 8) {
                return be_hex(raw);
            }
            // sign extend to 64 bits
            uint64_t num = (raw.back() & 0x80) ? uint64_t(-1) : 0;
            for (size_t i = 0; i < raw.size(); ++i) {
                num &= ~(uint64_t(0xff) << (8 * i));
                num |= uint64_t(raw[i]) << (8 * i);
            }
            return int64_t(num);
        }
        case Kind::Text:
            return text;
        case Kind::Bytes:
            return to_hex(raw);
        case Kind::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item: items) {
                arr.push_back(item.to_json());
            }
            return arr;
        }
        case Kind::Option:
            return items.empty() ? nlohmann::json(nullptr) : items[0].to_json();
        case Kind::Composite:
            return fields_to_json(*this);
        case Kind::Variant: {
            nlohmann::json fields = nullptr;
            if (items.size() == 1 and (names.empty() or names[0].empty())) {
                fields = items[0].to_json();
            } else if (not items.empty()) {
                fields = fields_to_json(*this);
            }
            return {{string_camel_case(text), fields}};
        }
    }
    throw InternalError(F() << "Unknown value kind " << int(kind) << ".");
}
}  // namespace metaconf
