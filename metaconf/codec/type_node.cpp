#include "metaconf/codec/type_node.h"

#include <sstream>
#include <string>
#include <utility>

#include "metaconf/err/exceptions.h"

namespace metaconf {
std::string TypeNode::display() const {
    std::stringstream ss;
    switch (kind) {
        case Kind::Null:
            return "Null";
        case Kind::Primitive:
            return primitive_expr_name(primitive);
        case Kind::Compact:
            return "Compact<" + elem()->display() + ">";
        case Kind::Bytes:
            return "Bytes";
        case Kind::Sequence:
            return "Vec<" + elem()->display() + ">";
        case Kind::Array:
            ss << "[" << elem()->display() << ";" << len << "]";
            return ss.str();
        case Kind::Tuple:
            ss << "(";
            for (size_t i = 0; i < fields.size(); ++i) {
                ss << (i ? "," : "") << fields[i].type->display();
            }
            ss << ")";
            return ss.str();
        case Kind::Option:
            return "Option<" + elem()->display() + ">";
        case Kind::Composite:
            if (not name.empty()) {
                return name;
            }
            ss << "{";
            for (size_t i = 0; i < fields.size(); ++i) {
                ss << (i ? "," : "") << fields[i].name << ":" << fields[i].type->display();
            }
            ss << "}";
            return ss.str();
        case Kind::Variant:
            if (not name.empty()) {
                return name;
            }
            ss << "{\"_enum\":[";
            for (size_t i = 0; i < variants.size(); ++i) {
                ss << (i ? "," : "") << variants[i].name;
            }
            ss << "]}";
            return ss.str();
        case Kind::BitSequence:
            return "BitVec";
        case Kind::Lookup:
            ss << "Lookup" << len;
            return ss.str();
        case Kind::Named:
            return name;
    }
    throw InternalError(F() << "Unknown type node kind " << int(kind) << ".");
}

const TypeNodePtr& TypeNode::elem() const {
    if (fields.empty() or not fields[0].type) {
        throw InternalError(F() << "Type node of kind " << int(kind) << " has no element type.");
    }
    return fields[0].type;
}

namespace {
std::shared_ptr<TypeNode> make_node(TypeNode::Kind kind) {
    auto node = std::make_shared<TypeNode>();
    node->kind = kind;
    return node;
}

std::shared_ptr<TypeNode> make_node_with_elem(TypeNode::Kind kind, TypeNodePtr elem) {
    auto node = make_node(kind);
    node->fields.push_back({"", std::move(elem)});
    return node;
}
}  // namespace

TypeNodePtr TypeNode::make_null() { return make_node(Kind::Null); }

TypeNodePtr TypeNode::make_primitive(Primitive p) {
    auto node = make_node(Kind::Primitive);
    node->primitive = p;
    return node;
}

TypeNodePtr TypeNode::make_bytes() { return make_node(Kind::Bytes); }

TypeNodePtr TypeNode::make_compact(TypeNodePtr elem) { return make_node_with_elem(Kind::Compact, std::move(elem)); }

TypeNodePtr TypeNode::make_sequence(TypeNodePtr elem) { return make_node_with_elem(Kind::Sequence, std::move(elem)); }

TypeNodePtr TypeNode::make_array(TypeNodePtr elem, uint32_t len) {
    auto node = make_node_with_elem(Kind::Array, std::move(elem));
    node->len = len;
    return node;
}

TypeNodePtr TypeNode::make_tuple(std::vector<TypeNodePtr> elems) {
    auto node = make_node(Kind::Tuple);
    for (auto& elem: elems) {
        node->fields.push_back({"", std::move(elem)});
    }
    return node;
}

TypeNodePtr TypeNode::make_option(TypeNodePtr elem) { return make_node_with_elem(Kind::Option, std::move(elem)); }

TypeNodePtr TypeNode::make_composite(std::string name, std::vector<field_t> fields) {
    auto node = make_node(Kind::Composite);
    node->name = std::move(name);
    node->fields = std::move(fields);
    return node;
}

TypeNodePtr TypeNode::make_variant(std::string name, std::vector<variant_t> variants) {
    auto node = make_node(Kind::Variant);
    node->name = std::move(name);
    node->variants = std::move(variants);
    return node;
}

TypeNodePtr TypeNode::make_bit_sequence() { return make_node(Kind::BitSequence); }

TypeNodePtr TypeNode::make_lookup(uint32_t id) {
    auto node = make_node(Kind::Lookup);
    node->len = id;
    return node;
}

TypeNodePtr TypeNode::make_named(std::string name) {
    auto node = make_node(Kind::Named);
    node->name = std::move(name);
    return node;
}
}  // namespace metaconf
