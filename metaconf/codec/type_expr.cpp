#include "metaconf/codec/type_expr.h"

#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "metaconf/err/exceptions.h"

namespace {
using namespace metaconf;

const unsigned MAX_NESTING = 64;

class ExprParser {
public:
    explicit ExprParser(std::string_view expr): expr(expr), pos(0), depth(0) {}

    TypeNodePtr parse() {
        auto node = parse_type();
        skip_ws();
        if (pos != expr.size()) {
            fail("unexpected trailing characters");
        }
        return node;
    }

private:
    std::string_view expr;
    size_t pos;
    unsigned depth;

    [[noreturn]] void fail(const std::string& why) const {
        throw DecodeError(F() << "Unable to parse type expression '" << expr << "' at position " << pos << ": "
                              << why << ".");
    }

    void skip_ws() {
        while (pos < expr.size() and std::isspace(static_cast<unsigned char>(expr[pos]))) {
            ++pos;
        }
    }

    bool accept(char c) {
        skip_ws();
        if (pos < expr.size() and expr[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    bool accept(std::string_view s) {
        skip_ws();
        if (expr.substr(pos, s.size()) == s) {
            pos += s.size();
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (not accept(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    bool at_ident_start() {
        skip_ws();
        return pos < expr.size() and (std::isalpha(static_cast<unsigned char>(expr[pos])) or expr[pos] == '_');
    }

    std::string ident() {
        if (not at_ident_start()) {
            fail("expected an identifier");
        }
        const size_t begin = pos;
        while (pos < expr.size() and (std::isalnum(static_cast<unsigned char>(expr[pos])) or expr[pos] == '_')) {
            ++pos;
        }
        return std::string(expr.substr(begin, pos - begin));
    }

    uint32_t number() {
        skip_ws();
        const size_t begin = pos;
        uint64_t num = 0;
        while (pos < expr.size() and std::isdigit(static_cast<unsigned char>(expr[pos]))) {
            num = num * 10 + uint64_t(expr[pos] - '0');
            if (num > uint32_t(-1)) {
                fail("array length too large");
            }
            ++pos;
        }
        if (begin == pos) {
            fail("expected a number");
        }
        return uint32_t(num);
    }

    std::vector<TypeNodePtr> parse_list(char close) {
        std::vector<TypeNodePtr> elems;
        if (accept(close)) {
            return elems;
        }

        while (true) {
            elems.push_back(parse_type());
            if (accept(close)) {
                break;
            }
            expect(',');
            if (accept(close)) {  // trailing comma
                break;
            }
        }
        return elems;
    }

    TypeNodePtr parse_type() {
        if (++depth > MAX_NESTING) {
            fail("nesting too deep");
        }

        TypeNodePtr node;
        if (accept('(')) {
            auto elems = parse_list(')');
            node = elems.empty() ? TypeNode::make_null() : TypeNode::make_tuple(std::move(elems));
        } else if (accept('[')) {
            auto elem = parse_type();
            if (accept(';')) {
                const uint32_t len = number();
                expect(']');
                node = TypeNode::make_array(std::move(elem), len);
            } else {
                expect(']');
                node = is_u8(elem) ? TypeNode::make_bytes() : TypeNode::make_sequence(std::move(elem));
            }
        } else if (accept('&')) {
            if (accept('\'')) {
                ident();  // lifetime
            }
            node = parse_type();
        } else if (accept('<')) {
            // Qualified path: <T as Trait<I>>::Name
            parse_type();
            skip_ws();
            if (ident() != "as") {
                fail("expected 'as' in qualified path");
            }
            parse_type();
            expect('>');
            if (not accept("::")) {
                fail("expected '::' after qualified path");
            }
            node = parse_path();
        } else {
            node = parse_path();
        }

        --depth;
        return node;
    }

    TypeNodePtr parse_path() {
        std::string name = ident();
        while (accept("::")) {
            name = ident();
        }

        std::vector<TypeNodePtr> generics;
        bool has_generics = false;
        if (accept('<')) {
            has_generics = true;
            generics = parse_list('>');
        }

        return from_path(name, std::move(generics), has_generics);
    }

    static bool is_u8(const TypeNodePtr& node) {
        return node->kind == TypeNode::Kind::Primitive and node->primitive == Primitive::U8;
    }

    void expect_generics(const std::string& name, const std::vector<TypeNodePtr>& generics, size_t cnt) const {
        if (generics.size() != cnt) {
            fail(name + " expects " + std::to_string(cnt) + " type argument(s)");
        }
    }

    TypeNodePtr from_path(const std::string& name, std::vector<TypeNodePtr> generics, bool has_generics) {
        if (has_generics) {
            if (name == "Vec") {
                expect_generics(name, generics, 1);
                return is_u8(generics[0]) ? TypeNode::make_bytes() : TypeNode::make_sequence(generics[0]);
            }
            if (name == "Option") {
                expect_generics(name, generics, 1);
                return TypeNode::make_option(generics[0]);
            }
            if (name == "Compact") {
                expect_generics(name, generics, 1);
                return TypeNode::make_compact(generics[0]);
            }
            if (name == "Box" or name == "Cow" or name == "Rc" or name == "Arc") {
                expect_generics(name, generics, 1);
                return generics[0];
            }
            if (name == "BTreeMap" or name == "HashMap") {
                expect_generics(name, generics, 2);
                return TypeNode::make_sequence(TypeNode::make_tuple(std::move(generics)));
            }
            if (name == "BTreeSet" or name == "HashSet") {
                expect_generics(name, generics, 1);
                return TypeNode::make_sequence(generics[0]);
            }
            if (name == "PhantomData") {
                return TypeNode::make_null();
            }

            std::string full = name + "<";
            for (size_t i = 0; i < generics.size(); ++i) {
                full += (i ? "," : "") + generics[i]->display();
            }
            full += ">";
            return TypeNode::make_named(full);
        }

        if (auto p = primitive_from_expr_name(name); p) {
            return TypeNode::make_primitive(*p);
        }
        if (name == "Bytes") {
            return TypeNode::make_bytes();
        }
        if (name == "Null") {
            return TypeNode::make_null();
        }

        return TypeNode::make_named(name);
    }
};
}  // namespace

namespace metaconf {
TypeNodePtr parse_type_expr(std::string_view expr) { return ExprParser(expr).parse(); }

std::string normalize_type_expr(std::string_view expr) { return parse_type_expr(expr)->display(); }
}  // namespace metaconf
