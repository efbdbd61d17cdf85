#include "metaconf/check/check.h"

#include <utility>

#include "metaconf/meta/naming.h"

namespace metaconf {
namespace {
std::string fold(const std::string& name) { return string_lower_case(string_camel_case(name)); }
}  // namespace

Exemption::Exemption(bool structured, const std::string& module, const std::string& item):
        structured(structured), module(module), pattern(item) {}

Exemption Exemption::item(const std::string& module, const std::string& item) {
    return Exemption(true, module, item);
}

Exemption Exemption::substring(const std::string& pattern) { return Exemption(false, "", pattern); }

Exemption::Exemption(const char* pattern): Exemption(false, "", pattern) {}

Exemption::Exemption(const std::string& pattern): Exemption(false, "", pattern) {}

bool Exemption::matches(std::string_view location, const storage_item_key_t& key) const {
    if (structured) {
        return fold(module) == fold(key.module) and fold(pattern) == fold(key.item);
    }
    return location.find(pattern) != std::string_view::npos;
}

std::string Exemption::describe() const {
    if (structured) {
        return "item " + module + "." + pattern;
    }
    return "substring '" + pattern + "'";
}

Check Check::from_hex(std::string_view hexstr, std::vector<Exemption> fails) {
    return Check{.data = metaconf::from_hex(hexstr), .fails = std::move(fails)};
}
}  // namespace metaconf
