#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "metaconf/mem/bytes.h"

namespace metaconf {
// A storage item: the module (pallet) that declares it and its name
struct storage_item_key_t {
    std::string module;
    std::string item;
};

/*
 * A storage item that is expected to fail the default-value validation.
 *
 * Structured exemptions name the item by (module, item); the names are
 * compared in lowerCamel case and case-insensitively, so
 * {"ElectionsPhragmen", "members"} and {"electionsPhragmen", "Members"}
 * are the same.
 *
 * Substring exemptions are kept for compatibility with the allow-lists
 * written against the location strings: they match any location that
 * contains the pattern (like "staking.erasStakers").
 * */
class Exemption {
public:
    static Exemption item(const std::string& module, const std::string& item);
    static Exemption substring(const std::string& pattern);

    // Implicit: a plain string is a substring exemption
    Exemption(const char* pattern);
    Exemption(const std::string& pattern);

    bool matches(std::string_view location, const storage_item_key_t& key) const;

    bool is_structured() const { return structured; }

    std::string describe() const;

private:
    Exemption(bool structured, const std::string& module, const std::string& item);

    bool structured;
    std::string module;
    std::string pattern;  // the item for structured exemptions
};

/*
 * One test fixture: the encoded metadata and the storage items expected
 * to fail the default-value validation.
 * */
struct Check {
    bytes_t data;
    std::vector<Exemption> fails;

    // The data given in hexadecimal (see from_hex in metaconf/mem/bytes.h)
    static Check from_hex(std::string_view hexstr, std::vector<Exemption> fails = {});
};
}  // namespace metaconf
