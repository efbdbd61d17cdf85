#pragma once

#include <string>
#include <string_view>

#include "metaconf/codec/type_node.h"

namespace metaconf {
/*
 * Parse a type expression as found in legacy (pre-lookup) metadata
 * and in type definitions:
 *
 *  - primitives: bool, char, u8 ... u256, i8 ... i256, Text (String, str)
 *  - Bytes, Null and ()
 *  - Vec<T>, Option<T>, Compact<T>, [T; N], tuples (A, B, ...)
 *  - Box<T>, Cow<T>, Rc<T>, Arc<T> are the same as T
 *  - BTreeMap<K, V> and HashMap<K, V> are Vec<(K, V)>;
 *    BTreeSet<T> and HashSet<T> are Vec<T>
 *  - references and slices: &'static [u8], &[T], &str
 *  - qualified paths are reduced to their last segment:
 *    T::Balance, <T as Trait>::Balance, frame_system::AccountInfo
 *
 * Vec<u8> (and [u8] slices) are Bytes.
 *
 * Any other name yields a Named node that the TypeRegistry resolves
 * later (generic arguments are kept in the name: "Foo<u32>").
 *
 * Throw DecodeError if the expression is malformed.
 * */
TypeNodePtr parse_type_expr(std::string_view expr);

/*
 * Canonical form of a type expression: the expression parsed and
 * displayed back. Whitespace and path qualifiers are removed so
 * "<T as Trait>::Balance" and "T::Balance" normalize to "Balance"
 * and "Vec< u8 >" to "Bytes".
 * */
std::string normalize_type_expr(std::string_view expr);
}  // namespace metaconf
