#pragma once

#include <cstdint>
#include <type_traits>

#include "metaconf/mem/asserts.h"

namespace metaconf {

/*
 * Perform a static cast of the argument from source type Src to Dst where
 * both Src and Dst types are integers.
 *
 * After the static cast was performed the result is DEBUG-assert checked.
 * The assert fails when the input value n and the output value m differ
 * "semantically" (lost bits or lost/gained sign).
 * */
namespace internals {
template <typename Dst, typename Src>
[[nodiscard]] constexpr inline typename std::enable_if_t<std::is_integral_v<Src> and std::is_integral_v<Dst>, Dst>
        assert_integral_cast_annotated(const Src n, [[maybe_unused]] const char* file,
                                       [[maybe_unused]] unsigned int line, [[maybe_unused]] const char* func) noexcept {
    Dst m = static_cast<Dst>(n);
    if constexpr (std::is_signed_v<Src> == std::is_signed_v<Dst>) {
        metaconf_internals__assert_annotated("integral cast failed", (m == n), file, line, func);
    } else {
        if constexpr (std::is_signed_v<Src>) {
            metaconf_internals__assert_annotated("integral cast failed", (n >= 0), file, line, func);
        } else {
            metaconf_internals__assert_annotated("integral cast failed", (m >= 0), file, line, func);
        }
    }
    return m;
}
}  // namespace internals

#define assert_u32(n) internals::assert_integral_cast_annotated<uint32_t>(n, __FILE__, __LINE__, __func__)

}  // namespace metaconf
