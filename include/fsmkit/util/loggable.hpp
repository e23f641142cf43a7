#pragma once

#include "../core/types.hpp"
#include <ostream>
#include <type_traits>

namespace fsmkit {
    namespace util {

        template <typename T>
        concept Streamable = requires(std::ostream &os, const T &v) { os << v; };

        // ─── Printable form of an opaque state id for log output ─────────────────────
        // Enums print as their numeric value, streamable types as themselves.
        template <typename S> auto loggable(const S &s) {
            if constexpr (std::is_enum_v<S>) {
                return static_cast<i64>(static_cast<std::underlying_type_t<S>>(s));
            } else if constexpr (Streamable<S>) {
                return s;
            } else {
                return "<opaque>";
            }
        }

    } // namespace util
    using namespace util;
} // namespace fsmkit
