#pragma once

#include <datapod/datapod.hpp>

namespace fsmkit {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Log categories ──────────────────────────────────────────────────────────
    inline constexpr const char *LOG_MACHINE = "fsmkit.machine";
    inline constexpr const char *LOG_CONFIG = "fsmkit.config";

} // namespace fsmkit
