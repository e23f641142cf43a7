#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace fsmkit {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        RedirectLimit,
        InvalidConfig,
        InvalidState,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error redirect_limit(u32 limit) noexcept {
            return Error(ErrorCode::RedirectLimit,
                         "redirect limit exceeded: more than " + dp::String(std::to_string(limit)) + " hops");
        }
        static Error invalid_config(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidConfig, std::move(msg));
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace fsmkit
