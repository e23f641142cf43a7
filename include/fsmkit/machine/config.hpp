#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <utility>

namespace fsmkit {
    namespace machine {

        // ─── Machine configuration ─────────────────────────────────────────────────────
        struct MachineConfig {
            u32 redirect_limit = 0; // 0 = follow redirects without limit
            dp::String machine_name = "fsm";

            MachineConfig &max_redirects(u32 hops) {
                redirect_limit = hops;
                return *this;
            }
            MachineConfig &name(dp::String n) {
                machine_name = std::move(n);
                return *this;
            }

            bool bounded() const noexcept { return redirect_limit != 0; }

            Result<void> validate() const {
                if (machine_name.empty()) {
                    echo::category(LOG_CONFIG).error("machine name must not be empty");
                    return Result<void>::err(Error::invalid_config("machine name must not be empty"));
                }
                return {};
            }
        };

    } // namespace machine
    using namespace machine;
} // namespace fsmkit
