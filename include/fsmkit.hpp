#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "fsmkit/core/error.hpp"
#include "fsmkit/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "fsmkit/util/event.hpp"
#include "fsmkit/util/loggable.hpp"

// ─── Machine ─────────────────────────────────────────────────────────────────
#include "fsmkit/machine/config.hpp"
#include "fsmkit/machine/properties.hpp"
#include "fsmkit/machine/state_machine.hpp"
