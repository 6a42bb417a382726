#pragma once
/**
 * @page zm-command-dispatch zmesh Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Centralized resolution of CLI options → outgoing dimmer frames.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue layer between high-level CLI arguments and the
 * frame builders of `MultiLevelSwitchCommandClass`. It exists so that:
 *   - `cli/main.cpp` never has to know about individual builders.
 *   - New parameters can be added by editing only this file.
 *   - Parsing, validation, and builder selection are kept in one place.
 *
 * WHAT THIS DOES
 * --------------
 * - `CommandKind` lists every supported operation.
 * - `name_to_kind()` maps user-facing strings (`"level"`, `"dim"`,
 *   `"power"`, `"switch"`, `"step"`) plus GET/SET into a `CommandKind`.
 * - `build_frame_from_kind()` validates the value and calls the builder.
 * - `build_param_get_frame()` / `build_param_set_frame()` wrap both steps for
 *   the `--get` / `--set` CLI style.
 *
 * PROCESS FLOW
 * ------------
 * 1. CLI args parsed in main.cpp (e.g., `--set level 40`).
 * 2. main.cpp calls `build_param_set_frame("level", "40", sw, ep, out, err)`.
 * 3. Dispatcher → `name_to_kind("level", true)` → `CommandKind::SET_LEVEL`.
 * 4. Value is parsed and range-checked (0..99), then `set_value_message()`.
 * 5. `out` now holds the frame ready for the transport.
 *
 * Building a SET updates the handler's stored level immediately, exactly as
 * calling the builder directly would.
 *
 * EXAMPLE
 * -------
 *   zmesh::Frame f;
 *   std::string err;
 *   if (!zmesh::build_param_set_frame("power", "on", sw, zmesh::kRootEndpoint, f, err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *       return 2;
 *   }
 *   // f.bytes() == 05 03 26 01 63
 *
 * @note Errors are surfaced with stable strings like "unknown_get",
 *       "bad_value:level(0..99)" so scripts can act accordingly.
 */

#include <string>
#include <cstdint>

#include "zmesh/address.hpp"
#include "zmesh/frame.hpp"

namespace zmesh {

class MultiLevelSwitchCommandClass;

/**
 * @enum CommandKind
 * @brief Canonical set of operations the CLI can request from a dimmer.
 *
 * GET_* ignore their value; SET_* require and validate one.
 */
enum class CommandKind {

    /** Read back the current level (GET). */
    GET_LEVEL,

    /** Set an absolute level 0..99. */
    SET_LEVEL,

    /** Switch fully on (99) or off (0). */
    SET_POWER,

    /** Step the level up or down by one increment. */
    SET_STEP
};

/**
 * @brief Resolve a user-facing name and operation into a CommandKind.
 *
 * Names are matched case-insensitively. Accepted:
 *   - GET: `level`, `dim`
 *   - SET: `level`, `dim`, `power`, `switch`, `step`
 *
 * @retval true   Resolved; @p out_kind is set.
 * @retval false  Unknown name; @p out_kind is untouched.
 */
bool name_to_kind(const std::string& name, bool is_set, CommandKind& out_kind);

/**
 * @brief Build the outgoing frame for @p kind.
 *
 * Value formats:
 *   - SET_LEVEL: integer 0..99 (decimal or 0x hex)
 *   - SET_POWER: `on`/`off`/`1`/`0`
 *   - SET_STEP:  `up`/`down`
 *
 * @param err  On failure: "bad_value:level(0..99)", "bad_value:power(on|off)",
 *             "bad_value:step(up|down)" or "encode_failed".
 */
bool build_frame_from_kind(CommandKind kind,
                           MultiLevelSwitchCommandClass& handler,
                           Endpoint endpoint,
                           const std::string& value,
                           Frame& out,
                           std::string& err);

/// GET by name. @p err is "unknown_get" for an unknown name.
bool build_param_get_frame(const std::string& name,
                           MultiLevelSwitchCommandClass& handler,
                           Endpoint endpoint,
                           Frame& out,
                           std::string& err);

/// SET by name. @p err is "unknown_set" for an unknown name.
bool build_param_set_frame(const std::string& name,
                           const std::string& value,
                           MultiLevelSwitchCommandClass& handler,
                           Endpoint endpoint,
                           Frame& out,
                           std::string& err);

} // namespace zmesh
