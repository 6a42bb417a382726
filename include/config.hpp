#pragma once
/**
 * @page zm-config zmesh Node Layout Configuration
 * @file config.hpp
 * @brief JSON description of known nodes, their endpoints and command classes.
 *
 * @details
 * PURPOSE
 * -------
 * Discovery and inclusion live outside the core. Tools still need to know
 * which nodes exist and what they can do before the first frame arrives; this
 * file is where that knowledge is written down by hand.
 *
 * FORMAT
 * ------
 * @code{.json}
 * {
 *   "log_level": "info",
 *   "nodes": [
 *     { "id": 5, "endpoints": [1, 2],
 *       "command_classes": ["SWITCH_MULTILEVEL", {"class": 38, "version": 3}] }
 *   ]
 * }
 * @endcode
 *
 * - `log_level` is optional (`trace`..`off`).
 * - A command class is a label (`"SWITCH_MULTILEVEL"`), a number (`38` or
 *   `"0x26"`), or an object with `class` and optional `version`.
 * - Node ids must be 1..232 and unique; endpoints 1..127.
 *
 * LOCATION
 * --------
 * `$XDG_CONFIG_HOME/zmesh/nodes.json`, falling back to
 * `$HOME/.config/zmesh/nodes.json`.
 *
 * FAILURE MODEL
 * -------------
 * No exceptions escape. Every function returns false and fills `err` with a
 * short, script-friendly reason such as `config_parse:...`,
 * `config_node_id:300` or `config_unknown_class:FOO`.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zmesh/log.hpp"

namespace zmesh {

class Controller;

/// One command class entry of a node.
struct CommandClassConfig {
    uint8_t code{0};
    std::optional<uint8_t> version;   ///< as reported by the device, if known
};

struct NodeConfig {
    uint8_t id{0};
    std::vector<uint8_t> endpoints;
    std::vector<CommandClassConfig> command_classes;
};

struct Config {
    std::optional<log::Level> log_level;
    std::vector<NodeConfig> nodes;
};

/// Parse JSON text. On failure @p cfg is left untouched.
bool parse_config(const std::string& text, Config& cfg, std::string& err);

/// Read and parse a file. A missing file is an error ("config_open:<path>").
bool load_config(const std::string& path, Config& cfg, std::string& err);

/**
 * @brief Create the configured nodes, endpoints and handlers on @p controller.
 *
 * Existing nodes are extended, not replaced. Codes without a handler are
 * logged by the registry and skipped; they are not an error here since the
 * layout may list capabilities this build does not drive.
 *
 * @return number of handlers created or already present.
 */
size_t apply_config(const Config& cfg, Controller& controller);

/// Default location of the node layout file.
std::string default_config_path();

} // namespace zmesh
