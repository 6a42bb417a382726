// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// - See command_dispatch.hpp for API contracts and examples.
// - See tests/test_command_dispatch.cpp for the accepted names and values.
//
// Style: no exceptions, switch-based dispatch, stable error strings.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"
#include "zmesh/multilevel_switch.hpp"

#include <cctype>     // std::tolower
#include <cstdlib>    // strtol

namespace zmesh {

// ---------- local parsing helpers (no exceptions) ----------

static bool parse_u8(const std::string& s, uint8_t& out,
                     uint32_t lo=0, uint32_t hi=255) {
    if (s.empty()) return false;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 0);
    if (!e || *e) return false;                 // leftover junk
    if (v < (long)lo || v > (long)hi) return false;
    out = (uint8_t)v;
    return true;
}

static std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

// ---------- mapping: (name, is_set) -> CommandKind ----------

bool name_to_kind(const std::string& raw_name, bool is_set, CommandKind& out_kind) {
    const std::string name = lower(raw_name);

    if (!is_set) {
        if (name == "level" || name == "dim") { out_kind = CommandKind::GET_LEVEL; return true; }
        return false;
    }

    if (name == "level" || name == "dim")     { out_kind = CommandKind::SET_LEVEL; return true; }
    if (name == "power" || name == "switch")  { out_kind = CommandKind::SET_POWER; return true; }
    if (name == "step")                       { out_kind = CommandKind::SET_STEP;  return true; }
    return false;
}

// ---------- builder switchboard ----------

bool build_frame_from_kind(CommandKind kind,
                           MultiLevelSwitchCommandClass& handler,
                           Endpoint endpoint,
                           const std::string& value,
                           Frame& out,
                           std::string& err) {
    const std::string v = lower(value);

    switch (kind) {
        case CommandKind::GET_LEVEL:
            out = handler.get_value_message(endpoint);
            break;

        case CommandKind::SET_LEVEL: {
            uint8_t level = 0;
            if (!parse_u8(v, level, MultiLevelSwitchCommandClass::LEVEL_OFF,
                          MultiLevelSwitchCommandClass::LEVEL_ON)) {
                err = "bad_value:level(0..99)";
                return false;
            }
            out = handler.set_value_message(level, endpoint);
            break;
        }

        case CommandKind::SET_POWER: {
            uint8_t level = 0;
            if (v == "on" || v == "1")       level = MultiLevelSwitchCommandClass::LEVEL_ON;
            else if (v == "off" || v == "0") level = MultiLevelSwitchCommandClass::LEVEL_OFF;
            else { err = "bad_value:power(on|off)"; return false; }
            out = handler.set_value_message(level, endpoint);
            break;
        }

        case CommandKind::SET_STEP:
            if (v == "up")        out = handler.increase_level_message(endpoint);
            else if (v == "down") out = handler.decrease_level_message(endpoint);
            else { err = "bad_value:step(up|down)"; return false; }
            break;

        default:
            err = "unhandled_command";
            return false;
    }

    if (out.empty()) { err = "encode_failed"; return false; }
    return true;
}

bool build_param_get_frame(const std::string& name,
                           MultiLevelSwitchCommandClass& handler,
                           Endpoint endpoint,
                           Frame& out,
                           std::string& err) {
    CommandKind k;
    if (!name_to_kind(name, false, k)) { err = "unknown_get"; return false; }
    return build_frame_from_kind(k, handler, endpoint, "", out, err);
}

bool build_param_set_frame(const std::string& name,
                           const std::string& value,
                           MultiLevelSwitchCommandClass& handler,
                           Endpoint endpoint,
                           Frame& out,
                           std::string& err) {
    CommandKind k;
    if (!name_to_kind(name, true, k)) { err = "unknown_set"; return false; }
    return build_frame_from_kind(k, handler, endpoint, value, out, err);
}

} // namespace zmesh
