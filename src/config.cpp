// -----------------------------------------------------------------------------
// config.cpp - Node layout file (nlohmann::json)
//
// API & format: see include/config.hpp
// Tests: tests/test_config.cpp
// -----------------------------------------------------------------------------
#include "config.hpp"
#include "zmesh/command_class.hpp"
#include "zmesh/controller.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace zmesh {

static const char* TAG = "config";

// ---------- helpers ----------

// "SWITCH_MULTILEVEL", 38 or "0x26"
static bool class_code_from_json(const json& j, uint8_t& out, std::string& err) {
    if (j.is_number_unsigned()) {
        const auto v = j.get<uint64_t>();
        if (v > 0xFF) { err = "config_class_range:" + std::to_string(v); return false; }
        out = static_cast<uint8_t>(v);
        return true;
    }
    if (j.is_string()) {
        const std::string s = j.get<std::string>();
        if (command_class_from_label(s, out)) return true;
        char* e = nullptr;
        const long v = std::strtol(s.c_str(), &e, 0);
        if (!s.empty() && e && !*e && v >= 0 && v <= 0xFF) {
            out = static_cast<uint8_t>(v);
            return true;
        }
        err = "config_unknown_class:" + s;
        return false;
    }
    err = "config_class_type";
    return false;
}

static bool command_class_from_json(const json& j, CommandClassConfig& out, std::string& err) {
    if (!j.is_object()) return class_code_from_json(j, out.code, err);

    if (!j.contains("class")) { err = "config_class_missing"; return false; }
    if (!class_code_from_json(j.at("class"), out.code, err)) return false;
    if (j.contains("version")) {
        const json& v = j.at("version");
        if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFF) {
            err = "config_class_version";
            return false;
        }
        out.version = static_cast<uint8_t>(v.get<uint64_t>());
    }
    return true;
}

static bool node_from_json(const json& j, NodeConfig& out, std::string& err) {
    if (!j.is_object() || !j.contains("id")) { err = "config_node_missing_id"; return false; }

    const json& id = j.at("id");
    if (!id.is_number_unsigned()) { err = "config_node_id_type"; return false; }
    const auto idv = id.get<uint64_t>();
    if (idv < NODE_ID_MIN || idv > NODE_ID_MAX) {
        err = "config_node_id:" + std::to_string(idv);
        return false;
    }
    out.id = static_cast<uint8_t>(idv);

    if (j.contains("endpoints")) {
        if (!j.at("endpoints").is_array()) { err = "config_endpoints_type"; return false; }
        for (const auto& e : j.at("endpoints")) {
            if (!e.is_number_unsigned()) { err = "config_endpoint_type"; return false; }
            const auto ev = e.get<uint64_t>();
            if (ev < ENDPOINT_ID_MIN || ev > ENDPOINT_ID_MAX) {
                err = "config_endpoint:" + std::to_string(ev);
                return false;
            }
            out.endpoints.push_back(static_cast<uint8_t>(ev));
        }
    }

    if (j.contains("command_classes")) {
        if (!j.at("command_classes").is_array()) { err = "config_command_classes_type"; return false; }
        for (const auto& c : j.at("command_classes")) {
            CommandClassConfig cc;
            if (!command_class_from_json(c, cc, err)) return false;
            out.command_classes.push_back(cc);
        }
    }
    return true;
}

// ---------- public API ----------

bool parse_config(const std::string& text, Config& cfg, std::string& err) {
    Config tmp;
    try {
        const json j = json::parse(text);
        if (!j.is_object()) { err = "config_not_object"; return false; }

        if (j.contains("log_level")) {
            const json& lv = j.at("log_level");
            log::Level level;
            if (!lv.is_string() || !log::parse_level(lv.get<std::string>(), level)) {
                err = "config_log_level";
                return false;
            }
            tmp.log_level = level;
        }

        if (j.contains("nodes")) {
            const json& nodes = j.at("nodes");
            if (!nodes.is_array()) { err = "config_nodes_type"; return false; }
            std::set<uint8_t> seen;
            for (const auto& n : nodes) {
                NodeConfig nc;
                if (!node_from_json(n, nc, err)) return false;
                if (!seen.insert(nc.id).second) {
                    err = "config_duplicate_node:" + std::to_string(nc.id);
                    return false;
                }
                tmp.nodes.push_back(std::move(nc));
            }
        }
    } catch (const json::exception& e) {
        err = std::string("config_parse:") + e.what();
        return false;
    }

    cfg = std::move(tmp);
    return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "config_open:" + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!parse_config(ss.str(), cfg, err)) {
        ZMESH_LOGE(TAG, "%s: %s", path.c_str(), err.c_str());
        return false;
    }
    ZMESH_LOGD(TAG, "loaded %s nodes=%u", path.c_str(), unsigned(cfg.nodes.size()));
    return true;
}

size_t apply_config(const Config& cfg, Controller& controller) {
    size_t handlers = 0;
    for (const auto& nc : cfg.nodes) {
        auto node = controller.add_node(nc.id);
        if (!node) continue;                       // range already checked by the parser
        for (uint8_t ep : nc.endpoints) node->add_endpoint(ep);
        for (const auto& cc : nc.command_classes) {
            auto handler = node->add_command_class(cc.code);
            if (!handler) continue;
            if (cc.version) handler->set_version(*cc.version);
            ++handlers;
        }
    }
    return handlers;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : "") / ".config";
    return (base / "zmesh" / "nodes.json").string();
}

} // namespace zmesh
