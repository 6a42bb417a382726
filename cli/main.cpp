/**
 * @file main.cpp
 * @brief zmesh CLI: Linux one-shot runner around zmesh::Controller.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11).
 *  - Load the node layout (explicit --config must exist; the default path is optional).
 *  - Make sure the target node exists; create it with SWITCH_MULTILEVEL if unconfigured.
 *  - Feed inbound frames (--feed HEX, repeatable) through controller.handle_incoming().
 *  - Print every event the handlers emit.
 *  - Build the requested outgoing frame (--get NAME | --set NAME VALUE).
 *  - Drain the in-memory transport and print every frame handed to it.
 *
 * Output is line-oriented `key=value` (pretty) or one JSON object per line (json).
 *
 * Exit codes:
 *   0 ok, 2 usage/argument error, 4 node/endpoint not found, 5 config error.
 */

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "command_dispatch.hpp"
#include "config.hpp"
#include "zmesh/controller.hpp"
#include "zmesh/log.hpp"
#include "zmesh/multilevel_switch.hpp"
#include "zmesh/transport/queue_transport.hpp"

using json = nlohmann::json;
using namespace zmesh;

static const char* TAG = "cli";

static constexpr int EXIT_OK        = 0;
static constexpr int EXIT_USAGE     = 2;
static constexpr int EXIT_NOT_FOUND = 4;
static constexpr int EXIT_CONFIG    = 5;

// ---------- output ----------

static json frame_json(const char* dir, const Frame& f) {
  json j;
  j["dir"]      = dir;
  j["node"]     = f.node_id();
  j["endpoint"] = endpoint_number(f.endpoint());
  j["class"]    = command_class_label(f.command_class());
  j["command"]  = f.command();
  j["msg"]      = message_class_name(f.transport().message_class);
  j["prio"]     = message_priority_name(f.transport().priority);
  j["bytes"]    = to_hex(f);
  return j;
}

static void print_frame(const std::string& format, const char* dir, const Frame& f) {
  if (format == "json") {
    std::cout << frame_json(dir, f).dump() << "\n";
    return;
  }
  std::cout << "status=ok dir=" << dir
            << " node=" << unsigned(f.node_id())
            << " endpoint=" << endpoint_number(f.endpoint())
            << " class=" << command_class_label(f.command_class())
            << " msg=" << message_class_name(f.transport().message_class)
            << " prio=" << message_priority_name(f.transport().priority)
            << " bytes=\"" << to_hex(f) << "\"\n";
}

static void print_dropped(const std::string& format, const char* reason) {
  if (format == "json") {
    json j;
    j["status"] = "dropped";
    j["reason"] = reason;
    std::cout << j.dump() << "\n";
  } else {
    std::cout << "status=dropped reason=" << reason << "\n";
  }
}

static int fail(const std::string& format, const std::string& reason, int code) {
  if (format == "json") {
    json j;
    j["status"] = "error";
    j["reason"] = reason;
    std::cout << j.dump() << "\n";
  } else {
    std::cerr << "status=error reason=" << reason << "\n";
  }
  return code;
}

/// Prints every event as it is delivered.
struct EventPrinter : EventListener {
  explicit EventPrinter(std::string fmt) : format(std::move(fmt)) {}

  void notification(const Event& e) override {
    if (format == "json") {
      json j;
      j["event"]    = event_kind_name(e.kind);
      j["node"]     = e.node_id;
      j["endpoint"] = endpoint_number(e.endpoint);
      j["value"]    = e.value.to_string();
      std::cout << j.dump() << "\n";
    } else {
      std::cout << "status=ok event=" << event_kind_name(e.kind)
                << " node=" << unsigned(e.node_id)
                << " endpoint=" << endpoint_number(e.endpoint)
                << " value=" << e.value.to_string() << "\n";
    }
  }

  std::string format;
};

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  unsigned    opt_node = 0;
  unsigned    opt_endpoint = 0;      // 0 => root device
  std::string opt_get;
  std::vector<std::string> opt_set;  // NAME VALUE
  std::vector<std::string> opt_feed;
  std::string opt_format = "pretty";
  std::string opt_log_level;

  CLI::App app{"zmesh CLI: feed frames to a node, print events, build commands"};

  app.add_option("--config", opt_config, "Node layout JSON (default: $XDG_CONFIG_HOME/zmesh/nodes.json)");
  app.add_option("--node", opt_node, "Target node id")
      ->required()
      ->check(CLI::Range(unsigned(NODE_ID_MIN), unsigned(NODE_ID_MAX)));
  app.add_option("--endpoint", opt_endpoint, "Endpoint (0 = root device)")
      ->check(CLI::Range(0u, unsigned(ENDPOINT_ID_MAX)));
  auto* get = app.add_option("--get", opt_get, "Parameter to read back: level|dim");
  auto* set = app.add_option("--set", opt_set, "Parameter and value: level N | power on|off | step up|down")
      ->expected(2);
  get->excludes(set);
  app.add_option("--feed", opt_feed, "Inbound frame as hex, e.g. \"05 03 26 03 32\" (repeatable)");
  app.add_option("--format", opt_format, "Output format: pretty|json")
      ->check(CLI::IsMember({"pretty", "json"}));
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (!opt_log_level.empty()) {
    log::Level lv;
    if (!log::parse_level(opt_log_level, lv)) return fail(opt_format, "bad_value:log_level", EXIT_USAGE);
    log::set_level(lv);
  }

  // ---- config ----
  Config cfg;
  {
    std::string err;
    if (!opt_config.empty()) {
      if (!load_config(opt_config, cfg, err)) return fail(opt_format, err, EXIT_CONFIG);
    } else {
      const std::string path = default_config_path();
      if (!load_config(path, cfg, err)) {
        if (err.rfind("config_open:", 0) != 0) return fail(opt_format, err, EXIT_CONFIG);
        ZMESH_LOGD(TAG, "no config at %s, continuing without", path.c_str());
        cfg = Config{};
      }
    }
  }
  if (cfg.log_level && opt_log_level.empty()) log::set_level(*cfg.log_level);

  transport::QueueTransport link;
  Controller controller(link);
  apply_config(cfg, controller);

  // ---- target ----
  const uint8_t node_id = static_cast<uint8_t>(opt_node);
  auto node = controller.get_node(node_id);
  if (!node) {
    node = controller.add_node(node_id);
    if (!node) return fail(opt_format, "node_not_found", EXIT_NOT_FOUND);
    node->add_command_class(SWITCH_MULTILEVEL);
    ZMESH_LOGI(TAG, "node=%u not configured, assuming a dimmer", unsigned(node_id));
  }

  Endpoint endpoint = kRootEndpoint;
  if (opt_endpoint != 0) {
    endpoint = static_cast<uint8_t>(opt_endpoint);
    if (!node->has_endpoint(endpoint)) {
      return fail(opt_format, "endpoint_not_found:" + std::to_string(opt_endpoint), EXIT_NOT_FOUND);
    }
  }

  auto dimmer = std::dynamic_pointer_cast<MultiLevelSwitchCommandClass>(
      node->get_command_class(SWITCH_MULTILEVEL));

  EventPrinter printer(opt_format);
  controller.notifier().add_listener(printer);

  // ---- inbound ----
  for (const auto& hex : opt_feed) {
    std::vector<uint8_t> bytes;
    if (!parse_hex(hex, bytes)) return fail(opt_format, "bad_value:feed(hex)", EXIT_USAGE);
    const DispatchStatus st = controller.handle_incoming(bytes.data(), bytes.size(), endpoint);
    if (st != DispatchStatus::Ok) print_dropped(opt_format, dispatch_status_name(st));
  }

  // ---- outbound ----
  if (!opt_get.empty() || !opt_set.empty()) {
    if (!dimmer) return fail(opt_format, "node_has_no_switch_multilevel", EXIT_NOT_FOUND);

    Frame out;
    std::string err;
    const bool ok = !opt_get.empty()
        ? build_param_get_frame(opt_get, *dimmer, endpoint, out, err)
        : build_param_set_frame(opt_set[0], opt_set[1], *dimmer, endpoint, out, err);
    if (!ok) return fail(opt_format, err, EXIT_USAGE);
    const transport::TxResult tx = controller.send(out);
    if (tx != transport::TxResult::Ok) print_dropped(opt_format, transport::tx_result_name(tx));
  }

  // ---- drain ----
  Frame f;
  while (link.pop(f)) print_frame(opt_format, "tx", f);

  controller.notifier().remove_listener(printer);
  return EXIT_OK;
}
