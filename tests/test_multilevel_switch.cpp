#include <doctest/doctest.h>
#include "test_support.hpp"

#include "zmesh/controller.hpp"
#include "zmesh/multilevel_switch.hpp"

#include <memory>
#include <vector>

using namespace zmesh;
using namespace zmesh_test;
using ML = MultiLevelSwitchCommandClass;

namespace {

struct Fixture {
    RecordingTransport link;
    Controller ctl{link};
    EventRecorder events;
    std::shared_ptr<ML> sw;

    Fixture() {
        auto node = ctl.add_node(5);
        node->add_endpoint(2);
        sw = std::dynamic_pointer_cast<ML>(node->add_command_class(SWITCH_MULTILEVEL));
        ctl.notifier().add_listener(events);
    }
    ~Fixture() { ctl.notifier().remove_listener(events); }

    DispatchStatus report(uint8_t v, Endpoint ep = kRootEndpoint) {
        const uint8_t rx[] = {0x05, 0x03, SWITCH_MULTILEVEL, ML::SWITCH_MULTILEVEL_REPORT, v};
        return ctl.handle_incoming(rx, sizeof(rx), ep);
    }

    DispatchStatus command(uint8_t cmd) {
        const uint8_t rx[] = {0x05, 0x02, SWITCH_MULTILEVEL, cmd};
        return ctl.handle_incoming(rx, sizeof(rx), kRootEndpoint);
    }
};

bool is_get(const Frame& f) {
    return f.to_vector() == std::vector<uint8_t>{0x05, 0x02, 0x26, 0x02};
}

} // namespace

TEST_CASE("report 0 emits OFF and stores 0") {
    Fixture fx;
    REQUIRE(fx.sw);
    CHECK(fx.report(0) == DispatchStatus::Ok);
    REQUIRE(fx.events.size() == 1);
    const Event& e = fx.events.events[0];
    CHECK(e.kind == EventKind::Dimmer);
    CHECK(e.node_id == 5);
    CHECK(e.endpoint == kRootEndpoint);
    CHECK(e.value == EventValue::state(StateToken::Off));
    CHECK(fx.sw->level() == std::optional<uint8_t>(0));
    CHECK(fx.link.size() == 0);
}

TEST_CASE("report 1..98 emits the integer level") {
    Fixture fx;
    for (unsigned v = 1; v <= 98; ++v) {
        fx.report(static_cast<uint8_t>(v));
        REQUIRE(fx.events.size() == v);
        const Event& e = fx.events.events.back();
        CHECK(e.value.is_level());
        CHECK(e.value.as_level() == v);
        CHECK(fx.sw->level() == std::optional<uint8_t>(static_cast<uint8_t>(v)));
    }
    CHECK(fx.link.size() == 0);
}

TEST_CASE("report 99 emits ON") {
    Fixture fx;
    fx.report(99);
    REQUIRE(fx.events.size() == 1);
    CHECK(fx.events.events[0].value == EventValue::state(StateToken::On));
    CHECK(fx.events.events[0].value.to_string() == "ON");
    CHECK(fx.sw->level() == std::optional<uint8_t>(99));
}

TEST_CASE("report above 99 stores nothing, emits nothing, reads back once") {
    for (unsigned v = 100; v <= 255; ++v) {
        Fixture fx;
        fx.report(40);
        REQUIRE(fx.events.size() == 1);

        fx.report(static_cast<uint8_t>(v));
        CHECK(fx.events.size() == 1);
        CHECK(fx.sw->level() == std::optional<uint8_t>(40));
        const auto frames = fx.link.frames();
        REQUIRE(frames.size() == 1);
        CHECK(is_get(frames[0]));
        CHECK(frames[0].transport().priority == MessagePriority::Get);
    }
}

TEST_CASE("report without a value byte is dropped with a warning") {
    LogCapture logs(log::Level::Warn);
    Fixture fx;
    CHECK(fx.command(ML::SWITCH_MULTILEVEL_REPORT) == DispatchStatus::Ok);
    CHECK(fx.events.size() == 0);
    CHECK(fx.link.size() == 0);
    CHECK_FALSE(fx.sw->level().has_value());
    CHECK(logs.contains(log::Level::Warn, "without value byte"));
}

TEST_CASE("report from an endpoint keeps the endpoint on event and read-back") {
    Fixture fx;
    fx.report(10, uint8_t(2));
    REQUIRE(fx.events.size() == 1);
    CHECK(fx.events.events[0].endpoint == Endpoint(uint8_t(2)));

    fx.report(0xFF, uint8_t(2));
    const auto frames = fx.link.frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].endpoint() == Endpoint(uint8_t(2)));
}

TEST_CASE("stop level change requests one read-back; start is ignored") {
    Fixture fx;
    fx.command(ML::SWITCH_MULTILEVEL_START_LEVEL_CHANGE);
    CHECK(fx.link.size() == 0);
    CHECK(fx.events.size() == 0);

    fx.command(ML::SWITCH_MULTILEVEL_STOP_LEVEL_CHANGE);
    const auto frames = fx.link.frames();
    REQUIRE(frames.size() == 1);
    CHECK(is_get(frames[0]));
    CHECK(fx.events.size() == 0);
}

TEST_CASE("set, get and supported commands are logged as not implemented") {
    LogCapture logs(log::Level::Warn);
    Fixture fx;
    fx.report(30);
    const uint8_t cmds[] = {ML::SWITCH_MULTILEVEL_SET, ML::SWITCH_MULTILEVEL_GET,
                            ML::SWITCH_MULTILEVEL_SUPPORTED_GET, ML::SWITCH_MULTILEVEL_SUPPORTED_REPORT};
    for (uint8_t c : cmds) fx.command(c);

    CHECK(logs.count(log::Level::Warn) == 4);
    CHECK(logs.contains(log::Level::Warn, "Command 0x01 not implemented."));
    CHECK(logs.contains(log::Level::Warn, "Command 0x07 not implemented."));
    CHECK(fx.events.size() == 1);
    CHECK(fx.link.size() == 0);
    CHECK(fx.sw->level() == std::optional<uint8_t>(30));
}

TEST_CASE("unknown command code is logged as unsupported") {
    LogCapture logs(log::Level::Warn);
    Fixture fx;
    fx.command(0x09);
    CHECK(logs.contains(log::Level::Warn,
                        "Unsupported command 0x09 for command class SWITCH_MULTILEVEL (0x26)."));
    CHECK(fx.events.size() == 0);
}

TEST_CASE("get_value_message builds a GET expecting an application command") {
    Fixture fx;
    const Frame f = fx.sw->get_value_message(kRootEndpoint);
    CHECK(is_get(f));
    CHECK(f.transport().message_class == MessageClass::SendData);
    CHECK(f.transport().type == MessageType::Request);
    CHECK(f.transport().expected_reply == MessageClass::ApplicationCommandHandler);
    CHECK(f.transport().priority == MessagePriority::Get);
}

TEST_CASE("set_value_message carries the level and stores it") {
    Fixture fx;
    const Frame f = fx.sw->set_value_message(50, kRootEndpoint);
    CHECK(f.to_vector() == std::vector<uint8_t>{0x05, 0x03, 0x26, 0x01, 0x32});
    CHECK(f.transport().expected_reply == MessageClass::SendData);
    CHECK(f.transport().priority == MessagePriority::Set);
    CHECK(fx.sw->level() == std::optional<uint8_t>(50));
    CHECK(fx.events.size() == 0);
}

TEST_CASE("set_value_message above 99 is sent as-is but not stored") {
    Fixture fx;
    fx.sw->set_value_message(20, kRootEndpoint);
    const Frame f = fx.sw->set_value_message(ML::LEVEL_RESTORE, kRootEndpoint);
    REQUIRE(f.payload_size() == 1);
    CHECK(f.payload()[0] == 0xFF);
    CHECK(fx.sw->level() == std::optional<uint8_t>(20));
}

TEST_CASE("five increases from 0 reach 25") {
    Fixture fx;
    fx.sw->set_value_message(0, kRootEndpoint);
    const uint8_t expected[] = {5, 10, 15, 20, 25};
    for (uint8_t want : expected) {
        const Frame f = fx.sw->increase_level_message();
        REQUIRE(f.payload_size() == 1);
        CHECK(f.payload()[0] == want);
        CHECK(f.command() == ML::SWITCH_MULTILEVEL_SET);
        CHECK(f.transport().priority == MessagePriority::Set);
    }
    CHECK(fx.sw->level() == std::optional<uint8_t>(25));
    CHECK(fx.events.size() == 0);
}

TEST_CASE("increase clamps at 99") {
    Fixture fx;
    fx.sw->set_value_message(97, kRootEndpoint);
    CHECK(fx.sw->increase_level_message().payload()[0] == 99);
    CHECK(fx.sw->increase_level_message().payload()[0] == 99);
    CHECK(fx.sw->level() == std::optional<uint8_t>(99));
}

TEST_CASE("decrease from 99 snaps to 95") {
    Fixture fx;
    fx.report(99);
    const Frame f = fx.sw->decrease_level_message();
    CHECK(f.payload()[0] == 95);
    CHECK(fx.sw->level() == std::optional<uint8_t>(95));
    CHECK(f.transport().priority == MessagePriority::Set);
}

TEST_CASE("decrease below the step stops at 0") {
    Fixture fx;
    fx.sw->set_value_message(3, kRootEndpoint);
    CHECK(fx.sw->decrease_level_message().payload()[0] == 0);
    CHECK(fx.sw->decrease_level_message().payload()[0] == 0);
    CHECK(fx.sw->level() == std::optional<uint8_t>(0));
}

TEST_CASE("unknown level counts as 0 for steps") {
    SUBCASE("increase") {
        Fixture fx;
        CHECK_FALSE(fx.sw->level().has_value());
        CHECK(fx.sw->increase_level_message().payload()[0] == 5);
    }
    SUBCASE("decrease") {
        Fixture fx;
        CHECK(fx.sw->decrease_level_message().payload()[0] == 0);
    }
}

TEST_CASE("level arithmetic") {
    CHECK(ML::increased(0) == 5);
    CHECK(ML::increased(94) == 99);
    CHECK(ML::increased(99) == 99);
    CHECK(ML::decreased(99) == 95);
    CHECK(ML::decreased(50) == 45);
    CHECK(ML::decreased(5) == 0);
    CHECK(ML::decreased(4) == 0);
    CHECK(ML::decreased(0) == 0);
}

TEST_CASE("builders address the requested endpoint") {
    Fixture fx;
    const Frame f = fx.sw->set_value_message(10, uint8_t(2));
    CHECK(f.address() == Address(5, uint8_t(2)));
}

TEST_CASE("version is clamped to what the handler understands") {
    LogCapture logs(log::Level::Warn);
    Fixture fx;
    CHECK(fx.sw->version() == 1);
    CHECK(fx.sw->max_version() == 3);
    fx.sw->set_version(2);
    CHECK(fx.sw->version() == 2);
    fx.sw->set_version(7);
    CHECK(fx.sw->version() == 3);
    CHECK(logs.count(log::Level::Warn) == 1);
    fx.sw->set_version(0);
    CHECK(fx.sw->version() == 1);
}
