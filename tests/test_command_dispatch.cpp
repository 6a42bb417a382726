#include <doctest/doctest.h>
#include "test_support.hpp"

#include "command_dispatch.hpp"
#include "zmesh/controller.hpp"
#include "zmesh/multilevel_switch.hpp"

using namespace zmesh;
using namespace zmesh_test;
using ML = MultiLevelSwitchCommandClass;

namespace {

struct Fixture {
    RecordingTransport link;
    Controller ctl{link};
    std::shared_ptr<ML> sw;
    Frame out;
    std::string err;

    Fixture() {
        sw = std::dynamic_pointer_cast<ML>(ctl.add_node(5)->add_command_class(SWITCH_MULTILEVEL));
    }
};

} // namespace

TEST_CASE("name_to_kind: accepted names and aliases") {
    CommandKind k;
    CHECK(name_to_kind("level", false, k)); CHECK(k == CommandKind::GET_LEVEL);
    CHECK(name_to_kind("DIM", false, k));   CHECK(k == CommandKind::GET_LEVEL);
    CHECK(name_to_kind("level", true, k));  CHECK(k == CommandKind::SET_LEVEL);
    CHECK(name_to_kind("power", true, k));  CHECK(k == CommandKind::SET_POWER);
    CHECK(name_to_kind("switch", true, k)); CHECK(k == CommandKind::SET_POWER);
    CHECK(name_to_kind("step", true, k));   CHECK(k == CommandKind::SET_STEP);
    CHECK_FALSE(name_to_kind("power", false, k));
    CHECK_FALSE(name_to_kind("color", true, k));
}

TEST_CASE("get level builds a GET") {
    Fixture fx;
    REQUIRE(build_param_get_frame("level", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(to_hex(fx.out) == "05 02 26 02");
}

TEST_CASE("set level validates 0..99") {
    Fixture fx;
    REQUIRE(build_param_set_frame("level", "40", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(to_hex(fx.out) == "05 03 26 01 28");
    CHECK(fx.sw->level() == std::optional<uint8_t>(40));

    REQUIRE(build_param_set_frame("dim", "0x10", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(to_hex(fx.out) == "05 03 26 01 10");

    CHECK_FALSE(build_param_set_frame("level", "100", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.err == "bad_value:level(0..99)");
    CHECK_FALSE(build_param_set_frame("level", "abc", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK_FALSE(build_param_set_frame("level", "", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.sw->level() == std::optional<uint8_t>(16));
}

TEST_CASE("power on/off map to 99/0") {
    Fixture fx;
    REQUIRE(build_param_set_frame("power", "on", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(to_hex(fx.out) == "05 03 26 01 63");
    REQUIRE(build_param_set_frame("switch", "OFF", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(to_hex(fx.out) == "05 03 26 01 00");
    REQUIRE(build_param_set_frame("power", "1", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.sw->level() == std::optional<uint8_t>(99));

    CHECK_FALSE(build_param_set_frame("power", "maybe", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.err == "bad_value:power(on|off)");
}

TEST_CASE("step up/down use the handler arithmetic") {
    Fixture fx;
    fx.sw->set_value_message(99, kRootEndpoint);
    REQUIRE(build_param_set_frame("step", "down", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.out.payload()[0] == 95);
    REQUIRE(build_param_set_frame("step", "up", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.out.payload()[0] == 99);

    CHECK_FALSE(build_param_set_frame("step", "sideways", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.err == "bad_value:step(up|down)");
}

TEST_CASE("unknown names report stable errors") {
    Fixture fx;
    CHECK_FALSE(build_param_get_frame("rgb", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.err == "unknown_get");
    CHECK_FALSE(build_param_set_frame("rgb", "1", *fx.sw, kRootEndpoint, fx.out, fx.err));
    CHECK(fx.err == "unknown_set");
}

TEST_CASE("endpoint is carried into the frame") {
    Fixture fx;
    REQUIRE(build_param_get_frame("level", *fx.sw, uint8_t(3), fx.out, fx.err));
    CHECK(fx.out.endpoint() == Endpoint(uint8_t(3)));
}
