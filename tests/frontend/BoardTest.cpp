/*  This file is part of Blinkery, a library for simulating small FPGA designs.
	Copyright (C) 2023 Michael Offel, Andreas Ley

	Blinkery is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Blinkery is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#include "frontend/pch.h"

#include <boost/test/unit_test.hpp>

using namespace boost::unit_test;
using namespace blk;
using hlim::ClockRational;

BOOST_AUTO_TEST_SUITE(Boards)

BOOST_AUTO_TEST_CASE(ArtyPreset)
{
	BoardDesc arty = digilentArty();
	BOOST_TEST(arty.name == "digilent_arty");
	BOOST_TEST(arty.clockResource == "clk100");
	BOOST_TEST(arty.clockFrequency == ClockRational(100'000'000));
	BOOST_TEST(arty.resetResource == "cpu_reset");

	BOOST_REQUIRE(arty.findResource("cpu_reset") != nullptr);
	BOOST_TEST(arty.findResource("cpu_reset")->activeLow);
	BOOST_TEST(arty.findResource("user_led")->count == 4);
	BOOST_TEST(arty.findResource("rgb_led")->subsignals.size() == 3);
	BOOST_TEST(arty.findResource("i2s_tx")->hasSubsignal("sync"));
	BOOST_TEST(arty.findResource("key") == nullptr);
}

BOOST_AUTO_TEST_CASE(De0NanoPreset)
{
	BoardDesc de0nano = boardFromName("terasic_de0nano");
	BOOST_TEST(de0nano.clockResource == "clk50");
	BOOST_TEST(de0nano.clockFrequency == ClockRational(50'000'000));
	BOOST_TEST(de0nano.resetResource == "key");
	BOOST_TEST(de0nano.findResource("key")->count == 2);
	BOOST_TEST(de0nano.findResource("user_led")->count == 8);

	BOOST_CHECK_THROW(boardFromName("breadboard"), blk::utils::ConfigurationError);
}

BOOST_AUTO_TEST_CASE(PinNaming)
{
	Board board(digilentArty());

	BOOST_TEST(board.requestOutput("user_led", 2).name() == "user_led2");
	BOOST_TEST(board.requestOutput("rgb_led", 1, "g").name() == "rgb_led1_g");
	BOOST_TEST(board.requestOutput("i2s_tx", 0, "tx").name() == "i2s_tx_tx");
	BOOST_TEST(board.requestInput("cpu_reset").name() == "cpu_reset");
	BOOST_TEST(board.requestClock("clk100").name() == "clk100");

	BOOST_TEST(board.pins().size() == 5);
	BOOST_TEST(board.pins().front()->name() == "user_led2");
	BOOST_TEST(board.findPin("rgb_led1_g") != nullptr);
	BOOST_TEST(board.findPin("rgb_led1_r") == nullptr);
}

BOOST_AUTO_TEST_CASE(InvalidRequests)
{
	Board board(terasicDe0Nano());

	BOOST_CHECK_THROW(board.requestOutput("rgb_led", 0, "r"), blk::utils::DesignError);
	BOOST_CHECK_THROW(board.requestOutput("user_led", 8), blk::utils::DesignError);
	BOOST_CHECK_THROW(board.requestOutput("key", 0), blk::utils::DesignError);
	BOOST_CHECK_THROW(board.requestInput("user_led", 0), blk::utils::DesignError);
	BOOST_CHECK_THROW(board.requestOutput("user_led", 0, "r"), blk::utils::DesignError);

	board.requestOutput("user_led", 3);
	BOOST_CHECK_THROW(board.requestOutput("user_led", 3), blk::utils::DesignError);

	Board arty(digilentArty());
	BOOST_CHECK_THROW(arty.requestOutput("rgb_led", 0), blk::utils::DesignError);
	BOOST_CHECK_THROW(arty.requestOutput("rgb_led", 0, "w"), blk::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(PinLevels)
{
	Board board(terasicDe0Nano());

	InputPin &key = board.requestInput("key", 1);
	BOOST_TEST(key.activeLow());
	BOOST_TEST(key.value() == true);
	key.press(true);
	BOOST_TEST(key.value() == false);
	key.set(true);
	BOOST_TEST(key.value() == true);

	OutputPin &led = board.requestOutput("user_led", 0);
	BOOST_TEST(!led.isDriven());
	BOOST_TEST(led.value() == false);

	bool level = false;
	led.driveWith([&level]() { return level; });
	BOOST_TEST(led.value() == false);
	level = true;
	BOOST_TEST(led.value() == true);

	BOOST_CHECK_THROW(led.driveWith([]() { return false; }), blk::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(LoadBoardFromConfig)
{
	blk::utils::ConfigTree cfg;
	cfg.loadFromString(R"(
custom:
  name: breadboard
  clock: osc
  clock_frequency: 12 MHz
  reset: button
  resources:
    - name: osc
      direction: clock
    - name: button
      direction: input
      active_low: true
    - name: led
      count: 3
preset_override:
  preset: digilent_arty
  clock_frequency: 10 ns
preset_name: terasic_de0nano
broken:
  preset: digilent_arty
  reset: user_led
)");

	BoardDesc custom;
	custom.loadConfig(cfg["custom"]);
	BOOST_TEST(custom.name == "breadboard");
	BOOST_TEST(custom.clockFrequency == ClockRational(12'000'000));
	BOOST_TEST(custom.resources.size() == 3);
	BOOST_TEST(custom.findResource("button")->activeLow);
	BOOST_TEST((custom.findResource("led")->direction == PinDirection::OUTPUT));
	BOOST_TEST(custom.findResource("led")->count == 3);

	BoardDesc overridden;
	overridden.loadConfig(cfg["preset_override"]);
	BOOST_TEST(overridden.name == "digilent_arty");
	BOOST_TEST(overridden.clockFrequency == ClockRational(100'000'000));
	BOOST_TEST(overridden.findResource("rgb_led") != nullptr);

	BoardDesc named;
	named.loadConfig(cfg["preset_name"]);
	BOOST_TEST(named.name == "terasic_de0nano");

	BoardDesc broken;
	BOOST_CHECK_THROW(broken.loadConfig(cfg["broken"]), blk::utils::ConfigurationError);
}

BOOST_AUTO_TEST_CASE(PinNamesMustBeUnique)
{
	blk::utils::ConfigTree cfg;
	cfg.loadFromString(R"(
clock: osc
clock_frequency: 12 MHz
reset: button
resources:
  - name: osc
    direction: clock
  - name: button
    direction: input
  - name: led
    count: 2
  - name: led1
)");

	BoardDesc desc;
	BOOST_CHECK_THROW(desc.loadConfig(cfg), blk::utils::ConfigurationError);

	BoardDesc twice = terasicDe0Nano();
	twice.resources.push_back({ .name = "user_led" });
	BOOST_CHECK_THROW(Board{twice}, blk::utils::ConfigurationError);

	BoardDesc clash = terasicDe0Nano();
	clash.resources.push_back({ .name = "user_led3" });
	BOOST_CHECK_THROW(Board{clash}, blk::utils::ConfigurationError);

	clash.resources.back().name = "user_led8";
	Board board(clash);
	BOOST_TEST(board.requestOutput("user_led8").name() == "user_led8");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ClockReset)

BOOST_AUTO_TEST_CASE(SysDomainFromBoard)
{
	Board board(digilentArty());
	ClockResetGenerator crg(board);

	BOOST_TEST(crg.sys().getName() == "sys");
	BOOST_TEST(crg.sys().absoluteFrequency() == ClockRational(100'000'000));
	BOOST_TEST(crg.clockPin().clock() == &crg.sys());
	BOOST_TEST((crg.sys().getResetActive() == hlim::Clock::ResetActive::LOW));

	BOOST_TEST(!crg.reset());
	crg.resetPin().press(true);
	BOOST_TEST(crg.reset());
	crg.resetPin().press(false);
	BOOST_TEST(!crg.reset());

	// pins of the crg are taken
	BOOST_CHECK_THROW(board.requestInput("cpu_reset"), blk::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(PllDomains)
{
	Board board(digilentArty());
	ClockResetGenerator crg(board);

	hlim::DerivedClock &i2s = crg.addPll("i2s", clockFromString("12.288 MHz"));
	BOOST_TEST(i2s.absoluteFrequency() == ClockRational(12'288'000));
	BOOST_TEST(&crg.clock("i2s") == &i2s);
	BOOST_TEST(&crg.clock("sys") == &crg.sys());
	BOOST_TEST(crg.clocks().size() == 2);

	BOOST_TEST(!i2s.resetAsserted());
	crg.resetPin().press(true);
	BOOST_TEST(i2s.resetAsserted());

	BOOST_CHECK_THROW(crg.addPll("i2s", ClockRational(1000)), blk::utils::DesignError);
	BOOST_CHECK_THROW(crg.addPll("sys", ClockRational(1000)), blk::utils::DesignError);
	BOOST_CHECK_THROW(crg.clock("video"), blk::utils::DesignError);

	// PLL domains follow the reset of sys
	ClockConfig lowReset;
	lowReset.name = "video";
	lowReset.absoluteFrequency = ClockRational(25'000'000);
	lowReset.resetActive = hlim::Clock::ResetActive::LOW;
	BOOST_CHECK_THROW(crg.addPll(lowReset), blk::utils::ConfigurationError);

	lowReset.resetActive.reset();
	lowReset.resetName = "video_rst";
	hlim::DerivedClock &video = crg.addPll(lowReset);
	BOOST_TEST(video.getResetName() == "video_rst");
	BOOST_TEST(video.resetAsserted());
}

BOOST_AUTO_TEST_SUITE_END()
