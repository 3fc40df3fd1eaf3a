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
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <blinkery/utils/ConfigTree.h>

#include <filesystem>
#include <fstream>

using namespace boost::unit_test;
using namespace blk::utils;


BOOST_AUTO_TEST_CASE(GlobbingMatchPath)
{
	{
		auto m1 = globbingMatchPath("full_match", "full_match");
		BOOST_TEST((m1 && *m1 == "full_match"));
	}
	{
		auto m1 = globbingMatchPath("not", "full_match");
		BOOST_TEST((!m1));
	}
	{
		auto m1 = globbingMatchPath("*", "board/resources");
		BOOST_TEST((m1 && *m1 == "board"));
	}
	{
		auto m1 = globbingMatchPath("board/*", "board/resources/user_led");
		BOOST_TEST((m1 && *m1 == "board/resources"));
	}
	{
		auto m1 = globbingMatchPath("toggles/led*", "toggles/led0");
		BOOST_TEST((m1 && *m1 == "toggles/led0"));
	}
	{
		auto m1 = globbingMatchPath("a/b*/*", "a/b/c");
		BOOST_TEST((m1 && *m1 == "a/b/c"));
	}
}

BOOST_AUTO_TEST_CASE(EnvVarReplacement)
{
	BOOST_TEST(replaceEnvVars("3 Hz") == "3 Hz");

	BOOST_CHECK_THROW(replaceEnvVars("$(BLINKERY_UNDEFINED_VAR)"), ConfigurationError);
	BOOST_CHECK_THROW(replaceEnvVars("led $(BLINKERY_UNDEFINED_VAR)"), std::runtime_error);

	setenv("BLINKERY_TEST_VAR", "5 Hz", 1);
	BOOST_TEST(replaceEnvVars("toggle at $(BLINKERY_TEST_VAR) please") == "toggle at 5 Hz please");
}

BOOST_AUTO_TEST_CASE(ConfigTreePathSearch)
{
	YAML::Node root;

	root["sub1"]["sub2"]["sub3"]["0"] = 5;
	root["sub1"]["sub2/sub3"]["1"] = 6;
	root["sub1/sub2/sub3"]["2"] = 7;
	root["sub1/donotmatch/sub3"]["2"] = 1;
	root["sub1/*/sub3"]["3"] = 8;
	root["sub1/*"]["sub3"]["4"] = "9";

	ConfigTree cfg{ root };

	auto node = cfg["sub1/sub2/sub3"];
	BOOST_TEST(node["0"].as(0) == 5);
	BOOST_TEST(node["1"].as(0) == 6);
	BOOST_TEST(node["2"].as(0) == 7);
	BOOST_TEST(node["3"].as(0) == 8);
	BOOST_TEST(node["4"].as<std::string>("0") == "9");
	BOOST_TEST(node["missing"].as(42) == 42);
}

BOOST_AUTO_TEST_CASE(ConfigTreeLists)
{
	ConfigTree cfg;
	cfg.loadFromString("toggles: [3, 5, 7]");

	auto toggles = cfg["toggles"];
	BOOST_TEST(toggles.isSequence());
	BOOST_TEST(toggles.size() == 3);
	BOOST_TEST(toggles[1].as(0) == 5);

	size_t check = 3;
	for (ConfigTree n : toggles) {
		BOOST_TEST(n.as<size_t>() == check);
		check += 2;
	}
}

BOOST_AUTO_TEST_CASE(ConfigTreeLaterFilesOverride)
{
	ConfigTree cfg;
	cfg.loadFromString(R"(
name: first
board:
  name: my_board
  clock_frequency: 50 MHz
)");
	cfg.loadFromString(R"(
name: second
board:
  clock_frequency: 25 MHz
)");

	BOOST_TEST(cfg["name"].as<std::string>() == "second");
	BOOST_TEST(cfg["board"]["clock_frequency"].as<std::string>() == "25 MHz");
	BOOST_TEST(cfg["board"]["name"].as<std::string>() == "my_board");
}

BOOST_AUTO_TEST_CASE(ConfigTreeMissingValues)
{
	ConfigTree cfg;
	cfg.loadFromString("count: three\nenabled: true");

	BOOST_TEST(!cfg["nothing"]);
	BOOST_TEST(cfg["enabled"].as<bool>());
	BOOST_CHECK_THROW(cfg["nothing"].as<int>(), ConfigurationError);
	BOOST_CHECK_THROW(cfg["count"].as<int>(), ConfigurationError);
	BOOST_CHECK_THROW(cfg.loadFromFile("does/not/exist.yaml"), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(ConfigTreeMalformedInput)
{
	ConfigTree broken;
	BOOST_CHECK_THROW(broken.loadFromString("toggles: [ {"), ConfigurationError);

	std::filesystem::create_directories("tmp/utils");
	{
		std::ofstream file("tmp/utils/broken.yaml");
		file << "toggles: [ {\n";
	}
	BOOST_CHECK_THROW(broken.loadFromFile("tmp/utils/broken.yaml"), ConfigurationError);

	ConfigTree cfg;
	cfg.loadFromString("initial_value: { a: 1 }\nname: [ x, y ]\nempty: ~");
	BOOST_CHECK_THROW(cfg["initial_value"].as<bool>(), ConfigurationError);
	BOOST_CHECK_THROW(cfg["name"].as<std::string>(), ConfigurationError);
	BOOST_CHECK_THROW(cfg["name"].as<std::string>("fallback"), ConfigurationError);
	BOOST_CHECK_THROW(cfg["empty"].as<int>(), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(ConfigTreeEnvironmentValues)
{
	setenv("BLINKERY_TEST_COUNT", "12", 1);
	setenv("BLINKERY_TEST_FLAG", "false", 1);

	ConfigTree cfg;
	cfg.loadFromString("count: $(BLINKERY_TEST_COUNT)\nflag: $(BLINKERY_TEST_FLAG)\nname: led_$(BLINKERY_TEST_COUNT)");

	BOOST_TEST(cfg["count"].as<int>() == 12);
	BOOST_TEST(cfg["flag"].as<bool>(true) == false);
	BOOST_TEST(cfg["name"].as<std::string>() == "led_12");
}
