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

using namespace boost::unit_test;
using namespace blk;
using hlim::ClockRational;

BOOST_AUTO_TEST_SUITE(ClockParsing)

BOOST_AUTO_TEST_CASE(FrequencyUnits)
{
	BOOST_TEST(clockFromString("100 MHz") == ClockRational(100'000'000));
	BOOST_TEST(clockFromString("50MHz") == ClockRational(50'000'000));
	BOOST_TEST(clockFromString("3 Hz") == ClockRational(3));
	BOOST_TEST(clockFromString("48 kHz") == ClockRational(48'000));
	BOOST_TEST(clockFromString("1 GHz") == ClockRational(1'000'000'000));
	BOOST_TEST(clockFromString("12.288 MHz") == ClockRational(12'288'000));
	BOOST_TEST(clockFromString("0.5 Hz") == ClockRational(1, 2));
}

BOOST_AUTO_TEST_CASE(PeriodUnits)
{
	BOOST_TEST(clockFromString("20 ns") == ClockRational(50'000'000));
	BOOST_TEST(clockFromString("10 ns") == ClockRational(100'000'000));
	BOOST_TEST(clockFromString("1 ms") == ClockRational(1'000));
	BOOST_TEST(clockFromString("2 s") == ClockRational(1, 2));
	BOOST_TEST(clockFromString("400 ps") == ClockRational(2'500'000'000));
}

BOOST_AUTO_TEST_CASE(MalformedStrings)
{
	BOOST_CHECK_THROW(clockFromString("fast"), blk::utils::ConfigurationError);
	BOOST_CHECK_THROW(clockFromString("100 parsecs"), blk::utils::ConfigurationError);
	BOOST_CHECK_THROW(clockFromString("0 Hz"), blk::utils::ConfigurationError);
	BOOST_CHECK_THROW(clockFromString("-3 Hz"), blk::utils::ConfigurationError);
	BOOST_CHECK_THROW(clockFromString("100"), blk::utils::ConfigurationError);
}

BOOST_AUTO_TEST_CASE(LoadClockConfig)
{
	blk::utils::ConfigTree cfg;
	cfg.loadFromString(R"(
scalar: 25 MHz
full:
  name: audio
  frequency: 12.288 MHz
  reset_name: audio_reset
  reset_active: low
)");

	ClockConfig scalar;
	scalar.loadConfig(cfg["scalar"]);
	BOOST_TEST(!scalar.name);
	BOOST_TEST((scalar.absoluteFrequency == ClockRational(25'000'000)));

	ClockConfig full;
	full.loadConfig(cfg["full"]);
	BOOST_TEST(*full.name == "audio");
	BOOST_TEST((*full.absoluteFrequency == ClockRational(12'288'000)));
	BOOST_TEST(*full.resetName == "audio_reset");
	BOOST_TEST((*full.resetActive == hlim::Clock::ResetActive::LOW));

	std::stringstream s;
	s << full;
	BOOST_TEST(s.str() == "ClockConfig{name: audio, frequency: 12288 kHz, reset name: audio_reset, reset active: low}");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ClockRationalHelpers)

BOOST_AUTO_TEST_CASE(Rounding)
{
	BOOST_TEST(hlim::floor(ClockRational(7, 2)) == 3u);
	BOOST_TEST(hlim::ceil(ClockRational(7, 2)) == 4u);
	BOOST_TEST(hlim::round(ClockRational(7, 2)) == 4u);
	BOOST_TEST(hlim::round(ClockRational(10, 3)) == 3u);
	BOOST_TEST(hlim::round(ClockRational(50'000'000, 6)) == 8'333'333u);
	BOOST_TEST(hlim::ceil(ClockRational(4)) == 4u);
}

BOOST_AUTO_TEST_CASE(Formatting)
{
	BOOST_TEST(hlim::formatFrequency(ClockRational(100'000'000)) == "100 MHz");
	BOOST_TEST(hlim::formatFrequency(ClockRational(12'288'000)) == "12288 kHz");
	BOOST_TEST(hlim::formatFrequency(ClockRational(3)) == "3 Hz");
	BOOST_TEST(hlim::formatTime(ClockRational(2)) == "2 sec");
	BOOST_TEST(hlim::formatTime(ClockRational(1, 1000)) == "1 ms");
	BOOST_TEST(hlim::formatTime(ClockRational(1, 100'000'000)) == "10 ns");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Clocks)

BOOST_AUTO_TEST_CASE(RootAndDerivedFrequencies)
{
	hlim::RootClock sys("sys", ClockRational(100'000'000));
	hlim::DerivedClock pll(&sys, "i2s", ClockRational(12'288'000) / ClockRational(100'000'000));

	BOOST_TEST(pll.absoluteFrequency() == ClockRational(12'288'000));
	BOOST_TEST(pll.getParentClock() == &sys);
	BOOST_TEST(sys.getDerivedClocks().size() == 1);
	BOOST_TEST(sys.period() == ClockRational(1, 100'000'000));
	BOOST_TEST(pll.getResetName() == "i2s_rst");

	BOOST_CHECK_THROW(hlim::RootClock("broken", ClockRational(0)), blk::utils::ConfigurationError);
}

BOOST_AUTO_TEST_CASE(DerivedClockUnregistersFromParent)
{
	hlim::RootClock sys("sys", ClockRational(50'000'000));
	{
		hlim::DerivedClock pll(&sys, "pll", ClockRational(2));
		BOOST_TEST(sys.getDerivedClocks().size() == 1);
	}
	BOOST_TEST(sys.getDerivedClocks().empty());
}

BOOST_AUTO_TEST_CASE(ResetPolarity)
{
	bool button = true;

	hlim::RootClock sys("sys", ClockRational(1000));
	BOOST_TEST(!sys.resetAsserted());

	sys.setResetDriver([&button]() { return button; });
	BOOST_TEST(sys.resetAsserted());

	sys.setResetActive(hlim::Clock::ResetActive::LOW);
	BOOST_TEST(!sys.resetAsserted());
	button = false;
	BOOST_TEST(sys.resetAsserted());
}

BOOST_AUTO_TEST_CASE(DerivedClockFollowsParentReset)
{
	bool button = false;

	hlim::RootClock sys("sys", ClockRational(1000));
	sys.setResetDriver([&button]() { return button; });
	hlim::DerivedClock pll(&sys, "pll", ClockRational(3));

	BOOST_TEST(!pll.resetAsserted());
	button = true;
	BOOST_TEST(pll.resetAsserted());

	pll.setResetDriver([]() { return false; });
	BOOST_TEST(!pll.resetAsserted());
}

BOOST_AUTO_TEST_SUITE_END()
