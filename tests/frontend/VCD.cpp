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

#include <regex>

using namespace boost::unit_test;
using namespace blk;
using hlim::ClockRational;

class VCDTestFixture : public sim::UnitTestSimulationFixture
{
	public:
		VCDTestFixture();

		bool VCDContains(const std::regex &regex);
	protected:
		std::filesystem::path m_testDir;
};

VCDTestFixture::VCDTestFixture()
{
	const auto& testCase = boost::unit_test::framework::current_test_case();
	std::filesystem::path testCaseFile{ std::string{ testCase.p_file_name.begin(), testCase.p_file_name.end() } };
	m_testDir = std::filesystem::path{ "tmp" } / testCaseFile.stem() / testCase.p_name.get();

	std::error_code ignored;
	std::filesystem::remove_all(m_testDir, ignored);
	std::filesystem::create_directories(m_testDir);
}

bool VCDTestFixture::VCDContains(const std::regex &regex)
{
	m_vcdSink.reset();
	std::fstream file((m_testDir / "test.vcd").string(), std::fstream::in);
	BOOST_TEST((bool) file);
	std::stringstream buffer;
	buffer << file.rdbuf();

	return std::regex_search(buffer.str(), regex);
}

namespace {
	struct Counter : public sim::SequentialComponent
	{
		std::uint64_t value = 0;

		virtual void reset() override { value = 0; }
		virtual void tick() override { value++; }
	};
}


BOOST_AUTO_TEST_SUITE(VCD)

BOOST_AUTO_TEST_CASE(IdentifierCodes)
{
	BOOST_TEST(sim::VCDWriter::identifierCode(0) == "!");
	BOOST_TEST(sim::VCDWriter::identifierCode(93) == "~");
	BOOST_TEST(sim::VCDWriter::identifierCode(94) == "!\"");
}

BOOST_FIXTURE_TEST_CASE(RecordsClocksAndPins, VCDTestFixture)
{
	Board board(terasicDe0Nano());
	ClockResetGenerator crg(board);

	Counter counter;
	addComponent(counter, crg.sys());
	board.requestOutput("user_led", 0).driveWith([&counter]() { return counter.value & 1; });

	auto &sink = recordVCD((m_testDir / "test.vcd").string());
	recordPins(sink, board);
	sink.addBus("test", "counter", 8, [&counter]() { return counter.value; });

	runTicks(crg.sys(), 10);

	BOOST_TEST(VCDContains(std::regex{"\\$timescale\\n1ps\\n\\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ sys \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ sys_rst \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$scope module board \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ user_led0 \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 1 \\S+ key0 \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"\\$var wire 8 \\S+ counter \\$end"}));
	BOOST_TEST(!VCDContains(std::regex{"clk50"}));

	// first rising edge of the 50 MHz clock
	BOOST_TEST(VCDContains(std::regex{"\\n#10000\\n"}));
	BOOST_TEST(VCDContains(std::regex{"\\nb00001010 "}));
}

BOOST_FIXTURE_TEST_CASE(OnlyChangesAreWritten, VCDTestFixture)
{
	hlim::RootClock clock("clk", ClockRational(1'000'000));
	Counter counter;
	addComponent(counter, clock);

	bool constant = true;
	auto &sink = recordVCD((m_testDir / "test.vcd").string());
	sink.addSignal("test", "constant", [&constant]() { return constant; });

	runTicks(clock, 20);

	// declared as the third signal after the clock and its reset
	std::string code = sim::VCDWriter::identifierCode(2);

	m_vcdSink.reset();
	std::ifstream file((m_testDir / "test.vcd").string());
	std::string line;
	size_t occurrences = 0;
	while (std::getline(file, line)) {
		BOOST_TEST(line != "0" + code);
		if (line == "1" + code)
			occurrences++;
	}
	BOOST_TEST(occurrences == 1);
}

BOOST_FIXTURE_TEST_CASE(WarningsAsStrings, VCDTestFixture)
{
	hlim::RootClock clock("clk", ClockRational(1'000'000));
	Counter counter;
	addComponent(counter, clock);

	recordVCD((m_testDir / "test.vcd").string());
	expectWarnings();

	runTicks(clock, 2);
	getSimulator().warning("led stuck");
	runTicks(clock, 2);

	BOOST_TEST(VCDContains(std::regex{"\\$var string 0 \\S+ warnings \\$end"}));
	BOOST_TEST(VCDContains(std::regex{"sled\\\\x20stuck "}));
	BOOST_TEST(warnings().size() == 1);
}

BOOST_FIXTURE_TEST_CASE(SignalsAfterPowerOnAreRejected, VCDTestFixture)
{
	hlim::RootClock clock("clk", ClockRational(1'000'000));
	Counter counter;
	addComponent(counter, clock);

	auto &sink = recordVCD((m_testDir / "test.vcd").string());
	powerOn();

	BOOST_CHECK_THROW(sink.addSignal("test", "late", []() { return false; }), blk::utils::DesignError);
}

BOOST_AUTO_TEST_SUITE_END()
