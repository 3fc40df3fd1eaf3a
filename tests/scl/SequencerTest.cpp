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
#include "scl/pch.h"

#include <boost/test/unit_test.hpp>

using namespace boost::unit_test;
using namespace blk;
using namespace blk::scl;
using hlim::ClockRational;
using UnitTestSimulationFixture = blk::sim::UnitTestSimulationFixture;

namespace {
	/// Lights one output after the other, advancing every tick.
	class WalkingOne : public PatternSequencer
	{
		public:
			WalkingOne(size_t width) : m_width(width) { }

			virtual size_t width() const override { return m_width; }
			virtual void reset() override { m_position = 0; }
			virtual void tick() override { m_position = (m_position + 1) % m_width; }
			virtual bool output(size_t index) const override { return index == m_position; }
		protected:
			size_t m_width;
			size_t m_position = 0;
	};

	std::vector<OutputPin*> requestLeds(Board &board, size_t first, size_t count)
	{
		std::vector<OutputPin*> pads;
		for (size_t i = first; i < first + count; i++)
			pads.push_back(&board.requestOutput("user_led", i));
		return pads;
	}
}

BOOST_AUTO_TEST_SUITE(Sequencer)

BOOST_FIXTURE_TEST_CASE(DriverBindsOutputsToPads, UnitTestSimulationFixture)
{
	Board board(terasicDe0Nano());
	ClockResetGenerator crg(board);
	auto pads = requestLeds(board, 2, 6);

	SequencerDriver driver(std::make_unique<WalkingOne>(6), pads);
	addComponent(driver, crg.sys());

	powerOn();
	BOOST_TEST(pads[0]->value());
	for (size_t i = 1; i < pads.size(); i++)
		BOOST_TEST(!pads[i]->value());

	runTicks(crg.sys(), 3);
	BOOST_TEST(pads[3]->value());
	BOOST_TEST(!pads[0]->value());

	// the reset button of the board brings the sequence back to its start
	crg.resetPin().press(true);
	runTicks(crg.sys(), 1);
	BOOST_TEST(pads[0]->value());
	runTicks(crg.sys(), 5);
	BOOST_TEST(pads[0]->value());

	crg.resetPin().press(false);
	runTicks(crg.sys(), 8);
	BOOST_TEST(pads[2]->value());
}

BOOST_AUTO_TEST_CASE(WidthMustMatchPads)
{
	Board board(terasicDe0Nano());
	auto pads = requestLeds(board, 0, 4);

	BOOST_CHECK_THROW(SequencerDriver(std::make_unique<WalkingOne>(5), pads), blk::utils::DesignError);
	BOOST_CHECK_THROW(SequencerDriver(std::unique_ptr<PatternSequencer>{}, pads), blk::utils::DesignError);
}

BOOST_AUTO_TEST_SUITE_END()
