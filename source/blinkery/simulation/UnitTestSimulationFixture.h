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
#pragma once

#include "SimulatorCallbacks.h"
#include "SequentialComponent.h"

#include "../hlim/ClockRational.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blk::hlim {
	class Clock;
}

namespace blk::sim {

	class Simulator;
	class VCDSink;

/**
 * @brief Base fixture for Boost.Test cases that own a simulator.
 * @details Warnings issued during the simulation are collected and reported as test errors when the run ends,
 * unless the test case takes them out of @ref m_warnings first.
 */
	class UnitTestSimulationFixture : public SimulatorCallbacks
	{
	public:
		UnitTestSimulationFixture();
		~UnitTestSimulationFixture();

		void addComponent(SequentialComponent &component, hlim::Clock &clock);

		void powerOn();
		/// Powers on (if not done yet) and runs until the clock has had numTicks more rising edges.
		void runTicks(const hlim::Clock &clock, size_t numTicks);
		/// Powers on (if not done yet) and advances the simulation by the given amount of seconds.
		void runFor(hlim::ClockRational seconds);

		/// Records all clocks of the simulation into a vcd file. Signals can be added to the returned sink before the first run.
		VCDSink &recordVCD(const std::string &filename);

		virtual void onWarning(std::string msg) override;

		Simulator& getSimulator() { return *m_simulator; }
		const std::vector<std::string> &warnings() const { return m_warnings; }
		/// Keeps warnings from failing the test, for test cases that check for them.
		void expectWarnings() { m_expectWarnings = true; }
	protected:
		std::unique_ptr<Simulator> m_simulator;
		std::unique_ptr<VCDSink> m_vcdSink;

		std::vector<std::string> m_warnings;

		bool m_expectWarnings = false;

		void checkWarnings();
};


}
