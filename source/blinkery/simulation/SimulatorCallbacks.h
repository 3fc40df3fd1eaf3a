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

#include "../hlim/ClockRational.h"

#include <string>

namespace blk::hlim {
	class Clock;
}

namespace blk::sim {

/**
 * @brief Interface for classes that want to be informed of simulator events.
 */
class SimulatorCallbacks
{
	public:
		virtual ~SimulatorCallbacks() = default;

		/**
		 * @brief Called after all components attained their power-on state but before the first clock edge.
		 */
		virtual void onPowerOn() { }

		/**
		 * @brief Called whenever all components triggered at the current time have advanced.
		 * @details This is where checks can be performed or states can be written to waveform files.
		 */
		virtual void onCommitState() { }

		/**
		 * @brief Called whenever the simulation time advances, but before the new state for this time step has been evaluated.
		 * @param simulationTime The new simulator time.
		 */
		virtual void onNewTick(const hlim::ClockRational &simulationTime) { }

		/**
		 * @brief Called when a clock changes its value (twice per clock cycle).
		 * @param clock The clock whose value is changing.
		 * @param risingEdge Wether the new clock value is asserted.
		 */
		virtual void onClock(const hlim::Clock *clock, bool risingEdge) { }

		/**
		 * @brief Called when the sampled reset of a clock changes its value.
		 * @details The reset is sampled on every rising clock edge, so this fires with the first edge that sees the new level.
		 * @param clock The clock whose reset is changing.
		 * @param resetAsserted Wether the new reset value is asserted.
		 */
		virtual void onReset(const hlim::Clock *clock, bool resetAsserted) { }

		virtual void onWarning(std::string msg) { }
};


/**
 * @brief Simple SimulatorCallbacks implementation that forwards the most important events to the log.
 */
class SimulatorConsoleOutput : public SimulatorCallbacks
{
	public:
		virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
		virtual void onReset(const hlim::Clock *clock, bool resetAsserted) override;
		virtual void onWarning(std::string msg) override;
	protected:
		hlim::ClockRational m_simTime;
};

}
