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

#include "../hlim/Clock.h"

#include <vector>
#include <queue>
#include <map>

namespace blk::sim {

/**
 * @brief Cycle based simulator for designs made of SequentialComponents in one or more clock domains.
 * @details Every clock starts low at power on, has its first rising edge after half a period, and its falling edges at full periods.
 * Components advance on rising edges only. Edges of different clocks that fall onto the same time are handled in one time step:
 * first the resets of all triggering clocks are sampled, then the components of all triggering clocks advance in the order of registration.
 */
class Simulator
{
	public:
		Simulator();
		~Simulator();

		/// Adds a simulator callback hook to inform waveform recorders and test benches about simulation events.
		void addCallbacks(SimulatorCallbacks *simCallbacks) { m_callbacks.push_back(simCallbacks); }
		void removeCallbacks(SimulatorCallbacks *simCallbacks);

		/// Registers a clock without components, e.g. to see its reset in a waveform.
		void addClock(hlim::Clock &clock);
		/// Registers a component that advances on the rising edges of the given clock. The component must outlive the simulator.
		void addComponent(SequentialComponent &component, hlim::Clock &clock);

		/// Reset the time to zero and bring all components into the power-on state.
		void powerOn();

		/// Advance simulation to the next time at which any clock has an edge.
		void advanceEvent();

		/**
		 * @brief Advance simulation by given amount of time or until aborted.
		 * @param seconds Amount of time (in seconds) by which the simulation gets advanced.
		 */
		void advance(hlim::ClockRational seconds);

		/// Advance simulation until the given clock has had numTicks more rising edges or until aborted.
		void runTicks(const hlim::Clock &clock, size_t numTicks);

		/// Aborts a running call to advance() or runTicks() after the current time step.
		void abort() { m_abortCalled = true; }
		bool abortCalled() const { return m_abortCalled; }

		bool poweredOn() const { return m_poweredOn; }

		/// Returns the elapsed simulation time (in seconds) since @ref powerOn.
		inline const hlim::ClockRational &getCurrentSimulationTime() const { return m_simulationTime; }

		/// Current level of the clock signal.
		bool getValueOfClock(const hlim::Clock &clock) const;
		/// Reset level as sampled on the last rising edge of the clock.
		bool getValueOfReset(const hlim::Clock &clock) const;
		/// Number of rising edges of the clock since power on.
		size_t getTickCount(const hlim::Clock &clock) const;

		const std::vector<hlim::Clock*> &getClocks() const { return m_clockOrder; }

		/// Forwards a warning to all registered callbacks.
		void warning(std::string msg);
	protected:
		struct ClockState {
			hlim::Clock *clock = nullptr;
			std::vector<SequentialComponent*> components;
			hlim::ClockRational halfPeriod;
			size_t halfCycles = 0;
			size_t ticks = 0;
			bool value = false;
			bool resetSampled = false;
		};

		struct Event {
			hlim::ClockRational timeOfEvent = {0};
			size_t clockIdx = 0;

			bool operator<(const Event &rhs) const {
				if (timeOfEvent > rhs.timeOfEvent) return true;
				if (timeOfEvent < rhs.timeOfEvent) return false;
				return clockIdx > rhs.clockIdx;
			}
		};

		ClockState &getClockState(hlim::Clock &clock);
		const ClockState &getClockState(const hlim::Clock &clock) const;
		void scheduleNextEdge(size_t clockIdx);

		std::vector<SimulatorCallbacks*> m_callbacks;
		std::vector<ClockState> m_clocks;
		std::vector<hlim::Clock*> m_clockOrder;
		std::map<const hlim::Clock*, size_t> m_clock2idx;

		std::priority_queue<Event> m_nextEvents;
		/// Scratch lists of advanceEvent(), kept to avoid allocations per edge.
		std::vector<size_t> m_triggeredClocks;
		std::vector<size_t> m_risingClocks;
		hlim::ClockRational m_simulationTime = {0};
		bool m_poweredOn = false;
		bool m_abortCalled = false;
};

}
