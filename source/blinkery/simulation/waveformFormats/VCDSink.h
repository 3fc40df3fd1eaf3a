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

#include "../SimulatorCallbacks.h"
#include "VCDWriter.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blk::sim {

class Simulator;

/**
 * @brief Records clocks, resets, and registered signals of a simulation into a value change dump file.
 * @details Signals are sampled after every time step and only written on change.
 * All signals must be added before the simulation is powered on.
 */
class VCDSink : public SimulatorCallbacks
{
	public:
		VCDSink(Simulator &simulator, std::string filename);
		virtual ~VCDSink() override;

		VCDSink(const VCDSink &) = delete;
		VCDSink &operator=(const VCDSink &) = delete;

		/// Adds a single bit signal to the given scope (module) of the dump.
		VCDSink &addSignal(std::string scope, std::string name, std::function<bool()> probe);
		/// Adds a multi bit signal of up to 64 bits to the given scope (module) of the dump.
		VCDSink &addBus(std::string scope, std::string name, size_t width, std::function<std::uint64_t()> probe);

		/// @brief Add a pseudo-signal to the VCD file which contains warnings as strings
		VCDSink &includeWarnings() { m_includeWarnings = true; return *this; }

		virtual void onPowerOn() override;
		virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
		virtual void onClock(const hlim::Clock *clock, bool risingEdge) override;
		virtual void onReset(const hlim::Clock *clock, bool resetAsserted) override;
		virtual void onCommitState() override;
		virtual void onWarning(std::string msg) override;
	protected:
		struct Signal {
			std::string scope;
			std::string name;
			size_t width = 1;
			std::function<std::uint64_t()> probe;
			std::string code;
			std::optional<std::uint64_t> lastValue;
		};

		Simulator &m_simulator;
		VCDWriter m_VCD;

		std::vector<Signal> m_signals;
		std::vector<std::pair<const hlim::Clock*, std::string>> m_clock2code;
		std::vector<std::pair<const hlim::Clock*, std::string>> m_rst2code;
		std::string m_warningsCode;

		bool m_includeWarnings = false;
		bool m_declared = false;

		std::uint64_t m_currentTime = 0;
		bool m_timeWritten = false;

		void ensureTimeWritten();
		const std::string &findCode(const std::vector<std::pair<const hlim::Clock*, std::string>> &codes, const hlim::Clock *clock) const;
};

}
