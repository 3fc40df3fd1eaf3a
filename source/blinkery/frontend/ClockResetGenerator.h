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

#include "Board.h"
#include "Clock.h"

#include "../hlim/Clock.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace blk {

	/**
	 * @brief Clock and reset generation of a board design.
	 * @details Binds the board's oscillator to the "sys" clock domain, whose reset is driven by the board's reset button.
	 * Further clock domains are derived from sys as PLL outputs and share its reset.
	 */
	class ClockResetGenerator
	{
		public:
			ClockResetGenerator(Board &board);

			ClockResetGenerator(const ClockResetGenerator &) = delete;
			ClockResetGenerator &operator=(const ClockResetGenerator &) = delete;

			hlim::RootClock &sys() { return m_sys; }
			const hlim::RootClock &sys() const { return m_sys; }

			/// Creates a PLL output clock domain. Name and frequency must be given.
			hlim::DerivedClock &addPll(const ClockConfig &config);
			hlim::DerivedClock &addPll(std::string name, hlim::ClockRational frequency);

			/// Looks up a clock domain by name, "sys" or the name of a PLL.
			hlim::Clock &clock(std::string_view name);
			std::vector<hlim::Clock*> clocks();

			/// Current reset level of the sys domain, active high.
			bool reset() const { return m_sys.resetAsserted(); }
			InputPin &resetPin() { return m_resetPin; }
			ClockPin &clockPin() { return m_clockPin; }
		protected:
			ClockPin &m_clockPin;
			InputPin &m_resetPin;

			hlim::RootClock m_sys;
			// PLLs refer to sys, so they must be destroyed before it.
			std::vector<std::unique_ptr<hlim::DerivedClock>> m_plls;

			void logClock(const hlim::Clock &clock) const;
	};

}
