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

#include "../hlim/Clock.h"
#include "../hlim/ClockRational.h"
#include "../utils/ConfigTree.h"

#include <optional>
#include <ostream>
#include <string>

namespace blk {

	/**
	 * @brief Parses a frequency or period with unit, e.g. "100 MHz", "12.288 MHz", "3 Hz", or "20 ns", into a frequency in Hz.
	 * @details The number is kept with three decimal places. Units are case insensitive.
	 */
	hlim::ClockRational clockFromString(std::string text);

	/**
	 * @brief Optional settings of a clock domain, as given in code or loaded from a config file.
	 * @details Unset fields fall back to whatever the owner of the clock chooses as defaults.
	 */
	class ClockConfig
	{
	public:
		using ClockRational = hlim::ClockRational;
		using ResetActive = hlim::Clock::ResetActive;

		void loadConfig(const utils::ConfigTree& config);
		void print(std::ostream& s) const;

		std::optional<std::string> name;
		std::optional<ClockRational> absoluteFrequency;
		std::optional<std::string> resetName;
		std::optional<ResetActive> resetActive;
	};

	std::ostream& operator << (std::ostream&, const ClockConfig&);
}

namespace blk::hlim {
	std::ostream& operator << (std::ostream&, Clock::ResetActive);
}

namespace YAML {
	template<>
	struct convert<blk::hlim::Clock::ResetActive> {
		static bool decode(const Node& node, blk::hlim::Clock::ResetActive& rhs);
	};
}
