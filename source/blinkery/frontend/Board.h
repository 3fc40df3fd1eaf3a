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

#include "Pin.h"

#include "../hlim/ClockRational.h"
#include "../utils/ConfigTree.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blk::sim {
	class VCDSink;
}

namespace blk {

	/**
	 * @brief A named group of identical pads, e.g. all user LEDs of a board.
	 * @details Resources with subsignals (e.g. the r, g, b channels of an RGB LED) have one pad per index and subsignal.
	 */
	struct ResourceDesc
	{
		std::string name;
		size_t count = 1;
		PinDirection direction = PinDirection::OUTPUT;
		bool activeLow = false;
		std::vector<std::string> subsignals;

		void loadConfig(const utils::ConfigTree &config);
		bool hasSubsignal(std::string_view subsignal) const;
	};

	struct BoardDesc
	{
		std::string name;
		std::vector<ResourceDesc> resources;

		/// Resource of the oscillator that clocks the sys domain, and its frequency.
		std::string clockResource;
		hlim::ClockRational clockFrequency = {0};

		/// Resource of the button that resets the design (index 0 is used).
		std::string resetResource;

		/**
		 * @brief Loads a board from either a preset name or a map.
		 * @details A map may name a `preset` to start from and then override `name`, `clock`, `clock_frequency`, `reset`, and `resources`.
		 */
		void loadConfig(const utils::ConfigTree &config);

		const ResourceDesc *findResource(std::string_view name) const;
		/// Every pad must map to its own pin name, e.g. resources "led" with two pads and "led1" collide.
		void checkPinNames() const;
	};

	/// Digilent Arty A7: 100 MHz oscillator, active low cpu reset button, 4 LEDs, 4 RGB LEDs, and an I2S Pmod.
	BoardDesc digilentArty();
	/// Terasic DE0-Nano: 50 MHz oscillator, 2 active low keys, 8 LEDs.
	BoardDesc terasicDe0Nano();
	/// Looks up a board preset by name ("digilent_arty" or "terasic_de0nano").
	BoardDesc boardFromName(std::string_view name);

	/**
	 * @brief Hands out the pads of a board to a design.
	 * @details Every pad can only be requested once. Pins stay owned by the board and remain valid for its lifetime.
	 */
	class Board
	{
		public:
			Board(BoardDesc desc);

			Board(const Board &) = delete;
			Board &operator=(const Board &) = delete;

			const BoardDesc &desc() const { return m_desc; }

			InputPin &requestInput(std::string_view resource, size_t index = 0, std::string_view subsignal = {});
			OutputPin &requestOutput(std::string_view resource, size_t index = 0, std::string_view subsignal = {});
			ClockPin &requestClock(std::string_view resource, size_t index = 0);

			/// All requested pins in the order of their request.
			const std::vector<std::unique_ptr<Pin>> &pins() const { return m_pins; }
			Pin *findPin(std::string_view name) const;

			/// Name of a pad, e.g. "user_led0" or "rgb_led1_r". Resources with a single pad are not numbered.
			static std::string pinName(const ResourceDesc &resource, size_t index, std::string_view subsignal);
		protected:
			BoardDesc m_desc;
			std::vector<std::unique_ptr<Pin>> m_pins;

			std::string checkRequest(std::string_view resource, size_t index, std::string_view subsignal, PinDirection direction, bool &activeLow) const;
			void logRequest(const Pin &pin) const;
	};

	/// Adds all input and output pins that the board has handed out so far to the waveform, in the scope "board".
	void recordPins(sim::VCDSink &sink, const Board &board);
}

namespace YAML {
	template<>
	struct convert<blk::PinDirection> {
		static bool decode(const Node& node, blk::PinDirection& rhs);
	};
}
