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

#include <functional>
#include <string>
#include <string_view>

namespace blk {

namespace hlim {
	class Clock;
}

	enum class PinDirection {
		INPUT,
		OUTPUT,
		CLOCK
	};

	std::string_view pinDirectionName(PinDirection direction);

	/**
	 * @brief A single physical pad of a board, handed out by @ref Board.
	 * @details Pins carry raw pad levels. Active low pads are not inverted, this is up to whoever reads or drives them.
	 */
	class Pin
	{
		public:
			Pin(std::string name, PinDirection direction, bool activeLow);
			virtual ~Pin() = default;

			Pin(const Pin &) = delete;
			Pin &operator=(const Pin &) = delete;

			const std::string &name() const { return m_name; }
			PinDirection direction() const { return m_direction; }
			bool activeLow() const { return m_activeLow; }

			/// Current raw level of the pad.
			virtual bool value() const = 0;
		protected:
			std::string m_name;
			PinDirection m_direction;
			bool m_activeLow;
	};

	/**
	 * @brief Pad driven from outside the design, e.g. a button. The test bench sets its level.
	 * @details Starts out at its idle level: high for active low pads, low otherwise.
	 */
	class InputPin : public Pin
	{
		public:
			InputPin(std::string name, bool activeLow);

			void set(bool level) { m_level = level; }
			/// Drives the pad to its active level (true) or its idle level (false), taking the polarity into account.
			void press(bool pressed) { m_level = pressed != m_activeLow; }

			virtual bool value() const override { return m_level; }
		protected:
			bool m_level;
	};

	/**
	 * @brief Pad driven by the design, e.g. an LED.
	 * @details The driver is evaluated whenever the pad is read, which makes it behave like a combinational assignment.
	 */
	class OutputPin : public Pin
	{
		public:
			OutputPin(std::string name, bool activeLow);

			void driveWith(std::function<bool()> driver);
			bool isDriven() const { return (bool) m_driver; }

			/// Level of the driver, or low if nothing drives the pad.
			virtual bool value() const override { return m_driver ? m_driver() : false; }
		protected:
			std::function<bool()> m_driver;
	};

	/**
	 * @brief Pad carrying an oscillator into the design.
	 * @details The level of a clock pad is not modelled, the bound clock is what gets simulated and recorded.
	 */
	class ClockPin : public Pin
	{
		public:
			ClockPin(std::string name);

			void bind(hlim::Clock &clock);
			hlim::Clock *clock() const { return m_clock; }

			virtual bool value() const override { return false; }
		protected:
			hlim::Clock *m_clock = nullptr;
	};

}
