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
#include "blinkery/pch.h"
#include "Pin.h"

#include "../hlim/Clock.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

namespace blk {

	std::string_view pinDirectionName(PinDirection direction)
	{
		switch (direction) {
			case PinDirection::INPUT: return "input";
			case PinDirection::OUTPUT: return "output";
			case PinDirection::CLOCK: return "clock";
		}
		return "unknown";
	}

	Pin::Pin(std::string name, PinDirection direction, bool activeLow) :
		m_name(std::move(name)), m_direction(direction), m_activeLow(activeLow)
	{
	}

	InputPin::InputPin(std::string name, bool activeLow) :
		Pin(std::move(name), PinDirection::INPUT, activeLow), m_level(activeLow)
	{
	}

	OutputPin::OutputPin(std::string name, bool activeLow) :
		Pin(std::move(name), PinDirection::OUTPUT, activeLow)
	{
	}

	void OutputPin::driveWith(std::function<bool()> driver)
	{
		BLK_DESIGNCHECK_HINT(!m_driver, "Output pin " + m_name + " is already driven by something else.");
		BLK_DESIGNCHECK_HINT((bool) driver, "Output pin " + m_name + " can not be driven by an empty function.");
		m_driver = std::move(driver);
	}

	ClockPin::ClockPin(std::string name) :
		Pin(std::move(name), PinDirection::CLOCK, false)
	{
	}

	void ClockPin::bind(hlim::Clock &clock)
	{
		BLK_DESIGNCHECK_HINT(m_clock == nullptr, "Clock pin " + m_name + " is already bound to clock " + m_clock->getName() + ".");
		m_clock = &clock;
	}

}
