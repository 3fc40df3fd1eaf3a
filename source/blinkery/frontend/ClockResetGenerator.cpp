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
#include "ClockResetGenerator.h"

#include "../debug/DebugInterface.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

namespace blk {

	ClockResetGenerator::ClockResetGenerator(Board &board) :
		m_clockPin(board.requestClock(board.desc().clockResource)),
		m_resetPin(board.requestInput(board.desc().resetResource)),
		m_sys("sys", board.desc().clockFrequency)
	{
		m_clockPin.bind(m_sys);

		const InputPin *resetPin = &m_resetPin;
		m_sys.setResetDriver([resetPin]() { return resetPin->value(); });
		m_sys.setResetActive(m_resetPin.activeLow() ? hlim::Clock::ResetActive::LOW : hlim::Clock::ResetActive::HIGH);

		logClock(m_sys);
	}

	hlim::DerivedClock &ClockResetGenerator::addPll(const ClockConfig &config)
	{
		BLK_DESIGNCHECK_HINT(config.name, "PLL clock domains need a name.");
		BLK_CONFIGCHECK_HINT(config.absoluteFrequency, "PLL clock domain " + *config.name + " needs a frequency.");
		BLK_DESIGNCHECK_HINT(*config.name != "sys", "The name sys is reserved for the board clock domain.");

		for (auto &pll : m_plls)
			BLK_DESIGNCHECK_HINT(pll->getName() != *config.name, "A clock domain named " + *config.name + " already exists.");

		BLK_CONFIGCHECK_HINT(config.absoluteFrequency->numerator() != 0, "PLL clock domain " + *config.name + " needs a non-zero frequency.");
		BLK_CONFIGCHECK_HINT(!config.resetActive, "PLL clock domain " + *config.name + " follows the reset of sys, its reset polarity can not be configured.");

		m_plls.push_back(std::make_unique<hlim::DerivedClock>(&m_sys, *config.name, *config.absoluteFrequency / m_sys.absoluteFrequency()));
		hlim::DerivedClock *pll = m_plls.back().get();

		if (config.resetName)
			pll->setResetName(*config.resetName);

		logClock(*pll);
		return *pll;
	}

	hlim::DerivedClock &ClockResetGenerator::addPll(std::string name, hlim::ClockRational frequency)
	{
		ClockConfig config;
		config.name = std::move(name);
		config.absoluteFrequency = frequency;
		return addPll(config);
	}

	hlim::Clock &ClockResetGenerator::clock(std::string_view name)
	{
		if (name == m_sys.getName())
			return m_sys;

		for (auto &pll : m_plls)
			if (pll->getName() == name)
				return *pll;

		BLK_DESIGNCHECK_HINT(false, "There is no clock domain named " + std::string(name) + ".");
		return m_sys;
	}

	std::vector<hlim::Clock*> ClockResetGenerator::clocks()
	{
		std::vector<hlim::Clock*> result;
		result.push_back(&m_sys);
		for (auto &pll : m_plls)
			result.push_back(pll.get());
		return result;
	}

	void ClockResetGenerator::logClock(const hlim::Clock &clock) const
	{
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN
				<< "Created clock domain " << clock << " at " << hlim::formatFrequency(clock.absoluteFrequency())
				<< " with reset " << clock.getResetName());
	}

}
