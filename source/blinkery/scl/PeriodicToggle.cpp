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
#include "PeriodicToggle.h"

#include "../debug/DebugInterface.h"
#include "../frontend/Clock.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

#include <bit>

namespace blk::scl {

	void PeriodicToggleConfig::loadConfig(const utils::ConfigTree &config)
	{
		if (config.isScalar()) {
			frequency = clockFromString(config.as<std::string>());
			return;
		}

		if (config["frequency"])
			frequency = clockFromString(config["frequency"].as<std::string>());
		if (config["initial_value"])
			initialValue = config["initial_value"].as<bool>();
	}

	std::uint64_t PeriodicToggle::computePeriod(hlim::ClockRational clockFrequency, hlim::ClockRational toggleFrequency)
	{
		BLK_CONFIGCHECK_HINT(clockFrequency.numerator() != 0, "The clock of a periodic toggle must have a positive frequency.");
		BLK_CONFIGCHECK_HINT(toggleFrequency.numerator() != 0, "The toggle frequency must be positive.");
		BLK_CONFIGCHECK_HINT(toggleFrequency * hlim::ClockRational(2) <= clockFrequency, 
				"Can not toggle at " + hlim::formatFrequency(toggleFrequency) + " with a " + hlim::formatFrequency(clockFrequency) 
				+ " clock, the toggle frequency can be at most half the clock frequency.");

		std::uint64_t period = hlim::round(clockFrequency / (toggleFrequency * hlim::ClockRational(2)));
		BLK_CONFIGCHECK_HINT(period >= 1, "The toggle period rounds to zero clock cycles.");
		return period;
	}

	PeriodicToggle::PeriodicToggle(hlim::ClockRational clockFrequency, hlim::ClockRational toggleFrequency, bool initialOutput) :
		m_clockFrequency(clockFrequency),
		m_toggleFrequency(toggleFrequency),
		m_period(computePeriod(clockFrequency, toggleFrequency)),
		m_initialOutput(initialOutput),
		m_counter(m_period),
		m_output(initialOutput)
	{
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN
				<< "Toggling at " << hlim::formatFrequency(toggleFrequency) << " from a " << hlim::formatFrequency(clockFrequency)
				<< " clock: flip every " << (size_t) m_period << " ticks with a " << counterWidth() << " bit counter");

		if (achievedFrequency() != toggleFrequency) {
			double achieved = hlim::toDouble(achievedFrequency());
			double target = hlim::toDouble(toggleFrequency);
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_CONFIGURATION
					<< "Toggle frequency " << hlim::formatFrequency(toggleFrequency) << " can not be met exactly with this clock, actually toggling at "
					<< (boost::format("%.9f Hz (%+.3f ppm)") % achieved % ((achieved - target) / target * 1e6)).str());
		}
	}

	PeriodicToggle::PeriodicToggle(hlim::ClockRational clockFrequency, const PeriodicToggleConfig &config) :
		PeriodicToggle(clockFrequency, config.frequency ? *config.frequency : hlim::ClockRational(0), config.initialValue)
	{
	}

	void PeriodicToggle::reset()
	{
		m_counter = m_period;
		m_output = m_initialOutput;
	}

	void PeriodicToggle::tick()
	{
		m_counter--;
		if (m_counter == 0) {
			m_output = !m_output;
			m_counter = m_period;
		}
	}

	hlim::ClockRational PeriodicToggle::achievedFrequency() const
	{
		return m_clockFrequency / hlim::ClockRational(2 * m_period);
	}

	size_t PeriodicToggle::counterWidth() const
	{
		return std::bit_width(m_period);
	}

}
