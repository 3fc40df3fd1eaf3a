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
#include "Clock.h"

#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

#include <algorithm>

namespace blk::hlim {

Clock::Clock(std::string name) : m_name(std::move(name)), m_resetName(m_name + "_rst")
{
}

Clock::~Clock()
{
}

ClockRational Clock::period() const
{
	auto frequency = absoluteFrequency();
	BLK_DESIGNCHECK_HINT(frequency.numerator() != 0, "Clock " + m_name + " has no frequency.");
	return ClockRational(1) / frequency;
}

void Clock::removeDerivedClock(DerivedClock *clock)
{
	m_derivedClocks.erase(std::remove(m_derivedClocks.begin(), m_derivedClocks.end(), clock), m_derivedClocks.end());
}

void Clock::setResetDriver(std::function<bool()> driver)
{
	m_resetDriver = std::move(driver);
}

bool Clock::resetAsserted() const
{
	if (m_resetDriver)
		return m_resetDriver() == (m_resetActive == ResetActive::HIGH);

	if (m_parentClock != nullptr)
		return m_parentClock->resetAsserted();

	return false;
}


RootClock::RootClock(std::string name, ClockRational frequency) : Clock(std::move(name)), m_frequency(frequency)
{
	BLK_CONFIGCHECK_HINT(frequency.numerator() != 0, "Clock " + m_name + " needs a positive frequency.");
}

void RootClock::setFrequency(ClockRational frequency)
{
	BLK_CONFIGCHECK_HINT(frequency.numerator() != 0, "Clock " + m_name + " needs a positive frequency.");
	m_frequency = frequency;
}


DerivedClock::DerivedClock(Clock *parentClock, std::string name, ClockRational frequencyMultiplier) : 
		Clock(std::move(name)), m_parentRelativeMultiplicator(frequencyMultiplier)
{
	BLK_ASSERT(parentClock != nullptr);
	BLK_CONFIGCHECK_HINT(frequencyMultiplier.numerator() != 0, "Clock " + m_name + " needs a positive frequency multiplier.");

	m_parentClock = parentClock;
	m_parentClock->addDerivedClock(this);
}

DerivedClock::~DerivedClock()
{
	m_parentClock->removeDerivedClock(this);
}

ClockRational DerivedClock::absoluteFrequency() const
{
	return m_parentClock->absoluteFrequency() * m_parentRelativeMultiplicator;
}

}
