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
#include "UnitTestSimulationFixture.h"

#include "Simulator.h"
#include "waveformFormats/VCDSink.h"

#include <boost/test/unit_test.hpp>

namespace blk::sim {

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
	m_simulator = std::make_unique<Simulator>();
	m_simulator->addCallbacks(this);
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
	// The sink unregisters itself from the simulator, so it has to go first.
	m_vcdSink.reset();
}

void UnitTestSimulationFixture::addComponent(SequentialComponent &component, hlim::Clock &clock)
{
	m_simulator->addComponent(component, clock);
}

void UnitTestSimulationFixture::powerOn()
{
	m_simulator->powerOn();
	checkWarnings();
}

void UnitTestSimulationFixture::runTicks(const hlim::Clock &clock, size_t numTicks)
{
	if (!m_simulator->poweredOn())
		m_simulator->powerOn();

	m_simulator->runTicks(clock, numTicks);
	checkWarnings();
}

void UnitTestSimulationFixture::runFor(hlim::ClockRational seconds)
{
	if (!m_simulator->poweredOn())
		m_simulator->powerOn();

	m_simulator->advance(seconds);
	checkWarnings();
}

VCDSink &UnitTestSimulationFixture::recordVCD(const std::string &filename)
{
	m_vcdSink = std::make_unique<VCDSink>(*m_simulator, filename);
	m_vcdSink->includeWarnings();
	return *m_vcdSink;
}

void UnitTestSimulationFixture::onWarning(std::string msg)
{
	BOOST_TEST_MESSAGE(msg);
	m_warnings.push_back(std::move(msg));
}

void UnitTestSimulationFixture::checkWarnings()
{
	if (!m_expectWarnings && !m_warnings.empty())
		BOOST_ERROR(m_warnings.front());
}

}
