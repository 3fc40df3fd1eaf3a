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
#include "Simulator.h"

#include "../debug/DebugInterface.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

#include <algorithm>

namespace blk::sim {

Simulator::Simulator()
{
}

Simulator::~Simulator()
{
}

void Simulator::removeCallbacks(SimulatorCallbacks *simCallbacks)
{
	m_callbacks.erase(std::remove(m_callbacks.begin(), m_callbacks.end(), simCallbacks), m_callbacks.end());
}

void Simulator::addClock(hlim::Clock &clock)
{
	BLK_DESIGNCHECK_HINT(!m_poweredOn, "Clocks and components must be registered before the simulation is powered on.");

	if (m_clock2idx.contains(&clock))
		return;

	m_clock2idx[&clock] = m_clocks.size();
	m_clocks.push_back({ .clock = &clock, .halfPeriod = clock.period() / hlim::ClockRational(2) });
	m_clockOrder.push_back(&clock);
}

void Simulator::addComponent(SequentialComponent &component, hlim::Clock &clock)
{
	addClock(clock);
	getClockState(clock).components.push_back(&component);
}

void Simulator::powerOn()
{
	m_nextEvents = {};
	m_simulationTime = 0;
	m_abortCalled = false;

	if (m_clocks.empty())
		warning("Nothing to simulate, no clocks have been registered.");

	for (auto &state : m_clocks) {
		state.halfPeriod = state.clock->period() / hlim::ClockRational(2);
		state.halfCycles = 0;
		state.ticks = 0;
		state.value = false;
		state.resetSampled = state.clock->resetAsserted();

		for (auto *component : state.components)
			component->powerOn();
	}

	for (size_t i = 0; i < m_clocks.size(); i++)
		scheduleNextEdge(i);

	m_poweredOn = true;

	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION 
			<< "Simulation powered on with " << m_clocks.size() << " clock domain(s)");

	for (auto *cb : m_callbacks)
		cb->onPowerOn();
	for (auto *cb : m_callbacks)
		cb->onCommitState();
}

void Simulator::advanceEvent()
{
	BLK_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before it can advance.");

	if (m_nextEvents.empty()) return;

	m_simulationTime = m_nextEvents.top().timeOfEvent;
	for (auto *cb : m_callbacks)
		cb->onNewTick(m_simulationTime);

	auto &triggered = m_triggeredClocks;
	triggered.clear();
	while (!m_nextEvents.empty() && m_nextEvents.top().timeOfEvent == m_simulationTime) {
		triggered.push_back(m_nextEvents.top().clockIdx);
		m_nextEvents.pop();
	}

	auto &rising = m_risingClocks;
	rising.clear();
	for (auto idx : triggered) {
		auto &state = m_clocks[idx];
		state.halfCycles++;
		state.value = !state.value;
		scheduleNextEdge(idx);
		if (state.value)
			rising.push_back(idx);
	}

	// Sample all resets before anything advances, so resets driven by other components see the state of the previous cycle.
	for (auto idx : rising) {
		auto &state = m_clocks[idx];
		bool resetAsserted = state.clock->resetAsserted();
		if (resetAsserted != state.resetSampled) {
			state.resetSampled = resetAsserted;
			for (auto *cb : m_callbacks)
				cb->onReset(state.clock, resetAsserted);
		}
	}

	for (auto idx : rising) {
		auto &state = m_clocks[idx];
		state.ticks++;
		for (auto *component : state.components)
			component->step(state.resetSampled);
	}

	for (auto idx : triggered)
		for (auto *cb : m_callbacks)
			cb->onClock(m_clocks[idx].clock, m_clocks[idx].value);

	for (auto *cb : m_callbacks)
		cb->onCommitState();
}

void Simulator::advance(hlim::ClockRational seconds)
{
	BLK_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before it can advance.");

	hlim::ClockRational targetTime = m_simulationTime + seconds;
	m_abortCalled = false;

	while (m_simulationTime < targetTime && !m_abortCalled) {
		if (m_nextEvents.empty() || m_nextEvents.top().timeOfEvent > targetTime) {
			m_simulationTime = targetTime;
			break;
		}
		advanceEvent();
	}
}

void Simulator::runTicks(const hlim::Clock &clock, size_t numTicks)
{
	BLK_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before it can advance.");

	const auto &state = getClockState(clock);
	size_t targetTicks = state.ticks + numTicks;
	m_abortCalled = false;

	while (state.ticks < targetTicks && !m_abortCalled)
		advanceEvent();
}

bool Simulator::getValueOfClock(const hlim::Clock &clock) const
{
	return getClockState(clock).value;
}

bool Simulator::getValueOfReset(const hlim::Clock &clock) const
{
	return getClockState(clock).resetSampled;
}

size_t Simulator::getTickCount(const hlim::Clock &clock) const
{
	return getClockState(clock).ticks;
}

void Simulator::warning(std::string msg)
{
	for (auto *cb : m_callbacks)
		cb->onWarning(msg);
}

Simulator::ClockState &Simulator::getClockState(hlim::Clock &clock)
{
	auto it = m_clock2idx.find(&clock);
	BLK_DESIGNCHECK_HINT(it != m_clock2idx.end(), "Clock " + clock.getName() + " is not part of this simulation.");
	return m_clocks[it->second];
}

const Simulator::ClockState &Simulator::getClockState(const hlim::Clock &clock) const
{
	auto it = m_clock2idx.find(&clock);
	BLK_DESIGNCHECK_HINT(it != m_clock2idx.end(), "Clock " + clock.getName() + " is not part of this simulation.");
	return m_clocks[it->second];
}

void Simulator::scheduleNextEdge(size_t clockIdx)
{
	auto &state = m_clocks[clockIdx];
	m_nextEvents.push({
		.timeOfEvent = state.halfPeriod * hlim::ClockRational(state.halfCycles + 1),
		.clockIdx = clockIdx
	});
}

}
