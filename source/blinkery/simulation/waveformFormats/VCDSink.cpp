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
#include "VCDSink.h"

#include "../Simulator.h"
#include "../../utils/Exceptions.h"
#include "../../utils/Preprocessor.h"

namespace blk::sim {

VCDSink::VCDSink(Simulator &simulator, std::string filename) : m_simulator(simulator), m_VCD(std::move(filename))
{
	m_simulator.addCallbacks(this);
}

VCDSink::~VCDSink()
{
	m_simulator.removeCallbacks(this);
}

VCDSink &VCDSink::addSignal(std::string scope, std::string name, std::function<bool()> probe)
{
	return addBus(std::move(scope), std::move(name), 1, [probe = std::move(probe)]()->std::uint64_t { return probe() ? 1 : 0; });
}

VCDSink &VCDSink::addBus(std::string scope, std::string name, size_t width, std::function<std::uint64_t()> probe)
{
	BLK_DESIGNCHECK_HINT(!m_declared, "Signals must be added to the waveform before the simulation is powered on.");
	BLK_DESIGNCHECK_HINT(width > 0 && width <= 64, "Signal " + name + " must be between 1 and 64 bits wide.");

	m_signals.push_back({
		.scope = std::move(scope),
		.name = std::move(name),
		.width = width,
		.probe = std::move(probe),
	});
	return *this;
}

void VCDSink::onPowerOn()
{
	if (m_declared) {
		// A second power on restarts the time axis, which vcd can not represent. Keep appending with a marker instead.
		onWarning("simulation powered on again");
		for (auto &signal : m_signals)
			signal.lastValue.reset();
		return;
	}

	size_t nextCode = 0;
	{
		auto module = m_VCD.beginModule("clocks");
		for (auto *clock : m_simulator.getClocks()) {
			m_clock2code.emplace_back(clock, VCDWriter::identifierCode(nextCode++));
			m_VCD.declareWire(1, m_clock2code.back().second, clock->getName());

			m_rst2code.emplace_back(clock, VCDWriter::identifierCode(nextCode++));
			m_VCD.declareWire(1, m_rst2code.back().second, clock->getResetName());
		}
	}

	std::vector<std::string> scopes;
	for (auto &signal : m_signals)
		if (std::find(scopes.begin(), scopes.end(), signal.scope) == scopes.end())
			scopes.push_back(signal.scope);

	for (auto &scope : scopes) {
		auto module = m_VCD.beginModule(scope);
		for (auto &signal : m_signals)
			if (signal.scope == scope) {
				signal.code = VCDWriter::identifierCode(nextCode++);
				m_VCD.declareWire(signal.width, signal.code, signal.name);
			}
	}

	if (m_includeWarnings) {
		m_warningsCode = VCDWriter::identifierCode(nextCode++);
		m_VCD.declareString(m_warningsCode, "warnings");
	}

	{
		auto dumpVars = m_VCD.beginDumpVars();
		for (auto &[clock, code] : m_clock2code)
			m_VCD.writeBitState(code, m_simulator.getValueOfClock(*clock));
		for (auto &[clock, code] : m_rst2code)
			m_VCD.writeBitState(code, m_simulator.getValueOfReset(*clock));
		for (auto &signal : m_signals) {
			signal.lastValue = signal.probe();
			if (signal.width == 1)
				m_VCD.writeBitState(signal.code, *signal.lastValue != 0);
			else
				m_VCD.writeState(signal.code, signal.width, *signal.lastValue);
		}
		if (m_includeWarnings)
			m_VCD.writeString(m_warningsCode, "");
	}

	m_declared = true;
	m_currentTime = 0;
	m_timeWritten = false;
}

void VCDSink::onNewTick(const hlim::ClockRational &simulationTime)
{
	m_currentTime = hlim::floor(simulationTime * hlim::ClockRational(1'000'000'000'000ull));
	m_timeWritten = false;
}

void VCDSink::onClock(const hlim::Clock *clock, bool risingEdge)
{
	if (!m_declared) return;

	ensureTimeWritten();
	m_VCD.writeBitState(findCode(m_clock2code, clock), risingEdge);
}

void VCDSink::onReset(const hlim::Clock *clock, bool resetAsserted)
{
	if (!m_declared) return;

	ensureTimeWritten();
	m_VCD.writeBitState(findCode(m_rst2code, clock), resetAsserted);
}

void VCDSink::onCommitState()
{
	if (!m_declared) return;

	for (auto &signal : m_signals) {
		std::uint64_t value = signal.probe();
		if (signal.lastValue && *signal.lastValue == value)
			continue;

		ensureTimeWritten();
		signal.lastValue = value;
		if (signal.width == 1)
			m_VCD.writeBitState(signal.code, value != 0);
		else
			m_VCD.writeState(signal.code, signal.width, value);
	}
	m_VCD.flush();
}

void VCDSink::onWarning(std::string msg)
{
	if (!m_declared || !m_includeWarnings) return;

	ensureTimeWritten();
	m_VCD.writeString(m_warningsCode, msg);
}

void VCDSink::ensureTimeWritten()
{
	if (m_timeWritten) return;

	m_VCD.writeTime(m_currentTime);
	m_timeWritten = true;
}

const std::string &VCDSink::findCode(const std::vector<std::pair<const hlim::Clock*, std::string>> &codes, const hlim::Clock *clock) const
{
	for (auto &[c, code] : codes)
		if (c == clock)
			return code;

	BLK_ASSERT_HINT(false, "Clock " + clock->getName() + " was not known when the waveform was set up.");
	return codes.front().second;
}

}
