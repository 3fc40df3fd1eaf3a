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
#include "Board.h"
#include "Clock.h"

#include "../debug/DebugInterface.h"
#include "../simulation/waveformFormats/VCDSink.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

#include <boost/algorithm/string.hpp>

namespace blk {

	void ResourceDesc::loadConfig(const utils::ConfigTree &config)
	{
		name = config["name"].as<std::string>();

		if (config["count"])
			count = config["count"].as<size_t>();
		if (config["direction"])
			direction = config["direction"].as<PinDirection>();
		if (config["active_low"])
			activeLow = config["active_low"].as<bool>();

		if (config["subsignals"]) {
			subsignals.clear();
			for (auto subsignal : config["subsignals"])
				subsignals.push_back(subsignal.as<std::string>());
		}

		BLK_CONFIGCHECK_HINT(!name.empty(), "Board resources need a name.");
		BLK_CONFIGCHECK_HINT(count > 0, "Resource " + name + " must have at least one pad.");
	}

	bool ResourceDesc::hasSubsignal(std::string_view subsignal) const
	{
		return std::find(subsignals.begin(), subsignals.end(), subsignal) != subsignals.end();
	}

	void BoardDesc::loadConfig(const utils::ConfigTree &config)
	{
		if (config.isScalar()) {
			*this = boardFromName(config.as<std::string>());
			return;
		}

		if (config["preset"])
			*this = boardFromName(config["preset"].as<std::string>());

		if (config["name"])
			name = config["name"].as<std::string>();

		if (config["resources"]) {
			resources.clear();
			for (auto resource : config["resources"]) {
				resources.emplace_back();
				resources.back().loadConfig(resource);
			}
		}

		if (config["clock"])
			clockResource = config["clock"].as<std::string>();
		if (config["clock_frequency"])
			clockFrequency = clockFromString(config["clock_frequency"].as<std::string>());
		if (config["reset"])
			resetResource = config["reset"].as<std::string>();

		const ResourceDesc *clock = findResource(clockResource);
		BLK_CONFIGCHECK_HINT(clock != nullptr, "The clock resource '" + clockResource + "' of board " + name + " does not exist.");
		BLK_CONFIGCHECK_HINT(clock->direction == PinDirection::CLOCK, "The clock resource '" + clockResource + "' of board " + name + " is not a clock input.");
		BLK_CONFIGCHECK_HINT(clockFrequency.numerator() != 0, "Board " + name + " needs a clock frequency.");

		const ResourceDesc *reset = findResource(resetResource);
		BLK_CONFIGCHECK_HINT(reset != nullptr, "The reset resource '" + resetResource + "' of board " + name + " does not exist.");
		BLK_CONFIGCHECK_HINT(reset->direction == PinDirection::INPUT, "The reset resource '" + resetResource + "' of board " + name + " is not an input.");

		checkPinNames();
	}

	void BoardDesc::checkPinNames() const
	{
		std::map<std::string, std::string> owner;
		for (auto &resource : resources) {
			BLK_CONFIGCHECK_HINT(findResource(resource.name) == &resource, "Board " + name + " lists the resource " + resource.name + " twice.");

			std::vector<std::string_view> subsignals(resource.subsignals.begin(), resource.subsignals.end());
			if (subsignals.empty())
				subsignals.push_back({});

			for (size_t index = 0; index < resource.count; index++)
				for (auto subsignal : subsignals) {
					auto [it, inserted] = owner.emplace(Board::pinName(resource, index, subsignal), resource.name);
					BLK_CONFIGCHECK_HINT(inserted, "Board " + name + ": the pin name " + it->first + " of resource " + resource.name 
							+ " is already used by resource " + it->second + ".");
				}
		}
	}

	const ResourceDesc *BoardDesc::findResource(std::string_view name) const
	{
		for (auto &resource : resources)
			if (resource.name == name)
				return &resource;
		return nullptr;
	}

	BoardDesc digilentArty()
	{
		return {
			.name = "digilent_arty",
			.resources = {
				{ .name = "clk100", .direction = PinDirection::CLOCK },
				{ .name = "cpu_reset", .direction = PinDirection::INPUT, .activeLow = true },
				{ .name = "user_led", .count = 4 },
				{ .name = "rgb_led", .count = 4, .subsignals = { "r", "g", "b" } },
				// Pmod I2S2 on the JA connector
				{ .name = "i2s_tx", .subsignals = { "clk", "sync", "tx" } },
			},
			.clockResource = "clk100",
			.clockFrequency = hlim::ClockRational(100'000'000ull),
			.resetResource = "cpu_reset",
		};
	}

	BoardDesc terasicDe0Nano()
	{
		return {
			.name = "terasic_de0nano",
			.resources = {
				{ .name = "clk50", .direction = PinDirection::CLOCK },
				{ .name = "key", .count = 2, .direction = PinDirection::INPUT, .activeLow = true },
				{ .name = "user_led", .count = 8 },
			},
			.clockResource = "clk50",
			.clockFrequency = hlim::ClockRational(50'000'000ull),
			.resetResource = "key",
		};
	}

	BoardDesc boardFromName(std::string_view name)
	{
		if (name == "digilent_arty" || name == "arty")
			return digilentArty();
		if (name == "terasic_de0nano" || name == "de0nano")
			return terasicDe0Nano();

		BLK_CONFIGCHECK_HINT(false, "Unknown board '" + std::string(name) + "'. Known boards are digilent_arty and terasic_de0nano.");
		return {};
	}

	Board::Board(BoardDesc desc) : m_desc(std::move(desc))
	{
		m_desc.checkPinNames();
	}

	InputPin &Board::requestInput(std::string_view resource, size_t index, std::string_view subsignal)
	{
		bool activeLow;
		std::string name = checkRequest(resource, index, subsignal, PinDirection::INPUT, activeLow);

		auto pin = std::make_unique<InputPin>(std::move(name), activeLow);
		InputPin &ref = *pin;
		m_pins.push_back(std::move(pin));
		logRequest(ref);
		return ref;
	}

	OutputPin &Board::requestOutput(std::string_view resource, size_t index, std::string_view subsignal)
	{
		bool activeLow;
		std::string name = checkRequest(resource, index, subsignal, PinDirection::OUTPUT, activeLow);

		auto pin = std::make_unique<OutputPin>(std::move(name), activeLow);
		OutputPin &ref = *pin;
		m_pins.push_back(std::move(pin));
		logRequest(ref);
		return ref;
	}

	ClockPin &Board::requestClock(std::string_view resource, size_t index)
	{
		bool activeLow;
		std::string name = checkRequest(resource, index, {}, PinDirection::CLOCK, activeLow);

		auto pin = std::make_unique<ClockPin>(std::move(name));
		ClockPin &ref = *pin;
		m_pins.push_back(std::move(pin));
		logRequest(ref);
		return ref;
	}

	Pin *Board::findPin(std::string_view name) const
	{
		for (auto &pin : m_pins)
			if (pin->name() == name)
				return pin.get();
		return nullptr;
	}

	std::string Board::pinName(const ResourceDesc &resource, size_t index, std::string_view subsignal)
	{
		std::string name = resource.name;
		if (resource.count > 1)
			name += std::to_string(index);
		if (!subsignal.empty()) {
			name += '_';
			name += subsignal;
		}
		return name;
	}

	std::string Board::checkRequest(std::string_view resource, size_t index, std::string_view subsignal, PinDirection direction, bool &activeLow) const
	{
		const ResourceDesc *desc = m_desc.findResource(resource);
		BLK_DESIGNCHECK_HINT(desc != nullptr, "Board " + m_desc.name + " has no resource named " + std::string(resource) + ".");
		BLK_DESIGNCHECK_HINT(index < desc->count, 
				(boost::format("Resource %s of board %s only has %d pads, index %d is out of range.") % desc->name % m_desc.name % desc->count % index).str());
		BLK_DESIGNCHECK_HINT(desc->direction == direction,
				"Resource " + desc->name + " is an " + std::string(pinDirectionName(desc->direction)) + " and can not be requested as " + std::string(pinDirectionName(direction)) + ".");

		if (desc->subsignals.empty()) {
			BLK_DESIGNCHECK_HINT(subsignal.empty(), "Resource " + desc->name + " has no subsignals.");
		} else {
			BLK_DESIGNCHECK_HINT(!subsignal.empty(),
					"Resource " + desc->name + " has subsignals (" + boost::algorithm::join(desc->subsignals, ", ") + "), one of them must be requested.");
			BLK_DESIGNCHECK_HINT(desc->hasSubsignal(subsignal),
					"Resource " + desc->name + " has no subsignal " + std::string(subsignal) + ", only " + boost::algorithm::join(desc->subsignals, ", ") + ".");
		}

		std::string name = pinName(*desc, index, subsignal);
		BLK_DESIGNCHECK_HINT(findPin(name) == nullptr, "Pin " + name + " has already been requested.");

		activeLow = desc->activeLow;
		return name;
	}

	void Board::logRequest(const Pin &pin) const
	{
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN
				<< "Requested " << pinDirectionName(pin.direction()) << " pin " << pin.name() << " of board " << m_desc.name
				<< (pin.activeLow() ? " (active low)" : ""));
	}

	void recordPins(sim::VCDSink &sink, const Board &board)
	{
		for (auto &pin : board.pins()) {
			if (pin->direction() == PinDirection::CLOCK)
				continue;

			const Pin *p = pin.get();
			sink.addSignal("board", p->name(), [p]() { return p->value(); });
		}
	}
}

namespace YAML {
	bool convert<blk::PinDirection>::decode(const Node& node, blk::PinDirection& rhs)
	{
		if (!node.IsScalar())
			return false;

		std::string value = node.Scalar();
		boost::algorithm::to_lower(value);
		if (value == "input")
			rhs = blk::PinDirection::INPUT;
		else if (value == "output")
			rhs = blk::PinDirection::OUTPUT;
		else if (value == "clock")
			rhs = blk::PinDirection::CLOCK;
		else
			return false;
		return true;
	}
}
