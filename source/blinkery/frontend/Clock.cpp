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

#include <boost/algorithm/string.hpp>

#include <cmath>
#include <sstream>

namespace blk {

	hlim::ClockRational clockFromString(std::string text)
	{
		double number = 0;
		std::string unit;
		std::istringstream stream{ text };
		stream >> number >> unit;

		BLK_CONFIGCHECK_HINT(!stream.fail(), "'" + text + "' is not a frequency or period. Expected a number followed by a unit, e.g. '100 MHz'.");
		BLK_CONFIGCHECK_HINT(number >= 0, "'" + text + "' is negative.");

		// Keep three decimal places, rounded to nearest so that e.g. 12.288 does not turn into 12.287.
		std::uint64_t milli = (std::uint64_t) std::llround(number * 1000);
		BLK_CONFIGCHECK_HINT(milli > 0, "'" + text + "' is zero, clocks need a non-zero frequency.");

		ClockConfig::ClockRational roundedNumber{ milli, 1000 };
		ClockConfig::ClockRational frequency;

		boost::algorithm::to_lower(unit);
		if (unit == "ps")
			frequency = ClockConfig::ClockRational{ 1'000'000'000'000, 1 } / roundedNumber;
		else if (unit == "ns")
			frequency = ClockConfig::ClockRational{ 1'000'000'000, 1 } / roundedNumber;
		else if (unit == "us")
			frequency = ClockConfig::ClockRational{ 1'000'000, 1 } / roundedNumber;
		else if (unit == "ms")
			frequency = ClockConfig::ClockRational{ 1'000, 1 } / roundedNumber;
		else if (unit == "s")
			frequency = ClockConfig::ClockRational{ 1, 1 } / roundedNumber;
		else if (unit == "hz")
			frequency = ClockConfig::ClockRational{ 1, 1 } * roundedNumber;
		else if (unit == "khz")
			frequency = ClockConfig::ClockRational{ 1'000, 1 } * roundedNumber;
		else if (unit == "mhz")
			frequency = ClockConfig::ClockRational{ 1'000'000, 1 } * roundedNumber;
		else if (unit == "ghz")
			frequency = ClockConfig::ClockRational{ 1'000'000'000, 1 } * roundedNumber;
		else if (unit == "thz")
			frequency = ClockConfig::ClockRational{ 1'000'000'000'000, 1 } * roundedNumber;
		else
			BLK_CONFIGCHECK_HINT(false, "unknown clock period unit '" + unit + "'. must be one of (ps, ns, us, ms, s, Hz, KHz, MHz, GHz, THz)");

		return frequency;
	}

	std::ostream& operator<<(std::ostream& s, const ClockConfig& cfg)
	{
		cfg.print(s);
		return s;
	}

	void ClockConfig::loadConfig(const utils::ConfigTree& config)
	{
		if (config.isScalar())
			absoluteFrequency = clockFromString(config.as<std::string>());
		else
		{
			if (config["name"])
				name = config["name"].as<std::string>();

			if (config["frequency"])
				absoluteFrequency = clockFromString(config["frequency"].as<std::string>());

			if (config["period"])
				absoluteFrequency = clockFromString(config["period"].as<std::string>());

			if (config["reset_name"])
				resetName = config["reset_name"].as<std::string>();

			if (config["reset_active"])
				resetActive = config["reset_active"].as<ResetActive>();
		}
	}

	void ClockConfig::print(std::ostream& s) const
	{
		const char *separator = "";
		auto print = [&](std::string_view label, const auto& value)
		{
			if (value) {
				s << separator << label << ": " << *value;
				separator = ", ";
			}
		};

		std::optional<std::string> frequency;
		if (absoluteFrequency)
			frequency = hlim::formatFrequency(*absoluteFrequency);

		s << "ClockConfig{";
		print("name", name);
		print("frequency", frequency);
		print("reset name", resetName);
		print("reset active", resetActive);
		s << "}";
	}
}

namespace blk::hlim {
	std::ostream& operator<<(std::ostream& s, Clock::ResetActive active)
	{
		switch (active) {
			case Clock::ResetActive::HIGH: return s << "high";
			case Clock::ResetActive::LOW: return s << "low";
		}
		return s;
	}
}

namespace YAML {
	bool convert<blk::hlim::Clock::ResetActive>::decode(const Node& node, blk::hlim::Clock::ResetActive& rhs)
	{
		if (!node.IsScalar())
			return false;

		std::string value = node.Scalar();
		boost::algorithm::to_lower(value);
		if (value == "high")
			rhs = blk::hlim::Clock::ResetActive::HIGH;
		else if (value == "low")
			rhs = blk::hlim::Clock::ResetActive::LOW;
		else
			return false;
		return true;
	}
}
