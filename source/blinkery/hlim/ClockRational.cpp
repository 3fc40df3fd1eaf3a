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
#include "ClockRational.h"

#include <sstream>

namespace blk::hlim {
	void formatTime(std::ostream &stream, ClockRational time) {
		const char *unit = "sec";
		if (time.denominator() > 1) { unit = "ms"; time *= ClockRational(1000); }
		if (time.denominator() > 1) { unit = "us"; time *= ClockRational(1000); }
		if (time.denominator() > 1) { unit = "ns"; time *= ClockRational(1000); }
		if (time.denominator() > 1) { unit = "ps"; time *= ClockRational(1000); }
		if (time.denominator() > 1) { unit = "fs"; time *= ClockRational(1000); }

		stream << floor(time) << ' ' << unit;
	}

	void formatFrequency(std::ostream &stream, ClockRational frequency) {
		if (frequency.denominator() != 1) {
			stream << toDouble(frequency) << " Hz";
			return;
		}

		std::uint64_t hz = frequency.numerator();
		if (hz != 0 && hz % 1'000'000'000 == 0)
			stream << hz / 1'000'000'000 << " GHz";
		else if (hz != 0 && hz % 1'000'000 == 0)
			stream << hz / 1'000'000 << " MHz";
		else if (hz != 0 && hz % 1'000 == 0)
			stream << hz / 1'000 << " kHz";
		else
			stream << hz << " Hz";
	}

	std::string formatTime(ClockRational time) {
		std::stringstream stream;
		formatTime(stream, time);
		return stream.str();
	}

	std::string formatFrequency(ClockRational frequency) {
		std::stringstream stream;
		formatFrequency(stream, frequency);
		return stream.str();
	}
}
