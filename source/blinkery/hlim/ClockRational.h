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
#pragma once

#include <boost/rational.hpp>

#include <cstdint>
#include <ostream>
#include <string>

namespace blk::hlim {
	/// Frequencies (in Hz) and simulation times (in seconds) are exact rationals to keep clock edges of unrelated clocks from drifting.
	using ClockRational = boost::rational<std::uint64_t>;

	inline std::uint64_t floor(const ClockRational &v) { return v.numerator() / v.denominator(); }
	inline std::uint64_t ceil(const ClockRational &v) { return (v.numerator() + v.denominator()-1) / v.denominator(); }
	/// Rounds to the nearest integer, halves are rounded up.
	inline std::uint64_t round(const ClockRational &v) { return floor(v + ClockRational(1, 2)); }

	inline double toDouble(const ClockRational &v) { return (double) v.numerator() / v.denominator(); }
	inline double toNanoseconds(const ClockRational &v) { return v.numerator() * 1e9 / v.denominator(); }

	void formatTime(std::ostream &stream, ClockRational time);
	void formatFrequency(std::ostream &stream, ClockRational frequency);

	std::string formatTime(ClockRational time);
	std::string formatFrequency(ClockRational frequency);
}
