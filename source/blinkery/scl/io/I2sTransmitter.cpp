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
#include "I2sTransmitter.h"

#include "../../frontend/Pin.h"

namespace blk::scl {

	I2sTransmitter::I2sTransmitter(bool testPattern) : m_testPattern(testPattern)
	{
	}

	void I2sTransmitter::reset()
	{
		m_divider = 0;
		m_shift = 0;
		m_data = false;

		if (m_testPattern) {
			m_left = 0;
			m_right = 0;
		}
	}

	void I2sTransmitter::tick()
	{
		bool lrckBefore = lrck();
		m_divider++;

		if (m_testPattern && lrck() != lrckBefore) {
			if (lrck())
				m_left++;
			else
				m_right++;
		}

		// falling edge of sclk
		if ((m_divider & 3) == 0) {
			unsigned slot = m_divider >> 2;
			if (slot == 1)
				m_shift = m_left;
			else if (slot == 33)
				m_shift = m_right;
			else
				m_shift <<= 1;

			m_data = (m_shift >> 31) & 1;
		}
	}

	void I2sTransmitter::drive(OutputPin &clk, OutputPin &sync, OutputPin &tx) const
	{
		clk.driveWith([this]() { return sclk(); });
		sync.driveWith([this]() { return lrck(); });
		tx.driveWith([this]() { return data(); });
	}

}
