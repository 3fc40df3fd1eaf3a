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

#include "../../simulation/SequentialComponent.h"

#include <cstdint>

namespace blk {
	class OutputPin;
}

namespace blk::scl {

	/**
	 * @brief Philips I2S transmitter clocked by the audio master clock (MCLK).
	 * @details An 8 bit divider counts MCLK ticks. Bit 1 of the divider is the bit clock (SCLK = MCLK/4)
	 * and bit 7 the word select (LRCK = MCLK/256), so each frame has 32 bit slots per channel.
	 * LRCK low selects the left channel. Data changes on falling SCLK edges, MSB first, one SCLK cycle after LRCK.
	 *
	 * Samples are taken over from the sample registers at the falling SCLK edge that starts their MSB.
	 * In test pattern mode the left sample increments on every rising LRCK edge and the right sample on every falling one.
	 */
	class I2sTransmitter : public sim::SequentialComponent
	{
		public:
			I2sTransmitter(bool testPattern = true);

			/// Sets the words that are sent with the next left and right channel slots.
			void setSample(std::uint32_t left, std::uint32_t right) { m_left = left; m_right = right; }

			virtual void reset() override;
			virtual void tick() override;

			inline bool sclk() const { return (m_divider >> 1) & 1; }
			inline bool lrck() const { return (m_divider >> 7) & 1; }
			inline bool data() const { return m_data; }

			inline std::uint8_t divider() const { return m_divider; }
			inline bool testPattern() const { return m_testPattern; }
			inline std::uint32_t leftSample() const { return m_left; }
			inline std::uint32_t rightSample() const { return m_right; }

			/// Drives the pads of an I2S Pmod with the bit clock, the word select and the serial data.
			void drive(OutputPin &clk, OutputPin &sync, OutputPin &tx) const;
		protected:
			bool m_testPattern;

			std::uint8_t m_divider = 0;
			std::uint32_t m_shift = 0;
			bool m_data = false;

			std::uint32_t m_left = 0;
			std::uint32_t m_right = 0;
	};

}
