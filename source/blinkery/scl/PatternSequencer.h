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

#include "../hlim/ClockRational.h"
#include "../simulation/SequentialComponent.h"

#include <functional>
#include <memory>
#include <vector>

namespace blk {
	class OutputPin;
}

namespace blk::scl {

	/**
	 * @brief A free running pattern generator with a fixed number of output bits, e.g. an LED chaser.
	 * @details The library does not care what the pattern looks like, only that it advances once per tick.
	 */
	class PatternSequencer
	{
		public:
			virtual ~PatternSequencer() = default;

			virtual size_t width() const = 0;
			virtual void reset() = 0;
			virtual void tick() = 0;
			virtual bool output(size_t index) const = 0;
	};

	/// Builds a sequencer for the given number of outputs and the frequency of the clock it will run on.
	using SequencerFactory = std::function<std::unique_ptr<PatternSequencer>(size_t width, hlim::ClockRational clockFrequency)>;

	/**
	 * @brief Runs a PatternSequencer in a clock domain and drives one output pin per sequencer output.
	 */
	class SequencerDriver : public sim::SequentialComponent
	{
		public:
			SequencerDriver(std::unique_ptr<PatternSequencer> sequencer, const std::vector<OutputPin*> &pads);

			virtual void reset() override { m_sequencer->reset(); }
			virtual void tick() override { m_sequencer->tick(); }

			PatternSequencer &sequencer() { return *m_sequencer; }
		protected:
			std::unique_ptr<PatternSequencer> m_sequencer;
	};

}
