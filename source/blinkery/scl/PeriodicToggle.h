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
#include "../utils/ConfigTree.h"

#include <cstdint>
#include <optional>

namespace blk::scl {

	struct PeriodicToggleConfig
	{
		std::optional<hlim::ClockRational> frequency;
		bool initialValue = false;

		/// Accepts either a frequency string (e.g. "3 Hz") or a map with `frequency` and `initial_value`.
		void loadConfig(const utils::ConfigTree &config);
	};

	/**
	 * @brief Output bit that flips at a fixed frequency, derived from the clock by a down counter.
	 * @details The counter holds the number of ticks until the next flip. It starts at the period, counts down once per tick,
	 * and when it reaches zero the output flips and the counter reloads in the same tick. The output thus flips on every
	 * period-th tick and the counter is always within [1, period].
	 *
	 * The period is round(clockFrequency / (2 * toggleFrequency)), so the toggle frequency is met up to one clock cycle.
	 * Reset reloads the counter and restores the initial output.
	 */
	class PeriodicToggle : public sim::SequentialComponent
	{
		public:
			PeriodicToggle(hlim::ClockRational clockFrequency, hlim::ClockRational toggleFrequency, bool initialOutput = false);
			PeriodicToggle(hlim::ClockRational clockFrequency, const PeriodicToggleConfig &config);

			/// Number of clock ticks between two flips of the output. Throws a ConfigurationError if the frequencies can not be realized.
			static std::uint64_t computePeriod(hlim::ClockRational clockFrequency, hlim::ClockRational toggleFrequency);

			virtual void reset() override;
			virtual void tick() override;

			inline bool output() const { return m_output; }
			inline std::uint64_t counter() const { return m_counter; }

			inline std::uint64_t period() const { return m_period; }
			inline bool initialOutput() const { return m_initialOutput; }
			inline hlim::ClockRational clockFrequency() const { return m_clockFrequency; }
			inline hlim::ClockRational toggleFrequency() const { return m_toggleFrequency; }

			/// Frequency at which the output actually flips after rounding the period.
			hlim::ClockRational achievedFrequency() const;
			/// Number of bits a hardware register needs to hold the counter.
			size_t counterWidth() const;
		protected:
			hlim::ClockRational m_clockFrequency;
			hlim::ClockRational m_toggleFrequency;
			std::uint64_t m_period;
			bool m_initialOutput;

			std::uint64_t m_counter;
			bool m_output;
	};

}
