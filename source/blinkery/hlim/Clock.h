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

#include "ClockRational.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace blk::hlim {

class DerivedClock;

/**
 * @brief A clock domain: a periodic tick source together with its reset.
 * @details The reset is level sensitive and sampled synchronously on every active edge of the clock.
 * A clock without its own reset driver follows the reset of its parent clock.
 */
class Clock
{
	public:
		enum class ResetActive {
			HIGH,
			LOW
		};

		Clock(std::string name);
		virtual ~Clock();

		Clock(const Clock &) = delete;
		Clock &operator=(const Clock &) = delete;

		virtual ClockRational absoluteFrequency() const = 0;
		/// Duration of one clock cycle in seconds.
		ClockRational period() const;

		inline Clock *getParentClock() const { return m_parentClock; }

		inline const std::string &getName() const { return m_name; }
		inline const std::string &getResetName() const { return m_resetName; }
		inline ResetActive getResetActive() const { return m_resetActive; }

		inline void setName(std::string name) { m_name = std::move(name); }
		inline void setResetName(std::string name) { m_resetName = std::move(name); }
		inline void setResetActive(ResetActive active) { m_resetActive = active; }

		/// @brief Binds the raw reset level of this clock to the given driver, e.g. a reset button.
		/// @details The raw level is interpreted according to @ref getResetActive.
		void setResetDriver(std::function<bool()> driver);
		inline bool hasResetDriver() const { return (bool) m_resetDriver; }

		/// Returns whether the reset is currently active, normalized to active high.
		bool resetAsserted() const;

		inline const std::vector<DerivedClock*> &getDerivedClocks() const { return m_derivedClocks; }
		inline void addDerivedClock(DerivedClock *clock) { m_derivedClocks.push_back(clock); }
		void removeDerivedClock(DerivedClock *clock);
	protected:
		Clock *m_parentClock = nullptr;

		std::string m_name;
		std::string m_resetName;
		ResetActive m_resetActive = ResetActive::HIGH;

		std::function<bool()> m_resetDriver;

		std::vector<DerivedClock*> m_derivedClocks;
};

class RootClock : public Clock
{
	public:
		RootClock(std::string name, ClockRational frequency);

		virtual ClockRational absoluteFrequency() const override { return m_frequency; }

		void setFrequency(ClockRational frequency);
	protected:
		ClockRational m_frequency;
};

/**
 * @brief Clock that runs at a rational multiple of its parent, e.g. the output of a PLL.
 */
class DerivedClock : public Clock
{
	public:
		DerivedClock(Clock *parentClock, std::string name, ClockRational frequencyMultiplier);
		~DerivedClock();

		virtual ClockRational absoluteFrequency() const override;

		inline void setFrequencyMultiplier(ClockRational m) { m_parentRelativeMultiplicator = m; }
		inline ClockRational getFrequencyMultiplier() const { return m_parentRelativeMultiplicator; }
	protected:
		ClockRational m_parentRelativeMultiplicator;
};

}
