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

namespace blk::sim {

/**
 * @brief Synchronous logic that advances once per active edge of the clock it is registered with.
 * @details The simulator samples the reset of that clock at every edge and calls either reset() or tick(), never both.
 */
class SequentialComponent
{
	public:
		virtual ~SequentialComponent() = default;

		/// Brings the component into its initial state when the simulation starts.
		virtual void powerOn() { reset(); }
		/// Called instead of tick() on every clock edge during which the reset is asserted.
		virtual void reset() = 0;
		/// Advances the component by one clock cycle.
		virtual void tick() = 0;

		/// One clock edge with the given, already sampled, reset level.
		void step(bool resetAsserted) { if (resetAsserted) reset(); else tick(); }
};

}
