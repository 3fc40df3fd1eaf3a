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
#include "PatternSequencer.h"

#include "../frontend/Pin.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

namespace blk::scl {

	SequencerDriver::SequencerDriver(std::unique_ptr<PatternSequencer> sequencer, const std::vector<OutputPin*> &pads) :
		m_sequencer(std::move(sequencer))
	{
		BLK_DESIGNCHECK_HINT(m_sequencer != nullptr, "The sequencer factory did not return a sequencer.");
		BLK_DESIGNCHECK_HINT(m_sequencer->width() == pads.size(), 
				(boost::format("The sequencer has %d outputs but %d pads were given.") % m_sequencer->width() % pads.size()).str());

		const PatternSequencer *seq = m_sequencer.get();
		for (size_t i = 0; i < pads.size(); i++)
			pads[i]->driveWith([seq, i]() { return seq->output(i); });
	}

}
