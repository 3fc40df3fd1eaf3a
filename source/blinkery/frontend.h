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

#include "pch.h"

#include "frontend/Board.h"
#include "frontend/Clock.h"
#include "frontend/ClockResetGenerator.h"
#include "frontend/Pin.h"

#include "debug/DebugInterface.h"
#include "hlim/Clock.h"
#include "hlim/ClockRational.h"
#include "utils/ConfigTree.h"
#include "utils/Exceptions.h"
#include "utils/Preprocessor.h"

#include "simulation/Simulator.h"
#include "simulation/SimulatorCallbacks.h"
#include "simulation/waveformFormats/VCDSink.h"
