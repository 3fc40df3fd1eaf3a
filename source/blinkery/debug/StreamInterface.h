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

#include "DebugInterface.h"

#include <ostream>

namespace blk::dbg {

/**
 * @brief Logging backend that writes one line per message into a std::ostream.
 * @details Lines have the form `[warning] design: message text`.
 */
class StreamInterface : public DebugInterface
{
	public:
		static void create(std::ostream &stream, LogMessage::Severity minSeverity);

		StreamInterface(std::ostream &stream, LogMessage::Severity minSeverity);

		virtual void log(LogMessage msg) override;
		virtual std::string howToReachLog() override { return "Log messages are written to the configured output stream."; }
	protected:
		std::ostream &m_stream;
		LogMessage::Severity m_minSeverity;
};

}
