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
#include "StreamInterface.h"

#include <boost/format.hpp>

namespace blk::dbg {

void StreamInterface::create(std::ostream &stream, LogMessage::Severity minSeverity)
{
	DebugInterface::instance = std::make_unique<StreamInterface>(stream, minSeverity);
}

StreamInterface::StreamInterface(std::ostream &stream, LogMessage::Severity minSeverity) : m_stream(stream), m_minSeverity(minSeverity)
{
}

void StreamInterface::log(LogMessage msg)
{
	if (msg.severity() < m_minSeverity)
		return;

	m_stream << boost::format("[%s] %s: %s\n") % severityName(msg.severity()) % sourceName(msg.source()) % msg.text();
}

}
