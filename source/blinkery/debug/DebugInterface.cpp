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
#include "DebugInterface.h"
#include "StreamInterface.h"

#include "../hlim/Clock.h"

namespace blk::dbg {

LogMessage::LogMessage()
{
}

LogMessage::LogMessage(const char *c)
{
	(*this) << c;
}

std::string LogMessage::text() const
{
	std::string result;
	for (const auto &part : m_messageParts) {
		if (std::holds_alternative<const char*>(part))
			result += std::get<const char*>(part);
		else if (std::holds_alternative<std::string>(part))
			result += std::get<std::string>(part);
		else {
			const hlim::Clock *clock = std::get<const hlim::Clock*>(part);
			result += clock != nullptr ? clock->getName() : std::string("<null clock>");
		}
	}
	return result;
}

std::string_view severityName(LogMessage::Severity severity)
{
	switch (severity) {
		case LogMessage::LOG_INFO: return "info";
		case LogMessage::LOG_WARNING: return "warning";
		case LogMessage::LOG_ERROR: return "error";
	}
	return "unknown";
}

std::string_view sourceName(LogMessage::Source source)
{
	switch (source) {
		case LogMessage::LOG_DESIGN: return "design";
		case LogMessage::LOG_CONFIGURATION: return "configuration";
		case LogMessage::LOG_SIMULATION: return "simulation";
	}
	return "unknown";
}

thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();

void logToStream(std::ostream &stream, LogMessage::Severity minSeverity)
{
	StreamInterface::create(stream, minSeverity);
}

void logToConsole(LogMessage::Severity minSeverity)
{
	StreamInterface::create(std::clog, minSeverity);
}

void logNothing()
{
	DebugInterface::instance = std::make_unique<DebugInterface>();
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}

}
