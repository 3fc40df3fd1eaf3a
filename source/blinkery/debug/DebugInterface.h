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

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace blk {

namespace hlim {
	class Clock;
}

/**
 * @addtogroup blk_logging
 * @{
 */

namespace dbg {

/**
 * @brief Helper class for composing logging messages.
 * @details Similarly to std::ostream, it uses the << operator to concatenate message parts.
 * Message parts can refer to clocks such that the logging backend can render them in whatever way is suitable.
 * 
 * A common use case is `log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_DESIGN << "Clock " << clock << " has no components");`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_DESIGN,
			LOG_CONFIGURATION,
			LOG_SIMULATION
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }
		/// Adds a string message part 
		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		/// Adds a string message part 
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// @brief Adds a reference to a clock to the message.
		/// @details The clock must outlive the message if the backend defers rendering.
		LogMessage &operator<<(const hlim::Clock *clock) { m_messageParts.push_back(clock); return *this; }
		LogMessage &operator<<(const hlim::Clock &clock) { m_messageParts.push_back(&clock); return *this; }

		/// Adds an integer number to the message
		LogMessage &operator<<(std::size_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }

		/// @brief Returns the parts of which this message is composed.
		const auto &parts() const { return m_messageParts; }

		/// Renders all message parts into one string, clocks by their name.
		std::string text() const;
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_DESIGN;

		std::vector<std::variant<const char*, std::string, const hlim::Clock*>> m_messageParts;
};

std::string_view severityName(LogMessage::Severity severity);
std::string_view sourceName(LogMessage::Source source);

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface 
{
	public:
		virtual ~DebugInterface() = default;

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. blk::dbg::logToConsole."; }
};

/// Initialize logging to write human readable lines into the given stream. The stream must outlive the logging backend.
void logToStream(std::ostream &stream, LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Initialize logging to write human readable lines into std::clog.
void logToConsole(LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Drops all log messages from now on.
void logNothing();

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);

/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

/**@}*/

}
