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
#include "StackTrace.h"

#include <boost/format.hpp>

namespace blk::utils 
{

	void StackTrace::record(size_t size, size_t skipTop) 
	{ 
		boost::stacktrace::stacktrace trace;

		m_trace.clear();
		for (size_t i = skipTop; i < trace.size() && m_trace.size() < size; i++)
			m_trace.push_back(trace[i]);
	}

	std::vector<std::string> StackTrace::formatEntries() const 
	{ 
		std::vector<std::string> result;
		result.reserve(m_trace.size());
		for (const auto &frame : m_trace)
			result.push_back(formatFrame(frame));
	
		return result;
	}

	std::vector<std::string> StackTrace::formatEntriesFiltered() const
	{
		std::vector<std::string> result;
		for (const auto &frame : m_trace)
		{
			std::string formatted = formatFrame(frame);

			if (formatted.starts_with("boost::"))
				continue;
			if (formatted.starts_with("std::"))
				continue;
			if (formatted.starts_with("blk::") && !formatted.starts_with("blk::scl::"))
				continue;

			result.emplace_back(std::move(formatted));
		}

		while (!result.empty() && !result.back().starts_with("main "))
			result.pop_back();

		return result;
	}

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace)
	{
		auto symbols = trace.formatEntries();
		for (size_t i = 0; i < symbols.size(); i++)
			stream << "	" << i << ": " << symbols[i] << std::endl;
	
		return stream;
	}

	std::string formatFrame(const boost::stacktrace::frame& frame)
	{
		return (boost::format("%s at %s:%d") % frame.name() % frame.source_file() % frame.source_line()).str();
	}
}
