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
#include "Exceptions.h"

namespace blk::utils {

template class BlkError<std::logic_error>;
template class BlkError<std::runtime_error>;

std::string composeBlkErrorString(const char *file, size_t line, const std::string &what)
{
	return what + " Location: " + file + '(' + boost::lexical_cast<std::string>(line) + ')';
}

InternalError::InternalError(const char *file, size_t line, const std::string &what) : BlkError<std::logic_error>(file, line, what) { }
InternalError::~InternalError() { }

DesignError::DesignError(const char *file, size_t line, const std::string &what) : BlkError<std::runtime_error>(file, line, what) {
#ifdef _WIN32
	OutputDebugStringA(what.c_str());
#endif
}
DesignError::~DesignError() { }

ConfigurationError::ConfigurationError(const char *file, size_t line, const std::string &what) : DesignError(file, line, what) { }
ConfigurationError::~ConfigurationError() { }

}
