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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <csignal>
#include <iostream>


namespace blk::utils {

std::string composeBlkErrorString(const char *file, size_t line, const std::string &what);


template<class BaseError>
class BlkError : public BaseError
{
	public:
		BlkError(const char *file, size_t line, const std::string &what) : 
				BaseError(composeBlkErrorString(file, line, what)) {
					
			m_trace.record(20, 1);
		}		
		inline const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class BlkError<std::logic_error>;
extern template class BlkError<std::runtime_error>;

/// Thrown when an internal invariant of the library is broken.
class InternalError : public BlkError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// Thrown when the library is used in a way that can not work, e.g. requesting a pin twice.
class DesignError : public BlkError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};

/**
 * @brief Thrown when a configuration value can not be realized.
 * @details E.g. a toggle frequency that is too high for the driving clock or a malformed frequency string.
 */
class ConfigurationError : public DesignError
{
	public:
		ConfigurationError(const char *file, size_t line, const std::string &what);
		~ConfigurationError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const BlkError<BaseError> &exception) {
	stream 
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();
		
	return stream;
}

}
