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

#include <iostream>

#if defined(_MSC_VER)

#define GET_FUNCTION_NAME __FUNCSIG__

#elif defined(__GNUC__)

#define GET_FUNCTION_NAME __PRETTY_FUNCTION__

#else
#error "Unsupported platform!"
#endif


#define BLK_ASSERT(x) { if (!(x)) { throw blk::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}
#define BLK_ASSERT_HINT(x, message) { if (!(x)) { throw blk::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x + " Hint: " + message); }}


#define BLK_DESIGNCHECK(x) { if (!(x)) { throw blk::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x); }}
#define BLK_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw blk::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x + " Hint: " + message); }}

#define BLK_CONFIGCHECK_HINT(x, message) { if (!(x)) { throw blk::utils::ConfigurationError(__FILE__, __LINE__, std::string("Configuration failed: ") + #x + " Hint: " + message); }}
