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
#ifdef _WIN32
 #ifndef NOMINMAX
  #define NOMINMAX
 #endif
 #define WIN32_LEAN_AND_MEAN
 #define _CRT_SECURE_NO_WARNINGS
 #include <Windows.h>
#endif

#ifndef BLK_NO_PCH

#ifdef _WIN32
#pragma warning(push, 0)
#pragma warning(disable : 4146) // boost rational "unary minus operator applied to unsigned type, result still unsigned"
#endif

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/rational.hpp>
#include <boost/spirit/home/x3.hpp>
#include <boost/stacktrace.hpp>

#ifdef _WIN32
#pragma warning (push)
#pragma warning (disable : 4251) // yaml-cpp wrong dll interface export for stl
#pragma warning (disable : 4275) // yaml-cpp wrong dll interface export for stl
#endif

#include <yaml-cpp/yaml.h>

#ifdef _WIN32
#pragma warning (pop)
#endif

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <queue>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace boost {
	extern template class rational<std::uint64_t>;
	extern template class basic_format<char>;
}

#ifdef _WIN32
#pragma warning(pop)
#endif

#endif
