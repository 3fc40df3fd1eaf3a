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
#include <string>
#include <string_view>
#include <fstream>
#include <functional>
#include <cstdint>

namespace blk::sim
{
	/**
	 * @brief Low level writer for value change dump files.
	 * @details All declarations must happen before beginDumpVars(), all state changes after it.
	 */
	class VCDWriter
	{
	public:
		class Scope
		{
		public:
			Scope(std::function<void()> exitFunc) : m_EndScope(exitFunc) {}
			~Scope() { m_EndScope(); }
		private:
			std::function<void()> m_EndScope;
		};

		VCDWriter(std::string filename);

		explicit operator bool () const { return (bool)m_File; }

		Scope beginModule(std::string_view name);
		void declareWire(size_t width, std::string_view code, std::string_view label);
		void declareString(std::string_view code, std::string_view label);

		Scope beginDumpVars();
		void writeState(std::string_view code, size_t size, std::uint64_t value);
		void writeString(std::string_view code, std::string_view text);
		void writeBitState(std::string_view code, bool value);
		/// Writes a time stamp in units of the 1ps timescale.
		void writeTime(std::uint64_t time);

		void flush() { m_File.flush(); }

		/// Returns the short identifier code for the n-th declared variable.
		static std::string identifierCode(size_t index);
	protected:
		std::ofstream m_File;
		std::string m_FileName;
		bool m_EndDefinitions = false;
	};
}
