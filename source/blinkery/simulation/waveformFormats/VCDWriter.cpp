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
#include "VCDWriter.h"

#include "../../utils/Exceptions.h"
#include "../../utils/Preprocessor.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>

blk::sim::VCDWriter::VCDWriter(std::string filename) :
	m_FileName(filename)
{
	auto parentPath = std::filesystem::path(filename).parent_path();
	if (!parentPath.empty())
		std::filesystem::create_directories(parentPath);

	m_File.open(m_FileName.c_str(), std::ofstream::binary);
	BLK_DESIGNCHECK_HINT(m_File.is_open(), "Could not open vcd file for writing! " + m_FileName);

	auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

	tm now_tb;
#ifdef WIN32
	localtime_s(&now_tb, &now);
#else
	localtime_r(&now, &now_tb);
#endif

	m_File
		<< "$date\n" << std::put_time(&now_tb, "%Y-%m-%d %X") << "\n$end\n"
		<< "$version\nBlinkery simulation output\n$end\n"
		<< "$timescale\n1ps\n$end\n";
}

blk::sim::VCDWriter::Scope blk::sim::VCDWriter::beginModule(std::string_view name)
{
	BLK_ASSERT(!name.empty());
	BLK_ASSERT(!m_EndDefinitions);
	m_File << "$scope module " << name << " $end\n";

	return Scope([this]() {
		m_File << "$upscope $end\n";
	});
}

void blk::sim::VCDWriter::declareWire(size_t width, std::string_view code, std::string_view label)
{
	BLK_ASSERT(!m_EndDefinitions);
	m_File << "$var wire " << width << " " << code << " " << label << " $end\n";
}

void blk::sim::VCDWriter::declareString(std::string_view code, std::string_view label)
{
	BLK_ASSERT(!m_EndDefinitions);
	m_File << "$var string 0 " << code << " " << label << " $end\n";
}

blk::sim::VCDWriter::Scope blk::sim::VCDWriter::beginDumpVars()
{
	BLK_ASSERT(!m_EndDefinitions);
	m_File
		<< "$enddefinitions $end\n"
		<< "$dumpvars\n";
	m_EndDefinitions = true;

	return Scope([this]() {
		m_File << "$end\n";
	});
}

void blk::sim::VCDWriter::writeState(std::string_view code, size_t size, std::uint64_t value)
{
	BLK_ASSERT(m_EndDefinitions);

	m_File << 'b';
	for (size_t i = 0; i < size; i++) {
		auto bitIdx = size - 1 - i;
		m_File << (((value >> bitIdx) & 1) ? '1' : '0');
	}
	m_File << ' ' << code << '\n';
}

void blk::sim::VCDWriter::writeString(std::string_view code, std::string_view text)
{
	BLK_ASSERT(m_EndDefinitions);
	
	if (text.empty())
		text = " "; // empty strings are not supported by most viewers

	m_File << 's';
	for (auto c : text)
		if (c == ' ')
			m_File << "\\x20";
		else
			m_File << c;

	m_File << ' ' << code << '\n';
}

void blk::sim::VCDWriter::writeBitState(std::string_view code, bool value)
{
	BLK_ASSERT(m_EndDefinitions);

	m_File << (value ? '1' : '0') << code << '\n';
}

void blk::sim::VCDWriter::writeTime(std::uint64_t time)
{
	BLK_ASSERT(m_EndDefinitions);
	m_File << '#' << time << '\n';
}

std::string blk::sim::VCDWriter::identifierCode(size_t index)
{
	// printable ascii range '!' to '~'
	constexpr size_t base = '~' - '!' + 1;

	std::string code;
	do {
		code += char('!' + index % base);
		index /= base;
	} while (index != 0);
	return code;
}
