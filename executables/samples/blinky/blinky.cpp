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

#include <blinkery/frontend.h>
#include <blinkery/scl.h>

#include <cstdlib>
#include <iostream>

using namespace blk;

namespace {

/**
 * @brief Johnson counter chaser: lights fill up one by one from the lowest pad and then go dark in the same order.
 * @details One step every clock/(2*width) ticks, so a full round takes a second.
 */
class JohnsonChaser : public scl::PatternSequencer
{
	public:
		JohnsonChaser(size_t width, hlim::ClockRational clockFrequency) : m_leds(width, false) {
			hlim::ClockRational stepTicks = clockFrequency / (2 * width);
			m_stepTicks = std::max<std::uint64_t>(1, stepTicks.numerator() / stepTicks.denominator());
		}

		virtual size_t width() const override { return m_leds.size(); }
		virtual void reset() override {
			std::fill(m_leds.begin(), m_leds.end(), false);
			m_timer = 0;
		}
		virtual void tick() override {
			if (++m_timer < m_stepTicks)
				return;
			m_timer = 0;
			bool in = !m_leds.back();
			for (size_t i = m_leds.size()-1; i > 0; i--)
				m_leds[i] = m_leds[i-1];
			m_leds[0] = in;
		}
		virtual bool output(size_t index) const override { return m_leds[index]; }
	protected:
		std::vector<bool> m_leds;
		std::uint64_t m_stepTicks;
		std::uint64_t m_timer = 0;
};

class TransitionCounter : public sim::SimulatorCallbacks
{
	public:
		TransitionCounter(const Board &board) {
			for (const auto &pin : board.pins())
				if (pin->direction() == PinDirection::OUTPUT)
					m_pins.push_back({ .pin = pin.get() });
		}

		virtual void onPowerOn() override {
			for (auto &p : m_pins)
				p.last = p.pin->value();
		}

		virtual void onCommitState() override {
			for (auto &p : m_pins) {
				bool value = p.pin->value();
				if (value != p.last)
					p.transitions++;
				p.last = value;
			}
		}

		void print(std::ostream &stream) const {
			for (const auto &p : m_pins)
				stream << boost::format("%-16s %10d transitions, now %s\n") % p.pin->name() % p.transitions % (p.pin->value() ? "on" : "off");
		}
	protected:
		struct Watched {
			const Pin *pin;
			size_t transitions = 0;
			bool last = false;
		};
		std::vector<Watched> m_pins;
};

void printUsage(const char *program)
{
	std::cout
		<< "Usage: " << program << " [options]\n"
		<< "Simulates one of the blinky designs and reports how often each LED changed.\n\n"
		<< "Options:\n"
		<< "  --design <preset>         Design to start from (default arty_blinky). One of:";
	for (auto name : scl::blinkyPresetNames())
		std::cout << ' ' << name;
	std::cout << "\n"
		<< "  --config <yaml>           Configuration file applied on top of the preset, can be given multiple times\n"
		<< "  --time <duration>         Simulated time, e.g. \"2 s\" or \"250 ms\" (default 1 s)\n"
		<< "  --vcd <file>              Record a waveform of all pins\n"
		<< "  --press-reset <from> <to> Hold the reset button between the two points in time, e.g. \"0.5 s\" \"0.7 s\"\n"
		<< "  --verbose                 Log everything, not just warnings\n"
		<< "  --help                    Show this text\n";
}

hlim::ClockRational durationFromString(const std::string &text)
{
	// a period parses into the matching frequency
	hlim::ClockRational freq = clockFromString(text);
	return hlim::ClockRational(1) / freq;
}

}

int main(int argc, char *argv[])
{
	std::string design = "arty_blinky";
	std::vector<std::string> configFiles;
	std::string vcdFile;
	std::string duration = "1 s";
	std::optional<std::pair<std::string, std::string>> pressReset;
	bool verbose = false;

	for (int i = 1; i < argc; i++) {
		std::string_view arg = argv[i];
		auto needArgs = [&](int count) {
			if (i + count >= argc) {
				std::cerr << "Option " << arg << " needs " << count << " argument(s)\n";
				printUsage(argv[0]);
				std::exit(1);
			}
		};

		if (arg == "--help") {
			printUsage(argv[0]);
			return 0;
		} else if (arg == "--design") {
			needArgs(1);
			design = argv[++i];
		} else if (arg == "--config") {
			needArgs(1);
			configFiles.push_back(argv[++i]);
		} else if (arg == "--time") {
			needArgs(1);
			duration = argv[++i];
		} else if (arg == "--vcd") {
			needArgs(1);
			vcdFile = argv[++i];
		} else if (arg == "--press-reset") {
			needArgs(2);
			pressReset.emplace(argv[i+1], argv[i+2]);
			i += 2;
		} else if (arg == "--verbose") {
			verbose = true;
		} else {
			std::cerr << "Unknown option " << arg << "\n";
			printUsage(argv[0]);
			return 1;
		}
	}

	dbg::logToConsole(verbose ? dbg::LogMessage::LOG_INFO : dbg::LogMessage::LOG_WARNING);

	try {
		scl::BlinkyConfig config = scl::blinkyPreset(design);
		if (!configFiles.empty()) {
			utils::ConfigTree tree;
			for (const auto &file : configFiles)
				tree.loadFromFile(file);
			config.loadConfig(tree);
		}

		hlim::ClockRational total = durationFromString(duration);
		hlim::ClockRational pressAt = total, releaseAt = total;
		if (pressReset) {
			pressAt = durationFromString(pressReset->first);
			releaseAt = durationFromString(pressReset->second);
			BLK_DESIGNCHECK_HINT(pressAt < releaseAt, "The reset button must be pressed before it is released.");
			BLK_DESIGNCHECK_HINT(releaseAt <= total, "The reset button must be released within the simulated time.");
		}

		scl::Blinky blinky(config, [](size_t width, hlim::ClockRational clockFrequency) -> std::unique_ptr<scl::PatternSequencer> {
			return std::make_unique<JohnsonChaser>(width, clockFrequency);
		});

		sim::Simulator simulator;
		blinky.addToSimulator(simulator);

		TransitionCounter counter(blinky.board());
		simulator.addCallbacks(&counter);

		std::unique_ptr<sim::VCDSink> vcd;
		if (!vcdFile.empty()) {
			vcd = std::make_unique<sim::VCDSink>(simulator, vcdFile);
			vcd->includeWarnings();
			blinky.addToWaveform(*vcd);
		}

		simulator.powerOn();
		if (pressReset) {
			simulator.advance(pressAt);
			blinky.crg().resetPin().press(true);
			simulator.advance(releaseAt - pressAt);
			blinky.crg().resetPin().press(false);
		}
		simulator.advance(total - simulator.getCurrentSimulationTime());

		std::cout << "Simulated " << config.name << " on " << config.board.name << " for " << duration << "\n";
		counter.print(std::cout);

		vcd.reset();
		simulator.removeCallbacks(&counter);
	} catch (const utils::DesignError &e) {
		std::cerr << "Design error: " << e << std::endl;
		return 1;
	} catch (const utils::InternalError &e) {
		std::cerr << "Internal error: " << e << std::endl;
		return 1;
	} catch (const std::exception &e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
