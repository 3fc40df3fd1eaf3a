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
#include "Blinky.h"

#include "../debug/DebugInterface.h"
#include "../simulation/Simulator.h"
#include "../simulation/waveformFormats/VCDSink.h"
#include "../utils/Exceptions.h"
#include "../utils/Preprocessor.h"

namespace blk::scl {

	void PadRef::loadConfig(const utils::ConfigTree &config)
	{
		resource = config["resource"].as<std::string>();
		index = config["index"].as<size_t>(0);
		subsignal = config["subsignal"].as<std::string>("");
	}

	void ToggleChannel::loadConfig(const utils::ConfigTree &config)
	{
		led.loadConfig(config["led"]);
		clock = config["clock"].as<std::string>(clock);
		// The toggle settings are either nested under toggle or sit next to led and clock.
		if (config["toggle"])
			toggle.loadConfig(config["toggle"]);
		else
			toggle.loadConfig(config);
		BLK_CONFIGCHECK_HINT(toggle.frequency, "Toggle on " + led.resource + " needs a frequency.");
	}

	void I2sConfig::loadConfig(const utils::ConfigTree &config)
	{
		clock = config["clock"].as<std::string>(clock);
		resource = config["resource"].as<std::string>(resource);
		testPattern = config["test_pattern"].as<bool>(testPattern);
	}

	void BlinkyConfig::loadConfig(const utils::ConfigTree &config)
	{
		if (config["preset"])
			*this = blinkyPreset(config["preset"].as<std::string>());

		if (config["name"])
			name = config["name"].as<std::string>();

		if (config["board"])
			board.loadConfig(config["board"]);

		if (config["plls"]) {
			plls.clear();
			for (auto pllConfig : config["plls"]) {
				plls.emplace_back();
				plls.back().loadConfig(pllConfig);
			}
		}

		if (config["toggles"]) {
			toggles.clear();
			for (auto toggleConfig : config["toggles"]) {
				toggles.emplace_back();
				toggles.back().loadConfig(toggleConfig);
			}
		}

		if (config["reset_led"]) {
			if (config["reset_led"].isNull())
				resetLed.reset();
			else {
				resetLed.emplace();
				resetLed->loadConfig(config["reset_led"]);
			}
		}

		if (config["chaser"]) {
			chaser.clear();
			for (auto pad : config["chaser"]) {
				chaser.emplace_back();
				chaser.back().loadConfig(pad);
			}
		}

		if (config["i2s"]) {
			if (config["i2s"].isNull())
				i2s.reset();
			else {
				if (!i2s)
					i2s.emplace();
				i2s->loadConfig(config["i2s"]);
			}
		}

		BLK_CONFIGCHECK_HINT(!board.resources.empty(), "The design needs a board, either as a preset or described under the key board.");
	}

	BlinkyConfig blinkyPreset(std::string_view name)
	{
		const auto ledPad = [](size_t index) { return PadRef{ .resource = "user_led", .index = index }; };

		if (name == "arty_blinky") {
			BlinkyConfig config{
				.name = "arty_blinky",
				.board = digilentArty(),
				.toggles = {
					{ .led = ledPad(0), .toggle = { .frequency = hlim::ClockRational(3) } },
				},
				.resetLed = ledPad(1),
			};
			// Chaser runs over all red channels, then all green, then all blue.
			for (const char *color : { "r", "g", "b" })
				for (size_t i = 0; i < 4; i++)
					config.chaser.push_back({ .resource = "rgb_led", .index = i, .subsignal = color });
			return config;
		}

		if (name == "de0nano_blinky") {
			BlinkyConfig config{
				.name = "de0nano_blinky",
				.board = terasicDe0Nano(),
				.toggles = {
					{ .led = ledPad(0), .toggle = { .frequency = hlim::ClockRational(3) } },
				},
				.resetLed = ledPad(1),
			};
			for (size_t i = 2; i < 8; i++)
				config.chaser.push_back(ledPad(i));
			return config;
		}

		if (name == "arty_audio") {
			ClockConfig i2sClock;
			i2sClock.name = "i2s";
			i2sClock.absoluteFrequency = hlim::ClockRational(12'288'000);

			return {
				.name = "arty_audio",
				.board = digilentArty(),
				.plls = { i2sClock },
				.toggles = {
					{ .led = ledPad(0), .toggle = { .frequency = hlim::ClockRational(3) } },
					{ .led = ledPad(1), .clock = "i2s", .toggle = { .frequency = hlim::ClockRational(5) } },
				},
				.resetLed = ledPad(2),
				.i2s = I2sConfig{},
			};
		}

		BLK_CONFIGCHECK_HINT(false, "Unknown design preset '" + std::string(name) + "'. Known presets are arty_blinky, de0nano_blinky and arty_audio.");
		return {};
	}

	std::vector<std::string_view> blinkyPresetNames()
	{
		return { "arty_blinky", "de0nano_blinky", "arty_audio" };
	}

	Blinky::Blinky(BlinkyConfig config, SequencerFactory sequencerFactory) :
		m_config(std::move(config)),
		m_board(m_config.board),
		m_crg(m_board)
	{
		for (auto &pll : m_config.plls)
			m_crg.addPll(pll);

		for (auto &channel : m_config.toggles) {
			hlim::Clock &clock = m_crg.clock(channel.clock);
			OutputPin &led = requestOutput(channel.led);

			auto &t = m_toggles.emplace_back();
			t.toggle = std::make_unique<PeriodicToggle>(clock.absoluteFrequency(), channel.toggle);
			t.clock = &clock;
			t.led = &led;

			const PeriodicToggle *toggle = t.toggle.get();
			led.driveWith([toggle]() { return toggle->output(); });
		}

		if (m_config.resetLed) {
			m_resetLed = &requestOutput(*m_config.resetLed);
			const ClockResetGenerator *crg = &m_crg;
			m_resetLed->driveWith([crg]() { return crg->reset(); });
		}

		if (sequencerFactory && m_config.chaser.empty()) {
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN
					<< "The design " << m_config.name << " has no chaser pads, the sequencer is not used");
		} else if (sequencerFactory) {
			std::vector<OutputPin*> pads;
			for (auto &pad : m_config.chaser)
				pads.push_back(&requestOutput(pad));

			m_sequencer = std::make_unique<SequencerDriver>(sequencerFactory(pads.size(), m_crg.sys().absoluteFrequency()), pads);
		} else if (!m_config.chaser.empty()) {
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_DESIGN
					<< "The design " << m_config.name << " has " << m_config.chaser.size() << " chaser pads but no sequencer, they stay dark");
		}

		if (m_config.i2s) {
			m_i2sClock = &m_crg.clock(m_config.i2s->clock);
			m_i2s = std::make_unique<I2sTransmitter>(m_config.i2s->testPattern);
			m_i2s->drive(
				m_board.requestOutput(m_config.i2s->resource, 0, "clk"),
				m_board.requestOutput(m_config.i2s->resource, 0, "sync"),
				m_board.requestOutput(m_config.i2s->resource, 0, "tx")
			);
		}
	}

	void Blinky::addToSimulator(sim::Simulator &simulator)
	{
		for (auto *clock : m_crg.clocks())
			simulator.addClock(*clock);

		for (auto &t : m_toggles)
			simulator.addComponent(*t.toggle, *t.clock);

		if (m_sequencer)
			simulator.addComponent(*m_sequencer, m_crg.sys());

		if (m_i2s)
			simulator.addComponent(*m_i2s, *m_i2sClock);
	}

	void Blinky::addToWaveform(sim::VCDSink &sink)
	{
		recordPins(sink, m_board);

		for (size_t i = 0; i < m_toggles.size(); i++) {
			const PeriodicToggle *toggle = m_toggles[i].toggle.get();
			sink.addBus("toggles", "toggle" + std::to_string(i) + "_counter", toggle->counterWidth(), [toggle]() { return toggle->counter(); });
		}
	}

	OutputPin &Blinky::requestOutput(const PadRef &pad)
	{
		return m_board.requestOutput(pad.resource, pad.index, pad.subsignal);
	}

}
