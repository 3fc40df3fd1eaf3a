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

#include "PeriodicToggle.h"
#include "PatternSequencer.h"
#include "io/I2sTransmitter.h"

#include "../frontend/Board.h"
#include "../frontend/Clock.h"
#include "../frontend/ClockResetGenerator.h"
#include "../utils/ConfigTree.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blk::sim {
	class Simulator;
	class VCDSink;
}

namespace blk::scl {

	/// Reference to one pad of a board resource.
	struct PadRef
	{
		std::string resource;
		size_t index = 0;
		std::string subsignal;

		void loadConfig(const utils::ConfigTree &config);
	};

	/// A LED that blinks at a fixed frequency in one of the clock domains.
	struct ToggleChannel
	{
		PadRef led;
		std::string clock = "sys";
		PeriodicToggleConfig toggle;

		void loadConfig(const utils::ConfigTree &config);
	};

	struct I2sConfig
	{
		std::string clock = "i2s";
		std::string resource = "i2s_tx";
		bool testPattern = true;

		void loadConfig(const utils::ConfigTree &config);
	};

	/**
	 * @brief Everything a Blinky design is made of.
	 * @details Loading starts from the preset named by the `preset` key (if any) and then overrides `board`, `plls`,
	 * `toggles`, `reset_led`, `chaser`, and `i2s`. Lists replace the lists of the preset as a whole.
	 */
	struct BlinkyConfig
	{
		std::string name;
		BoardDesc board;
		std::vector<ClockConfig> plls;
		std::vector<ToggleChannel> toggles;
		std::optional<PadRef> resetLed;
		std::vector<PadRef> chaser;
		std::optional<I2sConfig> i2s;

		void loadConfig(const utils::ConfigTree &config);
	};

	/**
	 * @brief The designs of the tutorial.
	 * @details
	 * - arty_blinky: LED0 toggles at 3 Hz, LED1 shows the reset, the 12 RGB LED channels run a chaser.
	 * - de0nano_blinky: LED0 toggles at 3 Hz, LED1 shows the reset, LEDs 2 to 7 run a chaser.
	 * - arty_audio: LED0 toggles at 3 Hz, LED1 at 5 Hz from the 12.288 MHz i2s PLL, LED2 shows the reset, and an I2S test pattern is sent to the Pmod.
	 */
	BlinkyConfig blinkyPreset(std::string_view name);
	std::vector<std::string_view> blinkyPresetNames();

	/**
	 * @brief Builds a Blinky design on its board: clocks and reset, blinking LEDs, chaser, and audio output.
	 * @details The design owns the board and all components. Pins handed out by the board stay valid as long as the design lives.
	 */
	class Blinky
	{
		public:
			Blinky(BlinkyConfig config, SequencerFactory sequencerFactory = {});

			Blinky(const Blinky &) = delete;
			Blinky &operator=(const Blinky &) = delete;

			const BlinkyConfig &config() const { return m_config; }
			Board &board() { return m_board; }
			ClockResetGenerator &crg() { return m_crg; }

			size_t numToggles() const { return m_toggles.size(); }
			PeriodicToggle &toggle(size_t idx) { return *m_toggles.at(idx).toggle; }
			OutputPin &toggleLed(size_t idx) { return *m_toggles.at(idx).led; }
			hlim::Clock &toggleClock(size_t idx) { return *m_toggles.at(idx).clock; }

			OutputPin *resetLed() { return m_resetLed; }
			SequencerDriver *sequencer() { return m_sequencer.get(); }
			I2sTransmitter *i2s() { return m_i2s.get(); }

			/// Registers all clock domains and components with the simulator.
			void addToSimulator(sim::Simulator &simulator);
			/// Adds the board pins and the internal state of the toggles to a waveform.
			void addToWaveform(sim::VCDSink &sink);
		protected:
			struct Toggle {
				std::unique_ptr<PeriodicToggle> toggle;
				hlim::Clock *clock = nullptr;
				OutputPin *led = nullptr;
			};

			BlinkyConfig m_config;
			Board m_board;
			ClockResetGenerator m_crg;

			std::vector<Toggle> m_toggles;
			OutputPin *m_resetLed = nullptr;
			std::unique_ptr<SequencerDriver> m_sequencer;
			std::unique_ptr<I2sTransmitter> m_i2s;
			hlim::Clock *m_i2sClock = nullptr;

			OutputPin &requestOutput(const PadRef &pad);
	};

}
