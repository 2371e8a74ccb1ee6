/**
 * MIT License
 *
 * @brief Umbrella header for PpmTrainer.
 *
 * @file PpmTrainer.h
 * @author Little Man Builds (Darren Osborne)
 * @date 2025-11-14
 * @copyright © 2025 Little Man Builds
 */

#pragma once

// ---- Default includes ---- //
#include <Types.hpp>
#include <Constants.hpp>
#include <Config.hpp>
#include <SpecParser.hpp>
#include <Registry.hpp>
#include <Assembler.hpp>
#include <Waveform.hpp>
#include <Scheduler.hpp>

// ---- Hardware (Teensy 3.6/4.x) ---- //
#include <input/UsbJoystick_Teensy.hpp>
#include <output/PpmTimer_Teensy.hpp>
#include <output/StatusLeds.hpp>

// ---- Version macro ---- //
#define PPMTRAINER_VERSION "1.0.0"

using namespace ppm; ///< Make ppm:: types available without prefix.
