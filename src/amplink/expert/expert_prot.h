/******************************************************************************
 * Copyright 2026 ETC Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 ******************************************************************************
 * This file is a part of AmpLink.
 *****************************************************************************/

/// @file expert_prot.h
/// @brief Wire formats of the Expert status broadcast and command frame.

#ifndef AMPLINK_EXPERT_EXPERT_PROT_H_
#define AMPLINK_EXPERT_EXPERT_PROT_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include "amplink/defs.h"
#include "amplink/cpp/expert.h"

namespace amplink
{
namespace expert
{
// Status broadcast layout
constexpr size_t  kStatusNameOffset = 19;
constexpr size_t  kStatusNameSize = 31;
constexpr size_t  kStatusSourcesOffset = 52;
constexpr size_t  kStatusSourceStride = 17;
constexpr size_t  kStatusSourceNameSize = 16;
constexpr size_t  kStatusPowerOffset = 307;
constexpr uint8_t kStatusPowerMask = 0x80;
constexpr size_t  kStatusInputOffset = 308;
constexpr uint8_t kStatusSourceIndexMask = 0x3c;
constexpr int     kStatusSourceIndexShift = 2;
constexpr uint8_t kStatusMutedMask = 0x02;
constexpr size_t  kStatusVolumeOffset = 310;

// Command frame layout
constexpr uint8_t kCommandMarker[2] = {0x44, 0x72};
constexpr size_t  kCommandPacketCounterOffset = 2;
constexpr size_t  kCommandCommandCounterOffset = 4;
constexpr size_t  kCommandFlagOffset = 6;
constexpr size_t  kCommandOpcodeOffset = 7;
constexpr size_t  kCommandPayloadOffset = 8;
constexpr size_t  kCommandCrcOffset = 12;
// The CRC covers everything before it.
constexpr size_t kCommandCrcCoverage = kCommandCrcOffset;

constexpr uint16_t kVolumeCodeSignBit = 0x8000;

enum class Opcode : uint8_t
{
  kPower = 0x01,
  kVolume = 0x04,
  kSource = 0x05,
  kMute = 0x07
};

// A logical command, independent of the counters stamped into each transmission of it.
struct Command
{
  uint8_t                flag{0};
  Opcode                 opcode{Opcode::kPower};
  std::array<uint8_t, 2> payload{};
};

using CommandBuffer = std::array<uint8_t, AMPLINK_EXPERT_COMMAND_SIZE>;

// CRC-16/CCITT-FALSE: polynomial 0x1021, initial value 0xffff, no reflection, no final XOR.
uint16_t Crc16(const uint8_t* data, size_t size);

uint16_t DbToCode(double db);
uint16_t VolumeCode(double db);

Command PowerCommand(bool on);
Command MuteCommand(bool mute);
Command VolumeCommand(double db);
Command SourceCommand(unsigned int index);

CommandBuffer PackCommand(const Command& command, uint16_t packet_counter, uint16_t command_counter);

};  // namespace expert
};  // namespace amplink

#endif  // AMPLINK_EXPERT_EXPERT_PROT_H_
