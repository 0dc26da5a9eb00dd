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

#include "expert_prot.h"

#include <cmath>
#include "etcpal/pack.h"
#include "amplink/core/util.h"

namespace amplink
{
namespace expert
{
uint16_t Crc16(const uint8_t* data, size_t size)
{
  uint16_t crc = 0xffff;
  for (size_t i = 0; i < size; ++i)
  {
    crc ^= static_cast<uint16_t>(data[i] << 8);
    for (int bit = 0; bit < 8; ++bit)
    {
      if (crc & 0x8000)
        crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else
        crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

static unsigned int CeilLog2(unsigned int value)
{
  unsigned int result = 0;
  while ((1u << result) < value)
    ++result;
  return result;
}

/*
 * Encode the magnitude of a level in the amplifier's half-decibel code. The first half-decibel
 * step is 0x3f00; step k (counting from 1) adds 256 >> ceil(log2(k)). The result equals the upper
 * 16 bits of the IEEE-754 single-precision representation of |db|.
 *
 * Levels are rounded to the nearest half decibel.
 */
uint16_t DbToCode(double db)
{
  long steps = std::lround(std::fabs(db) * 2.0);
  if (steps <= 0)
    return 0;

  // Steps past 256 add nothing.
  if (steps > 256)
    steps = 256;

  uint16_t code = 0x3f00;
  for (unsigned int k = 2; k <= static_cast<unsigned int>(steps); ++k)
    code = static_cast<uint16_t>(code + (256u >> CeilLog2(k)));
  return code;
}

uint16_t VolumeCode(double db)
{
  uint16_t code = DbToCode(db);
  if (db < 0 && code != 0)
    code |= kVolumeCodeSignBit;
  return code;
}

Command PowerCommand(bool on)
{
  Command command;
  command.flag = (on ? 1 : 0);
  command.opcode = Opcode::kPower;
  return command;
}

Command MuteCommand(bool mute)
{
  Command command;
  command.flag = (mute ? 1 : 0);
  command.opcode = Opcode::kMute;
  return command;
}

Command VolumeCommand(double db)
{
  Command command;
  command.opcode = Opcode::kVolume;
  etcpal_pack_u16b(command.payload.data(), VolumeCode(db));
  return command;
}

Command SourceCommand(unsigned int index)
{
  uint16_t value = static_cast<uint16_t>(0x4000 | (index << 5));

  Command command;
  command.opcode = Opcode::kSource;
  command.payload[0] = static_cast<uint8_t>(value >> 8);
  // The amplifier expects the low byte shifted down one more bit for inputs above 7.
  command.payload[1] = static_cast<uint8_t>(index > 7 ? ((value & 0xff) >> 1) : (value & 0xff));
  return command;
}

CommandBuffer PackCommand(const Command& command, uint16_t packet_counter, uint16_t command_counter)
{
  CommandBuffer buf{};
  buf[0] = kCommandMarker[0];
  buf[1] = kCommandMarker[1];
  etcpal_pack_u16b(&buf[kCommandPacketCounterOffset], packet_counter);
  etcpal_pack_u16b(&buf[kCommandCommandCounterOffset], command_counter);
  buf[kCommandFlagOffset] = command.flag;
  buf[kCommandOpcodeOffset] = static_cast<uint8_t>(command.opcode);
  buf[kCommandPayloadOffset] = command.payload[0];
  buf[kCommandPayloadOffset + 1] = command.payload[1];
  etcpal_pack_u16b(&buf[kCommandCrcOffset], Crc16(buf.data(), kCommandCrcCoverage));
  return buf;
}

etcpal::Expected<Status> ParseStatus(const uint8_t* data, size_t size, const etcpal::IpAddr& sender)
{
  if (!data || size < AMPLINK_EXPERT_STATUS_MIN_SIZE)
    return kEtcPalErrBufSize;

  Status status;
  status.ip_address = sender;

  auto name = DecodeTextField(&data[kStatusNameOffset], kStatusNameSize);
  if (!name)
    return name.error_code();
  status.name = *name;

  status.source_index = (data[kStatusInputOffset] & kStatusSourceIndexMask) >> kStatusSourceIndexShift;
  if (status.source_index >= AMPLINK_EXPERT_NUM_SOURCES)
    return kEtcPalErrProtErr;

  status.sources.reserve(AMPLINK_EXPERT_NUM_SOURCES);
  for (unsigned int i = 0; i < AMPLINK_EXPERT_NUM_SOURCES; ++i)
  {
    const uint8_t* slot = &data[kStatusSourcesOffset + i * kStatusSourceStride];

    auto source_name = DecodeTextField(&slot[1], kStatusSourceNameSize);
    if (!source_name)
      return source_name.error_code();

    Source source;
    source.index = i;
    source.name = *source_name;
    // The flag is an ASCII digit; anything other than '0' is treated as enabled.
    source.enabled = (slot[0] != '0');
    source.selected = (i == status.source_index);
    status.sources.push_back(source);
  }

  status.power = (data[kStatusPowerOffset] & kStatusPowerMask) != 0;
  status.muted = (data[kStatusInputOffset] & kStatusMutedMask) != 0;
  status.volume = data[kStatusVolumeOffset];
  return status;
}

};  // namespace expert
};  // namespace amplink
