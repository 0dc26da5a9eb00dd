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

#include "minidsp_prot.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <nlohmann/json.hpp>
#include "etcpal/pack.h"
#include "amplink/core/util.h"

namespace amplink
{
namespace minidsp
{
static const char kPresetNamePrefix[] = "Preset ";

etcpal::Expected<DiscoveryPacket> ParseDiscoveryPacket(const uint8_t* data, size_t size)
{
  if (!data || size < AMPLINK_MINIDSP_DISCOVERY_MIN_SIZE)
    return kEtcPalErrBufSize;

  size_t name_len = data[kDiscoveryNameLenOffset];
  if (size < kDiscoveryNameOffset + name_len)
    return kEtcPalErrBufSize;

  auto name = DecodeTextField(&data[kDiscoveryNameOffset], name_len);
  if (!name)
    return name.error_code();

  DiscoveryPacket packet;
  packet.name = *name;
  packet.mac_address = etcpal::MacAddr(&data[kDiscoveryMacOffset]);
  packet.ip_address = etcpal::IpAddr(etcpal_unpack_u32b(&data[kDiscoveryIpOffset]));
  packet.hwid = data[kDiscoveryHwidOffset];
  packet.firmware_major = data[kDiscoveryFirmwareMajorOffset];
  packet.firmware_minor = data[kDiscoveryFirmwareMinorOffset];
  packet.dsp_id = data[kDiscoveryDspIdOffset];
  packet.serial = etcpal_unpack_u16b(&data[kDiscoverySerialOffset]);
  return packet;
}

std::string DiscoveryPacket::ToString() const
{
  char buf[96];
  snprintf(buf, sizeof(buf), "hwid=%u dsp_id=%u serial=%u firmware=%u.%u", hwid, dsp_id, serial, firmware_major,
           firmware_minor);
  return "DiscoveryPacket(name=\"" + name + "\" mac=" + mac_address.ToString() + " ip=" + ip_address.ToString() + " " +
         buf + ")";
}

// Fields with an unexpected JSON type are treated as absent.
etcpal::Expected<MasterStatus> ParseStatusMessage(const std::string& message)
{
  nlohmann::json root = nlohmann::json::parse(message, nullptr, false);
  if (root.is_discarded() || !root.is_object())
    return kEtcPalErrProtErr;

  auto master = root.find("master");
  if (master == root.end() || !master->is_object())
    return kEtcPalErrNotFound;

  MasterStatus status;

  auto source = master->find("source");
  if (source != master->end() && source->is_string())
    status.source = source->get<std::string>();

  auto mute = master->find("mute");
  if (mute != master->end() && mute->is_boolean())
    status.mute = mute->get<bool>();

  auto volume = master->find("volume");
  if (volume != master->end() && volume->is_number())
    status.volume = volume->get<double>();

  auto preset = master->find("preset");
  if (preset != master->end() && preset->is_number_integer())
  {
    // Values outside the range of int are absent, not narrowed.
    if (preset->is_number_unsigned())
    {
      auto value = preset->get<uint64_t>();
      if (value <= static_cast<uint64_t>(std::numeric_limits<int>::max()))
        status.preset = static_cast<int>(value);
    }
    else
    {
      auto value = preset->get<int64_t>();
      if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())
        status.preset = static_cast<int>(value);
    }
  }

  return status;
}

std::string BuildConfigRequest(const MasterStatus& change)
{
  nlohmann::json master_status = nlohmann::json::object();
  if (change.source)
    master_status["source"] = *change.source;
  if (change.mute)
    master_status["mute"] = *change.mute;
  if (change.volume)
    master_status["volume"] = *change.volume;
  if (change.preset)
    master_status["preset"] = *change.preset;

  nlohmann::json body;
  body["master_status"] = master_status;
  return body.dump();
}

const std::vector<std::string>& SourceNames()
{
  static const std::vector<std::string> kSourceNames = {"Analog", "Toslink"};
  return kSourceNames;
}

std::string PresetName(int preset)
{
  return kPresetNamePrefix + std::to_string(preset + 1);
}

etcpal::Expected<int> ParsePresetName(const std::string& name)
{
  const size_t prefix_len = sizeof(kPresetNamePrefix) - 1;
  if (name.size() <= prefix_len || name.compare(0, prefix_len, kPresetNamePrefix) != 0)
    return kEtcPalErrInvalid;

  const char* number = name.c_str() + prefix_len;
  if (!std::isdigit(static_cast<unsigned char>(*number)))
    return kEtcPalErrInvalid;

  char* end = nullptr;
  long        value = std::strtol(number, &end, 10);
  if (end == number || *end != '\0' || value < 1 || value > AMPLINK_MINIDSP_NUM_PRESETS)
    return kEtcPalErrInvalid;

  return static_cast<int>(value - 1);
}

};  // namespace minidsp
};  // namespace amplink
