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

#include "amplink/cpp/expert.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include "expert_prot.h"

namespace amplink
{
namespace expert
{
Device::Device(const Status& status, CommandTransport& transport, const Settings& settings, etcpal::Logger* logger)
    : name_(status.name), transport_(transport), settings_(settings), log_(logger), state_(status)
{
}

/*
 * Apply a newer status broadcast to the recorded state. A status for a different device is
 * ignored. The input list is always replaced so that its selection flags match the new status.
 * Returns whether any of the address, power, mute, volume or selected input changed.
 */
bool Device::Merge(const Status& status)
{
  if (status.name != name_)
    return false;

  etcpal::MutexGuard guard(lock_);

  bool changed = false;
  if (status.ip_address != state_.ip_address)
  {
    state_.ip_address = status.ip_address;
    changed = true;
  }
  if (status.source_index != state_.source_index)
  {
    state_.source_index = status.source_index;
    changed = true;
  }
  if (status.power != state_.power)
  {
    state_.power = status.power;
    changed = true;
  }
  if (status.muted != state_.muted)
  {
    state_.muted = status.muted;
    changed = true;
  }
  if (status.volume != state_.volume)
  {
    state_.volume = status.volume;
    changed = true;
  }

  state_.sources = status.sources;
  return changed;
}

Status Device::status() const
{
  etcpal::MutexGuard guard(lock_);
  return state_;
}

etcpal::IpAddr Device::ip_address() const
{
  etcpal::MutexGuard guard(lock_);
  return state_.ip_address;
}

bool Device::power() const
{
  etcpal::MutexGuard guard(lock_);
  return state_.power;
}

bool Device::muted() const
{
  etcpal::MutexGuard guard(lock_);
  return state_.muted;
}

uint8_t Device::volume() const
{
  etcpal::MutexGuard guard(lock_);
  return state_.volume;
}

unsigned int Device::source_index() const
{
  etcpal::MutexGuard guard(lock_);
  return state_.source_index;
}

std::vector<Source> Device::sources() const
{
  etcpal::MutexGuard guard(lock_);
  return state_.sources;
}

uint16_t Device::packet_counter() const
{
  etcpal::MutexGuard guard(counter_lock_);
  return packet_counter_;
}

uint16_t Device::command_counter() const
{
  etcpal::MutexGuard guard(counter_lock_);
  return command_counter_;
}

/// Get the names of the enabled inputs, in input order.
std::vector<std::string> Device::GetSources() const
{
  etcpal::MutexGuard       guard(lock_);
  std::vector<std::string> names;
  for (const auto& source : state_.sources)
  {
    if (source.enabled)
      names.push_back(source.name);
  }
  return names;
}

/// Get the name of the selected input.
std::string Device::GetSource() const
{
  etcpal::MutexGuard guard(lock_);
  if (state_.source_index < state_.sources.size())
    return state_.sources[state_.source_index].name;
  return std::string();
}

double Device::VolumeAsDb() const
{
  return VolumeToDb(volume());
}

float Device::VolumeAsFloat() const
{
  return static_cast<float>(volume()) / AMPLINK_EXPERT_VOLUME_INT_MAX;
}

std::string Device::ToString() const
{
  Status current = status();

  std::string source_name;
  if (current.source_index < current.sources.size())
    source_name = current.sources[current.source_index].name;

  char buf[128];
  snprintf(buf, sizeof(buf), "Volume: %u (%.1fdB, %.2f) Power: %s Muted: %s Source: ",
           static_cast<unsigned int>(current.volume),
           VolumeToDb(current.volume), static_cast<float>(current.volume) / AMPLINK_EXPERT_VOLUME_INT_MAX,
           current.power ? "on" : "off", current.muted ? "yes" : "no");
  return "Expert \"" + name_ + "\" at " + current.ip_address.ToString() + ". " + buf + source_name;
}

etcpal::Error Device::TurnOn()
{
  return SetPower(true);
}

etcpal::Error Device::TurnOff()
{
  return SetPower(false);
}

etcpal::Error Device::TogglePower()
{
  return SetPower(!power());
}

etcpal::Error Device::SetPower(bool on)
{
  return SendCommand(PowerCommand(on), on ? "power on" : "power off");
}

etcpal::Error Device::SetMute(bool mute)
{
  return SendCommand(MuteCommand(mute), mute ? "mute" : "unmute");
}

/*
 * Set the level in decibels. The level is clamped to the configured maximum and quantized to
 * half a decibel. Nothing is sent if the result encodes the same as the recorded volume.
 */
etcpal::Error Device::SetVolumeDb(double db)
{
  if (std::isnan(db))
    return kEtcPalErrInvalid;

  db = std::max(AMPLINK_EXPERT_MIN_VOLUME_DB, std::min(db, settings_.max_volume_db));
  db = std::round(db * 2.0) / 2.0;

  if (VolumeCode(db) == VolumeCode(VolumeAsDb()))
  {
    if (log_)
      log_->Debug("AmpLink Expert \"%s\": Volume already at %.1fdB; not sending.", name_.c_str(), db);
    return kEtcPalErrOk;
  }

  char description[32];
  snprintf(description, sizeof(description), "volume %.1fdB", db);
  return SendCommand(VolumeCommand(db), description);
}

/// Set the volume on the native 0-255 scale. Values above 175 are clamped.
etcpal::Error Device::SetVolumeInt(int volume)
{
  volume = std::max(0, std::min(volume, AMPLINK_EXPERT_MAX_VOLUME_INT));
  return SetVolumeDb(VolumeToDb(volume));
}

/// Set the volume as a fraction of the native scale.
etcpal::Error Device::SetVolumeFloat(float volume)
{
  if (std::isnan(volume))
    return kEtcPalErrInvalid;

  volume = std::max(0.0f, std::min(volume, 1.0f));
  return SetVolumeInt(static_cast<int>(std::lround(volume * AMPLINK_EXPERT_VOLUME_INT_MAX)));
}

etcpal::Error Device::VolumeUp()
{
  return SetVolumeInt(volume() + 1);
}

etcpal::Error Device::VolumeDown()
{
  return SetVolumeInt(volume() - 1);
}

/// Select an input by name. Only enabled inputs can be selected.
etcpal::Error Device::SelectSource(const std::string& source_name)
{
  unsigned int index = 0;
  bool         found = false;
  {
    etcpal::MutexGuard guard(lock_);
    for (const auto& source : state_.sources)
    {
      if (source.enabled && source.name == source_name)
      {
        index = source.index;
        found = true;
        break;
      }
    }
  }

  if (!found)
  {
    if (log_)
      log_->Warning("AmpLink Expert \"%s\": No enabled input named \"%s\".", name_.c_str(), source_name.c_str());
    return kEtcPalErrInvalid;
  }

  return SendCommand(SourceCommand(index), "select input");
}

etcpal::Error Device::SendCommand(const Command& command, const char* description)
{
  const etcpal::SockAddr dest(ip_address(), settings_.command_port);

  etcpal::MutexGuard counter_guard(counter_lock_);

  std::vector<CommandFrame> frames;
  frames.reserve(settings_.transmit_count);
  for (unsigned int i = 0; i < settings_.transmit_count; ++i)
  {
    auto frame = PackCommand(command, packet_counter_++, command_counter_);
    frames.emplace_back(frame.begin(), frame.end());
  }
  ++command_counter_;

  etcpal::Error res = transport_.Send(dest, frames);
  if (!res)
  {
    if (log_)
      log_->Warning("AmpLink Expert \"%s\": Failed to send %s: %s", name_.c_str(), description, res.ToCString());
  }
  else if (log_)
  {
    log_->Debug("AmpLink Expert \"%s\": Sent %s to %s.", name_.c_str(), description, dest.ToString().c_str());
  }
  return res;
}

};  // namespace expert
};  // namespace amplink
