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

#include "amplink/cpp/minidsp.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#define DEVICE_LOG(pri, ...) \
  if (log_)                  \
  log_->Log(pri, "AmpLink miniDSP: " __VA_ARGS__)

#define DEVICE_LOG_WARNING(...) DEVICE_LOG(ETCPAL_LOG_WARNING, __VA_ARGS__)
#define DEVICE_LOG_INFO(...) DEVICE_LOG(ETCPAL_LOG_INFO, __VA_ARGS__)
#define DEVICE_LOG_DEBUG(...) DEVICE_LOG(ETCPAL_LOG_DEBUG, __VA_ARGS__)

namespace amplink
{
namespace minidsp
{
static constexpr double kVolumeRangeDb = AMPLINK_MINIDSP_MAX_VOLUME_DB - AMPLINK_MINIDSP_MIN_VOLUME_DB;

Device::Device(const DiscoveryPacket&             packet,
               ConfigClient&                      config_client,
               std::unique_ptr<LiveUpdateChannel> live_channel,
               const Settings&                    settings,
               etcpal::Logger*                    logger)
    : name_(packet.name)
    , discovery_info_(packet)
    , port_(settings.http_port)
    , config_client_(config_client)
    , log_(logger)
    , live_channel_(std::move(live_channel))
{
}

Device::~Device()
{
  Close();
}

// Discovery broadcasts carry no state, so a repeat broadcast never changes anything.
bool Device::Merge(const DiscoveryPacket& packet)
{
  ETCPAL_UNUSED_ARG(packet);
  return false;
}

/*
 * Apply a status change received from the device. Fields absent from the change are left alone.
 * Volumes are clamped to the legal range. Unknown sources and out-of-range presets are ignored.
 * Returns whether any recorded field changed.
 */
bool Device::ApplyStatus(const MasterStatus& status)
{
  etcpal::MutexGuard guard(lock_);

  bool changed = false;
  if (status.source)
  {
    const auto& sources = SourceNames();
    if (std::find(sources.begin(), sources.end(), *status.source) == sources.end())
    {
      DEVICE_LOG_DEBUG("Ignoring unknown source \"%s\" reported by \"%s\".", status.source->c_str(), name_.c_str());
    }
    else if (status.source != source_)
    {
      source_ = status.source;
      changed = true;
    }
  }
  if (status.mute && *status.mute != muted_)
  {
    muted_ = *status.mute;
    changed = true;
  }
  if (status.volume)
  {
    double db = std::max(AMPLINK_MINIDSP_MIN_VOLUME_DB, std::min(*status.volume, AMPLINK_MINIDSP_MAX_VOLUME_DB));
    if (db != *status.volume)
      DEVICE_LOG_DEBUG("Clamped volume %.1fdB reported by \"%s\" to %.1fdB.", *status.volume, name_.c_str(), db);
    if (db != volume_db_)
    {
      volume_db_ = db;
      changed = true;
    }
  }
  if (status.preset)
  {
    if (*status.preset < 0 || *status.preset >= AMPLINK_MINIDSP_NUM_PRESETS)
    {
      DEVICE_LOG_DEBUG("Ignoring out-of-range preset %d reported by \"%s\".", *status.preset, name_.c_str());
    }
    else if (*status.preset != preset_)
    {
      preset_ = *status.preset;
      changed = true;
    }
  }
  return changed;
}

/// Set the function called after each status change is applied. Must be set before StartLiveUpdates().
void Device::SetUpdateCallback(UpdateCallback callback)
{
  update_callback_ = std::move(callback);
}

/// @brief Open the device's status stream.
/// @return kEtcPalErrInvalid: The device was created without a live update channel.
/// @return Errors from LiveUpdateChannel::Open().
etcpal::Error Device::StartLiveUpdates()
{
  if (!live_channel_)
    return kEtcPalErrInvalid;

  DEVICE_LOG_INFO("Opening status stream for \"%s\" at %s:%u.", name_.c_str(), ip_address().ToString().c_str(), port_);
  return live_channel_->Open(etcpal::SockAddr(ip_address(), port_), *this);
}

/// Close the status stream, if open. Safe to call more than once.
void Device::Close()
{
  if (live_channel_)
    live_channel_->Close();
}

bool Device::live_updates_open() const
{
  return (live_channel_ && live_channel_->is_open());
}

bool Device::muted() const
{
  etcpal::MutexGuard guard(lock_);
  return muted_;
}

double Device::volume_db() const
{
  etcpal::MutexGuard guard(lock_);
  return volume_db_;
}

std::optional<std::string> Device::source() const
{
  etcpal::MutexGuard guard(lock_);
  return source_;
}

int Device::preset() const
{
  etcpal::MutexGuard guard(lock_);
  return preset_;
}

const std::vector<std::string>& Device::GetSources() const
{
  return SourceNames();
}

std::optional<std::string> Device::GetSource() const
{
  return source();
}

float Device::VolumeAsFloat() const
{
  return static_cast<float>((volume_db() - AMPLINK_MINIDSP_MIN_VOLUME_DB) / kVolumeRangeDb);
}

std::string Device::ToString() const
{
  bool                       muted;
  double                     volume_db;
  std::optional<std::string> source;
  int                        preset;
  {
    etcpal::MutexGuard guard(lock_);
    muted = muted_;
    volume_db = volume_db_;
    source = source_;
    preset = preset_;
  }

  char buf[96];
  snprintf(buf, sizeof(buf), "Volume: %.1fdB (%.2f) Muted: %s Source: ", volume_db,
           (volume_db - AMPLINK_MINIDSP_MIN_VOLUME_DB) / kVolumeRangeDb, muted ? "yes" : "no");
  return "miniDSP \"" + name_ + "\" at " + ip_address().ToString() + ":" + std::to_string(port_) + ". " + buf +
         (source ? *source : "None") + " Preset: " + PresetName(preset);
}

etcpal::Error Device::SetMute(bool mute)
{
  MasterStatus change;
  change.mute = mute;
  return PostChange(change, mute ? "mute" : "unmute");
}

/// Set the level in decibels, clamped to -127.5..0.
etcpal::Error Device::SetVolumeDb(double db)
{
  if (std::isnan(db))
    return kEtcPalErrInvalid;

  db = std::max(AMPLINK_MINIDSP_MIN_VOLUME_DB, std::min(db, AMPLINK_MINIDSP_MAX_VOLUME_DB));

  MasterStatus change;
  change.volume = db;
  etcpal::Error res = PostChange(change, "volume");
  if (res)
  {
    etcpal::MutexGuard guard(lock_);
    volume_db_ = db;
  }
  return res;
}

/// Set the level as a fraction of the full range, in half-decibel steps.
etcpal::Error Device::SetVolumeFloat(float volume)
{
  if (std::isnan(volume))
    return kEtcPalErrInvalid;

  volume = std::max(0.0f, std::min(volume, 1.0f));
  double db = std::round(volume * kVolumeRangeDb * 2.0) / 2.0 + AMPLINK_MINIDSP_MIN_VOLUME_DB;
  return SetVolumeDb(db);
}

etcpal::Error Device::VolumeUp()
{
  return SetVolumeDb(volume_db() + AMPLINK_MINIDSP_VOLUME_STEP_DB);
}

etcpal::Error Device::VolumeDown()
{
  return SetVolumeDb(volume_db() - AMPLINK_MINIDSP_VOLUME_STEP_DB);
}

etcpal::Error Device::SelectSource(const std::string& source_name)
{
  const auto& sources = SourceNames();
  if (std::find(sources.begin(), sources.end(), source_name) == sources.end())
  {
    DEVICE_LOG_WARNING("\"%s\" has no input named \"%s\".", name_.c_str(), source_name.c_str());
    return kEtcPalErrInvalid;
  }

  MasterStatus change;
  change.source = source_name;
  etcpal::Error res = PostChange(change, "source");
  if (res)
  {
    etcpal::MutexGuard guard(lock_);
    source_ = source_name;
  }
  return res;
}

/// Select a preset by zero-based index.
etcpal::Error Device::SelectPreset(int preset)
{
  if (preset < 0 || preset >= AMPLINK_MINIDSP_NUM_PRESETS)
    return kEtcPalErrInvalid;

  MasterStatus change;
  change.preset = preset;
  etcpal::Error res = PostChange(change, "preset");
  if (res)
  {
    etcpal::MutexGuard guard(lock_);
    preset_ = preset;
  }
  return res;
}

void Device::HandleLiveMessage(const std::string& message)
{
  auto status = ParseStatusMessage(message);
  if (!status)
  {
    DEVICE_LOG_DEBUG("Ignoring status message from \"%s\" (%s): %s", name_.c_str(),
                     etcpal_strerror(status.error_code()), message.c_str());
    return;
  }

  bool changed = ApplyStatus(*status);
  if (update_callback_)
    update_callback_(*this, changed);
}

void Device::HandleLiveChannelClosed(const etcpal::Error& reason)
{
  DEVICE_LOG_INFO("Status stream for \"%s\" closed: %s", name_.c_str(), reason.ToCString());
}

etcpal::Error Device::PostChange(const MasterStatus& change, const char* description)
{
  const etcpal::SockAddr device_addr(ip_address(), port_);
  const std::string      body = BuildConfigRequest(change);

  etcpal::Error res = config_client_.PostConfig(device_addr, body);
  if (res)
  {
    DEVICE_LOG_DEBUG("Sent %s change to \"%s\": %s", description, name_.c_str(), body.c_str());
  }
  else
  {
    DEVICE_LOG_WARNING("Failed to send %s change to \"%s\": %s", description, name_.c_str(), res.ToCString());
  }
  return res;
}

};  // namespace minidsp
};  // namespace amplink
