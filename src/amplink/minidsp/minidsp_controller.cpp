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

#include "amplink/cpp/common.h"
#include "amplink/version.h"

#define MINIDSP_LOG(pri, ...) \
  if (logger())               \
  logger()->Log(pri, "AmpLink miniDSP: " __VA_ARGS__)

#define MINIDSP_LOG_WARNING(...) MINIDSP_LOG(ETCPAL_LOG_WARNING, __VA_ARGS__)
#define MINIDSP_LOG_INFO(...) MINIDSP_LOG(ETCPAL_LOG_INFO, __VA_ARGS__)

namespace amplink
{
namespace minidsp
{
Controller::Controller(std::unique_ptr<ConfigClient> config_client, LiveUpdateChannelFactory channel_factory)
    : config_client_(std::move(config_client)), channel_factory_(std::move(channel_factory))
{
}

// Devices hold references to members of this class.
Controller::~Controller()
{
  Shutdown();
  registry().Clear();
}

/// @brief Start listening for discovery broadcasts.
/// @param settings Ports and stream behavior; see Settings.
/// @param logger (optional) Logger for the controller, its devices and their connections.
/// @param listener (optional) Replaces the default UDP listener.
/// @return etcpal::Error::Ok(): Listening started, or was already started.
/// @return kEtcPalErrInvalid: The settings are invalid.
/// @return kEtcPalErrNotInit: amplink::Init() has not been called.
/// @return Errors from binding the discovery port.
etcpal::Error Controller::Startup(const Settings&                            settings,
                                  etcpal::Logger*                            logger,
                                  std::unique_ptr<DatagramListenerInterface> listener)
{
  if (started_)
  {
    if (listening())
      return kEtcPalErrOk;
    // The listener stopped itself after a socket failure.
    StopListening();
    started_ = false;
  }

  if (!settings.IsValid())
    return kEtcPalErrInvalid;

  if (!Initialized())
    return kEtcPalErrNotInit;

  settings_ = settings;
  if (!config_client_)
    config_client_ = CreateHttpConfigClient(logger);
  if (!channel_factory_)
    channel_factory_ = [logger]() { return CreateWebSocketLiveUpdateChannel(logger); };

  etcpal::Error res = StartListening(settings_.listen_port, logger, std::move(listener));
  if (!res)
    return res;

  started_ = true;
  MINIDSP_LOG_INFO("Controller started (version %s): discovery port %u, service port %u.", AMPLINK_VERSION_STRING,
                   settings_.listen_port, settings_.http_port);
  return res;
}

/// @brief Stop listening and close the status stream of every device.
///
/// Devices already discovered remain valid and can still be controlled.
void Controller::Shutdown()
{
  if (started_)
  {
    StopListening();
    for (Device* device : GetDevices())
      device->Close();
    started_ = false;
    MINIDSP_LOG_INFO("Controller stopped.");
  }
}

std::unique_ptr<Device> Controller::CreateDevice(const DiscoveryPacket& packet)
{
  auto device = std::make_unique<Device>(packet, *config_client_, channel_factory_(), settings_, logger());
  device->SetUpdateCallback([this](Device& updated, bool changed) { registry().NotifyDeviceUpdated(updated, changed); });
  return device;
}

void Controller::HandleDeviceAdded(Device& device)
{
  if (!settings_.start_live_updates)
    return;

  etcpal::Error res = device.StartLiveUpdates();
  if (!res)
    MINIDSP_LOG_WARNING("Could not open status stream for \"%s\": %s", device.name().c_str(), res.ToCString());
}

};  // namespace minidsp
};  // namespace amplink
