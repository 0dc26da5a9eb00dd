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

#include "amplink/cpp/common.h"
#include "amplink/version.h"

#define EXPERT_LOG(pri, ...)   \
  if (logger())                \
  logger()->Log(pri, "AmpLink Expert: " __VA_ARGS__)

#define EXPERT_LOG_ERR(...) EXPERT_LOG(ETCPAL_LOG_ERR, __VA_ARGS__)
#define EXPERT_LOG_INFO(...) EXPERT_LOG(ETCPAL_LOG_INFO, __VA_ARGS__)

namespace amplink
{
namespace expert
{
Controller::Controller(std::unique_ptr<CommandTransport> transport) : transport_(std::move(transport))
{
}

// Devices hold references to members of this class.
Controller::~Controller()
{
  Shutdown();
  registry().Clear();
}

/// @brief Start listening for status broadcasts.
/// @param settings Ports and command behavior; see Settings.
/// @param logger (optional) Logger for the controller and its devices.
/// @param listener (optional) Replaces the default UDP listener.
/// @return etcpal::Error::Ok(): Listening started, or was already started.
/// @return kEtcPalErrInvalid: The settings are invalid.
/// @return kEtcPalErrNotInit: amplink::Init() has not been called.
/// @return Errors from binding the status port.
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
  if (!transport_)
    transport_ = CreateUdpCommandTransport(logger);

  etcpal::Error res = StartListening(settings_.listen_port, logger, std::move(listener));
  if (!res)
    return res;

  started_ = true;
  EXPERT_LOG_INFO("Controller started (version %s): status port %u, command port %u, %u transmission(s) per command.",
                  AMPLINK_VERSION_STRING, settings_.listen_port, settings_.command_port, settings_.transmit_count);
  return res;
}

/// @brief Stop listening. Devices already discovered remain valid and controllable.
void Controller::Shutdown()
{
  if (started_)
  {
    StopListening();
    started_ = false;
    EXPERT_LOG_INFO("Controller stopped.");
  }
}

std::unique_ptr<Device> Controller::CreateDevice(const Status& status)
{
  return std::make_unique<Device>(status, *transport_, settings_, logger());
}

};  // namespace expert
};  // namespace amplink
