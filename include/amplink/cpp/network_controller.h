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

/// @file amplink/cpp/network_controller.h
/// @brief The discovery and dispatch skeleton shared by the amplifier families.

#ifndef AMPLINK_CPP_NETWORK_CONTROLLER_H_
#define AMPLINK_CPP_NETWORK_CONTROLLER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "etcpal/common.h"
#include "etcpal/cpp/error.h"
#include "etcpal/cpp/inet.h"
#include "etcpal/cpp/log.h"
#include "amplink/cpp/datagram_listener.h"
#include "amplink/cpp/device_registry.h"

namespace amplink
{
/// @brief Listens for one family's broadcasts and keeps a DeviceRegistry up to date.
///
/// The Family parameter provides, in addition to the requirements of DeviceRegistry:
/// - `static constexpr const char* kName`, used in log messages
/// - `static etcpal::Expected<Packet> ParsePacket(const uint8_t*, size_t, const etcpal::SockAddr&)`
///
/// Datagrams that fail to parse are logged at debug level and dropped.
template <class Family>
class NetworkController : public DatagramNotify
{
public:
  using Device = typename Family::Device;
  using Packet = typename Family::Packet;
  using NotifyHandler = typename DeviceRegistry<Family>::NotifyHandler;

  NetworkController() : registry_([this](const Packet& packet) { return CreateDevice(packet); }) {}
  virtual ~NetworkController() { StopListening(); }

  NetworkController(const NetworkController& other) = delete;
  NetworkController& operator=(const NetworkController& other) = delete;

  void AddNotifyHandler(NotifyHandler& handler) { registry_.AddNotifyHandler(handler); }
  void RemoveNotifyHandler(NotifyHandler& handler) { registry_.RemoveNotifyHandler(handler); }

  Device*              FindDevice(const std::string& name) const { return registry_.FindDevice(name); }
  std::vector<Device*> GetDevices() const { return registry_.GetDevices(); }

  bool listening() const { return listener_ && listener_->running(); }

  void HandleDatagram(const uint8_t* data, size_t size, const etcpal::SockAddr& from) override;

protected:
  etcpal::Error StartListening(uint16_t                                   port,
                               etcpal::Logger*                            logger,
                               std::unique_ptr<DatagramListenerInterface> listener);
  void          StopListening();

  /// Called on the listener thread, with the registry locked, for the first packet seen from a device.
  virtual std::unique_ptr<Device> CreateDevice(const Packet& packet) = 0;

  /// Called on the listener thread after handlers have been told about a new device.
  virtual void HandleDeviceAdded(Device& device) { ETCPAL_UNUSED_ARG(device); }

  DeviceRegistry<Family>& registry() { return registry_; }
  etcpal::Logger*         logger() const { return log_; }

private:
  DeviceRegistry<Family>                     registry_;
  std::unique_ptr<DatagramListenerInterface> listener_;
  etcpal::Logger*                            log_{nullptr};
};

template <class Family>
void NetworkController<Family>::HandleDatagram(const uint8_t* data, size_t size, const etcpal::SockAddr& from)
{
  auto packet = Family::ParsePacket(data, size, from);
  if (!packet)
  {
    if (log_ && log_->CanLog(ETCPAL_LOG_DEBUG))
    {
      log_->Debug("AmpLink %s: Dropping %zu-byte datagram from %s: %s", Family::kName, size, from.ToString().c_str(),
                  etcpal_strerror(packet.error_code()));
    }
    return;
  }

  if (registry_.HandlePacket(*packet))
  {
    if (log_)
      log_->Info("AmpLink %s: Discovered device \"%s\" (%s).", Family::kName, packet->name.c_str(),
                 from.ip().ToString().c_str());

    Device* device = registry_.FindDevice(packet->name);
    if (device)
      HandleDeviceAdded(*device);
  }
}

template <class Family>
etcpal::Error NetworkController<Family>::StartListening(uint16_t                                   port,
                                                        etcpal::Logger*                            logger,
                                                        std::unique_ptr<DatagramListenerInterface> listener)
{
  if (listening())
    return kEtcPalErrAlready;

  log_ = logger;
  listener_ = (listener ? std::move(listener) : CreateDatagramListener(logger));
  listener_->SetNotify(this);

  etcpal::Error res = listener_->Start(port);
  if (!res && log_)
    log_->Error("AmpLink %s: Could not listen on UDP port %u: %s", Family::kName, port, res.ToCString());
  return res;
}

template <class Family>
void NetworkController<Family>::StopListening()
{
  if (listener_)
    listener_->Stop();
}

};  // namespace amplink

#endif  // AMPLINK_CPP_NETWORK_CONTROLLER_H_
