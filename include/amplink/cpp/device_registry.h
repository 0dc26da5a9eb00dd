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

/// @file amplink/cpp/device_registry.h
/// @brief A registry of discovered devices, keyed by device name.

#ifndef AMPLINK_CPP_DEVICE_REGISTRY_H_
#define AMPLINK_CPP_DEVICE_REGISTRY_H_

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "etcpal/common.h"
#include "etcpal/cpp/mutex.h"

namespace amplink
{
/// @brief Owns every device seen by one controller and tells observers about them.
///
/// The Family parameter supplies the Device type and the Packet type decoded from the wire. A
/// Device must provide `const std::string& name() const` and `bool Merge(const Packet&)`, which
/// applies the packet and returns whether any recorded state changed. A Packet must have a
/// `name` member.
///
/// Devices are created on first sighting of a name and live until the registry is destroyed or
/// cleared. Each handled packet results in exactly one notification: HandleNewDevice() for a new
/// name, HandleDeviceUpdated() otherwise. Notifications are delivered to handlers in the order
/// they were added, one event at a time and without the registry lock held, so handlers may call
/// back into the registry.
template <class Family>
class DeviceRegistry
{
public:
  using Device = typename Family::Device;
  using Packet = typename Family::Packet;
  using DeviceFactory = std::function<std::unique_ptr<Device>(const Packet&)>;

  /// @brief A class that receives notification callbacks from a DeviceRegistry.
  class NotifyHandler
  {
  public:
    virtual ~NotifyHandler() = default;

    /// @brief A device was seen for the first time.
    virtual void HandleNewDevice(Device& device) = 0;

    /// @brief A known device was seen again, or reported a change on its own.
    /// @param device The device.
    /// @param changed Whether any of the device's recorded state was modified.
    virtual void HandleDeviceUpdated(Device& device, bool changed)
    {
      ETCPAL_UNUSED_ARG(device);
      ETCPAL_UNUSED_ARG(changed);
    }
  };

  explicit DeviceRegistry(DeviceFactory factory) : factory_(std::move(factory)) {}

  DeviceRegistry(const DeviceRegistry& other) = delete;
  DeviceRegistry& operator=(const DeviceRegistry& other) = delete;

  void AddNotifyHandler(NotifyHandler& handler);
  void RemoveNotifyHandler(NotifyHandler& handler);

  bool HandlePacket(const Packet& packet);
  void NotifyDeviceUpdated(Device& device, bool changed);

  Device*              FindDevice(const std::string& name) const;
  std::vector<Device*> GetDevices() const;
  size_t               size() const;
  void                 Clear();

private:
  template <typename Func>
  void Dispatch(Func&& func);

  DeviceFactory factory_;

  mutable etcpal::Mutex                          lock_;
  std::map<std::string, std::unique_ptr<Device>> devices_;
  std::vector<Device*>                           discovery_order_;
  std::vector<NotifyHandler*>                    handlers_;

  // Held while handlers run so that events are delivered one at a time.
  etcpal::Mutex dispatch_lock_;
};

/// @brief Register a handler for device notifications. Adding the same handler twice has no effect.
template <class Family>
void DeviceRegistry<Family>::AddNotifyHandler(NotifyHandler& handler)
{
  etcpal::MutexGuard guard(lock_);
  if (std::find(handlers_.begin(), handlers_.end(), &handler) == handlers_.end())
    handlers_.push_back(&handler);
}

template <class Family>
void DeviceRegistry<Family>::RemoveNotifyHandler(NotifyHandler& handler)
{
  etcpal::MutexGuard guard(lock_);
  handlers_.erase(std::remove(handlers_.begin(), handlers_.end(), &handler), handlers_.end());
}

/// @brief Create or merge the device named by a decoded packet, then notify handlers.
/// @return true if a new device was created.
template <class Family>
bool DeviceRegistry<Family>::HandlePacket(const Packet& packet)
{
  Device* device = nullptr;
  bool    is_new = false;
  bool    changed = false;

  {
    etcpal::MutexGuard guard(lock_);
    auto               existing = devices_.find(packet.name);
    if (existing == devices_.end())
    {
      auto new_device = factory_(packet);
      if (!new_device)
        return false;
      device = new_device.get();
      devices_.emplace(packet.name, std::move(new_device));
      discovery_order_.push_back(device);
      is_new = true;
    }
    else
    {
      device = existing->second.get();
      changed = device->Merge(packet);
    }
  }

  if (is_new)
    Dispatch([device](NotifyHandler& handler) { handler.HandleNewDevice(*device); });
  else
    Dispatch([device, changed](NotifyHandler& handler) { handler.HandleDeviceUpdated(*device, changed); });
  return is_new;
}

/// @brief Report a change that a device learned about outside of the discovery path.
template <class Family>
void DeviceRegistry<Family>::NotifyDeviceUpdated(Device& device, bool changed)
{
  Dispatch([&device, changed](NotifyHandler& handler) { handler.HandleDeviceUpdated(device, changed); });
}

template <class Family>
typename DeviceRegistry<Family>::Device* DeviceRegistry<Family>::FindDevice(const std::string& name) const
{
  etcpal::MutexGuard guard(lock_);
  auto               device = devices_.find(name);
  return (device == devices_.end() ? nullptr : device->second.get());
}

/// @brief Get all known devices, in the order they were first seen.
template <class Family>
std::vector<typename DeviceRegistry<Family>::Device*> DeviceRegistry<Family>::GetDevices() const
{
  etcpal::MutexGuard guard(lock_);
  return discovery_order_;
}

template <class Family>
size_t DeviceRegistry<Family>::size() const
{
  etcpal::MutexGuard guard(lock_);
  return devices_.size();
}

/// @brief Destroy all devices. Any Device pointers obtained earlier become invalid.
template <class Family>
void DeviceRegistry<Family>::Clear()
{
  std::map<std::string, std::unique_ptr<Device>> to_destroy;
  {
    etcpal::MutexGuard guard(lock_);
    to_destroy.swap(devices_);
    discovery_order_.clear();
  }
}

template <class Family>
template <typename Func>
void DeviceRegistry<Family>::Dispatch(Func&& func)
{
  etcpal::MutexGuard dispatch_guard(dispatch_lock_);

  std::vector<NotifyHandler*> handlers;
  {
    etcpal::MutexGuard guard(lock_);
    handlers = handlers_;
  }

  for (NotifyHandler* handler : handlers)
    func(*handler);
}

};  // namespace amplink

#endif  // AMPLINK_CPP_DEVICE_REGISTRY_H_
