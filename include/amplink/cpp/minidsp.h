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

/// @file amplink/cpp/minidsp.h
/// @brief Discovery and control of miniDSP devices.

#ifndef AMPLINK_CPP_MINIDSP_H_
#define AMPLINK_CPP_MINIDSP_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "etcpal/cpp/error.h"
#include "etcpal/cpp/inet.h"
#include "etcpal/cpp/log.h"
#include "etcpal/cpp/mutex.h"
#include "amplink/defs.h"
#include "amplink/cpp/network_controller.h"

/// @defgroup amplink_minidsp miniDSP
/// @ingroup amplink_cpp_api
/// @brief Discover miniDSP devices and control them through their HTTP/WebSocket service.
///
/// Devices announce themselves with discovery broadcasts on UDP port 3999. Each device runs a
/// management service (port 5380 by default) which accepts JSON configuration changes over HTTP
/// and streams JSON status changes over a WebSocket.

namespace amplink
{
namespace minidsp
{
/// @ingroup amplink_minidsp
/// @brief A decoded discovery broadcast.
struct DiscoveryPacket
{
  std::string     name;
  etcpal::MacAddr mac_address;
  etcpal::IpAddr  ip_address;
  uint8_t         hwid{0};
  uint8_t         dsp_id{0};
  uint16_t        serial{0};
  uint8_t         firmware_major{0};
  uint8_t         firmware_minor{0};

  std::string ToString() const;
};

/// @ingroup amplink_minidsp
/// @brief Decode a discovery broadcast.
/// @return kEtcPalErrBufSize: The datagram is shorter than its fixed part or its name.
/// @return kEtcPalErrProtErr: The name is not valid UTF-8.
etcpal::Expected<DiscoveryPacket> ParseDiscoveryPacket(const uint8_t* data, size_t size);

/// @ingroup amplink_minidsp
/// @brief The master status fields of a device. Unset fields are absent from the message.
///
/// Used both for status changes streamed by the device and for configuration changes sent to it.
struct MasterStatus
{
  std::optional<std::string> source;
  std::optional<bool>        mute;
  std::optional<double>      volume;
  std::optional<int>         preset;
};

/// @ingroup amplink_minidsp
/// @brief Decode a status message of the form `{"master": {...}}`.
/// @return kEtcPalErrProtErr: The message is not a JSON object.
/// @return kEtcPalErrNotFound: The message has no `master` object.
etcpal::Expected<MasterStatus> ParseStatusMessage(const std::string& message);

/// @ingroup amplink_minidsp
/// @brief Build a configuration request body of the form `{"master_status": {...}}`.
std::string BuildConfigRequest(const MasterStatus& change);

/// @ingroup amplink_minidsp
/// @brief The input names accepted by SelectSource().
const std::vector<std::string>& SourceNames();

/// @ingroup amplink_minidsp
/// @brief The display name of a zero-based preset index ("Preset 1" for 0).
std::string PresetName(int preset);

/// @ingroup amplink_minidsp
/// @brief The zero-based preset index of a display name returned by PresetName().
/// @return kEtcPalErrInvalid: The name is malformed or out of range.
etcpal::Expected<int> ParsePresetName(const std::string& name);

/// @ingroup amplink_minidsp
/// @brief Sends configuration changes to a device's management service.
class ConfigClient
{
public:
  virtual ~ConfigClient() = default;

  /// @brief POST a JSON body to the device's configuration endpoint and wait for the response.
  /// @param device_addr The address and port of the management service.
  /// @param body The request body.
  /// @return etcpal::Error::Ok(): The device accepted the request.
  /// @return kEtcPalErrProtErr: The device responded with an error status.
  /// @return kEtcPalErrSys: The request could not be completed.
  virtual etcpal::Error PostConfig(const etcpal::SockAddr& device_addr, const std::string& body) = 0;
};

std::unique_ptr<ConfigClient> CreateHttpConfigClient(etcpal::Logger* logger = nullptr);

/// @ingroup amplink_minidsp
/// @brief The interface for callbacks from a LiveUpdateChannel.
class LiveUpdateNotify
{
public:
  /// @brief A message was received. Called on the channel's worker thread.
  virtual void HandleLiveMessage(const std::string& message) = 0;

  /// @brief The channel closed for a reason other than LiveUpdateChannel::Close().
  virtual void HandleLiveChannelClosed(const etcpal::Error& reason) = 0;
};

/// @ingroup amplink_minidsp
/// @brief A persistent stream of status messages from one device.
class LiveUpdateChannel
{
public:
  virtual ~LiveUpdateChannel() = default;

  /// @brief Start connecting to the device's status stream.
  ///
  /// Returns once the connection attempt is under way; connection failures are reported through
  /// LiveUpdateNotify::HandleLiveChannelClosed().
  /// @return kEtcPalErrAlready: The channel is already open or connecting.
  virtual etcpal::Error Open(const etcpal::SockAddr& device_addr, LiveUpdateNotify& notify) = 0;

  /// @brief Close the channel and wait for its worker to finish. Safe to call at any time.
  ///
  /// Must not be called from LiveUpdateNotify callbacks.
  virtual void Close() = 0;

  virtual bool is_open() const = 0;
};

using LiveUpdateChannelFactory = std::function<std::unique_ptr<LiveUpdateChannel>()>;

std::unique_ptr<LiveUpdateChannel> CreateWebSocketLiveUpdateChannel(etcpal::Logger* logger = nullptr);

/// @ingroup amplink_minidsp
/// @brief Settings for a miniDSP Controller and the devices it creates.
struct Settings
{
  /// The port on which to listen for discovery broadcasts.
  uint16_t listen_port{AMPLINK_MINIDSP_DISCOVERY_PORT};
  /// The port of each device's HTTP and WebSocket service.
  uint16_t http_port{AMPLINK_MINIDSP_HTTP_PORT};
  /// Whether to open each device's status stream as soon as it is discovered.
  bool start_live_updates{true};

  bool IsValid() const { return (listen_port != 0 && http_port != 0); }
};

/// @ingroup amplink_minidsp
/// @brief A miniDSP device.
///
/// Discovery only carries identity; state starts muted at minimum volume and is filled in by the
/// status stream. Control functions validate their arguments, send the change to the device and
/// record the new value locally. All functions are thread-safe.
class Device : public LiveUpdateNotify
{
public:
  using UpdateCallback = std::function<void(Device& device, bool changed)>;

  Device(const DiscoveryPacket&             packet,
         ConfigClient&                      config_client,
         std::unique_ptr<LiveUpdateChannel> live_channel = nullptr,
         const Settings&                    settings = Settings{},
         etcpal::Logger*                    logger = nullptr);
  ~Device();

  Device(const Device& other) = delete;
  Device& operator=(const Device& other) = delete;

  bool Merge(const DiscoveryPacket& packet);
  bool ApplyStatus(const MasterStatus& status);

  void          SetUpdateCallback(UpdateCallback callback);
  etcpal::Error StartLiveUpdates();
  void          Close();
  bool          live_updates_open() const;

  const std::string&         name() const { return name_; }
  const DiscoveryPacket&     discovery_info() const { return discovery_info_; }
  const etcpal::IpAddr&      ip_address() const { return discovery_info_.ip_address; }
  uint16_t                   port() const { return port_; }
  bool                       muted() const;
  double                     volume_db() const;
  std::optional<std::string> source() const;
  int                        preset() const;

  const std::vector<std::string>& GetSources() const;
  std::optional<std::string>      GetSource() const;
  float                           VolumeAsFloat() const;
  std::string                     ToString() const;

  etcpal::Error SetMute(bool mute);
  etcpal::Error SetVolumeDb(double db);
  etcpal::Error SetVolumeFloat(float volume);
  etcpal::Error VolumeUp();
  etcpal::Error VolumeDown();
  etcpal::Error SelectSource(const std::string& source_name);
  etcpal::Error SelectPreset(int preset);

  void HandleLiveMessage(const std::string& message) override;
  void HandleLiveChannelClosed(const etcpal::Error& reason) override;

private:
  etcpal::Error PostChange(const MasterStatus& change, const char* description);

  const std::string     name_;
  const DiscoveryPacket discovery_info_;
  const uint16_t        port_;
  ConfigClient&         config_client_;
  etcpal::Logger*       log_{nullptr};

  std::unique_ptr<LiveUpdateChannel> live_channel_;
  UpdateCallback                     update_callback_;

  mutable etcpal::Mutex      lock_;
  bool                       muted_{true};
  double                     volume_db_{AMPLINK_MINIDSP_MIN_VOLUME_DB};
  std::optional<std::string> source_;
  int                        preset_{0};
};

/// @ingroup amplink_minidsp
/// @brief Binds the miniDSP discovery protocol to the generic discovery machinery.
struct Family
{
  using Device = minidsp::Device;
  using Packet = DiscoveryPacket;

  static constexpr const char* kName = "miniDSP";

  static etcpal::Expected<DiscoveryPacket> ParsePacket(const uint8_t* data, size_t size, const etcpal::SockAddr& from)
  {
    ETCPAL_UNUSED_ARG(from);
    return ParseDiscoveryPacket(data, size);
  }
};

/// @ingroup amplink_minidsp
/// @brief Listens for miniDSP discovery broadcasts and maintains the set of known devices.
///
/// Each discovered device is told about through HandleNewDevice(); its status stream is then
/// opened if Settings::start_live_updates is set. Every status change received on a stream is
/// reported through HandleDeviceUpdated(), as is every repeat discovery broadcast (with changed
/// set to false). Call Shutdown() to stop listening and close all status streams.
class Controller : public NetworkController<Family>
{
public:
  explicit Controller(std::unique_ptr<ConfigClient> config_client = nullptr,
                      LiveUpdateChannelFactory      channel_factory = nullptr);
  ~Controller() override;

  etcpal::Error Startup(const Settings&                            settings = Settings{},
                        etcpal::Logger*                            logger = nullptr,
                        std::unique_ptr<DatagramListenerInterface> listener = nullptr);
  void          Shutdown();

  const Settings& settings() const { return settings_; }

protected:
  std::unique_ptr<Device> CreateDevice(const DiscoveryPacket& packet) override;
  void                    HandleDeviceAdded(Device& device) override;

private:
  Settings                      settings_;
  std::unique_ptr<ConfigClient> config_client_;
  LiveUpdateChannelFactory      channel_factory_;
  bool                          started_{false};
};

};  // namespace minidsp
};  // namespace amplink

#endif  // AMPLINK_CPP_MINIDSP_H_
