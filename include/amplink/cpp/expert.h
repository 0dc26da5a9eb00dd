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

/// @file amplink/cpp/expert.h
/// @brief Discovery and control of Expert amplifiers.

#ifndef AMPLINK_CPP_EXPERT_H_
#define AMPLINK_CPP_EXPERT_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "etcpal/cpp/error.h"
#include "etcpal/cpp/inet.h"
#include "etcpal/cpp/log.h"
#include "etcpal/cpp/mutex.h"
#include "amplink/defs.h"
#include "amplink/cpp/command_transport.h"
#include "amplink/cpp/network_controller.h"

/// @defgroup amplink_expert Expert
/// @ingroup amplink_cpp_api
/// @brief Discover Expert amplifiers from their status broadcasts and send them binary commands.
///
/// Expert amplifiers broadcast their complete state on UDP port 45454 several times per second.
/// Commands are fixed-size, CRC-protected frames sent to UDP port 45455. There is no
/// acknowledgement; each command is repeated a configurable number of times.

namespace amplink
{
namespace expert
{
/// @ingroup amplink_expert
/// @brief One of the input slots of an amplifier.
struct Source
{
  unsigned int index{0};
  std::string  name;
  bool         enabled{false};
  /// Derived from the status broadcast's selected index each time one is parsed.
  bool selected{false};
};

bool operator==(const Source& a, const Source& b);
bool operator!=(const Source& a, const Source& b);

/// @ingroup amplink_expert
/// @brief The state of one amplifier as decoded from a single status broadcast.
struct Status
{
  std::string    name;
  etcpal::IpAddr ip_address;
  bool           power{false};
  bool           muted{false};
  /// Native volume scale: 0 is -97.5 dB, 195 is 0 dB, 255 is +30 dB.
  uint8_t             volume{0};
  unsigned int        source_index{0};
  std::vector<Source> sources;
};

/// @ingroup amplink_expert
/// @brief Decode a status broadcast.
/// @param data The datagram.
/// @param size Size of the datagram; at least AMPLINK_EXPERT_STATUS_MIN_SIZE.
/// @param sender The IP address the datagram came from, recorded as the device's address.
/// @return The decoded status.
/// @return kEtcPalErrBufSize: The datagram is too short.
/// @return kEtcPalErrProtErr: A text field is not valid UTF-8, or the selected input is out of range.
etcpal::Expected<Status> ParseStatus(const uint8_t* data, size_t size, const etcpal::IpAddr& sender);

/// @ingroup amplink_expert
/// @brief Convert a native volume value to decibels.
constexpr double VolumeToDb(int volume)
{
  return (volume - AMPLINK_EXPERT_ZERO_DB_VOLUME) / 2.0;
}

/// @ingroup amplink_expert
/// @brief Settings for an Expert Controller and the devices it creates.
struct Settings
{
  /// The port on which to listen for status broadcasts.
  uint16_t listen_port{AMPLINK_EXPERT_STATUS_PORT};
  /// The port to which commands are sent.
  uint16_t command_port{AMPLINK_EXPERT_COMMAND_PORT};
  /// How many times each command frame is transmitted. Must be at least 1.
  unsigned int transmit_count{AMPLINK_EXPERT_DEFAULT_TRANSMIT_COUNT};
  /// Decibel volume commands are clamped to this level.
  double max_volume_db{AMPLINK_EXPERT_MAX_VOLUME_DB};

  bool IsValid() const;
};

struct Command;

/// @ingroup amplink_expert
/// @brief An Expert amplifier.
///
/// Created by the Controller when a status broadcast with a new name is received. Recorded state
/// is only ever changed by status broadcasts; control functions send a command and the change is
/// seen when the amplifier next broadcasts. All functions are thread-safe.
class Device
{
public:
  Device(const Status&     status,
         CommandTransport& transport,
         const Settings&   settings = Settings{},
         etcpal::Logger*   logger = nullptr);

  Device(const Device& other) = delete;
  Device& operator=(const Device& other) = delete;

  bool Merge(const Status& status);

  const std::string&  name() const { return name_; }
  Status              status() const;
  etcpal::IpAddr      ip_address() const;
  bool                power() const;
  bool                muted() const;
  uint8_t             volume() const;
  unsigned int        source_index() const;
  std::vector<Source> sources() const;
  uint16_t            packet_counter() const;
  uint16_t            command_counter() const;

  std::vector<std::string> GetSources() const;
  std::string              GetSource() const;
  double                   VolumeAsDb() const;
  float                    VolumeAsFloat() const;
  std::string              ToString() const;

  etcpal::Error TurnOn();
  etcpal::Error TurnOff();
  etcpal::Error TogglePower();
  etcpal::Error SetMute(bool mute);
  etcpal::Error SetVolumeDb(double db);
  etcpal::Error SetVolumeInt(int volume);
  etcpal::Error SetVolumeFloat(float volume);
  etcpal::Error VolumeUp();
  etcpal::Error VolumeDown();
  etcpal::Error SelectSource(const std::string& source_name);

private:
  etcpal::Error SendCommand(const Command& command, const char* description);
  etcpal::Error SetPower(bool on);

  const std::string name_;
  CommandTransport& transport_;
  const Settings    settings_;
  etcpal::Logger*   log_{nullptr};

  mutable etcpal::Mutex lock_;
  Status                state_;

  // Serializes sends so counters are never duplicated or skipped.
  mutable etcpal::Mutex counter_lock_;
  uint16_t      packet_counter_{0};
  uint16_t      command_counter_{0};
};

/// @ingroup amplink_expert
/// @brief Binds the Expert protocol to the generic discovery machinery.
struct Family
{
  using Device = expert::Device;
  using Packet = Status;

  static constexpr const char* kName = "Expert";

  static etcpal::Expected<Status> ParsePacket(const uint8_t* data, size_t size, const etcpal::SockAddr& from)
  {
    return ParseStatus(data, size, from.ip());
  }
};

/// @ingroup amplink_expert
/// @brief Listens for Expert status broadcasts and maintains the set of known amplifiers.
///
/// Call Startup() to begin listening. Devices are reported through the NotifyHandler interface
/// from the listener thread. Call Shutdown() to stop listening; devices remain valid until the
/// Controller is destroyed.
class Controller : public NetworkController<Family>
{
public:
  explicit Controller(std::unique_ptr<CommandTransport> transport = nullptr);
  ~Controller() override;

  etcpal::Error Startup(const Settings&                            settings = Settings{},
                        etcpal::Logger*                            logger = nullptr,
                        std::unique_ptr<DatagramListenerInterface> listener = nullptr);
  void          Shutdown();

  const Settings& settings() const { return settings_; }

protected:
  std::unique_ptr<Device> CreateDevice(const Status& status) override;

private:
  Settings                          settings_;
  std::unique_ptr<CommandTransport> transport_;
  bool                              started_{false};
};

inline bool operator==(const Source& a, const Source& b)
{
  return (a.index == b.index && a.name == b.name && a.enabled == b.enabled && a.selected == b.selected);
}

inline bool operator!=(const Source& a, const Source& b)
{
  return !(a == b);
}

/// Whether the settings can be used to start a Controller.
inline bool Settings::IsValid() const
{
  return (listen_port != 0 && command_port != 0 && transmit_count >= 1 &&
          max_volume_db >= AMPLINK_EXPERT_MIN_VOLUME_DB && max_volume_db <= AMPLINK_EXPERT_ABS_MAX_VOLUME_DB);
}

};  // namespace expert
};  // namespace amplink

#endif  // AMPLINK_CPP_EXPERT_H_
