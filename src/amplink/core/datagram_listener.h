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

/// @file datagram_listener.h
/// @brief The socket-backed implementation of DatagramListenerInterface.

#ifndef AMPLINK_CORE_DATAGRAM_LISTENER_H_
#define AMPLINK_CORE_DATAGRAM_LISTENER_H_

#include <array>
#include <atomic>
#include <cstdint>
#include "etcpal/cpp/thread.h"
#include "etcpal/socket.h"
#include "amplink/cpp/datagram_listener.h"

namespace amplink
{
class DatagramListener : public DatagramListenerInterface
{
public:
  explicit DatagramListener(etcpal::Logger* log) : log_(log) {}
  ~DatagramListener() override;

  void SetNotify(DatagramNotify* notify) override { notify_ = notify; }

  etcpal::Error Start(uint16_t port) override;
  void          Stop() override;
  bool          running() const override { return !terminated_; }

  void Run();
  void ReadSocket();

  uint16_t port() const { return port_; }

  static constexpr int    kPollTimeoutMs{200};
  static constexpr size_t kRecvBufSize{2048};

private:
  etcpal::Error OpenSocket(uint16_t port);
  void          CloseSocket();

  DatagramNotify*   notify_{nullptr};
  etcpal::Logger*   log_{nullptr};
  std::atomic<bool> terminated_{true};
  bool              started_{false};

  etcpal_socket_t   socket_{ETCPAL_SOCKET_INVALID};
  EtcPalPollContext poll_context_{};
  bool              poll_context_valid_{false};
  uint16_t          port_{0};

  etcpal::Thread                   thread_;
  std::array<uint8_t, kRecvBufSize> recv_buf_{};
};

};  // namespace amplink

#endif  // AMPLINK_CORE_DATAGRAM_LISTENER_H_
