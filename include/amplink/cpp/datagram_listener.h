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

/// @file amplink/cpp/datagram_listener.h
/// @brief A worker that receives broadcast datagrams on a UDP port.

#ifndef AMPLINK_CPP_DATAGRAM_LISTENER_H_
#define AMPLINK_CPP_DATAGRAM_LISTENER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include "etcpal/cpp/error.h"
#include "etcpal/cpp/inet.h"
#include "etcpal/cpp/log.h"

namespace amplink
{
/// @brief The interface for callbacks from a DatagramListenerInterface.
class DatagramNotify
{
public:
  /// @brief A datagram was received.
  ///
  /// Called on the listener's worker thread. The data is only valid for the duration of the call.
  virtual void HandleDatagram(const uint8_t* data, size_t size, const etcpal::SockAddr& from) = 0;
};

/// @brief Receives datagrams on a bound UDP socket and hands each one to a DatagramNotify.
///
/// At most one datagram is in flight at a time; a datagram is fully handled before the next one
/// is read.
class DatagramListenerInterface
{
public:
  virtual ~DatagramListenerInterface() = default;

  virtual void SetNotify(DatagramNotify* notify) = 0;

  /// @brief Bind to the wildcard address on the given port and start receiving.
  /// @return etcpal::Error::Ok(): The socket is bound and the worker thread is running.
  /// @return kEtcPalErrAlready: The listener is already running.
  /// @return Errors from the socket or thread layers (e.g. kEtcPalErrAddrInUse).
  virtual etcpal::Error Start(uint16_t port) = 0;

  /// @brief Close the socket and join the worker thread. Safe to call when not running.
  virtual void Stop() = 0;

  virtual bool running() const = 0;
};

std::unique_ptr<DatagramListenerInterface> CreateDatagramListener(etcpal::Logger* logger = nullptr);

};  // namespace amplink

#endif  // AMPLINK_CPP_DATAGRAM_LISTENER_H_
