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

/// @file amplink/cpp/command_transport.h
/// @brief A sender for fire-and-forget UDP command frames.

#ifndef AMPLINK_CPP_COMMAND_TRANSPORT_H_
#define AMPLINK_CPP_COMMAND_TRANSPORT_H_

#include <cstdint>
#include <memory>
#include <vector>
#include "etcpal/cpp/error.h"
#include "etcpal/cpp/inet.h"
#include "etcpal/cpp/log.h"

namespace amplink
{
using CommandFrame = std::vector<uint8_t>;

/// @brief Sends command frames to a device. No reply is expected.
class CommandTransport
{
public:
  virtual ~CommandTransport() = default;

  /// @brief Send each frame, in order, to the destination address.
  ///
  /// Implementations must be safe to call from multiple threads.
  virtual etcpal::Error Send(const etcpal::SockAddr& dest, const std::vector<CommandFrame>& frames) = 0;
};

std::unique_ptr<CommandTransport> CreateUdpCommandTransport(etcpal::Logger* logger = nullptr);

};  // namespace amplink

#endif  // AMPLINK_CPP_COMMAND_TRANSPORT_H_
