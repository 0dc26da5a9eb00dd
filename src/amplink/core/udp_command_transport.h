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

/// @file udp_command_transport.h
/// @brief The socket-backed implementation of CommandTransport.

#ifndef AMPLINK_CORE_UDP_COMMAND_TRANSPORT_H_
#define AMPLINK_CORE_UDP_COMMAND_TRANSPORT_H_

#include "etcpal/socket.h"
#include "amplink/cpp/command_transport.h"

namespace amplink
{
// Each call to Send() opens its own UDP socket connected to the destination, sends every frame on
// it and closes it again. Calls for different devices can run concurrently.
class UdpCommandTransport : public CommandTransport
{
public:
  explicit UdpCommandTransport(etcpal::Logger* log) : log_(log) {}

  etcpal::Error Send(const etcpal::SockAddr& dest, const std::vector<CommandFrame>& frames) override;

private:
  etcpal::Error OpenSocket(const etcpal::SockAddr& dest, etcpal_socket_t& sock);

  etcpal::Logger* log_{nullptr};
};

};  // namespace amplink

#endif  // AMPLINK_CORE_UDP_COMMAND_TRANSPORT_H_
