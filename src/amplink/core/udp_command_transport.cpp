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

#include "udp_command_transport.h"

#define TRANSPORT_LOG(pri, ...) \
  if (log_)                     \
  log_->Log(pri, "AmpLink Transport: " __VA_ARGS__)

#define TRANSPORT_LOG_ERR(...) TRANSPORT_LOG(ETCPAL_LOG_ERR, __VA_ARGS__)
#define TRANSPORT_LOG_DEBUG(...) TRANSPORT_LOG(ETCPAL_LOG_DEBUG, __VA_ARGS__)

std::unique_ptr<amplink::CommandTransport> amplink::CreateUdpCommandTransport(etcpal::Logger* logger)
{
  return std::make_unique<UdpCommandTransport>(logger);
}

namespace amplink
{
etcpal::Error UdpCommandTransport::Send(const etcpal::SockAddr& dest, const std::vector<CommandFrame>& frames)
{
  etcpal_socket_t sock = ETCPAL_SOCKET_INVALID;
  etcpal::Error   res = OpenSocket(dest, sock);
  if (!res)
    return res;

  for (const auto& frame : frames)
  {
    int send_res = etcpal_send(sock, frame.data(), frame.size(), 0);
    if (send_res < 0)
    {
      res = static_cast<etcpal_error_t>(send_res);
      TRANSPORT_LOG_ERR("Sending to %s failed: %s", dest.ToString().c_str(), res.ToCString());
      break;
    }
  }

  etcpal_close(sock);

  if (res)
    TRANSPORT_LOG_DEBUG("Sent %zu frame(s) to %s", frames.size(), dest.ToString().c_str());
  return res;
}

etcpal::Error UdpCommandTransport::OpenSocket(const etcpal::SockAddr& dest, etcpal_socket_t& sock)
{
  etcpal::Error res = etcpal_socket(ETCPAL_AF_INET, ETCPAL_SOCK_DGRAM, &sock);
  if (!res)
  {
    TRANSPORT_LOG_ERR("Failed to create command socket: %s", res.ToCString());
    return res;
  }

  // Devices may be addressed by a subnet broadcast address.
  int option = 1;
  res = etcpal_setsockopt(sock, ETCPAL_SOL_SOCKET, ETCPAL_SO_BROADCAST, &option, sizeof(int));
  if (res)
    res = etcpal_connect(sock, &dest.get());

  if (!res)
  {
    TRANSPORT_LOG_ERR("Failed to open command socket to %s: %s", dest.ToString().c_str(), res.ToCString());
    etcpal_close(sock);
    sock = ETCPAL_SOCKET_INVALID;
  }
  return res;
}

};  // namespace amplink
