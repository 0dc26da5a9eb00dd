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

#include "datagram_listener.h"

#include "etcpal/cpp/inet.h"

#define LISTENER_LOG(pri, ...) \
  if (log_)                    \
  log_->Log(pri, "AmpLink Listener: " __VA_ARGS__)

#define LISTENER_LOG_ERR(...) LISTENER_LOG(ETCPAL_LOG_ERR, __VA_ARGS__)
#define LISTENER_LOG_WARNING(...) LISTENER_LOG(ETCPAL_LOG_WARNING, __VA_ARGS__)
#define LISTENER_LOG_INFO(...) LISTENER_LOG(ETCPAL_LOG_INFO, __VA_ARGS__)

/*************************** Function definitions ****************************/

std::unique_ptr<amplink::DatagramListenerInterface> amplink::CreateDatagramListener(etcpal::Logger* logger)
{
  return std::make_unique<DatagramListener>(logger);
}

namespace amplink
{
etcpal::Error DatagramListener::Start(uint16_t port)
{
  if (!terminated_)
    return kEtcPalErrAlready;

  // Clean up after a worker that stopped itself.
  Stop();

  etcpal::Error res = OpenSocket(port);
  if (!res)
    return res;

  terminated_ = false;

  res = thread_.SetName("AmpLinkListener").Start(&DatagramListener::Run, this);
  if (!res)
  {
    terminated_ = true;
    CloseSocket();
    LISTENER_LOG_ERR("Failed to start listener thread for port %u: %s", port, res.ToCString());
    return res;
  }

  started_ = true;
  port_ = port;
  LISTENER_LOG_INFO("Listening for datagrams on UDP port %u.", port);
  return res;
}

// The worker may have already set terminated_ after a fatal error. It still needs to be joined.
void DatagramListener::Stop()
{
  if (started_)
  {
    terminated_ = true;
    thread_.Join();
    CloseSocket();
    started_ = false;
    LISTENER_LOG_INFO("Stopped listening on UDP port %u.", port_);
  }
}

DatagramListener::~DatagramListener()
{
  Stop();
}

void DatagramListener::Run()
{
  while (!terminated_)
  {
    ReadSocket();
  }
}

void DatagramListener::ReadSocket()
{
  EtcPalPollEvent event{};
  etcpal::Error   res = etcpal_poll_wait(&poll_context_, &event, kPollTimeoutMs);
  if (res.code() == kEtcPalErrTimedOut)
    return;

  if (!res)
  {
    // A poll failure while stopping is expected.
    if (!terminated_)
    {
      LISTENER_LOG_ERR("Waiting on socket failed with error: %s. Stopping.", res.ToCString());
      terminated_ = true;
    }
    return;
  }

  if (event.events & ETCPAL_POLL_ERR)
  {
    LISTENER_LOG_WARNING("Socket error on UDP port %u: %s", port_, etcpal_strerror(event.err));
    return;
  }

  if (event.events & ETCPAL_POLL_IN)
  {
    EtcPalSockAddr from_addr;
    int            recv_res = etcpal_recvfrom(socket_, recv_buf_.data(), recv_buf_.size(), 0, &from_addr);
    if (recv_res < 0)
    {
      if (!terminated_)
        LISTENER_LOG_WARNING("Receive failed: %s", etcpal_strerror(static_cast<etcpal_error_t>(recv_res)));
      return;
    }

    if (notify_)
      notify_->HandleDatagram(recv_buf_.data(), static_cast<size_t>(recv_res), etcpal::SockAddr(from_addr));
  }
}

etcpal::Error DatagramListener::OpenSocket(uint16_t port)
{
  etcpal_socket_t sock = ETCPAL_SOCKET_INVALID;
  etcpal::Error   res = etcpal_socket(ETCPAL_AF_INET, ETCPAL_SOCK_DGRAM, &sock);
  if (!res)
  {
    LISTENER_LOG_ERR("Failed to create socket: %s", res.ToCString());
    return res;
  }

  int option = 1;
  res = etcpal_setsockopt(sock, ETCPAL_SOL_SOCKET, ETCPAL_SO_REUSEADDR, &option, sizeof(int));
  if (res)
    res = etcpal_setsockopt(sock, ETCPAL_SOL_SOCKET, ETCPAL_SO_BROADCAST, &option, sizeof(int));
  if (!res)
  {
    LISTENER_LOG_ERR("Failed to set socket options: %s", res.ToCString());
    etcpal_close(sock);
    return res;
  }

  EtcPalSockAddr bind_addr;
  ETCPAL_IP_SET_V4_ADDRESS(&bind_addr.ip, 0);
  bind_addr.port = port;
  res = etcpal_bind(sock, &bind_addr);
  if (!res)
  {
    LISTENER_LOG_ERR("Bind to UDP port %u failed: %s", port, res.ToCString());
    etcpal_close(sock);
    return res;
  }

  res = etcpal_poll_context_init(&poll_context_);
  if (res)
  {
    poll_context_valid_ = true;
    res = etcpal_poll_add_socket(&poll_context_, sock, ETCPAL_POLL_IN, this);
  }
  if (!res)
  {
    LISTENER_LOG_ERR("Failed to set up polling on UDP port %u: %s", port, res.ToCString());
    etcpal_close(sock);
    if (poll_context_valid_)
    {
      etcpal_poll_context_deinit(&poll_context_);
      poll_context_valid_ = false;
    }
    return res;
  }

  socket_ = sock;
  return res;
}

void DatagramListener::CloseSocket()
{
  if (poll_context_valid_)
  {
    if (socket_ != ETCPAL_SOCKET_INVALID)
      etcpal_poll_remove_socket(&poll_context_, socket_);
    etcpal_poll_context_deinit(&poll_context_);
    poll_context_valid_ = false;
  }
  if (socket_ != ETCPAL_SOCKET_INVALID)
  {
    etcpal_close(socket_);
    socket_ = ETCPAL_SOCKET_INVALID;
  }
}

};  // namespace amplink
