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

/// @file websocket_live_channel.h
/// @brief A LiveUpdateChannel carried over a WebSocket to the device's status stream.

#ifndef AMPLINK_MINIDSP_WEBSOCKET_LIVE_CHANNEL_H_
#define AMPLINK_MINIDSP_WEBSOCKET_LIVE_CHANNEL_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "etcpal/cpp/thread.h"
#include "amplink/cpp/minidsp.h"

namespace amplink
{
namespace minidsp
{
// Each Open() creates a private io_context which runs on the channel's thread until the stream
// ends. Close() asks the peer to close, then stops the context once the close completes or
// kCloseTimeout passes.
class WebSocketLiveUpdateChannel : public LiveUpdateChannel
{
public:
  explicit WebSocketLiveUpdateChannel(etcpal::Logger* log) : log_(log) {}
  ~WebSocketLiveUpdateChannel() override;

  etcpal::Error Open(const etcpal::SockAddr& device_addr, LiveUpdateNotify& notify) override;
  void          Close() override;
  bool          is_open() const override { return open_; }

  void Run();

  static constexpr std::chrono::milliseconds kConnectTimeout{5000};
  static constexpr std::chrono::milliseconds kCloseTimeout{1000};

private:
  using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void OnConnect(const boost::beast::error_code& ec);
  void OnHandshake(const boost::beast::error_code& ec);
  void DoRead();
  void OnRead(const boost::beast::error_code& ec);
  void BeginClose();
  void Fail(const boost::beast::error_code& ec, const char* what);

  etcpal::Logger*   log_{nullptr};
  LiveUpdateNotify* notify_{nullptr};
  etcpal::SockAddr  device_addr_;
  std::string       host_;

  std::unique_ptr<boost::asio::io_context>   ioc_;
  std::unique_ptr<boost::asio::steady_timer> close_timer_;
  std::unique_ptr<Stream>                    ws_;
  boost::beast::flat_buffer                  buffer_;

  etcpal::Thread    thread_;
  bool              running_{false};
  std::atomic<bool> open_{false};
  std::atomic<bool> terminated_{false};
};

};  // namespace minidsp
};  // namespace amplink

#endif  // AMPLINK_MINIDSP_WEBSOCKET_LIVE_CHANNEL_H_
