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

#include "websocket_live_channel.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include "amplink/version.h"

#define WS_LOG(pri, ...) \
  if (log_)              \
  log_->Log(pri, "AmpLink WebSocket: " __VA_ARGS__)

#define WS_LOG_WARNING(...) WS_LOG(ETCPAL_LOG_WARNING, __VA_ARGS__)
#define WS_LOG_INFO(...) WS_LOG(ETCPAL_LOG_INFO, __VA_ARGS__)

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::unique_ptr<amplink::minidsp::LiveUpdateChannel> amplink::minidsp::CreateWebSocketLiveUpdateChannel(
    etcpal::Logger* logger)
{
  return std::make_unique<WebSocketLiveUpdateChannel>(logger);
}

namespace amplink
{
namespace minidsp
{
WebSocketLiveUpdateChannel::~WebSocketLiveUpdateChannel()
{
  Close();
}

etcpal::Error WebSocketLiveUpdateChannel::Open(const etcpal::SockAddr& device_addr, LiveUpdateNotify& notify)
{
  if (running_)
    return kEtcPalErrAlready;
  if (!device_addr.ip().IsV4())
    return kEtcPalErrInvalid;

  notify_ = &notify;
  device_addr_ = device_addr;
  host_ = device_addr.ip().ToString() + ":" + std::to_string(device_addr.port());
  terminated_ = false;
  buffer_.clear();

  ioc_ = std::make_unique<net::io_context>();
  close_timer_ = std::make_unique<net::steady_timer>(*ioc_);
  ws_ = std::make_unique<Stream>(*ioc_);

  beast::get_lowest_layer(*ws_).expires_after(kConnectTimeout);
  beast::get_lowest_layer(*ws_).async_connect(
      tcp::endpoint(net::ip::address_v4(device_addr.ip().v4_data()), device_addr.port()),
      [this](beast::error_code ec) { OnConnect(ec); });

  etcpal::Error res = thread_.SetName("AmpLinkLiveUpdate").Start(&WebSocketLiveUpdateChannel::Run, this);
  if (!res)
  {
    ws_.reset();
    close_timer_.reset();
    ioc_.reset();
    WS_LOG_WARNING("Failed to start stream thread for %s: %s", host_.c_str(), res.ToCString());
    return res;
  }

  running_ = true;
  return res;
}

void WebSocketLiveUpdateChannel::Close()
{
  if (!running_)
    return;

  terminated_ = true;
  net::post(*ioc_, [this]() { BeginClose(); });
  thread_.Join();

  // Handlers still queued on a stopped context are destroyed with it, never invoked.
  ws_.reset();
  close_timer_.reset();
  ioc_.reset();
  running_ = false;
  open_ = false;
}

void WebSocketLiveUpdateChannel::Run()
{
  try
  {
    ioc_->run();
  }
  catch (const beast::system_error& e)
  {
    WS_LOG_WARNING("Stream from %s stopped: %s", host_.c_str(), e.code().message().c_str());
    open_ = false;
    if (!terminated_)
      notify_->HandleLiveChannelClosed(kEtcPalErrSys);
  }
}

void WebSocketLiveUpdateChannel::OnConnect(const beast::error_code& ec)
{
  if (ec)
    return Fail(ec, "connect");

  beast::get_lowest_layer(*ws_).expires_never();
  ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
    request.set(beast::http::field::user_agent, AMPLINK_VERSION_PRODUCTNAME "/" AMPLINK_VERSION_STRING);
  }));
  ws_->async_handshake(host_, AMPLINK_MINIDSP_STREAM_TARGET, [this](beast::error_code result) { OnHandshake(result); });
}

void WebSocketLiveUpdateChannel::OnHandshake(const beast::error_code& ec)
{
  if (ec)
    return Fail(ec, "handshake");

  open_ = true;
  WS_LOG_INFO("Receiving status stream from %s.", host_.c_str());
  DoRead();
}

void WebSocketLiveUpdateChannel::DoRead()
{
  ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t) { OnRead(ec); });
}

void WebSocketLiveUpdateChannel::OnRead(const beast::error_code& ec)
{
  if (ec)
    return Fail(ec, "read");

  std::string message = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  notify_->HandleLiveMessage(message);
  DoRead();
}

void WebSocketLiveUpdateChannel::BeginClose()
{
  close_timer_->expires_after(kCloseTimeout);
  close_timer_->async_wait([this](beast::error_code ec) {
    if (!ec)
      ioc_->stop();
  });

  if (open_)
  {
    ws_->async_close(websocket::close_code::normal, [this](beast::error_code) { ioc_->stop(); });
  }
  else
  {
    ioc_->stop();
  }
}

// Reports a failure that ends the stream. Failures caused by Close() are not reported.
void WebSocketLiveUpdateChannel::Fail(const beast::error_code& ec, const char* what)
{
  open_ = false;
  if (terminated_ || ec == net::error::operation_aborted)
    return;

  if (ec == websocket::error::closed)
  {
    WS_LOG_INFO("Status stream from %s was closed by the device.", host_.c_str());
  }
  else
  {
    WS_LOG_WARNING("Status stream from %s failed during %s: %s", host_.c_str(), what, ec.message().c_str());
  }
  notify_->HandleLiveChannelClosed(kEtcPalErrSys);
}

};  // namespace minidsp
};  // namespace amplink
