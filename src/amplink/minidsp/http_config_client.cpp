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

#include "http_config_client.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "amplink/version.h"

#define HTTP_LOG(pri, ...) \
  if (log_)                \
  log_->Log(pri, "AmpLink HTTP: " __VA_ARGS__)

#define HTTP_LOG_WARNING(...) HTTP_LOG(ETCPAL_LOG_WARNING, __VA_ARGS__)
#define HTTP_LOG_DEBUG(...) HTTP_LOG(ETCPAL_LOG_DEBUG, __VA_ARGS__)

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

std::unique_ptr<amplink::minidsp::ConfigClient> amplink::minidsp::CreateHttpConfigClient(etcpal::Logger* logger)
{
  return std::make_unique<HttpConfigClient>(logger);
}

namespace amplink
{
namespace minidsp
{
etcpal::Error HttpConfigClient::PostConfig(const etcpal::SockAddr& device_addr, const std::string& body)
{
  if (!device_addr.ip().IsV4())
    return kEtcPalErrInvalid;

  const std::string host = device_addr.ip().ToString() + ":" + std::to_string(device_addr.port());

  try
  {
    net::io_context  ioc;
    beast::tcp_stream stream(ioc);

    // A timeout is only enforced for asynchronous operations, so each step is run on the context.
    beast::error_code ec;
    stream.expires_after(kRequestTimeout);
    stream.async_connect(tcp::endpoint(net::ip::address_v4(device_addr.ip().v4_data()), device_addr.port()),
                         [&ec](beast::error_code result) { ec = result; });
    ioc.run();
    if (ec)
      throw beast::system_error(ec);

    http::request<http::string_body> request{http::verb::post, AMPLINK_MINIDSP_CONFIG_TARGET, 11};
    request.set(http::field::host, host);
    request.set(http::field::user_agent, AMPLINK_VERSION_PRODUCTNAME "/" AMPLINK_VERSION_STRING);
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();

    beast::flat_buffer                buffer;
    http::response<http::string_body> response;

    ioc.restart();
    http::async_write(stream, request, [&](beast::error_code result, std::size_t) {
      ec = result;
      if (!ec)
        http::async_read(stream, buffer, response, [&ec](beast::error_code read_result, std::size_t) { ec = read_result; });
    });
    ioc.run();
    if (ec)
      throw beast::system_error(ec);

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    if (response.result_int() < 200 || response.result_int() >= 300)
    {
      HTTP_LOG_WARNING("%s rejected configuration change with status %u: %s", host.c_str(), response.result_int(),
                       response.body().c_str());
      return kEtcPalErrProtErr;
    }

    HTTP_LOG_DEBUG("POST %s%s: %s", host.c_str(), AMPLINK_MINIDSP_CONFIG_TARGET, body.c_str());
    return kEtcPalErrOk;
  }
  catch (const beast::system_error& e)
  {
    HTTP_LOG_WARNING("POST to %s failed: %s", host.c_str(), e.code().message().c_str());
    return kEtcPalErrSys;
  }
}

};  // namespace minidsp
};  // namespace amplink
