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

/// @file http_config_client.h
/// @brief A ConfigClient which sends each change as a blocking HTTP/1.1 POST.

#ifndef AMPLINK_MINIDSP_HTTP_CONFIG_CLIENT_H_
#define AMPLINK_MINIDSP_HTTP_CONFIG_CLIENT_H_

#include <chrono>
#include "amplink/cpp/minidsp.h"

namespace amplink
{
namespace minidsp
{
class HttpConfigClient : public ConfigClient
{
public:
  explicit HttpConfigClient(etcpal::Logger* log) : log_(log) {}

  etcpal::Error PostConfig(const etcpal::SockAddr& device_addr, const std::string& body) override;

  static constexpr std::chrono::milliseconds kRequestTimeout{3000};

private:
  etcpal::Logger* log_{nullptr};
};

};  // namespace minidsp
};  // namespace amplink

#endif  // AMPLINK_MINIDSP_HTTP_CONFIG_CLIENT_H_
