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

#include "amplink/cpp/common.h"

#include <atomic>
#include "etcpal/common.h"
#include "amplink/version.h"

static constexpr etcpal_features_t kAmpLinkEtcPalFeatures = ETCPAL_FEATURE_SOCKETS | ETCPAL_FEATURE_LOGGING;

static std::atomic<unsigned int> init_count{0};

etcpal::Error amplink::Init(etcpal::Logger* logger)
{
  etcpal::Error res = etcpal_init(kAmpLinkEtcPalFeatures);
  if (res)
  {
    ++init_count;
    if (logger)
      logger->Info("%s library version %s initialized.", AMPLINK_VERSION_PRODUCTNAME, AMPLINK_VERSION_STRING);
  }
  return res;
}

void amplink::Deinit()
{
  unsigned int count = init_count.load();
  while (count > 0)
  {
    if (init_count.compare_exchange_weak(count, count - 1))
    {
      etcpal_deinit(kAmpLinkEtcPalFeatures);
      return;
    }
  }
}

bool amplink::Initialized()
{
  return init_count.load() > 0;
}
