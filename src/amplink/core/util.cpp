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

#include "util.h"

#include <algorithm>

bool amplink::IsValidUtf8(const uint8_t* data, size_t size)
{
  size_t i = 0;
  while (i < size)
  {
    uint8_t  lead = data[i];
    size_t   num_continuation = 0;
    uint32_t code_point = 0;

    if (lead < 0x80)
    {
      ++i;
      continue;
    }
    else if ((lead & 0xe0) == 0xc0)
    {
      num_continuation = 1;
      code_point = lead & 0x1f;
    }
    else if ((lead & 0xf0) == 0xe0)
    {
      num_continuation = 2;
      code_point = lead & 0x0f;
    }
    else if ((lead & 0xf8) == 0xf0)
    {
      num_continuation = 3;
      code_point = lead & 0x07;
    }
    else
    {
      return false;
    }

    if (size - i <= num_continuation)
      return false;

    for (size_t j = 1; j <= num_continuation; ++j)
    {
      if ((data[i + j] & 0xc0) != 0x80)
        return false;
      code_point = (code_point << 6) | (data[i + j] & 0x3f);
    }

    // Reject overlong encodings, surrogates and out-of-range code points.
    static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (code_point < kMinForLength[num_continuation] || code_point > 0x10ffff ||
        (code_point >= 0xd800 && code_point <= 0xdfff))
    {
      return false;
    }

    i += num_continuation + 1;
  }
  return true;
}

etcpal::Expected<std::string> amplink::DecodeTextField(const uint8_t* data, size_t size)
{
  if (!IsValidUtf8(data, size))
    return kEtcPalErrProtErr;

  std::string result(reinterpret_cast<const char*>(data), size);
  result.erase(std::remove(result.begin(), result.end(), '\0'), result.end());
  return result;
}
