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

/// @file amplink/core/util.h
/// @brief Helpers for decoding fixed-width text fields from datagrams.

#ifndef AMPLINK_CORE_UTIL_H_
#define AMPLINK_CORE_UTIL_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include "etcpal/cpp/error.h"

namespace amplink
{
bool IsValidUtf8(const uint8_t* data, size_t size);

// Decodes a fixed-width UTF-8 text field, removing every NUL byte (not only trailing padding).
// Fails with kEtcPalErrProtErr if the field is not valid UTF-8.
etcpal::Expected<std::string> DecodeTextField(const uint8_t* data, size_t size);

};  // namespace amplink

#endif  // AMPLINK_CORE_UTIL_H_
