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

/// @file minidsp_prot.h
/// @brief Wire layout of the miniDSP discovery broadcast.

#ifndef AMPLINK_MINIDSP_MINIDSP_PROT_H_
#define AMPLINK_MINIDSP_MINIDSP_PROT_H_

#include <cstddef>
#include "amplink/cpp/minidsp.h"

namespace amplink
{
namespace minidsp
{
constexpr size_t kDiscoveryMacOffset = 6;
constexpr size_t kDiscoveryIpOffset = 14;
constexpr size_t kDiscoveryHwidOffset = 18;
constexpr size_t kDiscoveryFirmwareMajorOffset = 19;
constexpr size_t kDiscoveryFirmwareMinorOffset = 20;
constexpr size_t kDiscoveryDspIdOffset = 21;
constexpr size_t kDiscoverySerialOffset = 22;
constexpr size_t kDiscoveryNameLenOffset = 35;
constexpr size_t kDiscoveryNameOffset = 36;

};  // namespace minidsp
};  // namespace amplink

#endif  // AMPLINK_MINIDSP_MINIDSP_PROT_H_
