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

#ifndef AMPLINK_CPP_COMMON_H_
#define AMPLINK_CPP_COMMON_H_

/// @file amplink/cpp/common.h
/// @brief Init/deinit functions for the AmpLink library.

#include "etcpal/cpp/error.h"
#include "etcpal/cpp/log.h"

/// @defgroup amplink_cpp_api AmpLink C++ Language APIs
/// @brief Native C++ APIs for discovering and controlling networked amplifiers.

/// @brief A namespace which contains all definitions in the AmpLink library.
namespace amplink
{
/// @ingroup amplink_cpp_api
/// @brief Initialize the AmpLink library.
///
/// Initializes the EtcPal socket and logging modules. Must be called before any controller is
/// started. Calls may be nested; each successful call must be balanced by a call to Deinit().
///
/// @param logger (optional) If provided, the library version is logged on successful init.
/// @return etcpal::Error::Ok(): Initialization successful.
/// @return Errors from etcpal_init().
etcpal::Error Init(etcpal::Logger* logger = nullptr);

/// @ingroup amplink_cpp_api
/// @brief Deinitialize the AmpLink library.
///
/// Controllers must be shut down before the last call to Deinit().
void Deinit();

/// @ingroup amplink_cpp_api
/// @brief Whether Init() has been called more times than Deinit().
bool Initialized();

};  // namespace amplink

#endif  // AMPLINK_CPP_COMMON_H_
