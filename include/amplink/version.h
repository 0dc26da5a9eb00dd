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

/**
 * @file amplink/version.h
 * @brief Provides the current version of the AmpLink library and executables.
 */

#ifndef AMPLINK_VERSION_H_
#define AMPLINK_VERSION_H_

/* clang-format off */

/**
 * @addtogroup amplink_api_common
 * @{
 */

/**
 * @name AmpLink version numbers
 * @{
 */
#define AMPLINK_VERSION_MAJOR 0 /**< The major version. */
#define AMPLINK_VERSION_MINOR 3 /**< The minor version. */
#define AMPLINK_VERSION_PATCH 0 /**< The patch version. */
#define AMPLINK_VERSION_BUILD 1 /**< The build number. */
/**
 * @}
 */

/**
 * @name AmpLink version strings
 * @{
 */
#define AMPLINK_VERSION_STRING "0.3.0.1" /**< The version number as a string. */
#define AMPLINK_VERSION_DATESTR "18.Oct.2026" /**< The date this version was created. */
#define AMPLINK_VERSION_COPYRIGHT "Copyright 2026 ETC Inc." /**< A copyright string for this library. */
#define AMPLINK_VERSION_PRODUCTNAME "AmpLink" /**< The name of the library as a string. */
/**
 * @}
 */

/**
 * @}
 */

/* clang-format on */

#endif /* AMPLINK_VERSION_H_ */
