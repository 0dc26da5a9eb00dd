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
 * @file amplink/defs.h
 * @brief Protocol constants shared by the AmpLink modules.
 */

#ifndef AMPLINK_DEFS_H_
#define AMPLINK_DEFS_H_

/**
 * @defgroup amplink_api_common Common Definitions
 * @brief Constants and definitions shared by the amplifier families.
 * @{
 */

/**
 * @name Expert (status broadcast / binary command) family
 * @{
 */

/** The UDP port on which Expert amplifiers broadcast their status. */
#define AMPLINK_EXPERT_STATUS_PORT 45454
/** The UDP port on which Expert amplifiers receive commands. */
#define AMPLINK_EXPERT_COMMAND_PORT 45455

/** The smallest status datagram that carries every field this library reads. */
#define AMPLINK_EXPERT_STATUS_MIN_SIZE 311
/** The fixed size of a command frame. */
#define AMPLINK_EXPERT_COMMAND_SIZE 142
/** The number of input slots described in a status datagram. */
#define AMPLINK_EXPERT_NUM_SOURCES 15

/** Each logical command is transmitted this many times unless configured otherwise. */
#define AMPLINK_EXPERT_DEFAULT_TRANSMIT_COUNT 2

/** The integer volume scale runs from 0 to 255 in half-decibel steps. */
#define AMPLINK_EXPERT_VOLUME_INT_MAX 255
/** The integer volume that corresponds to 0 dB. */
#define AMPLINK_EXPERT_ZERO_DB_VOLUME 195
/** Integer volume setters are clamped to this value. */
#define AMPLINK_EXPERT_MAX_VOLUME_INT 175
/** The quietest representable level, in dB. */
#define AMPLINK_EXPERT_MIN_VOLUME_DB (-97.5)
/** The loudest representable level, in dB. */
#define AMPLINK_EXPERT_ABS_MAX_VOLUME_DB 30.0
/** The default ceiling applied to decibel volume commands. */
#define AMPLINK_EXPERT_MAX_VOLUME_DB (-10.0)

/**
 * @}
 */

/**
 * @name miniDSP (discovery broadcast / HTTP + WebSocket) family
 * @{
 */

/** The UDP port on which miniDSP devices broadcast discovery datagrams. */
#define AMPLINK_MINIDSP_DISCOVERY_PORT 3999
/** The TCP port of the device's HTTP and WebSocket service. */
#define AMPLINK_MINIDSP_HTTP_PORT 5380

/** A discovery datagram is at least this long before the variable-length name. */
#define AMPLINK_MINIDSP_DISCOVERY_MIN_SIZE 36

#define AMPLINK_MINIDSP_MIN_VOLUME_DB (-127.5)
#define AMPLINK_MINIDSP_MAX_VOLUME_DB 0.0
#define AMPLINK_MINIDSP_VOLUME_STEP_DB 0.5
#define AMPLINK_MINIDSP_NUM_PRESETS 5

/** The HTTP target that accepts configuration changes. */
#define AMPLINK_MINIDSP_CONFIG_TARGET "/devices/0/config"
/** The WebSocket target that streams status changes. */
#define AMPLINK_MINIDSP_STREAM_TARGET "/devices/0?poll=true"

/**
 * @}
 */

/**
 * @}
 */

#endif /* AMPLINK_DEFS_H_ */
