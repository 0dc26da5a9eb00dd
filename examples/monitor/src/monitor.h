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

#ifndef AMPLINK_MONITOR_H_
#define AMPLINK_MONITOR_H_

#include <string>
#include <vector>

#include "etcpal/cpp/log.h"
#include "amplink/cpp/expert.h"
#include "amplink/cpp/minidsp.h"

namespace expert = amplink::expert;
namespace minidsp = amplink::minidsp;

// Prints amplifier discovery and state changes, and controls amplifiers from console commands.
class AmpMonitor : public expert::Controller::NotifyHandler, public minidsp::Controller::NotifyHandler
{
public:
  bool Startup(etcpal::Logger& logger);
  void Shutdown();

  enum class ParseResult
  {
    kRun,
    kParseErr,
    kPrintHelp,
    kPrintVersion
  };
  ParseResult ParseCommandLineArgs(const std::vector<std::string>& args);
  void        PrintUsage(const std::string& app_name);
  void        PrintVersion();

  int log_mask() const { return log_mask_; }

  void PrintCommandList();
  bool ParseCommand(const std::string& line);

  void HandleNewDevice(expert::Device& device) override;
  void HandleDeviceUpdated(expert::Device& device, bool changed) override;
  void HandleNewDevice(minidsp::Device& device) override;
  void HandleDeviceUpdated(minidsp::Device& device, bool changed) override;

private:
  void PrintDevices();
  void SetPower(const std::string& name, bool on);
  void SetMute(const std::string& name, bool mute);
  void SetVolume(const std::string& name, double db);
  void SelectSource(const std::string& name, const std::string& source);
  void SelectPreset(const std::string& name, int preset);
  void PrintResult(const std::string& name, const char* action, const etcpal::Error& result);

  bool run_expert_{true};
  bool run_minidsp_{true};
  int  log_mask_{ETCPAL_LOG_UPTO(ETCPAL_LOG_INFO)};

  expert::Settings  expert_settings_;
  minidsp::Settings minidsp_settings_;

  expert::Controller  expert_;
  minidsp::Controller minidsp_;
};

#endif  // AMPLINK_MONITOR_H_
