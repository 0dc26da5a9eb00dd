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

#include "monitor.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <stdexcept>

#include "amplink/cpp/common.h"
#include "amplink/version.h"

static const std::map<std::string, int> kLogLevels = {
    {"EMERG", ETCPAL_LOG_UPTO(ETCPAL_LOG_EMERG)},     {"ALERT", ETCPAL_LOG_UPTO(ETCPAL_LOG_ALERT)},
    {"CRIT", ETCPAL_LOG_UPTO(ETCPAL_LOG_CRIT)},       {"ERR", ETCPAL_LOG_UPTO(ETCPAL_LOG_ERR)},
    {"WARNING", ETCPAL_LOG_UPTO(ETCPAL_LOG_WARNING)}, {"NOTICE", ETCPAL_LOG_UPTO(ETCPAL_LOG_NOTICE)},
    {"INFO", ETCPAL_LOG_UPTO(ETCPAL_LOG_INFO)},       {"DEBUG", ETCPAL_LOG_UPTO(ETCPAL_LOG_DEBUG)}};

// Splits a command line on whitespace. Double quotes group words, so device names with spaces can
// be given as "Living Room".
static std::vector<std::string> Tokenize(const std::string& line)
{
  std::vector<std::string> tokens;
  std::string              current;
  bool                     in_quotes = false;
  bool                     have_token = false;

  for (char c : line)
  {
    if (c == '"')
    {
      in_quotes = !in_quotes;
      have_token = true;
    }
    else if (!in_quotes && (c == ' ' || c == '\t'))
    {
      if (have_token)
      {
        tokens.push_back(current);
        current.clear();
        have_token = false;
      }
    }
    else
    {
      current.push_back(c);
      have_token = true;
    }
  }
  if (have_token)
    tokens.push_back(current);
  return tokens;
}

bool AmpMonitor::Startup(etcpal::Logger& logger)
{
  etcpal::Error res = amplink::Init(&logger);
  if (!res)
  {
    printf("Failed to initialize the AmpLink library: %s\n", res.ToCString());
    return false;
  }

  if (run_expert_)
  {
    expert_.AddNotifyHandler(*this);
    res = expert_.Startup(expert_settings_, &logger);
    if (!res)
    {
      printf("Failed to start listening for Expert amplifiers: %s\n", res.ToCString());
      amplink::Deinit();
      return false;
    }
  }

  if (run_minidsp_)
  {
    minidsp_.AddNotifyHandler(*this);
    res = minidsp_.Startup(minidsp_settings_, &logger);
    if (!res)
    {
      printf("Failed to start listening for miniDSP devices: %s\n", res.ToCString());
      expert_.Shutdown();
      amplink::Deinit();
      return false;
    }
  }

  return true;
}

void AmpMonitor::Shutdown()
{
  minidsp_.Shutdown();
  expert_.Shutdown();
  amplink::Deinit();
}

AmpMonitor::ParseResult AmpMonitor::ParseCommandLineArgs(const std::vector<std::string>& args)
{
  for (auto iter = args.begin() + (args.empty() ? 0 : 1); iter != args.end(); ++iter)
  {
    const char* arg = iter->c_str();

    if (strncmp(arg, "--family=", 9) == 0)
    {
      std::string family(arg + 9);
      if (family == "expert")
      {
        run_expert_ = true;
        run_minidsp_ = false;
      }
      else if (family == "minidsp")
      {
        run_expert_ = false;
        run_minidsp_ = true;
      }
      else if (family == "all")
      {
        run_expert_ = true;
        run_minidsp_ = true;
      }
      else
      {
        return ParseResult::kParseErr;
      }
    }
    else if (strncmp(arg, "--repeat=", 9) == 0)
    {
      int repeat = atoi(arg + 9);
      if (repeat < 1)
        return ParseResult::kParseErr;
      expert_settings_.transmit_count = static_cast<unsigned int>(repeat);
    }
    else if (strncmp(arg, "--http-port=", 12) == 0)
    {
      int port = atoi(arg + 12);
      if (port <= 0 || port > 65535)
        return ParseResult::kParseErr;
      minidsp_settings_.http_port = static_cast<uint16_t>(port);
    }
    else if (*iter == "--no-live")
    {
      minidsp_settings_.start_live_updates = false;
    }
    else if (strncmp(arg, "--log-level=", 12) == 0)
    {
      auto level = kLogLevels.find(arg + 12);
      if (level == kLogLevels.end())
        return ParseResult::kParseErr;
      log_mask_ = level->second;
    }
    else if (*iter == "--version" || *iter == "-v")
    {
      return ParseResult::kPrintVersion;
    }
    else if (*iter == "--help" || *iter == "-?" || *iter == "-h")
    {
      return ParseResult::kPrintHelp;
    }
    else
    {
      return ParseResult::kParseErr;
    }
  }
  return ParseResult::kRun;
}

void AmpMonitor::PrintUsage(const std::string& app_name)
{
  printf("Usage: %s [OPTION]...\n", app_name.c_str());
  printf("With no options, the app listens for all supported amplifiers and waits for user input.\n");
  printf("\n");
  printf("Options:\n");
  printf("  --family=FAMILY   Listen for 'expert', 'minidsp' or 'all' (default) amplifiers.\n");
  printf("  --repeat=N        Transmit each Expert command N times (default %d).\n",
         AMPLINK_EXPERT_DEFAULT_TRANSMIT_COUNT);
  printf("  --http-port=PORT  Port of the miniDSP HTTP service (default %d).\n", AMPLINK_MINIDSP_HTTP_PORT);
  printf("  --no-live         Do not open miniDSP status streams.\n");
  printf("  --log-level=LEVEL Log messages up to LEVEL: EMERG, ALERT, CRIT, ERR, WARNING, NOTICE,\n");
  printf("                    INFO (default) or DEBUG.\n");
  printf("  --help            Display this help and exit.\n");
  printf("  --version         Output version information and exit.\n");
}

void AmpMonitor::PrintVersion()
{
  printf("AmpLink Amplifier Monitor\n");
  printf("Version %s\n\n", AMPLINK_VERSION_STRING);
  printf("%s\n", AMPLINK_VERSION_COPYRIGHT);
  printf("License: Apache License v2.0 <http://www.apache.org/licenses/LICENSE-2.0>\n");
  printf("Unless required by applicable law or agreed to in writing, this software is\n");
  printf("provided \"AS IS\", WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express\n");
  printf("or implied.\n");
}

void AmpMonitor::PrintCommandList()
{
  printf("Commands (quote names containing spaces):\n");
  printf("    list: List all known amplifiers.\n");
  printf("    on NAME: Turn an Expert amplifier on.\n");
  printf("    off NAME: Turn an Expert amplifier off.\n");
  printf("    mute NAME 0|1: Unmute or mute an amplifier.\n");
  printf("    vol NAME DB: Set an amplifier's volume in decibels.\n");
  printf("    src NAME SOURCE: Select an amplifier's input.\n");
  printf("    preset NAME N: Select a miniDSP preset (1-%d).\n", AMPLINK_MINIDSP_NUM_PRESETS);
  printf("    help: Print this list.\n");
  printf("    quit: Exit.\n");
}

bool AmpMonitor::ParseCommand(const std::string& line)
{
  auto tokens = Tokenize(line);
  if (tokens.empty())
    return true;

  const std::string& command = tokens[0];
  try
  {
    if (command == "quit" || command == "q")
    {
      return false;
    }
    else if (command == "list")
    {
      PrintDevices();
    }
    else if (command == "help")
    {
      PrintCommandList();
    }
    else if ((command == "on" || command == "off") && tokens.size() == 2)
    {
      SetPower(tokens[1], command == "on");
    }
    else if (command == "mute" && tokens.size() == 3)
    {
      SetMute(tokens[1], std::stoi(tokens[2]) != 0);
    }
    else if (command == "vol" && tokens.size() == 3)
    {
      SetVolume(tokens[1], std::stod(tokens[2]));
    }
    else if (command == "src" && tokens.size() == 3)
    {
      SelectSource(tokens[1], tokens[2]);
    }
    else if (command == "preset" && tokens.size() == 3)
    {
      SelectPreset(tokens[1], std::stoi(tokens[2]) - 1);
    }
    else
    {
      printf("Unrecognized command. Type 'help' for a list of commands.\n");
    }
  }
  catch (const std::logic_error&)
  {
    printf("Invalid number in command.\n");
  }
  return true;
}

void AmpMonitor::HandleNewDevice(expert::Device& device)
{
  printf("New amplifier: %s\n", device.ToString().c_str());
}

void AmpMonitor::HandleDeviceUpdated(expert::Device& device, bool changed)
{
  if (changed)
    printf("Updated: %s\n", device.ToString().c_str());
}

void AmpMonitor::HandleNewDevice(minidsp::Device& device)
{
  printf("New amplifier: %s\n", device.ToString().c_str());
}

void AmpMonitor::HandleDeviceUpdated(minidsp::Device& device, bool changed)
{
  if (changed)
    printf("Updated: %s\n", device.ToString().c_str());
}

void AmpMonitor::PrintDevices()
{
  auto expert_devices = expert_.GetDevices();
  auto minidsp_devices = minidsp_.GetDevices();
  if (expert_devices.empty() && minidsp_devices.empty())
  {
    printf("No amplifiers found.\n");
    return;
  }

  for (const auto* device : expert_devices)
  {
    printf("%s\n", device->ToString().c_str());
    auto sources = device->GetSources();
    printf("    Inputs:");
    for (const auto& source : sources)
      printf(" \"%s\"", source.c_str());
    printf("\n");
  }
  for (const auto* device : minidsp_devices)
  {
    printf("%s\n", device->ToString().c_str());
    printf("    %s\n", device->discovery_info().ToString().c_str());
  }
}

void AmpMonitor::SetPower(const std::string& name, bool on)
{
  auto device = expert_.FindDevice(name);
  if (!device)
  {
    printf("No Expert amplifier named \"%s\".\n", name.c_str());
    return;
  }
  PrintResult(name, on ? "Power on" : "Power off", on ? device->TurnOn() : device->TurnOff());
}

void AmpMonitor::SetMute(const std::string& name, bool mute)
{
  if (auto device = expert_.FindDevice(name))
    PrintResult(name, mute ? "Mute" : "Unmute", device->SetMute(mute));
  else if (auto other = minidsp_.FindDevice(name))
    PrintResult(name, mute ? "Mute" : "Unmute", other->SetMute(mute));
  else
    printf("No amplifier named \"%s\".\n", name.c_str());
}

void AmpMonitor::SetVolume(const std::string& name, double db)
{
  if (auto device = expert_.FindDevice(name))
    PrintResult(name, "Set volume", device->SetVolumeDb(db));
  else if (auto other = minidsp_.FindDevice(name))
    PrintResult(name, "Set volume", other->SetVolumeDb(db));
  else
    printf("No amplifier named \"%s\".\n", name.c_str());
}

void AmpMonitor::SelectSource(const std::string& name, const std::string& source)
{
  if (auto device = expert_.FindDevice(name))
    PrintResult(name, "Select input", device->SelectSource(source));
  else if (auto other = minidsp_.FindDevice(name))
    PrintResult(name, "Select input", other->SelectSource(source));
  else
    printf("No amplifier named \"%s\".\n", name.c_str());
}

void AmpMonitor::SelectPreset(const std::string& name, int preset)
{
  auto device = minidsp_.FindDevice(name);
  if (!device)
  {
    printf("No miniDSP device named \"%s\".\n", name.c_str());
    return;
  }
  PrintResult(name, "Select preset", device->SelectPreset(preset));
}

void AmpMonitor::PrintResult(const std::string& name, const char* action, const etcpal::Error& result)
{
  if (result)
    printf("%s on \"%s\": OK\n", action, name.c_str());
  else
    printf("%s on \"%s\" failed: %s\n", action, name.c_str(), result.ToCString());
}
