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

#include <csignal>
#include <ctime>
#include <iostream>
#include <string>

#include "etcpal/cpp/log.h"
#include "monitor.h"

class MonitorLogHandler : public etcpal::LogMessageHandler
{
public:
  void                 HandleLogMessage(const EtcPalLogStrings& strings) override;
  etcpal::LogTimestamp GetLogTimestamp() override;
};

void MonitorLogHandler::HandleLogMessage(const EtcPalLogStrings& strings)
{
  std::cout << strings.human_readable << '\n';
}

etcpal::LogTimestamp MonitorLogHandler::GetLogTimestamp()
{
  time_t     t = time(NULL);
  struct tm* local_time = localtime(&t);

  return etcpal::LogTimestamp(local_time->tm_year + 1900, local_time->tm_mon + 1, local_time->tm_mday,
                              local_time->tm_hour, local_time->tm_min, local_time->tm_sec, 0,
                              (int)(local_time->tm_gmtoff / 60));
}

static volatile sig_atomic_t stop_requested = 0;

void signal_handler(int signal)
{
  (void)signal;
  stop_requested = 1;
}

int main(int argc, char* argv[])
{
  AmpMonitor monitor;

  std::vector<std::string> args;
  args.reserve(argc);
  for (int i = 0; i < argc; ++i)
    args.push_back(std::string(argv[i]));
  switch (monitor.ParseCommandLineArgs(args))
  {
    case AmpMonitor::ParseResult::kParseErr:
      monitor.PrintUsage(argv[0]);
      return 1;
    case AmpMonitor::ParseResult::kPrintHelp:
      monitor.PrintUsage(argv[0]);
      return 0;
    case AmpMonitor::ParseResult::kPrintVersion:
      monitor.PrintVersion();
      return 0;
    default:
      break;
  }

  // Ctrl+C interrupts the blocking read below; no SA_RESTART.
  struct sigaction sigint_handler;
  sigint_handler.sa_handler = signal_handler;
  sigemptyset(&sigint_handler.sa_mask);
  sigint_handler.sa_flags = 0;
  sigaction(SIGINT, &sigint_handler, NULL);

  MonitorLogHandler log_handler;
  etcpal::Logger    logger;
  logger.SetLogAction(kEtcPalLogCreateHumanReadable).SetLogMask(monitor.log_mask()).Startup(log_handler);

  if (!monitor.Startup(logger))
  {
    logger.Shutdown();
    return 1;
  }

  monitor.PrintCommandList();

  std::string input;
  while (!stop_requested && std::getline(std::cin, input))
  {
    if (!monitor.ParseCommand(input))
      break;
  }

  if (stop_requested)
    std::cout << "Caught SIGINT. Stopping...\n";

  monitor.Shutdown();
  logger.Shutdown();
  return 0;
}
