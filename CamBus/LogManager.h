///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Logging setup of a message bus.
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "Logging/Logging.h"

#include <memory>
#include <mutex>
#include <string>

namespace cambus {

struct LoggingConfig
{
   logging::LogLevel level = logging::LogLevelInfo;
   bool useStdErr = false;
   // Empty for no log file
   std::string filename;
};

/**
 * Owns the logging core of a bus and the two sinks a bus can be configured
 * with: stderr and a log file. Both sinks filter at the configured level.
 */
class LogManager
{
public:
   LogManager();

   LogManager(const LogManager&) = delete;
   LogManager& operator=(const LogManager&) = delete;

   /**
    * Switch to the given configuration. An open log file is kept if the
    * file name does not change; a newly named file is appended to.
    *
    * Throws CamBusError (CAMBUS_ERR_FILE_OPEN_FAILED) if the log file cannot
    * be opened. The previous configuration then stays in effect.
    */
   void Configure(const LoggingConfig& config);
   LoggingConfig GetConfig() const;

   // Wait until entries logged so far have reached the sinks.
   void Flush();

   logging::Logger NewLogger(const std::string& label);

private:
   void ReplaceSink(std::shared_ptr<logging::LogSink>& current,
         std::shared_ptr<logging::LogSink> replacement);

   std::shared_ptr<logging::LoggingCore> core_;
   logging::Logger logger_;

   mutable std::mutex mutex_;
   LoggingConfig config_;
   std::shared_ptr<logging::LogSink> stdErrSink_;
   std::shared_ptr<logging::LogSink> fileSink_;
};

/**
 * Parse "trace", "debug", "info", "warning", "error" or "fatal".
 * Throws CamBusError (CAMBUS_ERR_CONFIG) for anything else.
 */
logging::LogLevel LogLevelFromString(const std::string& name);
const char* StringForLogLevel(logging::LogLevel level);

} // namespace cambus
