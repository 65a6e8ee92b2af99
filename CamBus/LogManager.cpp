///////////////////////////////////////////////////////////////////////////////
// FILE:          LogManager.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
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

#include "LogManager.h"

#include "CoreUtils.h"
#include "Error.h"

#include <utility>

namespace cambus {

namespace {

const logging::SinkMode BusSinkMode = logging::SinkModeAsynchronous;

const logging::LogLevel AllLevels[] = {
   logging::LogLevelTrace,
   logging::LogLevelDebug,
   logging::LogLevelInfo,
   logging::LogLevelWarning,
   logging::LogLevelError,
   logging::LogLevelFatal,
};

} // anonymous namespace

const char* StringForLogLevel(logging::LogLevel level)
{
   switch (level)
   {
      case logging::LogLevelTrace: return "trace";
      case logging::LogLevelDebug: return "debug";
      case logging::LogLevelInfo: return "info";
      case logging::LogLevelWarning: return "warning";
      case logging::LogLevelError: return "error";
      case logging::LogLevelFatal: return "fatal";
   }
   return "(unknown)";
}

logging::LogLevel LogLevelFromString(const std::string& name)
{
   for (logging::LogLevel level : AllLevels)
   {
      if (name == StringForLogLevel(level))
         return level;
   }
   throw CamBusError("No such log level: " + ToQuotedString(name),
         CAMBUS_ERR_CONFIG);
}


LogManager::LogManager() :
   core_(std::make_shared<logging::LoggingCore>()),
   logger_(core_->NewLogger("log"))
{}

void
LogManager::Configure(const LoggingConfig& config)
{
   std::lock_guard<std::mutex> lock(mutex_);

   // Open the file first; nothing changes if that fails
   std::shared_ptr<logging::LogSink> file = fileSink_;
   if (config.filename != config_.filename)
   {
      file.reset();
      if (!config.filename.empty())
      {
         try
         {
            file = std::make_shared<logging::FileLogSink>(config.filename,
                  true);
         }
         catch (const logging::CannotOpenFileException&)
         {
            LOG_ERROR(logger_) << "Cannot open log file " << config.filename;
            throw CamBusError("Cannot open log file " +
                  ToQuotedString(config.filename),
                  CAMBUS_ERR_FILE_OPEN_FAILED);
         }
      }
   }

   std::shared_ptr<logging::LogSink> stdErr;
   if (config.useStdErr)
      stdErr = stdErrSink_ ? stdErrSink_ :
         std::make_shared<logging::StdErrLogSink>();

   std::shared_ptr<logging::EntryFilter> filter =
      std::make_shared<logging::LevelFilter>(config.level);
   if (file)
      file->SetFilter(filter);
   if (stdErr)
      stdErr->SetFilter(filter);

   ReplaceSink(fileSink_, file);
   ReplaceSink(stdErrSink_, stdErr);
   config_ = config;

   LOG_INFO(logger_) << "Logging at level " <<
      StringForLogLevel(config_.level) <<
      (config_.useStdErr ? " to stderr" : "") <<
      (config_.filename.empty() ? "" : " to file " + config_.filename);
}

void
LogManager::ReplaceSink(std::shared_ptr<logging::LogSink>& current,
      std::shared_ptr<logging::LogSink> replacement)
{
   if (replacement == current)
      return;
   // Add before removing, so that no entry falls between the two sinks
   if (replacement)
      core_->AddSink(replacement, BusSinkMode);
   if (current)
      core_->RemoveSink(current, BusSinkMode);
   current = std::move(replacement);
}

LoggingConfig
LogManager::GetConfig() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return config_;
}

void
LogManager::Flush()
{
   core_->Flush();
}

logging::Logger
LogManager::NewLogger(const std::string& label)
{
   return core_->NewLogger(label);
}

} // namespace cambus
