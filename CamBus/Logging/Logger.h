// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//
// DESCRIPTION:   Logger handle and stream-style logging macros.
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

#include "Metadata.h"

#include <memory>
#include <sstream>
#include <string>


namespace cambus
{
namespace logging
{

class LoggingCore;


/**
 * Copyable handle for writing entries under one component label.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   LoggerData loggerData_;

public:
   Logger(std::shared_ptr<LoggingCore> core, const std::string& label);

   const std::string& GetLabel() const
   { return loggerData_.GetComponentLabel(); }

   void operator()(LogLevel level, const std::string& text) const;
};


namespace internal
{

// Collects one entry; the entry is sent when the stream is destroyed.
class LogStream : public std::ostringstream
{
   const Logger& logger_;
   LogLevel level_;
   bool used_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger), level_(level), used_(false)
   {}

   ~LogStream() { logger_(level_, str()); }

   bool Used() const { return used_; }
   void MarkUsed() { used_ = true; }
};

} // namespace internal

} // namespace logging
} // namespace cambus


// The for loop gives the stream a name (so that all operator<< overloads
// apply) and limits its lifetime to the one statement.
#define LOG_WITH_LEVEL(logger, level) \
   for (::cambus::logging::internal::LogStream cambusLogStrm_((logger), (level)); \
         !cambusLogStrm_.Used(); cambusLogStrm_.MarkUsed()) \
      cambusLogStrm_

#define LOG_TRACE(logger) LOG_WITH_LEVEL((logger), ::cambus::logging::LogLevelTrace)
#define LOG_DEBUG(logger) LOG_WITH_LEVEL((logger), ::cambus::logging::LogLevelDebug)
#define LOG_INFO(logger) LOG_WITH_LEVEL((logger), ::cambus::logging::LogLevelInfo)
#define LOG_WARNING(logger) LOG_WITH_LEVEL((logger), ::cambus::logging::LogLevelWarning)
#define LOG_ERROR(logger) LOG_WITH_LEVEL((logger), ::cambus::logging::LogLevelError)
#define LOG_FATAL(logger) LOG_WITH_LEVEL((logger), ::cambus::logging::LogLevelFatal)
