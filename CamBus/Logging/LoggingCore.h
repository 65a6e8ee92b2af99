// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//
// DESCRIPTION:   Routing of log entries from loggers to sinks.
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

#include "LogSink.h"
#include "Logger.h"
#include "Metadata.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>


namespace cambus
{
namespace logging
{


enum SinkMode
{
   // Entries are written on the thread that logs them
   SinkModeSynchronous,
   // Entries are queued and written on the core's background thread
   SinkModeAsynchronous,
};


class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   std::mutex syncSinksMutex_;
   std::vector<std::shared_ptr<LogSink>> synchronousSinks_;

   std::mutex asyncMutex_;
   std::condition_variable asyncCondVar_;
   std::condition_variable flushedCondVar_;
   std::deque<LogEntry> asyncQueue_;
   std::vector<std::shared_ptr<LogSink>> asynchronousSinks_;
   bool stopRequested_;
   bool writing_;
   std::thread asyncThread_;

public:
   LoggingCore();
   ~LoggingCore();

   LoggingCore(const LoggingCore&) = delete;
   LoggingCore& operator=(const LoggingCore&) = delete;

   Logger NewLogger(const std::string& label);

   void AddSink(std::shared_ptr<LogSink> sink, SinkMode mode);
   void RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode);

   // Block until all queued asynchronous entries have been written.
   void Flush();

   // Called by Logger
   void SendEntry(const LoggerData& loggerData, LogLevel level,
         const std::string& text);

private:
   void AsyncThreadFunc();
   void WriteAsyncBatch(std::unique_lock<std::mutex>& lock);
};


} // namespace logging
} // namespace cambus
