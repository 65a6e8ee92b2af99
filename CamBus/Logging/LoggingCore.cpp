// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
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

#include "LoggingCore.h"

#include <algorithm>
#include <utility>


namespace cambus
{
namespace logging
{


Logger::Logger(std::shared_ptr<LoggingCore> core, const std::string& label) :
   core_(std::move(core)),
   loggerData_(label)
{}


void
Logger::operator()(LogLevel level, const std::string& text) const
{
   core_->SendEntry(loggerData_, level, text);
}


LoggingCore::LoggingCore() :
   stopRequested_(false),
   writing_(false)
{
   asyncThread_ = std::thread(&LoggingCore::AsyncThreadFunc, this);
}


LoggingCore::~LoggingCore()
{
   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      stopRequested_ = true;
   }
   asyncCondVar_.notify_all();
   asyncThread_.join();
}


Logger
LoggingCore::NewLogger(const std::string& label)
{
   return Logger(shared_from_this(), label);
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   switch (mode)
   {
      case SinkModeSynchronous:
      {
         std::lock_guard<std::mutex> lock(syncSinksMutex_);
         synchronousSinks_.push_back(sink);
         break;
      }
      case SinkModeAsynchronous:
      {
         std::lock_guard<std::mutex> lock(asyncMutex_);
         asynchronousSinks_.push_back(sink);
         break;
      }
   }
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink, SinkMode mode)
{
   switch (mode)
   {
      case SinkModeSynchronous:
      {
         std::lock_guard<std::mutex> lock(syncSinksMutex_);
         synchronousSinks_.erase(std::remove(synchronousSinks_.begin(),
                  synchronousSinks_.end(), sink), synchronousSinks_.end());
         break;
      }
      case SinkModeAsynchronous:
      {
         // Entries already queued still go to the sink being removed
         std::unique_lock<std::mutex> lock(asyncMutex_);
         flushedCondVar_.wait(lock,
               [&] { return asyncQueue_.empty() && !writing_; });
         asynchronousSinks_.erase(std::remove(asynchronousSinks_.begin(),
                  asynchronousSinks_.end(), sink), asynchronousSinks_.end());
         break;
      }
   }
}


void
LoggingCore::Flush()
{
   std::unique_lock<std::mutex> lock(asyncMutex_);
   flushedCondVar_.wait(lock,
         [&] { return asyncQueue_.empty() && !writing_; });
}


void
LoggingCore::SendEntry(const LoggerData& loggerData, LogLevel level,
      const std::string& text)
{
   StampData stamp;
   stamp.Stamp();
   LogEntry entry(Metadata(loggerData, EntryData(level), stamp), text);

   {
      std::lock_guard<std::mutex> lock(syncSinksMutex_);
      if (!synchronousSinks_.empty())
      {
         const std::vector<LogEntry> entries(1, entry);
         for (const std::shared_ptr<LogSink>& sink : synchronousSinks_)
            sink->Consume(entries);
      }
   }

   {
      std::lock_guard<std::mutex> lock(asyncMutex_);
      if (asynchronousSinks_.empty())
         return;
      asyncQueue_.push_back(entry);
   }
   asyncCondVar_.notify_one();
}


void
LoggingCore::AsyncThreadFunc()
{
   std::unique_lock<std::mutex> lock(asyncMutex_);
   for (;;)
   {
      asyncCondVar_.wait(lock,
            [&] { return stopRequested_ || !asyncQueue_.empty(); });
      if (!asyncQueue_.empty())
         WriteAsyncBatch(lock);
      else if (stopRequested_)
         break;
   }
}


void
LoggingCore::WriteAsyncBatch(std::unique_lock<std::mutex>& lock)
{
   const std::vector<LogEntry> batch(asyncQueue_.begin(), asyncQueue_.end());
   asyncQueue_.clear();
   const std::vector<std::shared_ptr<LogSink>> sinks = asynchronousSinks_;
   writing_ = true;

   lock.unlock();
   for (const std::shared_ptr<LogSink>& sink : sinks)
      sink->Consume(batch);
   lock.lock();

   writing_ = false;
   flushedCondVar_.notify_all();
}


} // namespace logging
} // namespace cambus
