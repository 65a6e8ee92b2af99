// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//
// DESCRIPTION:   Log entry filters and sinks.
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
#include "MetadataFormatter.h"

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>


namespace cambus
{
namespace logging
{


class EntryFilter
{
public:
   virtual ~EntryFilter() {}
   virtual bool Filter(const Metadata& metadata) const = 0;
};


class LevelFilter : public EntryFilter
{
   LogLevel minLevel_;

public:
   explicit LevelFilter(LogLevel minLevel) : minLevel_(minLevel) {}

   bool Filter(const Metadata& metadata) const override
   { return metadata.GetEntryData().GetLevel() >= minLevel_; }
};


/**
 * Destination for log entries. Consume() may be called from any thread;
 * calls are serialized by the sink.
 */
class LogSink
{
   std::mutex mutex_;
   std::shared_ptr<EntryFilter> filter_;
   internal::MetadataFormatter formatter_;

public:
   virtual ~LogSink() {}

   void SetFilter(std::shared_ptr<EntryFilter> filter);

   void Consume(const std::vector<LogEntry>& entries);

protected:
   // Write formatted text; called with the sink's lock held.
   virtual void Write(const std::string& formatted) = 0;
};


class StdErrLogSink : public LogSink
{
protected:
   void Write(const std::string& formatted) override;
};


class CannotOpenFileException : public std::runtime_error
{
public:
   CannotOpenFileException() :
      std::runtime_error("Cannot open log file")
   {}
};


class FileLogSink : public LogSink
{
   std::string filename_;
   std::ofstream fileStream_;

public:
   FileLogSink(const std::string& filename, bool append);
   ~FileLogSink() override;

   const std::string& GetFilename() const { return filename_; }

protected:
   void Write(const std::string& formatted) override;
};


} // namespace logging
} // namespace cambus
