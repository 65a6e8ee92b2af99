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

#include "LogSink.h"

#include <iostream>
#include <sstream>


namespace cambus
{
namespace logging
{


void
LogSink::SetFilter(std::shared_ptr<EntryFilter> filter)
{
   std::lock_guard<std::mutex> lock(mutex_);
   filter_ = filter;
}


void
LogSink::Consume(const std::vector<LogEntry>& entries)
{
   std::lock_guard<std::mutex> lock(mutex_);

   std::ostringstream strm;
   for (const LogEntry& entry : entries)
   {
      if (filter_ && !filter_->Filter(entry.metadata))
         continue;
      formatter_.FormatEntry(strm, entry);
   }

   const std::string formatted = strm.str();
   if (!formatted.empty())
      Write(formatted);
}


void
StdErrLogSink::Write(const std::string& formatted)
{
   std::clog << formatted;
   std::clog.flush();
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException();
}


FileLogSink::~FileLogSink()
{
   fileStream_.close();
}


void
FileLogSink::Write(const std::string& formatted)
{
   fileStream_ << formatted;
   fileStream_.flush();
}


} // namespace logging
} // namespace cambus
