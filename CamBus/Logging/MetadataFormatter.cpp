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

#include "MetadataFormatter.h"

#include <cstdio>
#include <ctime>
#include <sstream>


namespace cambus
{
namespace logging
{
namespace internal
{


const char*
LevelString(LogLevel logLevel)
{
   switch (logLevel)
   {
      case LogLevelTrace: return "trc";
      case LogLevelDebug: return "dbg";
      case LogLevelInfo: return "IFO";
      case LogLevelWarning: return "WRN";
      case LogLevelError: return "ERR";
      case LogLevelFatal: return "FTL";
      default: return "???";
   }
}


std::string
FormatLocalTime(std::chrono::time_point<std::chrono::system_clock> tp)
{
   using namespace std::chrono;
   auto us = duration_cast<microseconds>(tp.time_since_epoch());
   auto secs = duration_cast<seconds>(us);
   auto whole = duration_cast<microseconds>(secs);
   auto frac = static_cast<int>((us - whole).count());

   std::time_t t(secs.count());
   std::tm tmstruct;
   std::tm* ptm = localtime_r(&t, &tmstruct);

   // "yyyy-mm-ddThh:mm:ss.uuuuuu"
   char buf[32];
   std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", ptm);
   std::snprintf(buf + len, sizeof(buf) - len, ".%06d", frac);
   return buf;
}


std::vector<std::string>
SplitEntryIntoLines(const std::string& text)
{
   std::string::size_type end = text.find_last_not_of("\r\n");
   const std::string trimmed = (end == std::string::npos) ?
      std::string() : text.substr(0, end + 1);

   std::vector<std::string> lines;
   std::string current;
   for (std::string::size_type i = 0; i < trimmed.size(); ++i)
   {
      const char ch = trimmed[i];
      if (ch == '\r' || ch == '\n')
      {
         lines.push_back(current);
         current.clear();
         if (ch == '\r' && i + 1 < trimmed.size() && trimmed[i + 1] == '\n')
            ++i;
      }
      else
      {
         current += ch;
      }
   }
   lines.push_back(current);
   return lines;
}


void
MetadataFormatter::FormatEntry(std::ostream& stream, const LogEntry& entry)
{
   const std::vector<std::string> lines = SplitEntryIntoLines(entry.text);
   for (std::vector<std::string>::size_type i = 0; i < lines.size(); ++i)
   {
      if (i == 0)
         FormatLinePrefix(stream, entry.metadata);
      else
         FormatContinuationPrefix(stream);
      stream << ' ' << lines[i] << '\n';
   }
}


void
MetadataFormatter::FormatLinePrefix(std::ostream& stream,
      const Metadata& metadata)
{
   buf_ = FormatLocalTime(metadata.GetStampData().GetTimestamp());
   buf_ += " tid";
   std::ostringstream tid;
   tid << metadata.GetStampData().GetThreadId();
   buf_ += tid.str();
   buf_ += ' ';

   openBracketCol_ = buf_.size();
   buf_ += '[';

   buf_ += LevelString(metadata.GetEntryData().GetLevel());
   buf_ += ',';
   buf_ += metadata.GetLoggerData().GetComponentLabel();

   closeBracketCol_ = buf_.size();
   buf_ += ']';

   stream << buf_;
}


void
MetadataFormatter::FormatContinuationPrefix(std::ostream& stream)
{
   buf_.assign(closeBracketCol_ + 1, ' ');
   buf_[openBracketCol_] = '[';
   buf_[closeBracketCol_] = ']';
   stream << buf_;
}


} // namespace internal
} // namespace logging
} // namespace cambus
