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

#pragma once

#include "Metadata.h"

#include <chrono>
#include <ostream>
#include <string>
#include <vector>


namespace cambus
{
namespace logging
{
namespace internal
{


const char* LevelString(LogLevel logLevel);

std::string FormatLocalTime(
      std::chrono::time_point<std::chrono::system_clock> tp);

// Split entry text at CR, LF, or CRLF. Trailing line breaks are dropped; the
// result always has at least one (possibly empty) line.
std::vector<std::string> SplitEntryIntoLines(const std::string& text);


// Writes an entry as
//    <time> tid<id> [LVL,component] first line
//                   [            ] continuation line
// Keeps buffers between calls; use from one thread only.
class MetadataFormatter
{
   std::string buf_;
   size_t openBracketCol_;
   size_t closeBracketCol_;

public:
   MetadataFormatter() : openBracketCol_(0), closeBracketCol_(0) {}

   void FormatEntry(std::ostream& stream, const LogEntry& entry);

private:
   void FormatLinePrefix(std::ostream& stream, const Metadata& metadata);
   void FormatContinuationPrefix(std::ostream& stream);
};


} // namespace internal
} // namespace logging
} // namespace cambus
