///////////////////////////////////////////////////////////////////////////////
// FILE:          FilmSettings.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
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

#include "FilmSettings.h"

#include "ParameterSet.h"

namespace camdev {

FilmSettings::FilmSettings(AcquisitionMode mode, long filmLength,
      const std::string& basename) :
   mode_(mode),
   filmLength_(filmLength),
   basename_(basename),
   runShutters_(false),
   saveFilm_(false)
{}


FilmSettings
FilmSettings::RunTillAbortFilm(const std::string& basename)
{
   return FilmSettings(RunTillAbort, 0, basename);
}


FilmSettings
FilmSettings::FixedLengthFilm(long filmLength, const std::string& basename)
{
   if (filmLength < 0)
      throw ParameterError("Film length must not be negative (got " +
            std::to_string(filmLength) + ")");
   return FilmSettings(FixedLength, filmLength, basename);
}

} // namespace camdev
