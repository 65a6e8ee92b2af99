///////////////////////////////////////////////////////////////////////////////
// FILE:          FilmSettings.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamDevice - Camera driver kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Settings of one acquisition ("film").
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

#include <string>

namespace camdev {

class FilmSettings
{
public:
   enum AcquisitionMode
   {
      RunTillAbort,
      FixedLength,
   };

   /**
    * A film that runs until it is stopped.
    */
   static FilmSettings RunTillAbortFilm(const std::string& basename = "");

   /**
    * A film of exactly filmLength frames. Throws ParameterError if
    * filmLength is negative.
    */
   static FilmSettings FixedLengthFilm(long filmLength,
         const std::string& basename = "");

   AcquisitionMode GetAcquisitionMode() const { return mode_; }
   bool IsFixedLength() const { return mode_ == FixedLength; }

   // Number of frames; 0 for run-till-abort films.
   long GetFilmLength() const { return filmLength_; }

   const std::string& GetBasename() const { return basename_; }

   bool GetRunShutters() const { return runShutters_; }
   void SetRunShutters(bool flag) { runShutters_ = flag; }

   bool GetSaveFilm() const { return saveFilm_; }
   void SetSaveFilm(bool flag) { saveFilm_ = flag; }

private:
   FilmSettings(AcquisitionMode mode, long filmLength,
         const std::string& basename);

   AcquisitionMode mode_;
   long filmLength_;
   std::string basename_;
   bool runShutters_;
   bool saveFilm_;
};

} // namespace camdev
