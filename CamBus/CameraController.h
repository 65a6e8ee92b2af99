///////////////////////////////////////////////////////////////////////////////
// FILE:          CameraController.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Bus module operating one camera.
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

#include "Devices/CameraInstance.h"
#include "LogManager.h"
#include "Module.h"
#include "ScopedTaskRunner.h"

#include <memory>
#include <mutex>
#include <string>

namespace cambus {

enum class FilmState
{
   Idle,
   // A fixed-length film was started; the length has not reached the driver
   PendingFixedLength,
   FixedLengthApplied,
};

std::string ToString(FilmState state);


/**
 * Controller for a single camera. The module name is the camera name; the
 * controller answers messages addressed to that name and every broadcast
 * that concerns cameras.
 *
 * Calls that may block on the hardware (start, stop, shutter, film length,
 * new parameters) run on the controller's task runner while the dispatch
 * path waits for them.
 */
class CameraController : public Module
{
public:
   CameraController(const std::string& name,
         std::unique_ptr<camdev::Camera> driver, LogManager& logManager);

   void RegisterMessages(MessageRegistry& registry) override;
   void ProcessMessage(Message& msg) override;
   void CleanUp() override;

   FilmState GetFilmState() const;
   bool HasFilmLength() const;
   // Throws CamBusError if there is no film length
   long GetFilmLength() const;

private:
   bool IsAddressedToMe(const Message& msg) const;

   void ConfigureInitial();
   void FilmTiming(Message& msg);
   void GetFunctionality(Message& msg);
   void NewParameters(Message& msg);
   void StartFilm(const Message& msg);
   void StopFilm(Message& msg);

   logging::Logger logger_;
   CameraInstance camera_;
   ScopedTaskRunner runner_;

   mutable std::mutex stateMutex_;
   FilmState filmState_;
   long filmLength_;
};

} // namespace cambus
