///////////////////////////////////////////////////////////////////////////////
// FILE:          CameraController.cpp
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
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

#include "CameraController.h"

#include "CoreUtils.h"
#include "Error.h"
#include "MessageRegistry.h"

#include <utility>

namespace cambus {

std::string ToString(FilmState state)
{
   switch (state)
   {
      case FilmState::Idle: return "idle";
      case FilmState::PendingFixedLength: return "fixed length pending";
      case FilmState::FixedLengthApplied: return "fixed length applied";
   }
   return "(unknown)";
}


CameraController::CameraController(const std::string& name,
      std::unique_ptr<camdev::Camera> driver, LogManager& logManager) :
   Module(name),
   logger_(logManager.NewLogger("cam:" + name)),
   camera_(std::move(driver), name, logger_),
   runner_(name, logManager.NewLogger("task:" + name)),
   filmState_(FilmState::Idle),
   filmLength_(0)
{}

void
CameraController::RegisterMessages(MessageRegistry& registry)
{
   // Every camera registers this; other modules send it to find a camera
   registry.RegisterMessage(msgtype::GetFunctionality, MessageShape(
            { { field::Camera, FieldSpec(true, FieldValue::TypeString) },
              { field::ExtraData, FieldSpec(false, FieldValue::TypeString) } },
            { { field::Functionality,
                  FieldSpec(true, FieldValue::TypeFunctionality) } }),
         false);
}

bool
CameraController::IsAddressedToMe(const Message& msg) const
{
   return msg.GetData().GetString(field::Camera) == GetName();
}

void
CameraController::ProcessMessage(Message& msg)
{
   switch (msg.GetKind())
   {
      case MessageKind::ConfigureInitial:
         ConfigureInitial();
         break;

      case MessageKind::FilmTiming:
         FilmTiming(msg);
         break;

      case MessageKind::GetFunctionality:
         GetFunctionality(msg);
         break;

      case MessageKind::NewParameters:
         NewParameters(msg);
         break;

      case MessageKind::ShutterClicked:
         if (IsAddressedToMe(msg))
            runner_.Run(msg, [this] { camera_.ToggleShutter(); });
         break;

      case MessageKind::StartCamera:
         if (IsAddressedToMe(msg))
            runner_.Run(msg, [this] { camera_.StartCamera(); });
         break;

      case MessageKind::StartFilm:
         StartFilm(msg);
         break;

      case MessageKind::StopCamera:
         if (IsAddressedToMe(msg))
            runner_.Run(msg, [this] { camera_.StopCamera(); });
         break;

      case MessageKind::StopFilm:
         StopFilm(msg);
         break;

      case MessageKind::InitialParameters:
      case MessageKind::Other:
         break;
   }
}

void
CameraController::ConfigureInitial()
{
   MessageData data;
   data.Set(field::Parameters, camera_.GetParameters().Copy());
   EmitMessage(std::make_shared<Message>(GetName(),
            MessageKind::InitialParameters, data));
}

void
CameraController::FilmTiming(Message& msg)
{
   std::shared_ptr<const camdev::CameraFunctionality> functionality =
      msg.GetData().GetFunctionality(field::Functionality);
   if (functionality->GetTimeBase() != GetName())
      return;

   long frames;
   {
      std::lock_guard<std::mutex> lock(stateMutex_);
      if (filmState_ != FilmState::PendingFixedLength)
      {
         LOG_DEBUG(logger_) << "Film timing ignored; film state is " <<
            ToString(filmState_);
         return;
      }
      frames = filmLength_;
   }

   if (runner_.Run(msg, [this, frames] { camera_.SetFilmLength(frames); }))
   {
      std::lock_guard<std::mutex> lock(stateMutex_);
      filmState_ = FilmState::FixedLengthApplied;
   }
}

void
CameraController::GetFunctionality(Message& msg)
{
   if (!IsAddressedToMe(msg))
      return;

   MessageData data;
   data.Set(field::Functionality, camera_.GetCameraFunctionality());
   msg.AddResponse(Response(GetName(), data));
}

void
CameraController::NewParameters(Message& msg)
{
   camdev::ParameterSet mine;
   try
   {
      mine = msg.GetData().GetParameters(field::Parameters).Get(GetName());
   }
   catch (const camdev::ParameterError& e)
   {
      throw CamBusError("New parameters have no settings for camera " +
            ToQuotedString(GetName()) + ": " + e.what(), CAMBUS_ERR_PROTOCOL);
   }

   MessageData oldData;
   oldData.Set(field::OldParameters, camera_.GetParameters().Copy());
   msg.AddResponse(Response(GetName(), oldData));

   if (!runner_.Run(msg, [this, mine] { camera_.NewParameters(mine); }))
      return;

   MessageData newData;
   newData.Set(field::NewParameters, camera_.GetParameters().Copy());
   msg.AddResponse(Response(GetName(), newData));
}

void
CameraController::StartFilm(const Message& msg)
{
   const camdev::FilmSettings& settings =
      msg.GetData().GetFilmSettings(field::FilmSettings);

   std::lock_guard<std::mutex> lock(stateMutex_);
   if (settings.IsFixedLength())
   {
      filmState_ = FilmState::PendingFixedLength;
      filmLength_ = settings.GetFilmLength();
      LOG_DEBUG(logger_) << "Fixed length film of " << filmLength_ <<
         " frames";
   }
   else
   {
      filmState_ = FilmState::Idle;
      filmLength_ = 0;
   }
}

void
CameraController::StopFilm(Message& msg)
{
   {
      std::lock_guard<std::mutex> lock(stateMutex_);
      if (filmState_ == FilmState::PendingFixedLength)
         LOG_DEBUG(logger_) << "Film length " << filmLength_ <<
            " was never applied; no film timing for this camera";
      filmState_ = FilmState::Idle;
      filmLength_ = 0;
   }

   camera_.StopFilm();

   MessageData data;
   data.Set(field::Parameters, camera_.GetParameters().Copy());
   msg.AddResponse(Response(GetName(), data));
}

void
CameraController::CleanUp()
{
   runner_.Abort();
   camera_.CleanUp();
}

FilmState
CameraController::GetFilmState() const
{
   std::lock_guard<std::mutex> lock(stateMutex_);
   return filmState_;
}

bool
CameraController::HasFilmLength() const
{
   std::lock_guard<std::mutex> lock(stateMutex_);
   return filmState_ != FilmState::Idle;
}

long
CameraController::GetFilmLength() const
{
   std::lock_guard<std::mutex> lock(stateMutex_);
   if (filmState_ == FilmState::Idle)
      throw CamBusError("Camera " + ToQuotedString(GetName()) +
            " has no film length", CAMBUS_ERR_BUS_STATE);
   return filmLength_;
}

} // namespace cambus
