///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.cpp
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

#include "Error.h"

namespace cambus {

CamBusError::CamBusError(const std::string& msg, Code code) :
   message_(msg),
   code_(code)
{}


CamBusError::CamBusError(const char* msg, Code code) :
   message_(msg ? msg : "(null message)"),
   code_(code)
{}


CamBusError::CamBusError(const std::string& msg, Code code,
      const CamBusError& underlyingError) :
   message_(msg),
   code_(code),
   underlying_(new CamBusError(underlyingError))
{}


CamBusError::CamBusError(const std::string& msg,
      const CamBusError& underlyingError) :
   message_(msg),
   code_(CAMBUS_ERR_GENERIC),
   underlying_(new CamBusError(underlyingError))
{}


CamBusError::CamBusError(const CamBusError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   underlying_(other.underlying_ ? new CamBusError(*other.underlying_) : 0)
{}


CamBusError&
CamBusError::operator=(const CamBusError& rhs)
{
   if (this == &rhs)
      return *this;
   message_ = rhs.message_;
   code_ = rhs.code_;
   underlying_.reset(rhs.underlying_ ? new CamBusError(*rhs.underlying_) : 0);
   return *this;
}


std::string
CamBusError::getMsg() const
{
   return message_;
}


std::string
CamBusError::getFullMsg() const
{
   if (underlying_)
      return getMsg() + " [ " + underlying_->getFullMsg() + " ]";
   return getMsg();
}


CamBusError::Code
CamBusError::getCode() const
{
   if (code_ != CAMBUS_ERR_GENERIC || !underlying_)
      return code_;
   return underlying_->getCode();
}

} // namespace cambus
