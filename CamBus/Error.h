///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exception class for bus errors.
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

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>

namespace cambus {

/// Exception thrown by the bus core.
/**
 * A CamBusError carries a message, an error code (see ErrorCodes.h), and
 * optionally the error that caused it. The chain is kept so that, for
 * example, a device failure can be reported as "Cannot start camera" with
 * the driver's own error text underneath.
 */
class CamBusError : public std::exception
{
public:
   typedef int Code;

   explicit CamBusError(const std::string& msg, Code code = CAMBUS_ERR_GENERIC);
   explicit CamBusError(const char* msg, Code code = CAMBUS_ERR_GENERIC);
   CamBusError(const std::string& msg, Code code,
         const CamBusError& underlyingError);
   CamBusError(const std::string& msg, const CamBusError& underlyingError);

   CamBusError(const CamBusError& other);
   CamBusError& operator=(const CamBusError& rhs);

   virtual ~CamBusError() {}

   virtual const char* what() const noexcept { return message_.c_str(); }

   /// Message of this error only.
   virtual std::string getMsg() const;

   /// Messages of this error and all underlying errors.
   virtual std::string getFullMsg() const;

   /// The code of this error, or of the first underlying error with a
   /// specific (non-generic) code.
   virtual Code getCode() const;

   /// The code of this error, ignoring underlying errors.
   virtual Code getSpecificCode() const { return code_; }

   virtual const CamBusError* getUnderlyingError() const
   { return underlying_.get(); }

private:
   std::string message_;
   Code code_;
   std::unique_ptr<CamBusError> underlying_;
};

} // namespace cambus
