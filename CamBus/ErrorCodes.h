///////////////////////////////////////////////////////////////////////////////
// FILE:          ErrorCodes.h
// PROJECT:       CamBus
// SUBSYSTEM:     CamBus
//-----------------------------------------------------------------------------
// DESCRIPTION:   List of error IDs
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

#define CAMBUS_ERR_OK                      0
#define CAMBUS_ERR_GENERIC                 1
#define CAMBUS_ERR_DEVICE                  2  // The camera driver failed an operation
#define CAMBUS_ERR_PROTOCOL                3  // Message payload does not match its registered shape
#define CAMBUS_ERR_CONFIG                  4
#define CAMBUS_ERR_UNKNOWN_MESSAGE         5
#define CAMBUS_ERR_DUPLICATE_MESSAGE       6
#define CAMBUS_ERR_DUPLICATE_MODULE        7
#define CAMBUS_ERR_NO_SUCH_ADAPTER         8
#define CAMBUS_ERR_NO_SUCH_DEVICE          9
#define CAMBUS_ERR_NO_SUCH_FEATURE         10
#define CAMBUS_ERR_BUS_STATE               11
#define CAMBUS_ERR_TASK_BUSY               12
#define CAMBUS_ERR_FILE_OPEN_FAILED        13
