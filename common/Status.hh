// ----------------------------------------------------------------------
// File: Status.hh
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2026 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#ifndef XMDCOMMON_STATUS_HH
#define XMDCOMMON_STATUS_HH

#include "common/Namespace.hh"
#include "common/XattrCompat.hh"
#include <cerrno>
#include <sstream>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Status object for metadata operations which may fail.
//!
//! Carries the error kind higher layers branch on, the OS errno the failure
//! originated from and a context message for diagnostics.
//------------------------------------------------------------------------------
class Status
{
public:
  enum class Kind {
    kOk,       //!< success
    kNotFound, //!< attribute/metadata does not exist
    kTooSmall, //!< destination buffer shorter than the value
    kIOError   //!< any other failure, errno kept verbatim
  };

  //----------------------------------------------------------------------------
  // Default constructor - status is OK, no error message.
  //----------------------------------------------------------------------------
  Status() : mKind(Kind::kOk), mErrc(0) {}

  //----------------------------------------------------------------------------
  // Constructor with an error
  //----------------------------------------------------------------------------
  Status(Kind kind, int err, const std::string& msg) :
    mKind(kind), mErrc(err), mErrorMessage(msg) {}

  static Status NotFound(const std::string& msg)
  {
    return Status(Kind::kNotFound, ENOATTR, msg);
  }

  static Status TooSmall(const std::string& msg)
  {
    return Status(Kind::kTooSmall, ERANGE, msg);
  }

  static Status IOError(int err, const std::string& msg)
  {
    return Status(Kind::kIOError, err, msg);
  }

  //----------------------------------------------------------------------------
  //! Classify an errno returned by one of the xattr syscalls
  //----------------------------------------------------------------------------
  static Status FromErrno(int err, const std::string& msg)
  {
    if ((err == ENOATTR) || (err == ENODATA)) {
      return NotFound(msg);
    }

    if (err == ERANGE) {
      return TooSmall(msg);
    }

    return IOError(err, msg);
  }

  //----------------------------------------------------------------------------
  // Is status ok?
  //----------------------------------------------------------------------------
  bool ok() const
  {
    return (mKind == Kind::kOk);
  }

  Kind kind() const
  {
    return mKind;
  }

  bool IsNotFound() const
  {
    return (mKind == Kind::kNotFound);
  }

  bool IsTooSmall() const
  {
    return (mKind == Kind::kTooSmall);
  }

  bool IsIOError() const
  {
    return (mKind == Kind::kIOError);
  }

  //----------------------------------------------------------------------------
  // Get errorcode
  //----------------------------------------------------------------------------
  int getErrc() const
  {
    return mErrc;
  }

  //----------------------------------------------------------------------------
  // Get error message
  //----------------------------------------------------------------------------
  std::string getMsg() const
  {
    return mErrorMessage;
  }

  //----------------------------------------------------------------------------
  //! Printable name of an error kind
  //----------------------------------------------------------------------------
  static const char* KindToString(Kind kind)
  {
    switch (kind) {
    case Kind::kOk:
      return "ok";

    case Kind::kNotFound:
      return "not-found";

    case Kind::kTooSmall:
      return "too-small";

    case Kind::kIOError:
      return "io-error";
    }

    return "unknown";
  }

  //----------------------------------------------------------------------------
  // To string, including kind and error code
  //----------------------------------------------------------------------------
  std::string toString() const
  {
    std::ostringstream ss;
    ss << KindToString(mKind) << " (" << mErrc << "): " << mErrorMessage;
    return ss.str();
  }

  //----------------------------------------------------------------------------
  // Implicit conversion to boolean: Same value as ok()
  //----------------------------------------------------------------------------
  operator bool() const
  {
    return ok();
  }

private:
  Kind mKind;
  int mErrc;
  std::string mErrorMessage;
};

XMDCOMMONNAMESPACE_END

#endif
