// ----------------------------------------------------------------------
// File: FsAttrCodec.cc
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

#include "node/io/FsAttrCodec.hh"
#include "common/ErrnoToString.hh"
#include "common/Logging.hh"
#include "common/XattrCompat.hh"
#include <cerrno>

XMDNODENAMESPACE_BEGIN

using xmd::common::Status;

namespace
{
//------------------------------------------------------------------------------
// Build the status for a failed syscall and log it
//------------------------------------------------------------------------------
Status
SyscallError(int err, const char* op, int fd, const std::string& key)
{
  std::string msg = std::string(op) + " failed for key=" + key + " fd=" +
                    std::to_string(fd) + ": " + common::ErrnoToString(err);

  if ((err != ENOATTR) && (err != ENODATA)) {
    xmd_static_debug("msg=\"xattr syscall failed\" op=%s fd=%d key=\"%s\" "
                     "errno=%d", op, fd, key.c_str(), err);
  }

  return Status::FromErrno(err, msg);
}
}

//------------------------------------------------------------------------------
// Validate attribute name
//------------------------------------------------------------------------------
Status
FsAttrCodec::ValidateKey(const std::string& key)
{
  if (key.empty()) {
    return Status::IOError(EINVAL, "empty attribute key");
  }

  if (key.find('\0') != std::string::npos) {
    return Status::IOError(EINVAL, "attribute key contains a NUL byte");
  }

  return Status();
}

//------------------------------------------------------------------------------
// Read attribute value or probe its size
//------------------------------------------------------------------------------
Status
FsAttrCodec::Get(int fd, const std::string& key, AttrBuffer buffer,
                 size_t& nbytes)
{
  nbytes = 0;
  Status st = ValidateKey(key);

  if (!st) {
    return st;
  }

  if (buffer.empty()) {
    ssize_t rc = common::xfgetxattr(fd, key.c_str(), nullptr, 0);

    if (rc < 0) {
      int err = errno;

      // a probe can never be too small
      if (err == ERANGE) {
        return Status::IOError(err, "size probe failed for key=" + key);
      }

      return SyscallError(err, "fgetxattr(probe)", fd, key);
    }

    nbytes = rc;
    return Status();
  }

  ssize_t rc = common::xfgetxattr(fd, key.c_str(), buffer.data, buffer.size);

  if (rc < 0) {
    return SyscallError(errno, "fgetxattr", fd, key);
  }

  nbytes = rc;
  return Status();
}

//------------------------------------------------------------------------------
// Create or replace attribute value
//------------------------------------------------------------------------------
Status
FsAttrCodec::Set(int fd, const std::string& key, const char* value,
                 size_t length, size_t& nbytes)
{
  nbytes = 0;
  Status st = ValidateKey(key);

  if (!st) {
    return st;
  }

  if (common::xfsetxattr(fd, key.c_str(), value, length) != 0) {
    int err = errno;
    xmd_static_err("msg=\"failed to set xattr\" fd=%d key=\"%s\" length=%lu "
                   "errno=%d", fd, key.c_str(), (unsigned long) length, err);
    // every failure of a write is an I/O error for the caller
    return Status::IOError(err, "fsetxattr failed for key=" + key + ": " +
                           common::ErrnoToString(err));
  }

  nbytes = length;
  return Status();
}

//------------------------------------------------------------------------------
// Remove attribute
//------------------------------------------------------------------------------
Status
FsAttrCodec::Remove(int fd, const std::string& key)
{
  Status st = ValidateKey(key);

  if (!st) {
    return st;
  }

  if (common::xfremovexattr(fd, key.c_str()) != 0) {
    return SyscallError(errno, "fremovexattr", fd, key);
  }

  return Status();
}

//------------------------------------------------------------------------------
// List attribute names
//------------------------------------------------------------------------------
Status
FsAttrCodec::List(int fd, std::vector<std::string>& keys)
{
  keys.clear();

  for (int attempt = 0; attempt < mListAttempts; ++attempt) {
    ssize_t size = common::xflistxattr(fd, nullptr, 0);

    if (size < 0) {
      int err = errno;
      return Status::IOError(err, "flistxattr(probe) failed: " +
                             common::ErrnoToString(err));
    }

    if (size == 0) {
      return Status();
    }

    std::string names(size, '\0');
    ssize_t rc = common::xflistxattr(fd, &names[0], names.size());

    if (rc < 0) {
      int err = errno;

      if (err == ERANGE) {
        // list grew between probe and read
        continue;
      }

      return Status::IOError(err, "flistxattr failed: " +
                             common::ErrnoToString(err));
    }

    size_t pos = 0;

    while (pos < (size_t) rc) {
      size_t end = names.find('\0', pos);

      if ((end == std::string::npos) || (end > (size_t) rc)) {
        end = rc;
      }

      if (end > pos) {
        keys.emplace_back(names.substr(pos, end - pos));
      }

      pos = end + 1;
    }

    return Status();
  }

  return Status::TooSmall("attribute list kept growing while listing");
}

XMDNODENAMESPACE_END
