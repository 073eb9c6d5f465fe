// ----------------------------------------------------------------------
//! @file: XattrCompat.hh
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

#pragma once

#include "common/Namespace.hh"
#include <errno.h>
#include <sys/types.h>

#ifndef ENOATTR
#define ENOATTR ENODATA
#endif

#if __has_include(<sys/xattr.h>)
#include <sys/xattr.h>
#elif __has_include(<attr/xattr.h>)
#include <attr/xattr.h>
#else
#error "Could not find xattr.h header!"
#endif

//------------------------------------------------------------------------------
//! Descriptor based xattr calls with the platform differences folded away
//------------------------------------------------------------------------------
XMDCOMMONNAMESPACE_BEGIN

inline ssize_t
xfgetxattr(int fd, const char* name, void* value, size_t size)
{
#ifdef __APPLE__
  return ::fgetxattr(fd, name, value, size, 0, 0);
#else
  return ::fgetxattr(fd, name, value, size);
#endif
}

inline int
xfsetxattr(int fd, const char* name, const void* value, size_t size)
{
#ifdef __APPLE__
  return ::fsetxattr(fd, name, value, size, 0, 0);
#else
  return ::fsetxattr(fd, name, value, size, 0);
#endif
}

inline int
xfremovexattr(int fd, const char* name)
{
#ifdef __APPLE__
  return ::fremovexattr(fd, name, 0);
#else
  return ::fremovexattr(fd, name);
#endif
}

inline ssize_t
xflistxattr(int fd, char* list, size_t size)
{
#ifdef __APPLE__
  return ::flistxattr(fd, list, size, 0);
#else
  return ::flistxattr(fd, list, size);
#endif
}

XMDCOMMONNAMESPACE_END
