// ----------------------------------------------------------------------
// File: TestUtils.hh
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
#include "node/io/AttrCodec.hh"
#include "common/XattrCompat.hh"
#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <map>
#include <string>

namespace xmd
{
namespace node
{
namespace test
{

//------------------------------------------------------------------------------
//! Temporary file or directory removed at the end of the test
//------------------------------------------------------------------------------
class TmpPath
{
public:
  explicit TmpPath(bool directory = false) : mFd(-1), mDirectory(directory)
  {
    const char* tmpdir = getenv("TMPDIR");
    std::string templ = std::string(tmpdir ? tmpdir : "/tmp") + "/xmd-test.XXXXXX";
    std::string buf = templ;

    if (directory) {
      if (mkdtemp(&buf[0])) {
        mPath = buf;
        mFd = open(mPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
      }
    } else {
      mFd = mkstemp(&buf[0]);

      if (mFd >= 0) {
        mPath = buf;
      }
    }
  }

  ~TmpPath()
  {
    if (mFd >= 0) {
      (void) close(mFd);
    }

    if (!mPath.empty()) {
      if (mDirectory) {
        (void) nftw(mPath.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
      } else {
        (void) unlink(mPath.c_str());
      }
    }
  }

  int fd() const
  {
    return mFd;
  }

  const std::string& path() const
  {
    return mPath;
  }

  //----------------------------------------------------------------------------
  //! Check if the underlying filesystem accepts user extended attributes
  //----------------------------------------------------------------------------
  bool SupportsXattr() const
  {
    if (mFd < 0) {
      return false;
    }

    const char* key = "user.xmd.test.support";

    if (xmd::common::xfsetxattr(mFd, key, "1", 1) != 0) {
      return false;
    }

    (void) xmd::common::xfremovexattr(mFd, key);
    return true;
  }

private:
  int mFd;
  bool mDirectory;

  static int RemoveEntry(const char* path, const struct stat* sb, int flag,
                         struct FTW* ftw)
  {
    return remove(path);
  }

  std::string mPath;
};

//------------------------------------------------------------------------------
//! In-memory attribute codec able to simulate concurrent writers
//------------------------------------------------------------------------------
class FakeAttrCodec : public AttrCodec
{
public:
  using AttrCodec::Set;

  std::map<std::string, std::string> mAttrs;
  std::map<std::string, int> mFailWith; // key -> errno reported as IOError
  int mGrowOnRead = 0; // number of upcoming reads preceded by a value growth
  size_t mGrowBy = 8;
  bool mShrinkOnRead = false;
  int mProbes = 0;
  int mReads = 0;
  int mWrites = 0;

  common::Status Get(int fd, const std::string& key, AttrBuffer buffer,
                     size_t& nbytes) override
  {
    nbytes = 0;

    if (mFailWith.count(key)) {
      return common::Status::IOError(mFailWith[key], "injected failure");
    }

    auto it = mAttrs.find(key);

    if (it == mAttrs.end()) {
      return common::Status::NotFound("no attribute " + key);
    }

    if (buffer.empty()) {
      ++mProbes;
      nbytes = it->second.size();
      return common::Status();
    }

    ++mReads;

    if (mGrowOnRead > 0) {
      it->second.append(mGrowBy, 'g');
      --mGrowOnRead;
    }

    if (mShrinkOnRead) {
      it->second.resize(it->second.size() / 2);
      mShrinkOnRead = false;
    }

    if (it->second.size() > buffer.size) {
      return common::Status::TooSmall("buffer too small for " + key);
    }

    memcpy(buffer.data, it->second.data(), it->second.size());
    nbytes = it->second.size();
    return common::Status();
  }

  common::Status Set(int fd, const std::string& key, const char* value,
                     size_t length, size_t& nbytes) override
  {
    nbytes = 0;

    if (mFailWith.count(key)) {
      return common::Status::IOError(mFailWith[key], "injected failure");
    }

    ++mWrites;
    mAttrs[key].assign(value, length);
    nbytes = length;
    return common::Status();
  }

  common::Status Remove(int fd, const std::string& key) override
  {
    if (!mAttrs.erase(key)) {
      return common::Status::NotFound("no attribute " + key);
    }

    return common::Status();
  }

  common::Status List(int fd, std::vector<std::string>& keys) override
  {
    keys.clear();

    for (const auto& elem : mAttrs) {
      keys.push_back(elem.first);
    }

    return common::Status();
  }
};

} // namespace test
} // namespace node
} // namespace xmd

#define XMD_SKIP_WITHOUT_XATTR(tmp)                                     \
  if (!(tmp).SupportsXattr()) {                                         \
    GTEST_SKIP() << "filesystem of " << (tmp).path()                    \
                 << " does not support user extended attributes";       \
  }
