// ----------------------------------------------------------------------
// File: ConfigTest.cc
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

#include "node/Config.hh"
#include "node/MetadataStore.hh"
#include "node/tests/TestUtils.hh"
#include "XrdSys/XrdSysError.hh"
#include "XrdSys/XrdSysLogger.hh"
#include "gtest/gtest.h"
#include <unistd.h>

using xmd::node::Config;
using xmd::node::test::TmpPath;

namespace
{
void WriteFile(const TmpPath& tmp, const std::string& content)
{
  ASSERT_EQ(pwrite(tmp.fd(), content.data(), content.size(), 0),
            (ssize_t) content.size());
}
}

TEST(NodeConfig, Defaults)
{
  Config cfg;
  ASSERT_EQ(cfg.MetadataKey, "user.xmd.metadata");
  ASSERT_EQ(cfg.MetadataAttempts, 3);
  ASSERT_EQ(cfg.MetadataChunkSize, 254u);
  XrdSysLogger logger;
  XrdSysError eroute(&logger, "test");
  ASSERT_EQ(cfg.Configure(nullptr, eroute), 0);
}

TEST(NodeConfig, ParseDirectives)
{
  TmpPath tmp;
  ASSERT_GE(tmp.fd(), 0);
  WriteFile(tmp, "# node settings\n"
            "node.metadata.key user.test.md\n"
            "node.metadata.attempts 5\n"
            "node.metadata.chunksize 100\n"
            "node.unknown something\n"
            "proxy.port 9000\n");
  XrdSysLogger logger;
  XrdSysError eroute(&logger, "test");
  Config cfg;
  ASSERT_EQ(cfg.Configure(tmp.path().c_str(), eroute), 0);
  ASSERT_EQ(cfg.MetadataKey, "user.test.md");
  ASSERT_EQ(cfg.MetadataAttempts, 5);
  ASSERT_EQ(cfg.MetadataChunkSize, 100u);
  xmd::node::test::FakeAttrCodec codec;
  xmd::node::MetadataStore store(codec, cfg);
  ASSERT_EQ(store.GetMaxAttempts(), 5);
  ASSERT_EQ(store.GetChunkSize(), 100u);
}

TEST(NodeConfig, IllegalValue)
{
  TmpPath tmp;
  ASSERT_GE(tmp.fd(), 0);
  WriteFile(tmp, "node.metadata.attempts 0\n");
  XrdSysLogger logger;
  XrdSysError eroute(&logger, "test");
  Config cfg;
  ASSERT_NE(cfg.Configure(tmp.path().c_str(), eroute), 0);
  ASSERT_EQ(cfg.MetadataAttempts, 3);
}

TEST(NodeConfig, MissingFile)
{
  XrdSysLogger logger;
  XrdSysError eroute(&logger, "test");
  Config cfg;
  ASSERT_NE(cfg.Configure("/nonexistent/xmd.cfg", eroute), 0);
}
