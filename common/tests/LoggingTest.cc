// ----------------------------------------------------------------------
// File: LoggingTest.cc
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

#include "common/Logging.hh"
#include "gtest/gtest.h"
#include <cstdio>
#include <string>

using xmd::common::Logging;

namespace
{
class LoggedObject : public xmd::common::LogId
{
public:
  std::string Emit()
  {
    return xmd_info("msg=\"object message\" value=%d", 42);
  }
};
}

TEST(Logging, PriorityStrings)
{
  Logging& g_logging = Logging::GetInstance();
  ASSERT_EQ(g_logging.GetPriorityByString("debug"), LOG_DEBUG);
  ASSERT_EQ(g_logging.GetPriorityByString("err"), LOG_ERR);
  ASSERT_EQ(g_logging.GetPriorityByString("chatty"), -1);
  ASSERT_STREQ(g_logging.GetPriorityString(LOG_WARNING), "WARN ");
}

TEST(Logging, PriorityMask)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetLogPriority(LOG_WARNING);
  ASSERT_FALSE(g_logging.shouldlog(__FUNCTION__, LOG_INFO));
  ASSERT_TRUE(g_logging.shouldlog(__FUNCTION__, LOG_ERR));
  ASSERT_STREQ(xmd_static_info("msg=\"%s\"", "masked"), "");
  g_logging.SetLogPriority(LOG_INFO);
}

TEST(Logging, Filter)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetLogPriority(LOG_DEBUG);
  g_logging.SetFilter("Blocked,Other");
  ASSERT_FALSE(g_logging.shouldlog("Blocked", LOG_INFO));
  ASSERT_TRUE(g_logging.shouldlog("Allowed", LOG_INFO));
  g_logging.SetFilter("PASS:Allowed");
  ASSERT_TRUE(g_logging.shouldlog("Allowed", LOG_DEBUG));
  ASSERT_FALSE(g_logging.shouldlog("Blocked", LOG_DEBUG));
  // errors pass any filter
  ASSERT_TRUE(g_logging.shouldlog("Blocked", LOG_ERR));
  g_logging.SetFilter("");
  g_logging.SetLogPriority(LOG_INFO);
}

TEST(Logging, MessageContent)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetLogPriority(LOG_INFO);
  g_logging.SetUnit("test");
  LoggedObject obj;
  obj.SetLogId("0123456789", "client@host");
  std::string line = obj.Emit();
  ASSERT_NE(line.find("msg=\"object message\" value=42"), std::string::npos);
  ASSERT_NE(line.find("logid=0123456789"), std::string::npos);
  ASSERT_NE(line.find("tident=client@host"), std::string::npos);
  ASSERT_NE(line.find("unit=test"), std::string::npos);
  ASSERT_NE(line.find("level=INFO"), std::string::npos);
}

TEST(Logging, FanOut)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetLogPriority(LOG_INFO);
  FILE* fanout = tmpfile();
  ASSERT_TRUE(fanout != nullptr);
  g_logging.AddFanOut("LoggingTest", fanout);
  xmd_static_notice("msg=\"%s\"", "fan-out line");
  g_logging.AddFanOut("LoggingTest", stderr);
  rewind(fanout);
  char buf[1024];
  ASSERT_TRUE(fgets(buf, sizeof(buf), fanout) != nullptr);
  ASSERT_NE(std::string(buf).find("fan-out line"), std::string::npos);
  fclose(fanout);
}
