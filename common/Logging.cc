// ----------------------------------------------------------------------
// File: Logging.cc
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
#include <atomic>
#include <cstdarg>
#include <cstdlib>
#include <new>
#include <type_traits>

XMDCOMMONNAMESPACE_BEGIN

static std::atomic<int> sCounter {0};
static typename std::aligned_storage<sizeof(Logging), alignof(Logging)>::type
logging_buf; ///< Memory for the global logging object
Logging& gLogging = reinterpret_cast<Logging&>(logging_buf);

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
LoggingInitializer::LoggingInitializer()
{
  if (sCounter++ == 0) {
    new (&gLogging) Logging(); // placement new
  }
}

//------------------------------------------------------------------------------
// Destructor
//------------------------------------------------------------------------------
LoggingInitializer::~LoggingInitializer()
{
  if (--sCounter == 0) {
    (&gLogging)->~Logging();
  }
}

//------------------------------------------------------------------------------
// Get singleton instance
//------------------------------------------------------------------------------
Logging&
Logging::GetInstance()
{
  return gLogging;
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
Logging::Logging():
  gCircularIndexSize(XMDCOMMONLOGGING_CIRCULARINDEXSIZE),
  gLogMask(0), gPriorityLevel(0), gToSysLog(false), gUnit("none")
{
  gLogCircularIndex.resize(LOG_DEBUG + 1);
  gLogMemory.resize(LOG_DEBUG + 1);

  for (int i = 0; i <= LOG_DEBUG; i++) {
    gLogCircularIndex[i] = 0;
    gLogMemory[i].resize(gCircularIndexSize);
  }

  XrdOucString tosyslog;

  if (getenv("XMD_LOG_SYSLOG")) {
    tosyslog = getenv("XMD_LOG_SYSLOG");

    if ((tosyslog == "1") || (tosyslog == "true")) {
      gToSysLog = true;
    }
  }
}

//------------------------------------------------------------------------------
// Set the log filter
//------------------------------------------------------------------------------
void
Logging::SetFilter(const char* filter)
{
  int pos = 0;
  char del = ',';
  XrdOucString token;
  XrdOucString pass_tag = "PASS:";
  XrdOucString sfilter = filter;
  XrdSysMutexHelper scope_lock(gMutex);
  gDenyFilter.Purge();
  gAllowFilter.Purge();

  if ((pos = sfilter.find(pass_tag)) != STR_NPOS) {
    // Function names which are allowed to log
    pos += pass_tag.length();

    while ((pos = sfilter.tokenize(token, pos, del)) != -1) {
      gAllowFilter.Add(token.c_str(), NULL, 0, Hash_data_is_key);
    }
  } else {
    // Function names which are denied to log
    pos = 0;

    while ((pos = sfilter.tokenize(token, pos, del)) != -1) {
      gDenyFilter.Add(token.c_str(), NULL, 0, Hash_data_is_key);
    }
  }
}

//------------------------------------------------------------------------------
// Return priority as string
//------------------------------------------------------------------------------
const char*
Logging::GetPriorityString(int pri) const
{
  switch (pri) {
  case LOG_INFO:
    return "INFO ";

  case LOG_DEBUG:
    return "DEBUG";

  case LOG_ERR:
    return "ERROR";

  case LOG_EMERG:
    return "EMERG";

  case LOG_ALERT:
    return "ALERT";

  case LOG_CRIT:
    return "CRIT ";

  case LOG_WARNING:
    return "WARN ";

  case LOG_NOTICE:
    return "NOTE ";

  case LOG_SILENT:
    return "";
  }

  return "NONE ";
}

//------------------------------------------------------------------------------
// Return priority int from string
//------------------------------------------------------------------------------
int
Logging::GetPriorityByString(const char* pri) const
{
  static const std::map<std::string, int> sPriorities = {
    {"info", LOG_INFO}, {"debug", LOG_DEBUG}, {"err", LOG_ERR},
    {"emerg", LOG_EMERG}, {"alert", LOG_ALERT}, {"crit", LOG_CRIT},
    {"warning", LOG_WARNING}, {"notice", LOG_NOTICE}, {"silent", LOG_SILENT}
  };

  if (!pri) {
    return -1;
  }

  auto it = sPriorities.find(pri);
  return (it == sPriorities.end()) ? -1 : it->second;
}

//------------------------------------------------------------------------------
// Colour used for a priority in the fan-out streams
//------------------------------------------------------------------------------
const char*
Logging::GetLogColour(int priority) const
{
  switch (priority) {
  case LOG_INFO:
    return XMD_TEXTGREEN;

  case LOG_WARNING:
    return XMD_TEXTYELLOW;

  case LOG_NOTICE:
    return XMD_TEXTBLUE;

  case LOG_ERR:
  case LOG_CRIT:
  case LOG_ALERT:
  case LOG_EMERG:
    return XMD_TEXTRED;
  }

  return "";
}

//------------------------------------------------------------------------------
// Should log function
//------------------------------------------------------------------------------
bool
Logging::shouldlog(const char* func, int priority)
{
  if (priority == LOG_SILENT) {
    return true;
  }

  // short cut if log messages are masked
  if (!((LOG_MASK(priority) & gLogMask))) {
    return false;
  }

  if (priority >= LOG_INFO) {
    XrdSysMutexHelper scope_lock(gMutex);

    if (gAllowFilter.Num()) {
      return (gAllowFilter.Find(func) != nullptr);
    }

    if (gDenyFilter.Num() && gDenyFilter.Find(func)) {
      return false;
    }
  }

  return true;
}

//------------------------------------------------------------------------------
// Logging function
//------------------------------------------------------------------------------
const char*
Logging::log(const char* func, const char* file, int line, const char* logid,
             const char* cident, int priority, const char* msg, ...)
{
  bool silent = (priority == LOG_SILENT);

  if (!silent && !shouldlog(func, priority)) {
    return "";
  }

  static const size_t sBufferSize = 16 * 1024;
  char buffer[sBufferSize];
  XrdOucString File = file;
  // show only the file name without directory and extension
  File.erase(0, File.rfind("/") + 1);
  File.erase(File.length() - 3);
  time_t current_time;
  struct timeval tv;
  tm tm;
  gettimeofday(&tv, nullptr);
  current_time = tv.tv_sec;
  localtime_r(&current_time, &tm);
  char sourceline[64];
  snprintf(sourceline, sizeof(sourceline), "%s:%d", File.c_str(), line);
  int prefix = snprintf(buffer, sizeof(buffer),
                        "%02d%02d%02d %02d:%02d:%02d time=%lu.%06lu func=%-24s "
                        "level=%s logid=%s unit=%s tid=%016lx source=%-30s "
                        "tident=%s ",
                        tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                        tm.tm_min, tm.tm_sec, current_time,
                        (unsigned long) tv.tv_usec, func,
                        GetPriorityString(priority), logid, gUnit.c_str(),
                        (unsigned long) XrdSysThread::ID(), sourceline,
                        (cident && *cident) ? cident : "<static>");

  if ((prefix < 0) || (prefix >= (int) sizeof(buffer))) {
    return "";
  }

  char* ptr = buffer + prefix;
  va_list args;
  va_start(args, msg);
  vsnprintf(ptr, sizeof(buffer) - prefix, msg, args);
  va_end(args);

  if (silent) {
    priority = LOG_DEBUG;
  }

  XrdSysMutexHelper scope_lock(gMutex);
  // the circular memory copies the buffer
  XrdOucString& slot =
    gLogMemory[priority][gLogCircularIndex[priority] % gCircularIndexSize];
  slot = buffer;
  gLogCircularIndex[priority]++;

  if (silent) {
    return slot.c_str();
  }

  fprintf(stderr, "%s\n", buffer);
  fflush(stderr);

  if (gToSysLog) {
    syslog(priority, "%s", ptr);
  }

  if (gLogFanOut.size()) {
    if (gLogFanOut.count("*")) {
      fprintf(gLogFanOut["*"], "%s\n", buffer);
      fflush(gLogFanOut["*"]);
    }

    if (gLogFanOut.count(File.c_str())) {
      FILE* fanout = gLogFanOut[File.c_str()];
      fprintf(fanout, "%.15s %s%s%s %-30s %s\n", buffer, GetLogColour(priority),
              GetPriorityString(priority), XMD_TEXTNORMAL, sourceline, ptr);
      fflush(fanout);
    }
  }

  return slot.c_str();
}

XMDCOMMONNAMESPACE_END
