// ----------------------------------------------------------------------
// File: Logging.hh
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

/**
 * @file   Logging.hh
 *
 * @brief  Class for message logging.
 *
 * The logging class is a global singleton. All the 'xmd_<level>' macros
 * require that the calling class inherits from 'LogId'. Static functions and
 * free code use the 'xmd_static_<level>' macros. The log level is set with
 * 'SetLogPriority' and 'SetFilter' filters out messages by their function
 * name (__FUNCTION__). A filter prefixed with 'PASS:' becomes an acceptance
 * filter. Messages are printed to 'stderr' and optionally duplicated to a
 * fan-out FILE* selected by the source file name ('*' gets everything) and
 * to syslog when XMD_LOG_SYSLOG is set.
 */

#ifndef __XMDCOMMON_LOGGING_HH__
#define __XMDCOMMON_LOGGING_HH__

#include "common/Namespace.hh"
#include "XrdOuc/XrdOucHash.hh"
#include "XrdOuc/XrdOucString.hh"
#include "XrdSys/XrdSysPthread.hh"
#include <string.h>
#include <sys/syslog.h>
#include <sys/time.h>
#include <uuid/uuid.h>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

XMDCOMMONNAMESPACE_BEGIN

#define XMD_TEXTNORMAL "\033[0m"
#define XMD_TEXTRED    "\033[49;31m"
#define XMD_TEXTGREEN  "\033[49;32m"
#define XMD_TEXTYELLOW "\033[49;33m"
#define XMD_TEXTBLUE   "\033[49;34m"
#define LOG_SILENT 0xffff

//------------------------------------------------------------------------------
//! Log Macros usable in objects inheriting from the LogId Class
//------------------------------------------------------------------------------
#define xmd_debug(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                          this->cident, (LOG_DEBUG), __VA_ARGS__)
#define xmd_info(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                          this->cident, (LOG_INFO), __VA_ARGS__)
#define xmd_notice(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                          this->cident, (LOG_NOTICE), __VA_ARGS__)
#define xmd_warning(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                          this->cident, (LOG_WARNING), __VA_ARGS__)
#define xmd_err(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                          this->cident, (LOG_ERR), __VA_ARGS__)
#define xmd_crit(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                          this->cident, (LOG_CRIT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros usable from static member functions without LogId object
//------------------------------------------------------------------------------
#define xmd_static_debug(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                          "", (LOG_DEBUG), __VA_ARGS__)
#define xmd_static_info(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                          "", (LOG_INFO), __VA_ARGS__)
#define xmd_static_notice(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                          "", (LOG_NOTICE), __VA_ARGS__)
#define xmd_static_warning(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                          "", (LOG_WARNING), __VA_ARGS__)
#define xmd_static_err(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                          "", (LOG_ERR), __VA_ARGS__)
#define xmd_static_crit(...) \
  xmd::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                          "", (LOG_CRIT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros to check if a function would log in a certain log level
//------------------------------------------------------------------------------
#define XMD_LOGS_DEBUG   xmd::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_DEBUG)  )
#define XMD_LOGS_INFO    xmd::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_INFO)   )

#define XMDCOMMONLOGGING_CIRCULARINDEXSIZE 10000

//------------------------------------------------------------------------------
//! Class carrying the log identifier of an object
//------------------------------------------------------------------------------
class LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  LogId()
  {
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, logId);
    snprintf(cident, sizeof(cident), "<service>");
  }

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~LogId() = default;

  //----------------------------------------------------------------------------
  //! Generate log id value
  //----------------------------------------------------------------------------
  static std::string GenerateLogId()
  {
    char log_id[40];
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, log_id);
    return log_id;
  }

  //----------------------------------------------------------------------------
  //! Set's the logid and client identifier
  //----------------------------------------------------------------------------
  void
  SetLogId(const char* newlogid, const char* td = nullptr)
  {
    if (newlogid && (newlogid != logId)) {
      snprintf(logId, sizeof(logId), "%s", newlogid);
    }

    if (td) {
      snprintf(cident, sizeof(cident), "%s", td);
    }
  }

  char logId[40]; //< the log Id for message printout
  char cident[256]; //< the client identifier
};

//------------------------------------------------------------------------------
//! Class wrapping global singleton objects for logging
//------------------------------------------------------------------------------
class Logging
{
public:
  //! Circular index pointing to the next message position in the log array
  typedef std::vector< unsigned long > LogCircularIndex;
  //! Log message array per priority
  typedef std::vector< std::vector <XrdOucString> > LogArray;
  LogCircularIndex gLogCircularIndex; //< global circular index
  LogArray gLogMemory; //< global logging memory
  unsigned long gCircularIndexSize; //< global circular index size
  int gLogMask; //< log mask
  int gPriorityLevel; //< log priority
  bool gToSysLog; //< duplicate into syslog
  XrdSysMutex gMutex; //< global mutex
  XrdOucString gUnit; //< global unit name
  //! Global list of function names allowed to log
  XrdOucHash<const char*> gAllowFilter;
  //! Global list of function names denied to log
  XrdOucHash<const char*> gDenyFilter;
  //! Log fan-out to other file descriptors than stderr
  std::map<std::string, FILE*> gLogFanOut;

  //----------------------------------------------------------------------------
  //! Get singleton instance
  //----------------------------------------------------------------------------
  static Logging& GetInstance();

  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  Logging();

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~Logging() = default;

  int
  GetLogMask() const
  {
    return gLogMask;
  }

  //----------------------------------------------------------------------------
  //! Set the log priority (like syslog)
  //----------------------------------------------------------------------------
  void
  SetLogPriority(int pri)
  {
    gLogMask = LOG_UPTO(pri);
    gPriorityLevel = pri;
  }

  //----------------------------------------------------------------------------
  //! Set the log unit name
  //----------------------------------------------------------------------------
  void
  SetUnit(const char* unit)
  {
    gUnit = unit;
  }

  void
  SetSysLog(bool onoff)
  {
    gToSysLog = onoff;
  }

  //----------------------------------------------------------------------------
  //! Set the log filter, a comma separated list of function names
  //----------------------------------------------------------------------------
  void SetFilter(const char* filter);

  //----------------------------------------------------------------------------
  //! Return priority as string
  //----------------------------------------------------------------------------
  const char* GetPriorityString(int pri) const;

  //----------------------------------------------------------------------------
  //! Return priority int from string, -1 if unknown
  //----------------------------------------------------------------------------
  int GetPriorityByString(const char* pri) const;

  //----------------------------------------------------------------------------
  //! Add a tag fanout filedescriptor to the logging module
  //----------------------------------------------------------------------------
  void
  AddFanOut(const char* tag, FILE* fd)
  {
    gLogFanOut[tag] = fd;
  }

  //----------------------------------------------------------------------------
  //! Check if we should log in the defined level/filter
  //!
  //! @param func name of the calling function
  //! @param priority priority level of the message
  //----------------------------------------------------------------------------
  bool shouldlog(const char* func, int priority);

  //----------------------------------------------------------------------------
  //! Log a message
  //!
  //! @param func name of the calling function
  //! @param file name of the source file calling
  //! @param line line in the source file
  //! @param logid log message identifier
  //! @param cident client identifier
  //! @param priority priority level of the message
  //! @param msg the actual log message
  //!
  //! @return pointer to the log message kept in the circular memory
  //----------------------------------------------------------------------------
  const char* log(const char* func, const char* file, int line,
                  const char* logid, const char* cident, int priority,
                  const char* msg, ...)
  __attribute__((format(printf, 8, 9)));

private:
  const char* GetLogColour(int priority) const;
};

extern Logging& gLogging; ///< Global logging object

//------------------------------------------------------------------------------
//! Static Logging initializer
//------------------------------------------------------------------------------
static struct LoggingInitializer {
  LoggingInitializer();
  ~LoggingInitializer();
} sLoggingInit; ///< Static initializer for every translation unit

XMDCOMMONNAMESPACE_END

#endif
