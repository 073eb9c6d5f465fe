// ----------------------------------------------------------------------
// File: HttpServer.hh
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
 * @file   HttpServer.hh
 *
 * @brief  Class running an HTTP daemon. Creates an embedded HTTP server
 *         instance
 */

#pragma once
#include "common/http/HttpRequest.hh"
#include "common/http/HttpResponse.hh"
#include "common/Logging.hh"
#include "common/Namespace.hh"
#include "XrdSys/XrdSysPthread.hh"
#include <atomic>
#include <string>

#ifdef XMD_MICRO_HTTPD
#include <microhttpd.h>
#endif

XMDCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Class HttpServer
//------------------------------------------------------------------------------
class HttpServer
{
public:
  //! Instance of the HTTP server allowing the static handler functions to
  //! call class member functions
  static HttpServer* gHttp;

  /**
   * Constructor
   *
   * @param port  listening port
   */
  HttpServer(int port = 8080);

  /**
   * Destructor
   */
  virtual ~HttpServer();

  /**
   * Return port number of service
   */
  int Port() const
  {
    return mPort;
  }

  /**
   * Select the thread model: "threads" (thread per connection), "epoll"
   * (internal pool of nthreads) or "single". The XMD_HTTP_THREADPOOL and
   * XMD_HTTP_THREADPOOL_SIZE environment variables override these values.
   */
  void SetThreadModel(const std::string& model, int nthreads);

  /**
   * Start the listening HTTP server
   *
   * @return true if server running otherwise false
   */
  virtual bool Start();

  /**
   * Stop the server and wait for the serving thread
   */
  void Stop();

  /**
   * @return true while the embedded daemon is serving
   */
  bool IsRunning() const
  {
    return mRunning;
  }

  /**
   * Create the embedded server and run
   */
  void* Run();

  /**
   * Thread start function
   */
  static void* StaticHttp(void* arg);

  /**
   * Get an HTTP error response object containing an HTML error page inside
   * the body.
   *
   * @param errorText  the error message to be displayed on the error page
   * @param errorCode  the HTTP error code, or an errno value which gets
   *                   mapped to one
   *
   * @return an HTTP response object
   */
  static HttpResponse*
  HttpError(const char* errorText, int errorCode);

#ifdef XMD_MICRO_HTTPD

#if MHD_VERSION >= 0x00097002
#define MHD_RESULT enum MHD_Result
#else
#define MHD_RESULT int
#endif

  /**
   * Compatibility hacks for MHD versions
   */
  static MHD_RESULT convertToMHD_RESULT(int code)
  {
#if MHD_VERSION >= 0x00097002

    if (code == 1) {
      return MHD_YES;
    }

    return MHD_NO;
#else
    return code;
#endif
  }

  /**
   * Calls the instance handler function of the Http object
   */
  static MHD_RESULT
  StaticHandler(void*                  cls,
                struct MHD_Connection* connection,
                const char*            url,
                const char*            method,
                const char*            version,
                const char*            upload_data,
                size_t*                upload_data_size,
                void**                 ptr);

  /**
   * Calls the instance complete handler function of the Http object
   */
  static void
  StaticCompleteHandler(void*                  cls,
                        struct MHD_Connection* connection,
                        void**                 con_cls,
                        enum MHD_RequestTerminationCode toe);

  /**
   * HTTP object handler function
   *
   * @return 1 (MHD_YES) to continue, 0 (MHD_NO) to close the connection
   */
  virtual int
  Handler(void*                  cls,
          struct MHD_Connection* connection,
          const char*            url,
          const char*            method,
          const char*            version,
          const char*            upload_data,
          size_t*                upload_data_size,
          void**                 ptr) = 0;

  /**
   * HTTP complete handler function
   */
  virtual void
  CompleteHandler(void*                  cls,
                  struct MHD_Connection* connection,
                  void**                 con_cls,
                  enum MHD_RequestTerminationCode toe) = 0;

  /**
   * Returns the query string for an HTTP request. Keys and values arrive
   * decoded, the result is for display only and must not be split again.
   *
   * @param cls    in-out address of a std::string containing the query string
   * @param kind   the request type
   * @param key    the query parameter key
   * @param value  the query parameter value
   *
   * @return MHD_YES
   */
  static MHD_RESULT
  BuildQueryString(void*              cls,
                   enum MHD_ValueKind kind,
                   const char*        key,
                   const char*        value);

  /**
   * Returns the decoded query parameters of an HTTP request, the first
   * occurrence of a key wins and a key without value maps to ""
   *
   * @param cls    in-out address of a std::map<std::string,std::string>
   * @param kind   the request type
   * @param key    the decoded query parameter key
   * @param value  the decoded query parameter value
   *
   * @return MHD_YES
   */
  static MHD_RESULT
  BuildParamMap(void*              cls,
                enum MHD_ValueKind kind,
                const char*        key,
                const char*        value);

  /**
   * Returns the header map for an HTTP request, keys are lower cased
   *
   * @param cls    in-out address of a std::map<std::string,std::string>
   * @param kind   the request type
   * @param key    the header key
   * @param value  the header value
   *
   * @return MHD_YES
   */
  static MHD_RESULT
  BuildHeaderMap(void*              cls,
                 enum MHD_ValueKind kind,
                 const char*        key,
                 const char*        value);

  /**
   * Content reader callback copying a ResponseStream to the client
   */
  static ssize_t
  StreamReader(void* cls, uint64_t pos, char* buf, size_t max);

  /**
   * Free callback of a streamed response: closes and deletes the stream
   */
  static void
  StreamFree(void* cls);

  /**
   * Queue a response on the connection: either the buffered body or a
   * callback response reading from the body stream
   *
   * @return MHD result of queueing
   */
  static int
  QueueResponse(struct MHD_Connection* connection, HttpResponse* response,
                bool headOnly);

#endif

protected:
#ifdef XMD_MICRO_HTTPD
  struct MHD_Daemon* mDaemon; //!< MicroHttpd daemon instance
#endif
  int                mPort;        //!< The port this server listens on
  std::string        mThreadModel; //!< threads|epoll|single
  int                mThreadPoolSize; //!< threads in epoll mode
  std::atomic<bool>  mRunning;     //!< Is this server running?
  std::atomic<bool>  mShutdown;    //!< Has a stop been requested?
  pthread_t          mThreadId;    //!< This thread's ID
  bool               mThreadStarted; //!< Has the serving thread been started?
  XrdSysSemaphore    mStartupSem;  //!< Posted once the daemon is up or failed
};

XMDCOMMONNAMESPACE_END
