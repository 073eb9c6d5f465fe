// ----------------------------------------------------------------------
// File: HttpServer.cc
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

#include "common/http/HttpServer.hh"
#include "common/http/PlainHttpResponse.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include "XrdSys/XrdSysTimer.hh"
#include <strings.h>
#include <sys/select.h>
#include <cerrno>
#include <cstdlib>
#include <map>
#include <memory>
#include <sstream>

XMDCOMMONNAMESPACE_BEGIN

#ifdef XMD_MICRO_HTTPD
#if MHD_VERSION < 0x00093300
#define MHD_USE_EPOLL_LINUX_ONLY 512
#endif
#endif

HttpServer* HttpServer::gHttp; //!< Global HTTP server

namespace
{
//------------------------------------------------------------------------------
// Integer environment value or the default
//------------------------------------------------------------------------------
int
GetEnvInt(const char* name, int def)
{
  const char* value = getenv(name);
  return (value && *value) ? atoi(value) : def;
}
}

/*----------------------------------------------------------------------------*/
HttpServer::HttpServer(int port) :
#ifdef XMD_MICRO_HTTPD
  mDaemon(0),
#endif
  mPort(port), mThreadModel("threads"), mThreadPoolSize(16), mRunning(false),
  mShutdown(false), mThreadId(0), mThreadStarted(false), mStartupSem(0)
{
  gHttp = this;
}

/*----------------------------------------------------------------------------*/
HttpServer::~HttpServer()
{
  xmd_static_info("%s", "msg=\"common HttpServer destructor\"");
  Stop();

  if (gHttp == this) {
    gHttp = 0;
  }
}

/*----------------------------------------------------------------------------*/
void
HttpServer::SetThreadModel(const std::string& model, int nthreads)
{
  mThreadModel = model;
  mThreadPoolSize = nthreads;
}

/*----------------------------------------------------------------------------*/
bool
HttpServer::Start()
{
  if (mThreadStarted) {
    return false;
  }

  mShutdown = false;
  int rc = XrdSysThread::Run(&mThreadId, HttpServer::StaticHttp,
                             static_cast<void*>(this), XRDSYSTHREAD_HOLD,
                             "Httpd Thread");

  if (rc) {
    xmd_static_err("msg=\"failed to start http thread\" errno=%d", rc);
    return false;
  }

  mThreadStarted = true;
  // wait until the daemon reports up or failed
  mStartupSem.Wait();
  return mRunning;
}

/*----------------------------------------------------------------------------*/
void
HttpServer::Stop()
{
  mShutdown = true;

  if (mThreadStarted) {
    XrdSysThread::Join(mThreadId, 0);
    mThreadStarted = false;
  }
}

/*----------------------------------------------------------------------------*/
void*
HttpServer::StaticHttp(void* arg)
{
  return reinterpret_cast<HttpServer*>(arg)->Run();
}

/*----------------------------------------------------------------------------*/
void*
HttpServer::Run()
{
#ifdef XMD_MICRO_HTTPD
  std::string thread_model = mThreadModel;
  int nthreads = mThreadPoolSize;

  if (getenv("XMD_HTTP_THREADPOOL")) {
    thread_model = getenv("XMD_HTTP_THREADPOOL");
  }

  nthreads = GetEnvInt("XMD_HTTP_THREADPOOL_SIZE", nthreads);

  if (nthreads < 1) {
    nthreads = 16;
  }

  if (nthreads > 4096) {
    nthreads = 4096;
  }

  unsigned int memory_limit = GetEnvInt("XMD_HTTP_CONNECTION_MEMORY_LIMIT",
                                        128 * 1024 * 1024);
  unsigned int timeout = GetEnvInt("XMD_HTTP_CONNECTION_TIMEOUT", 128);

  if (thread_model == "threads") {
    xmd_static_notice("msg=\"starting http server\" mode=\"thread-per-connection\" "
                      "port=%d", mPort);
    mDaemon = MHD_start_daemon(MHD_USE_DEBUG | MHD_USE_THREAD_PER_CONNECTION |
                               MHD_USE_POLL,
                               mPort,
                               NULL,
                               NULL,
                               &HttpServer::StaticHandler,
                               (void*) 0,
                               MHD_OPTION_NOTIFY_COMPLETED,
                               &HttpServer::StaticCompleteHandler, NULL,
                               MHD_OPTION_CONNECTION_MEMORY_LIMIT,
                               (size_t) memory_limit,
                               MHD_OPTION_CONNECTION_TIMEOUT, timeout,
                               MHD_OPTION_END);
  } else if (thread_model == "epoll") {
    xmd_static_notice("msg=\"starting http server\" mode=\"epoll\" threads=%d "
                      "port=%d", nthreads, mPort);
    mDaemon = MHD_start_daemon(MHD_USE_DEBUG | MHD_USE_SELECT_INTERNALLY |
                               MHD_USE_EPOLL_LINUX_ONLY,
                               mPort,
                               NULL,
                               NULL,
                               &HttpServer::StaticHandler,
                               (void*) 0,
                               MHD_OPTION_THREAD_POOL_SIZE,
                               (unsigned int) nthreads,
                               MHD_OPTION_NOTIFY_COMPLETED,
                               &HttpServer::StaticCompleteHandler, NULL,
                               MHD_OPTION_CONNECTION_MEMORY_LIMIT,
                               (size_t) memory_limit,
                               MHD_OPTION_CONNECTION_TIMEOUT, timeout,
                               MHD_OPTION_END);
  } else {
    xmd_static_notice("msg=\"starting http server\" mode=\"single-threaded\" "
                      "port=%d", mPort);
    mDaemon = MHD_start_daemon(MHD_USE_DEBUG,
                               mPort,
                               NULL,
                               NULL,
                               &HttpServer::StaticHandler,
                               (void*) 0,
                               MHD_OPTION_NOTIFY_COMPLETED,
                               &HttpServer::StaticCompleteHandler, NULL,
                               MHD_OPTION_CONNECTION_MEMORY_LIMIT,
                               (size_t) memory_limit,
                               MHD_OPTION_END);
  }

  if (!mDaemon) {
    mRunning = false;
    xmd_static_warning("msg=\"start of micro httpd failed\" port=%d", mPort);
    mStartupSem.Post();
    return (0);
  }

  mRunning = true;
  xmd_static_info("msg=\"start of micro httpd succeeded\" port=%d", mPort);
  mStartupSem.Post();

  if ((thread_model == "epoll") || (thread_model == "threads")) {
    while (!mShutdown) {
      XrdSysTimer::Wait(200);
    }
  } else {
    fd_set rs;
    fd_set ws;
    fd_set es;
    MHD_socket max;
    MHD_UNSIGNED_LONG_LONG mhd_timeout;
    struct timeval tv;

    while (!mShutdown) {
      // wake up at least every second to check for a shutdown request
      tv.tv_sec = 1;
      tv.tv_usec = 0;
      max = 0;
      FD_ZERO(&rs);
      FD_ZERO(&ws);
      FD_ZERO(&es);

      if (MHD_YES != MHD_get_fdset(mDaemon, &rs, &ws, &es, &max)) {
        xmd_static_err("%s", "msg=\"fatal error getting the http fd set\"");
        break;
      }

      if (MHD_get_timeout(mDaemon, &mhd_timeout) == MHD_YES) {
        if ((tv.tv_sec * 1000) > (long long) mhd_timeout) {
          tv.tv_sec = mhd_timeout / 1000;
          tv.tv_usec = (mhd_timeout - (tv.tv_sec * 1000)) * 1000;
        }
      }

      if ((select(max + 1, &rs, &ws, &es, &tv) < 0) && (errno != EINTR)) {
        xmd_static_err("msg=\"select failed\" errno=%d", errno);
        break;
      }

      MHD_run(mDaemon);
    }
  }

  MHD_stop_daemon(mDaemon);
  mDaemon = 0;
  mRunning = false;
  xmd_static_info("msg=\"stopped micro httpd\" port=%d", mPort);
#else
  xmd_static_warning("msg=\"built without libmicrohttpd, http server disabled\" "
                     "port=%d", mPort);
  mRunning = false;
  mStartupSem.Post();
#endif
  return (0);
}

#ifdef XMD_MICRO_HTTPD

/*----------------------------------------------------------------------------*/
MHD_RESULT
HttpServer::StaticHandler(void* cls,
                          struct MHD_Connection* connection,
                          const char* url,
                          const char* method,
                          const char* version,
                          const char* upload_data,
                          size_t* upload_data_size,
                          void** ptr)
{
  // The static handler function calls back the original http object
  if (gHttp) {
    return convertToMHD_RESULT(gHttp->Handler(cls, connection, url, method,
                               version, upload_data, upload_data_size, ptr));
  }

  return MHD_NO;
}

/*----------------------------------------------------------------------------*/
void
HttpServer::StaticCompleteHandler(void* cls,
                                  struct MHD_Connection* connection,
                                  void** con_cls,
                                  enum MHD_RequestTerminationCode toe)
{
  if (gHttp) {
    gHttp->CompleteHandler(cls, connection, con_cls, toe);
  }
}

/*----------------------------------------------------------------------------*/
MHD_RESULT
HttpServer::BuildHeaderMap(void* cls,
                           enum MHD_ValueKind kind,
                           const char* key,
                           const char* value)
{
  // Call back function to return the header key-val map of an HTTP request
  std::map<std::string, std::string>* hMap
    = static_cast<std::map<std::string, std::string>*>(cls);

  if (key && hMap) {
    (*hMap)[LC_STRING(key)] = value ? value : "";
  }

  return MHD_YES;
}

/*----------------------------------------------------------------------------*/
MHD_RESULT
HttpServer::BuildParamMap(void* cls,
                          enum MHD_ValueKind kind,
                          const char* key,
                          const char* value)
{
  std::map<std::string, std::string>* pMap
    = static_cast<std::map<std::string, std::string>*>(cls);

  if (key && *key && pMap && !pMap->count(key)) {
    (*pMap)[key] = value ? value : "";
  }

  return MHD_YES;
}

/*----------------------------------------------------------------------------*/
MHD_RESULT
HttpServer::BuildQueryString(void* cls,
                             enum MHD_ValueKind kind,
                             const char* key,
                             const char* value)
{
  // Call back function to return the query string of an HTTP request
  std::string* qString = static_cast<std::string*>(cls);

  if (key && qString) {
    if (qString->length()) {
      *qString += "&";
    }

    *qString += key;

    if (value) {
      *qString += "=";
      *qString += value;
    }
  }

  return MHD_YES;
}

/*----------------------------------------------------------------------------*/
ssize_t
HttpServer::StreamReader(void* cls, uint64_t pos, char* buf, size_t max)
{
  ResponseStream* stream = static_cast<ResponseStream*>(cls);
  ssize_t nread = stream->Read(buf, max);

  if (nread > 0) {
    return nread;
  }

  if (nread == 0) {
    return MHD_CONTENT_READER_END_OF_STREAM;
  }

  xmd_static_err("msg=\"error reading response stream\" pos=%llu",
                 (unsigned long long) pos);
  return MHD_CONTENT_READER_END_WITH_ERROR;
}

/*----------------------------------------------------------------------------*/
void
HttpServer::StreamFree(void* cls)
{
  // deleting the stream closes it, also when the client went away
  delete static_cast<ResponseStream*>(cls);
}

/*----------------------------------------------------------------------------*/
int
HttpServer::QueueResponse(struct MHD_Connection* connection,
                          HttpResponse* response, bool headOnly)
{
  struct MHD_Response* mhd_response = 0;
  std::unique_ptr<ResponseStream> stream = response->ReleaseBodyStream();

  if (stream && !headOnly) {
    mhd_response = MHD_create_response_from_callback(MHD_SIZE_UNKNOWN,
                   64 * 1024, &HttpServer::StreamReader, stream.get(),
                   &HttpServer::StreamFree);

    if (mhd_response) {
      // owned by the MHD response from now on
      stream.release();
    }
  } else {
    std::string body = headOnly ? std::string() : response->GetBody();
    mhd_response = MHD_create_response_from_buffer(body.length(),
                   (void*) body.c_str(), MHD_RESPMEM_MUST_COPY);
  }

  if (!mhd_response) {
    xmd_static_err("msg=\"failed to create http response\" code=%d",
                   response->GetResponseCode());
    return 0;
  }

  for (auto it = response->GetHeaders().begin();
       it != response->GetHeaders().end(); ++it) {
    // the daemon computes the length of the body it sends
    if (!strcasecmp(it->first.c_str(), "content-length")) {
      continue;
    }

    MHD_add_response_header(mhd_response, it->first.c_str(),
                            it->second.c_str());
  }

  int ret = MHD_queue_response(connection, response->GetResponseCode(),
                               mhd_response);
  MHD_destroy_response(mhd_response);
  return (ret == MHD_YES) ? 1 : 0;
}
#endif

/*----------------------------------------------------------------------------*/
HttpResponse*
HttpServer::HttpError(const char* errorText, int errorCode)
{
  PlainHttpResponse* response = new PlainHttpResponse();

  if (errorCode >= 400) {
    response->SetResponseCode(errorCode);
  } else if (errorCode == ENOENT) {
    response->SetResponseCode(HttpResponse::NOT_FOUND);
  } else if (errorCode == EOPNOTSUPP) {
    response->SetResponseCode(HttpResponse::NOT_IMPLEMENTED);
  } else if ((errorCode == EDQUOT) || (errorCode == ENOSPC)) {
    response->SetResponseCode(HttpResponse::INSUFFICIENT_STORAGE);
  } else {
    response->SetResponseCode(HttpResponse::INTERNAL_SERVER_ERROR);
  }

  xmd_static_info("errc=%d retcode=%d errmsg=\"%s\"", errorCode,
                  response->GetResponseCode(), errorText ? errorText : "<none>");
  std::ostringstream body;
  body << "<html><h1>"
       << HttpResponse::GetReasonPhrase(response->GetResponseCode())
       << "</h1><p>" << (errorText ? errorText : "") << "</p></html>";
  response->SetBody(body.str());
  response->AddHeader("Content-Length", std::to_string(response->GetBodySize()));
  response->AddHeader("Content-Type", "text/html; charset=UTF-8");
  return response;
}

XMDCOMMONNAMESPACE_END
