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

#include "proxy/HttpServer.hh"
#include "proxy/AccountHandler.hh"
#include "proxy/Gatekeeper.hh"
#include "common/Logging.hh"

XMDPROXYNAMESPACE_BEGIN

using xmd::common::HttpRequest;
using xmd::common::HttpResponse;

constexpr size_t HttpServer::kMaxRequestBody;

namespace
{
//------------------------------------------------------------------------------
//! Upload state of a connection kept in the MHD per-request pointer
//------------------------------------------------------------------------------
struct PendingRequest {
  std::string mBody;
  bool mTooLarge = false;
};
}

/*----------------------------------------------------------------------------*/
HttpServer::HttpServer(const Config& config, AccountClient& client) :
  xmd::common::HttpServer(config.Port), mConfig(config), mFactory(client)
{
  SetThreadModel(config.ThreadModel, config.ThreadPoolSize);
}

/*----------------------------------------------------------------------------*/
std::unique_ptr<HttpResponse>
HttpServer::Dispatch(HttpRequest& request)
{
  std::string account;

  if (!AccountHandler::ParseAccount(request.GetUrl(), account)) {
    xmd_static_info("msg=\"no resource for path\" method=%s path=\"%s\"",
                    request.GetMethod().c_str(), request.GetUrl().c_str());
    return std::unique_ptr<HttpResponse>(HttpError("no such resource",
                                         HttpResponse::NOT_FOUND));
  }

  Gatekeeper::FilterRequest(request);
  ProxyContext ctx = mConfig.MakeContext();
  std::unique_ptr<xmd::common::ProtocolHandler> handler =
    mFactory.CreateProtocolHandler(request.GetMethod(), request.GetHeaders(),
                                   &ctx);

  if (!handler) {
    xmd_static_err("msg=\"no matching protocol for request method %s\"",
                   request.GetMethod().c_str());
    return std::unique_ptr<HttpResponse>(HttpError("unsupported method",
                                         HttpResponse::METHOD_NOT_ALLOWED));
  }

  if (XMD_LOGS_DEBUG) {
    xmd_static_debug("\n\n%s", request.ToString().c_str());
  }

  handler->HandleRequest(&request);
  std::unique_ptr<HttpResponse> response(handler->ReleaseResponse());

  if (!response) {
    return std::unique_ptr<HttpResponse>(HttpError("no response built",
                                         HttpResponse::INTERNAL_SERVER_ERROR));
  }

  Gatekeeper::FilterResponse(*response);

  if (XMD_LOGS_DEBUG) {
    xmd_static_debug("\n\n%s", response->ToString().c_str());
  }

  return response;
}

#ifdef XMD_MICRO_HTTPD

/*----------------------------------------------------------------------------*/
int
HttpServer::Handler(void* cls,
                    struct MHD_Connection* connection,
                    const char* url,
                    const char* method,
                    const char* version,
                    const char* upload_data,
                    size_t* upload_data_size,
                    void** ptr)
{
  // The handler is called once the headers arrived, then once per piece of
  // upload data and a last time with an empty upload to finish the request.
  // The upload state is kept in *ptr and freed by the complete handler.
  if (!*ptr) {
    *ptr = new PendingRequest();
    return 1;
  }

  PendingRequest* pending = static_cast<PendingRequest*>(*ptr);

  if (*upload_data_size) {
    if (pending->mBody.length() + *upload_data_size > kMaxRequestBody) {
      pending->mTooLarge = true;
    } else {
      pending->mBody.append(upload_data, *upload_data_size);
    }

    *upload_data_size = 0;
    return 1;
  }

  std::string lMethod = method ? method : "";
  std::string path = url ? url : "";
  std::string query;
  std::map<std::string, std::string> headers;
  HttpRequest::ParamMap params;
  MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND,
                            &HttpServer::BuildQueryString, (void*) &query);
  MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND,
                            &HttpServer::BuildParamMap, (void*) &params);
  MHD_get_connection_values(connection, MHD_HEADER_KIND,
                            &HttpServer::BuildHeaderMap, (void*) &headers);
  xmd_static_debug("method=%s path=\"%s\" query=\"%s\" version=%s",
                   lMethod.c_str(), path.c_str(), query.c_str(),
                   version ? version : "");
  std::unique_ptr<HttpResponse> response;

  if (pending->mTooLarge) {
    response.reset(HttpError("request body too large",
                             HttpResponse::REQUEST_ENTITY_TOO_LARGE));
  } else {
    HttpRequest request(headers, lMethod, path, query, pending->mBody);
    request.SetParams(params);
    response = Dispatch(request);
  }

  xmd_static_info("method=%s path=\"%s\" code=%d", lMethod.c_str(),
                  path.c_str(), response->GetResponseCode());
  return QueueResponse(connection, response.get(), (lMethod == "HEAD"));
}

/*----------------------------------------------------------------------------*/
void
HttpServer::CompleteHandler(void* cls,
                            struct MHD_Connection* connection,
                            void** con_cls,
                            enum MHD_RequestTerminationCode toe)
{
  if (toe != MHD_REQUEST_TERMINATED_COMPLETED_OK) {
    xmd_static_info("msg=\"request terminated early\" reason=%d", (int) toe);
  }

  delete static_cast<PendingRequest*>(*con_cls);
  *con_cls = 0;
}

#endif

XMDPROXYNAMESPACE_END
