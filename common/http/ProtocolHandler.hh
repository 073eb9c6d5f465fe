// ----------------------------------------------------------------------
// File: ProtocolHandler.hh
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
 * @file   ProtocolHandler.hh
 *
 * @brief  Abstract base class representing an interface which a concrete
 *         protocol/resource handler must implement.
 */

#ifndef __XMDCOMMON_PROTOCOLHANDLER__HH__
#define __XMDCOMMON_PROTOCOLHANDLER__HH__

#include "common/http/HttpRequest.hh"
#include "common/http/HttpResponse.hh"
#include "common/Namespace.hh"
#include <map>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

class ProtocolHandler
{

public:
  typedef std::map<std::string, std::string> HeaderMap;

protected:
  HttpResponse* mHttpResponse; //!< the HTTP response

public:

  /**
   * Constructor
   */
  ProtocolHandler() : mHttpResponse(0) {};

  /**
   * Destructor
   */
  virtual ~ProtocolHandler()
  {
    delete mHttpResponse;
  };

  ProtocolHandler(const ProtocolHandler&) = delete;
  ProtocolHandler& operator=(const ProtocolHandler&) = delete;

  /**
   * Concrete implementations must use this function to build a response to the
   * given request.
   *
   * @param request the client request object
   */
  virtual void
  HandleRequest(HttpRequest* request) = 0;

  /**
   * @return the HttpResponse object
   */
  inline HttpResponse*
  GetResponse()
  {
    return mHttpResponse;
  }

  /**
   * Hand the HttpResponse object over to the caller
   */
  inline HttpResponse*
  ReleaseResponse()
  {
    HttpResponse* response = mHttpResponse;
    mHttpResponse = 0;
    return response;
  }

  /**
   * Delete the HttpResponse object
   */
  inline void
  DeleteResponse()
  {
    delete mHttpResponse;
    mHttpResponse = 0;
  }
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_PROTOCOLHANDLER__HH__ */
