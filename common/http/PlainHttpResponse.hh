// ----------------------------------------------------------------------
// File: PlainHttpResponse.hh
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
 * @file   PlainHttpResponse.hh
 *
 * @brief  The simplest possible HTTP response. Does no request processing
 *         whatsoever.
 */

#ifndef __XMDCOMMON_PLAIN_HTTP_RESPONSE__HH__
#define __XMDCOMMON_PLAIN_HTTP_RESPONSE__HH__

#include "common/http/HttpResponse.hh"
#include "common/Namespace.hh"

XMDCOMMONNAMESPACE_BEGIN

class PlainHttpResponse : public HttpResponse
{

public:

  PlainHttpResponse() {};
  virtual ~PlainHttpResponse() {};

  /**
   * Build an appropriate response to the given request.
   *
   * @param request  the client request object
   *
   * @return the response object itself
   */
  HttpResponse*
  BuildResponse(xmd::common::HttpRequest* request) override
  {
    (void) request;
    return this;
  };

  /**
   * Turn the response into a standard response: status code plus the short
   * HTML body describing it
   */
  void
  SetStandardResponse(int code)
  {
    SetResponseCode(code);
    SetBody(StandardBody(code));

    if (GetBodySize()) {
      AddHeader("Content-Type", "text/html; charset=UTF-8");
    }
  }
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_PLAIN_HTTP_RESPONSE__HH__ */
