// ----------------------------------------------------------------------
// File: HttpResponse.hh
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
 * @file   HttpResponse.hh
 *
 * @brief  Holds all information related to a pure HTTP server response,
 *         such as status code, response headers and response body. The body
 *         is either buffered or a stream copied to the client by the server.
 */

#ifndef __XMDCOMMON_HTTP_RESPONSE__HH__
#define __XMDCOMMON_HTTP_RESPONSE__HH__

#include "common/http/HttpRequest.hh"
#include "common/http/ResponseStream.hh"
#include "common/Namespace.hh"
#include <map>
#include <memory>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

class HttpResponse
{

public:
  /**
   * Standard HTTP response codes which we use
   */
  enum ResponseCodes {
    // Informational 1xx
    CONTINUE                        = 100,

    // Successful 2xx
    OK                              = 200,
    CREATED                         = 201,
    ACCEPTED                        = 202,
    NO_CONTENT                      = 204,
    PARTIAL_CONTENT                 = 206,

    // Redirection 3xx
    NOT_MODIFIED                    = 304,
    TEMPORARY_REDIRECT              = 307,

    // Client Error 4xx
    BAD_REQUEST                     = 400,
    UNAUTHORIZED                    = 401,
    FORBIDDEN                       = 403,
    NOT_FOUND                       = 404,
    METHOD_NOT_ALLOWED              = 405,
    CONFLICT                        = 409,
    LENGTH_REQUIRED                 = 411,
    PRECONDITION_FAILED             = 412,
    REQUEST_ENTITY_TOO_LARGE        = 413,
    UNPROCESSABLE_ENTITY            = 422,

    // Server Error 5xx
    INTERNAL_SERVER_ERROR           = 500,
    NOT_IMPLEMENTED                 = 501,
    BAD_GATEWAY                     = 502,
    SERVICE_UNAVAILABLE             = 503,
    INSUFFICIENT_STORAGE            = 507,
  };

public:
  typedef std::map<std::string, std::string> HeaderMap;

protected:
  HeaderMap    mResponseHeaders;       //!< the response headers to be filled
  std::string  mResponseBody;          //!< the response body to be created
  int          mResponseCode;          //!< the response code to be determined
  std::unique_ptr<ResponseStream> mBodyStream; //!< streamed body, if any

public:

  /**
   * Constructor
   */
  HttpResponse() : mResponseCode(OK) {};

  /**
   * Destructor
   */
  virtual ~HttpResponse() {};

  /**
   * Build an appropriate response to the given request.
   *
   * @param request  the client request object
   *
   * @return the newly built response object
   */
  virtual HttpResponse*
  BuildResponse(xmd::common::HttpRequest* request) = 0;

  /**
   * @return the map of server response headers
   */
  inline HeaderMap&
  GetHeaders()
  {
    return mResponseHeaders;
  }

  /**
   * Add a header into the server response header map, replacing an existing
   * value for the same key.
   *
   * @param key    the header key, e.g. Content-Type
   * @param value  the header value, e.g. "text/plain"
   */
  void
  AddHeader(const std::string& key, const std::string& value);

  /**
   * @return the server response body
   */
  inline const std::string&
  GetBody() const
  {
    return mResponseBody;
  }

  /**
   * Set the server response body.
   *
   * @param body  the server response body to be set
   */
  inline void
  SetBody(const std::string& body)
  {
    mResponseBody = body;
  };

  /**
   * @return the size of the current response body
   */
  inline size_t
  GetBodySize() const
  {
    return mResponseBody.length();
  }

  /**
   * Hand a body stream to the response. The response takes ownership and
   * closes the stream when it is destroyed.
   */
  inline void
  SetBodyStream(std::unique_ptr<ResponseStream> stream)
  {
    mBodyStream = std::move(stream);
  }

  inline bool
  HasBodyStream() const
  {
    return (mBodyStream != nullptr);
  }

  /**
   * Transfer ownership of the body stream to the caller, e.g. the server
   * copying it to the client
   */
  inline std::unique_ptr<ResponseStream>
  ReleaseBodyStream()
  {
    return std::move(mBodyStream);
  }

  /**
   * @return the server response code
   */
  inline int
  GetResponseCode() const
  {
    return mResponseCode;
  }

  /**
   * Set the server response code
   *
   * @param responseCode  the new response code to be set
   */
  inline void
  SetResponseCode(int responseCode)
  {
    mResponseCode = responseCode;
  };

  /**
   * @return the reason phrase of an HTTP status code, e.g. "Not Found"
   */
  static std::string
  GetReasonPhrase(int code);

  /**
   * Short HTML body describing a status code. Codes which must not carry a
   * body (1xx, 204, 304) get an empty string.
   */
  static std::string
  StandardBody(int code);

  /**
   * @return printable name of the current response code
   */
  std::string
  GetResponseCodeDescription() const;

  /**
   * @return nicely formatted response, ready for printing
   */
  std::string
  ToString() const;
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_HTTP_RESPONSE__HH__ */
