// ----------------------------------------------------------------------
// File: HttpRequest.hh
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
 * @file   HttpRequest.hh
 *
 * @brief  Simple utility class to hold client request parameters.
 */

#ifndef __XMDCOMMON_HTTP_REQUEST__HH__
#define __XMDCOMMON_HTTP_REQUEST__HH__

#include "common/Namespace.hh"
#include <map>
#include <string>

XMDCOMMONNAMESPACE_BEGIN

class HttpRequest
{
public:
  typedef std::map<std::string, std::string> HeaderMap;
  typedef std::map<std::string, std::string> ParamMap;

private:
  HeaderMap         mRequestHeaders;  //!< the map of client request headers
  const std::string mRequestMethod;   //!< the client request method
  const std::string mRequestUrl;      //!< the client request URL
  std::string       mRequestQuery;    //!< the client request query string
  ParamMap          mRequestParams;   //!< decoded query parameters
  const std::string mRequestBody;     //!< the client request body

public:

  /**
   * Constructor
   *
   * @param headers  the map of request headers sent by the client, keys are
   *                 expected in lower case
   * @param method   the request verb used by the client (GET, PUT, etc)
   * @param url      the URL requested by the client
   * @param query    the request query string (if any), split into the
   *                 parameter map without decoding
   * @param body     the request body data sent by the client
   */
  HttpRequest(HeaderMap          headers,
              const std::string& method,
              const std::string& url,
              const std::string& query,
              const std::string& body = "");

  /**
   * Destructor
   */
  virtual ~HttpRequest() {};

  /**
   * @return the map of request headers
   */
  inline HeaderMap&
  GetHeaders()
  {
    return mRequestHeaders;
  }

  inline const HeaderMap&
  GetHeaders() const
  {
    return mRequestHeaders;
  }

  /**
   * @return value of a request header or an empty string
   */
  std::string
  GetHeader(const std::string& key) const;

  /**
   * Set (replace) a request header
   */
  inline void
  SetHeader(const std::string& key, const std::string& value)
  {
    mRequestHeaders[key] = value;
  }

  /**
   * @return the client request method
   */
  inline const std::string&
  GetMethod() const
  {
    return mRequestMethod;
  }

  /**
   * @return the client request URL
   */
  inline const std::string&
  GetUrl() const
  {
    return mRequestUrl;
  }

  /**
   * @return the client request query string
   */
  inline const std::string&
  GetQuery() const
  {
    return mRequestQuery;
  }

  /**
   * @return the query parameters, keys and values as sent by the client
   */
  inline const ParamMap&
  GetParams() const
  {
    return mRequestParams;
  }

  /**
   * @return value of a query parameter or an empty string
   */
  std::string
  GetParam(const std::string& key) const;

  /**
   * Replace the query parameters by an already decoded map, the query string
   * is left untouched
   */
  inline void
  SetParams(const ParamMap& params)
  {
    mRequestParams = params;
  }

  /**
   * @return the client request body
   */
  inline const std::string&
  GetBody() const
  {
    return mRequestBody;
  }

  /**
   * Change the request query string
   *
   * @param query  the new query string to use
   */
  inline void
  SetQuery(const std::string& query)
  {
    mRequestQuery = query;
  }

  /**
   * @return nicely formatted request, ready for printing
   */
  std::string
  ToString() const;
};

XMDCOMMONNAMESPACE_END

#endif /* __XMDCOMMON_HTTP_REQUEST__HH__ */
