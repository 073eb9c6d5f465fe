// ----------------------------------------------------------------------
// File: HttpRequest.cc
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

#include "common/http/HttpRequest.hh"
#include "common/StringConversion.hh"
#include <sstream>

XMDCOMMONNAMESPACE_BEGIN

/*----------------------------------------------------------------------------*/
HttpRequest::HttpRequest(HeaderMap          headers,
                         const std::string& method,
                         const std::string& url,
                         const std::string& query,
                         const std::string& body) :
  mRequestHeaders(headers), mRequestMethod(method), mRequestUrl(url),
  mRequestQuery(query), mRequestBody(body)
{
  StringConversion::ParseQueryString(query, mRequestParams);
}

/*----------------------------------------------------------------------------*/
std::string
HttpRequest::GetHeader(const std::string& key) const
{
  auto it = mRequestHeaders.find(key);
  return (it == mRequestHeaders.end()) ? std::string() : it->second;
}

/*----------------------------------------------------------------------------*/
std::string
HttpRequest::GetParam(const std::string& key) const
{
  auto it = mRequestParams.find(key);
  return (it == mRequestParams.end()) ? std::string() : it->second;
}

/*----------------------------------------------------------------------------*/
std::string
HttpRequest::ToString() const
{
  std::stringstream ss;
  ss << GetMethod() << " " << GetUrl() << (GetQuery().size() ? "?" : "")
     << GetQuery() << std::endl;

  for (auto it = GetHeaders().begin(); it != GetHeaders().end(); ++it) {
    ss << it->first << ": " << it->second << std::endl;
  }

  return ss.str();
}

XMDCOMMONNAMESPACE_END
