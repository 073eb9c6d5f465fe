// ----------------------------------------------------------------------
// File: Gatekeeper.hh
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

#ifndef __XMDPROXY_GATEKEEPER__HH__
#define __XMDPROXY_GATEKEEPER__HH__

#include "proxy/Namespace.hh"
#include "common/http/HttpRequest.hh"
#include "common/http/HttpResponse.hh"
#include <map>
#include <string>
#include <vector>

XMDPROXYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Removes system metadata headers which clients may neither set nor see
//------------------------------------------------------------------------------
class Gatekeeper
{
public:
  //----------------------------------------------------------------------------
  //! Check if a header name carries system metadata, ignoring case
  //----------------------------------------------------------------------------
  static bool IsSysMeta(const std::string& name);

  //----------------------------------------------------------------------------
  //! Remove system metadata headers from a header map
  //!
  //! @param headers header map to filter
  //!
  //! @return names of the removed headers
  //----------------------------------------------------------------------------
  static std::vector<std::string>
  RemoveSysMeta(std::map<std::string, std::string>& headers);

  //----------------------------------------------------------------------------
  //! Filter the headers of a client request
  //----------------------------------------------------------------------------
  static void FilterRequest(xmd::common::HttpRequest& request);

  //----------------------------------------------------------------------------
  //! Filter the headers of a response going to the client
  //----------------------------------------------------------------------------
  static void FilterResponse(xmd::common::HttpResponse& response);
};

XMDPROXYNAMESPACE_END

#endif
