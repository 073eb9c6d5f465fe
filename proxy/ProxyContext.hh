// ----------------------------------------------------------------------
// File: ProxyContext.hh
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

#ifndef __XMDPROXY_PROXYCONTEXT__HH__
#define __XMDPROXY_PROXYCONTEXT__HH__

#include "proxy/Namespace.hh"
#include "common/http/HttpRequest.hh"
#include <functional>

XMDPROXYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Per-request settings handed to the resource handlers
//------------------------------------------------------------------------------
struct ProxyContext {
  //! Authorization hook, requests are accepted when not set
  std::function<bool(const common::HttpRequest&)> Authorize;
  //! PUT and DELETE on accounts are permitted
  bool allowAccountManagement = true;
  //! Answer GET/HEAD on a missing account as if it existed
  bool accountAutocreate = false;
};

XMDPROXYNAMESPACE_END

#endif /* __XMDPROXY_PROXYCONTEXT__HH__ */
