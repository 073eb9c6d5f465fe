// ----------------------------------------------------------------------
// File: AccountClient.hh
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
 * @file   AccountClient.hh
 *
 * @brief  Interface of the backend account service used by the proxy.
 *         Every call returns the HTTP status code of the backend.
 */

#ifndef __XMDPROXY_ACCOUNTCLIENT__HH__
#define __XMDPROXY_ACCOUNTCLIENT__HH__

#include "proxy/Namespace.hh"
#include "common/http/ResponseStream.hh"
#include <map>
#include <memory>
#include <string>

XMDPROXYNAMESPACE_BEGIN

class AccountClient
{
public:
  typedef std::map<std::string, std::string> HeaderMap;

  AccountClient() {};
  virtual ~AccountClient() {};

  /**
   * Read an account and its listing
   *
   * @param account      account name
   * @param options      listing options: format, limit, marker, end_marker,
   *                     prefix and delimiter
   * @param headers      request headers
   * @param respHeaders  filled with the backend response headers
   * @param body         set to the listing stream, left empty if there is no
   *                     body
   *
   * @return HTTP status code
   */
  virtual int
  GetAccount(const std::string& account, const HeaderMap& options,
             const HeaderMap& headers, HeaderMap& respHeaders,
             std::unique_ptr<common::ResponseStream>& body) = 0;

  /**
   * Read the account headers only
   */
  virtual int
  HeadAccount(const std::string& account, const HeaderMap& headers,
              HeaderMap& respHeaders) = 0;

  /**
   * Create an account or update its put timestamp
   */
  virtual int
  PutAccount(const std::string& account, const HeaderMap& headers) = 0;

  /**
   * Update the account metadata
   */
  virtual int
  PostAccount(const std::string& account, const HeaderMap& headers) = 0;

  /**
   * Delete an account
   */
  virtual int
  DeleteAccount(const std::string& account, const HeaderMap& headers) = 0;
};

XMDPROXYNAMESPACE_END

#endif /* __XMDPROXY_ACCOUNTCLIENT__HH__ */
