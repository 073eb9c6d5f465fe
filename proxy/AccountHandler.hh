// ----------------------------------------------------------------------
// File: AccountHandler.hh
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
 * @file   AccountHandler.hh
 *
 * @brief  Handles HTTP requests on an account resource /<account> by
 *         forwarding them to the backend account client.
 */

#ifndef __XMDPROXY_ACCOUNT_HANDLER__HH__
#define __XMDPROXY_ACCOUNT_HANDLER__HH__

#include "proxy/Namespace.hh"
#include "proxy/AccountClient.hh"
#include "proxy/ProxyContext.hh"
#include "common/http/HttpHandler.hh"
#include "common/http/PlainHttpResponse.hh"
#include "common/Logging.hh"
#include <string>

XMDPROXYNAMESPACE_BEGIN

class AccountHandler : public xmd::common::HttpHandler,
  public xmd::common::LogId
{
public:
  //! Longest accepted account name
  static constexpr size_t kMaxAccountNameLength = 256;
  //! Limits on the x-account-meta-* headers of PUT and POST, name lengths
  //! exclude the prefix and the overall size sums names and values
  static constexpr size_t kMaxMetaNameLength = 128;
  static constexpr size_t kMaxMetaValueLength = 256;
  static constexpr size_t kMaxMetaCount = 90;
  static constexpr size_t kMaxMetaOverallSize = 4096;

  /**
   * Constructor
   *
   * @param client  backend account service
   * @param ctx     per-request context, a missing context fails every request
   */
  AccountHandler(AccountClient& client, ProxyContext* ctx) :
    mClient(client), mContext(ctx) {};

  /**
   * Destructor
   */
  virtual ~AccountHandler() {};

  /**
   * Check whether the URL addresses an account resource
   *
   * @param url      request path, e.g. /AUTH_test or /AUTH_test/
   * @param account  filled with the account name
   *
   * @return true if the path has exactly one non-empty segment
   */
  static bool
  ParseAccount(const std::string& url, std::string& account);

  /**
   * Build a response to the given account request
   *
   * @param request  the client request object, headers may get stamped
   */
  void
  HandleRequest(xmd::common::HttpRequest* request) override;

private:
  AccountClient& mClient;  //!< backend account service
  ProxyContext*  mContext; //!< per-request context, not owned

  void Get(xmd::common::HttpRequest* request, const std::string& account);
  void Head(xmd::common::HttpRequest* request, const std::string& account);
  void Put(xmd::common::HttpRequest* request, const std::string& account);
  void Post(xmd::common::HttpRequest* request, const std::string& account);
  void Delete(xmd::common::HttpRequest* request, const std::string& account);

  /**
   * Fill the response with a 400 if the account name is too long
   *
   * @return true if the name was rejected
   */
  bool RejectLongName(const std::string& account);

  /**
   * Fill the response with a 400 if the account metadata headers of the
   * request break one of the metadata limits
   *
   * @return true if the metadata was rejected
   */
  bool RejectBadMetadata(const xmd::common::HttpRequest& request);

  /**
   * Fill the response with a 400 and a plain text explanation
   */
  void BadRequest(const std::string& reason);

  /**
   * Fill the response with a 405 listing the permitted methods
   */
  void MethodNotAllowed();

  /**
   * Fill the response with the headers of an existing empty account
   */
  void AutocreateResponse();

  /**
   * Copy backend headers onto the response and set the status code
   */
  void RelayHeaders(const AccountClient::HeaderMap& headers, int code);

  xmd::common::PlainHttpResponse* Response()
  {
    return static_cast<xmd::common::PlainHttpResponse*>(mHttpResponse);
  }
};

XMDPROXYNAMESPACE_END

#endif /* __XMDPROXY_ACCOUNT_HANDLER__HH__ */
