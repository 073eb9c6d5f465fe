// ----------------------------------------------------------------------
// File: LocalAccountClient.hh
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
 * @file   LocalAccountClient.hh
 *
 * @brief  Account service on the local filesystem: every account is a
 *         directory below the root whose metadata dictionary is kept in the
 *         directory's extended attributes.
 */

#ifndef __XMDPROXY_LOCALACCOUNTCLIENT__HH__
#define __XMDPROXY_LOCALACCOUNTCLIENT__HH__

#include "proxy/Namespace.hh"
#include "proxy/AccountClient.hh"
#include "node/Config.hh"
#include "node/MetadataHandler.hh"
#include "node/MetadataStore.hh"
#include "node/io/FsAttrCodec.hh"
#include "common/Logging.hh"
#include <string>

XMDPROXYNAMESPACE_BEGIN

class LocalAccountClient : public AccountClient, public xmd::common::LogId
{
public:
  /**
   * Constructor
   *
   * @param root    directory holding the account directories
   * @param config  metadata settings
   */
  LocalAccountClient(const std::string& root,
                     const xmd::node::Config& config = xmd::node::Config());

  virtual ~LocalAccountClient() {};

  int GetAccount(const std::string& account, const HeaderMap& options,
                 const HeaderMap& headers, HeaderMap& respHeaders,
                 std::unique_ptr<xmd::common::ResponseStream>& body) override;

  int HeadAccount(const std::string& account, const HeaderMap& headers,
                  HeaderMap& respHeaders) override;

  int PutAccount(const std::string& account, const HeaderMap& headers) override;

  int PostAccount(const std::string& account, const HeaderMap& headers) override;

  int DeleteAccount(const std::string& account,
                    const HeaderMap& headers) override;

  /**
   * @return true if the name can be used as a directory name
   */
  static bool ValidAccountName(const std::string& account);

  const std::string& GetRoot() const
  {
    return mRoot;
  }

private:
  std::string mRoot;
  xmd::node::FsAttrCodec mCodec;
  xmd::node::MetadataStore mStore;
  xmd::node::MetadataHandler mHandler;

  std::string AccountPath(const std::string& account) const
  {
    return mRoot + "/" + account;
  }

  /**
   * Open the account directory and load its metadata
   *
   * @return 0 on success with fd and md filled, otherwise the HTTP status
   */
  int Load(const std::string& account, int& fd, xmd::node::MetadataMap& md);

  /**
   * Merge x-account-meta-* request headers into the dictionary, an empty
   * value removes the key
   */
  static void MergeMeta(const HeaderMap& headers, xmd::node::MetadataMap& md);

  /**
   * Response headers of an account: stored dictionary plus usage counters
   */
  static void FillHeaders(const xmd::node::MetadataMap& md,
                          HeaderMap& respHeaders);
};

XMDPROXYNAMESPACE_END

#endif /* __XMDPROXY_LOCALACCOUNTCLIENT__HH__ */
