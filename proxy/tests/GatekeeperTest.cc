// ----------------------------------------------------------------------
// File: GatekeeperTest.cc
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

#include "proxy/Gatekeeper.hh"
#include "common/http/PlainHttpResponse.hh"
#include "gtest/gtest.h"

using xmd::common::HttpRequest;
using xmd::proxy::Gatekeeper;

TEST(Gatekeeper, IsSysMeta)
{
  ASSERT_TRUE(Gatekeeper::IsSysMeta("x-account-sysmeta-quota"));
  ASSERT_TRUE(Gatekeeper::IsSysMeta("X-Container-Sysmeta-Acl"));
  ASSERT_TRUE(Gatekeeper::IsSysMeta("X-OBJECT-SYSMETA-CRYPTO"));
  ASSERT_FALSE(Gatekeeper::IsSysMeta("x-account-meta-color"));
  ASSERT_FALSE(Gatekeeper::IsSysMeta("x-account-sysmeta"));
  ASSERT_FALSE(Gatekeeper::IsSysMeta("my-x-account-sysmeta-a"));
}

TEST(Gatekeeper, FilterRequest)
{
  HttpRequest::HeaderMap headers {
    {"x-account-sysmeta-quota", "1"},
    {"x-container-sysmeta-acl", "2"},
    {"x-account-meta-color", "blue"},
    {"x-auth-token", "secret"}
  };
  HttpRequest request(headers, "PUT", "/acct", "");
  Gatekeeper::FilterRequest(request);
  HttpRequest::HeaderMap expected {
    {"x-account-meta-color", "blue"},
    {"x-auth-token", "secret"}
  };
  ASSERT_EQ(request.GetHeaders(), expected);
}

TEST(Gatekeeper, FilterResponse)
{
  xmd::common::PlainHttpResponse response;
  response.AddHeader("X-Account-Sysmeta-Quota", "1");
  response.AddHeader("X-Object-Sysmeta-Crypto", "2");
  response.AddHeader("X-Account-Object-Count", "0");
  Gatekeeper::FilterResponse(response);
  ASSERT_EQ(response.GetHeaders().size(), 1u);
  ASSERT_EQ(response.GetHeaders().count("X-Account-Object-Count"), 1u);
}

TEST(Gatekeeper, NothingToRemove)
{
  std::map<std::string, std::string> headers {{"content-type", "text/plain"}};
  ASSERT_TRUE(Gatekeeper::RemoveSysMeta(headers).empty());
  ASSERT_EQ(headers.size(), 1u);
}
