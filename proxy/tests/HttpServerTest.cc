// ----------------------------------------------------------------------
// File: HttpServerTest.cc
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

#include "proxy/HttpServer.hh"
#include "gtest/gtest.h"

using xmd::common::HttpRequest;
using xmd::common::HttpResponse;
using xmd::proxy::AccountClient;
using xmd::proxy::Config;
using xmd::proxy::HttpServer;

namespace
{
//------------------------------------------------------------------------------
//! Backend answering HEAD with fixed headers and recording request headers
//------------------------------------------------------------------------------
class EchoAccountClient : public AccountClient
{
public:
  int mHeads = 0;
  HeaderMap mSeen;

  int GetAccount(const std::string& account, const HeaderMap& options,
                 const HeaderMap& headers, HeaderMap& respHeaders,
                 std::unique_ptr<xmd::common::ResponseStream>& body) override
  {
    body.reset(new xmd::common::StringResponseStream("[]"));
    return 200;
  }

  int HeadAccount(const std::string& account, const HeaderMap& headers,
                  HeaderMap& respHeaders) override
  {
    ++mHeads;
    mSeen = headers;
    respHeaders["X-Account-Object-Count"] = "0";
    respHeaders["X-Account-Sysmeta-Secret"] = "hidden";
    return 204;
  }

  int PutAccount(const std::string& account, const HeaderMap& headers) override
  {
    return 201;
  }

  int PostAccount(const std::string& account, const HeaderMap& headers) override
  {
    return 204;
  }

  int DeleteAccount(const std::string& account,
                    const HeaderMap& headers) override
  {
    return 204;
  }
};

HttpRequest MakeRequest(const std::string& method, const std::string& url,
                        const std::string& token = "")
{
  HttpRequest::HeaderMap headers;
  headers["x-account-sysmeta-quota"] = "1000";

  if (!token.empty()) {
    headers["x-auth-token"] = token;
  }

  return HttpRequest(headers, method, url, "");
}
}

TEST(ProxyHttpServer, UnknownPathIsNotFound)
{
  Config config;
  EchoAccountClient client;
  HttpServer server(config, client);

  for (const char* url : {
         "/", "/acct/container", "/acct/container/object"
       }) {
    HttpRequest request = MakeRequest("GET", url);
    std::unique_ptr<HttpResponse> response = server.Dispatch(request);
    ASSERT_EQ(response->GetResponseCode(), 404) << url;
  }

  ASSERT_EQ(client.mHeads, 0);
}

TEST(ProxyHttpServer, GatekeeperOnBothDirections)
{
  Config config;
  EchoAccountClient client;
  HttpServer server(config, client);
  HttpRequest request = MakeRequest("HEAD", "/acct/");
  std::unique_ptr<HttpResponse> response = server.Dispatch(request);
  ASSERT_EQ(response->GetResponseCode(), 204);
  ASSERT_EQ(client.mHeads, 1);
  ASSERT_EQ(client.mSeen.count("x-account-sysmeta-quota"), 0u);
  ASSERT_EQ(response->GetHeaders().count("X-Account-Sysmeta-Secret"), 0u);
  ASSERT_EQ(response->GetHeaders()["X-Account-Object-Count"], "0");
}

TEST(ProxyHttpServer, AuthToken)
{
  Config config;
  config.AuthToken = "secret";
  EchoAccountClient client;
  HttpServer server(config, client);
  HttpRequest denied = MakeRequest("HEAD", "/acct", "wrong");
  ASSERT_EQ(server.Dispatch(denied)->GetResponseCode(), 401);
  HttpRequest anonymous = MakeRequest("HEAD", "/acct");
  ASSERT_EQ(server.Dispatch(anonymous)->GetResponseCode(), 401);
  ASSERT_EQ(client.mHeads, 0);
  HttpRequest accepted = MakeRequest("HEAD", "/acct", "secret");
  ASSERT_EQ(server.Dispatch(accepted)->GetResponseCode(), 204);
  ASSERT_EQ(client.mHeads, 1);
}

TEST(ProxyHttpServer, ContextFromConfig)
{
  Config config;
  config.AllowAccountManagement = false;
  EchoAccountClient client;
  HttpServer server(config, client);
  HttpRequest request = MakeRequest("PUT", "/acct");
  ASSERT_EQ(server.Dispatch(request)->GetResponseCode(), 405);
}

TEST(ProxyHttpServer, StreamedBody)
{
  Config config;
  EchoAccountClient client;
  HttpServer server(config, client);
  HttpRequest request = MakeRequest("GET", "/acct");
  std::unique_ptr<HttpResponse> response = server.Dispatch(request);
  ASSERT_EQ(response->GetResponseCode(), 200);
  ASSERT_TRUE(response->HasBodyStream());
}
