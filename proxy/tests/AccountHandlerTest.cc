// ----------------------------------------------------------------------
// File: AccountHandlerTest.cc
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

#include "proxy/AccountHandler.hh"
#include "gtest/gtest.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

using xmd::common::HttpRequest;
using xmd::common::HttpResponse;
using xmd::proxy::AccountClient;
using xmd::proxy::AccountHandler;
using xmd::proxy::ProxyContext;

namespace
{
//------------------------------------------------------------------------------
//! Stream reporting when it gets closed
//------------------------------------------------------------------------------
class TrackedStream : public xmd::common::StringResponseStream
{
public:
  TrackedStream(const std::string& body, std::shared_ptr<bool> closed) :
    StringResponseStream(body), mClosed(closed) {}

  ~TrackedStream()
  {
    Close();
  }

  void Close() override
  {
    *mClosed = true;
    StringResponseStream::Close();
  }

private:
  std::shared_ptr<bool> mClosed;
};

//------------------------------------------------------------------------------
//! Backend recording the calls it receives
//------------------------------------------------------------------------------
class MockAccountClient : public AccountClient
{
public:
  int mCode = 200;
  HeaderMap mRespHeaders;
  std::string mBody;
  std::shared_ptr<bool> mClosed = std::make_shared<bool>(false);
  std::vector<int> mCodes;
  std::vector<std::string> mCalls;
  std::vector<HeaderMap> mCallHeaders;
  std::string mAccount;
  HeaderMap mOptions;
  HeaderMap mHeaders;

  int GetAccount(const std::string& account, const HeaderMap& options,
                 const HeaderMap& headers, HeaderMap& respHeaders,
                 std::unique_ptr<xmd::common::ResponseStream>& body) override
  {
    Record("GET", account, headers);
    mOptions = options;
    respHeaders = mRespHeaders;

    if (!mBody.empty()) {
      body.reset(new TrackedStream(mBody, mClosed));
    }

    return NextCode();
  }

  int HeadAccount(const std::string& account, const HeaderMap& headers,
                  HeaderMap& respHeaders) override
  {
    Record("HEAD", account, headers);
    respHeaders = mRespHeaders;
    return NextCode();
  }

  int PutAccount(const std::string& account, const HeaderMap& headers) override
  {
    Record("PUT", account, headers);
    return NextCode();
  }

  int PostAccount(const std::string& account, const HeaderMap& headers) override
  {
    Record("POST", account, headers);
    return NextCode();
  }

  int DeleteAccount(const std::string& account,
                    const HeaderMap& headers) override
  {
    Record("DELETE", account, headers);
    return NextCode();
  }

private:
  void Record(const std::string& verb, const std::string& account,
              const HeaderMap& headers)
  {
    mCalls.push_back(verb);
    mCallHeaders.push_back(headers);
    mAccount = account;
    mHeaders = headers;
  }

  //! Codes queued in mCodes are answered first, then mCode
  int NextCode()
  {
    if (mCodes.empty()) {
      return mCode;
    }

    int code = mCodes.front();
    mCodes.erase(mCodes.begin());
    return code;
  }
};

HttpRequest MakeRequest(const std::string& method,
                        const std::string& url = "/AUTH_test",
                        const std::string& query = "")
{
  HttpRequest::HeaderMap headers;
  headers["x-auth-token"] = "secret";
  return HttpRequest(headers, method, url, query);
}

std::string ReadAll(xmd::common::ResponseStream& stream)
{
  std::string out;
  char buf[4];
  ssize_t nread;

  while ((nread = stream.Read(buf, sizeof(buf))) > 0) {
    out.append(buf, nread);
  }

  return out;
}
}

TEST(AccountHandler, ParseAccount)
{
  std::string account;
  ASSERT_TRUE(AccountHandler::ParseAccount("/AUTH_test", account));
  ASSERT_EQ(account, "AUTH_test");
  ASSERT_TRUE(AccountHandler::ParseAccount("/acct/", account));
  ASSERT_EQ(account, "acct");
  ASSERT_FALSE(AccountHandler::ParseAccount("/", account));
  ASSERT_FALSE(AccountHandler::ParseAccount("", account));
  ASSERT_FALSE(AccountHandler::ParseAccount("acct", account));
  ASSERT_FALSE(AccountHandler::ParseAccount("/acct/container", account));
}

TEST(AccountHandler, MissingContext)
{
  MockAccountClient client;
  AccountHandler handler(client, nullptr);
  HttpRequest request = MakeRequest("GET");
  handler.HandleRequest(&request);
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(),
            HttpResponse::INTERNAL_SERVER_ERROR);
  ASSERT_TRUE(client.mCalls.empty());
}

TEST(AccountHandler, DeniedByHook)
{
  for (const char* method : {
         "GET", "HEAD", "PUT", "POST", "DELETE"
       }) {
    MockAccountClient client;
    ProxyContext ctx;
    int hook_calls = 0;
    ctx.Authorize = [&hook_calls](const HttpRequest&) {
      ++hook_calls;
      return false;
    };
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method);
    handler.HandleRequest(&request);
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(),
              HttpResponse::UNAUTHORIZED) << method;
    ASSERT_EQ(hook_calls, 1);
    ASSERT_TRUE(client.mCalls.empty()) << method;
  }
}

TEST(AccountHandler, ContextCheckedBeforeValidation)
{
  MockAccountClient client;
  ProxyContext ctx;
  ctx.Authorize = [](const HttpRequest&) {
    return false;
  };
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("DELETE", "/acct", "junk=1");
  handler.HandleRequest(&request);
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(),
            HttpResponse::UNAUTHORIZED);
}

TEST(AccountHandler, PutWithoutHookReachesBackend)
{
  for (int code : {
         201, 202, 507
       }) {
    MockAccountClient client;
    client.mCode = code;
    ProxyContext ctx;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest("PUT", "/acct");
    handler.HandleRequest(&request);
    ASSERT_EQ(client.mCalls, std::vector<std::string> {"PUT"});
    ASSERT_EQ(client.mAccount, "acct");
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), code);
    ASSERT_EQ(handler.GetResponse()->GetBody(), HttpResponse::StandardBody(code));
    // the timestamp is stamped before the backend call
    ASSERT_EQ(client.mHeaders.count("x-timestamp"), 1u);
    ASSERT_EQ(client.mHeaders["x-timestamp"].length(), 16u);
    ASSERT_EQ(client.mHeaders["x-auth-token"], "secret");
  }
}

TEST(AccountHandler, MutationsStampTimestamp)
{
  for (const char* method : {
         "POST", "DELETE"
       }) {
    MockAccountClient client;
    client.mCode = 204;
    ProxyContext ctx;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method);
    request.SetHeader("x-timestamp", "0000000001.00000");
    handler.HandleRequest(&request);
    ASSERT_EQ(client.mCalls.size(), 1u);
    ASSERT_EQ(client.mCalls[0], method);
    ASSERT_NE(client.mHeaders["x-timestamp"], "0000000001.00000");
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 204);
    ASSERT_TRUE(handler.GetResponse()->GetBody().empty());
  }
}

TEST(AccountHandler, ReadsDoNotStampTimestamp)
{
  MockAccountClient client;
  client.mCode = 204;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("HEAD");
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mHeaders.count("x-timestamp"), 0u);
}

TEST(AccountHandler, GetPassesOptions)
{
  MockAccountClient client;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("GET", "/acct",
                                    "format=json&limit=10&marker=m1&other=x");
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls, std::vector<std::string> {"GET"});
  AccountClient::HeaderMap expected {
    {"format", "json"}, {"limit", "10"}, {"marker", "m1"},
    {"end_marker", ""}, {"prefix", ""}, {"delimiter", ""}
  };
  ASSERT_EQ(client.mOptions, expected);
}

TEST(AccountHandler, GetOptionsKeepReservedCharacters)
{
  MockAccountClient client;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("GET", "/acct",
                                    "prefix=a%26limit%3D1&marker=m");
  request.SetParams({{"prefix", "a&limit=1"}, {"marker", "m"}});
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls, std::vector<std::string> {"GET"});
  ASSERT_EQ(client.mOptions["prefix"], "a&limit=1");
  ASSERT_EQ(client.mOptions["marker"], "m");
  ASSERT_EQ(client.mOptions["limit"], "");
  ASSERT_EQ(client.mOptions.size(), 6u);
}

TEST(AccountHandler, GetCopiesHeadersAndStream)
{
  MockAccountClient client;
  client.mCode = 200;
  client.mBody = "[\"c1\",\"c2\"]";
  client.mRespHeaders["X-Account-Object-Count"] = "3";
  client.mRespHeaders["Content-Type"] = "application/json; charset=utf-8";
  ProxyContext ctx;
  std::unique_ptr<xmd::common::ResponseStream> stream;
  {
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest("GET");
    handler.HandleRequest(&request);
    HttpResponse* response = handler.GetResponse();
    ASSERT_EQ(response->GetResponseCode(), 200);
    ASSERT_EQ(response->GetHeaders()["X-Account-Object-Count"], "3");
    ASSERT_EQ(response->GetHeaders()["Content-Type"],
              "application/json; charset=utf-8");
    ASSERT_TRUE(response->HasBodyStream());
    ASSERT_FALSE(*client.mClosed);
    stream = response->ReleaseBodyStream();
  }
  ASSERT_EQ(ReadAll(*stream), "[\"c1\",\"c2\"]");
  ASSERT_FALSE(*client.mClosed);
  stream.reset();
  ASSERT_TRUE(*client.mClosed);
}

TEST(AccountHandler, StreamClosedWithResponse)
{
  MockAccountClient client;
  client.mBody = "listing";
  ProxyContext ctx;
  {
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest("GET");
    handler.HandleRequest(&request);
    ASSERT_FALSE(*client.mClosed);
  }
  ASSERT_TRUE(*client.mClosed);
}

TEST(AccountHandler, BackendStatusRelayed)
{
  for (int code : {
         204, 404, 503
       }) {
    MockAccountClient client;
    client.mCode = code;
    ProxyContext ctx;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest("HEAD");
    handler.HandleRequest(&request);
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), code);
  }
}

TEST(AccountHandler, Autocreate)
{
  for (const char* method : {
         "GET", "HEAD"
       }) {
    MockAccountClient client;
    client.mCode = 404;
    client.mBody = "not found";
    ProxyContext ctx;
    ctx.accountAutocreate = true;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method);
    handler.HandleRequest(&request);
    HttpResponse* response = handler.GetResponse();
    ASSERT_EQ(response->GetResponseCode(), 204);
    ASSERT_FALSE(response->HasBodyStream());
    ASSERT_EQ(response->GetHeaders()["Content-Length"], "0");
    ASSERT_EQ(response->GetHeaders()["Accept-Ranges"], "bytes");
    ASSERT_EQ(response->GetHeaders()["Content-Type"], "text/plain; charset=utf-8");
    ASSERT_EQ(response->GetHeaders()["X-Account-Bytes-Used"], "0");
    ASSERT_EQ(response->GetHeaders()["X-Account-Container-Count"], "0");
    ASSERT_EQ(response->GetHeaders()["X-Account-Object-Count"], "0");
    ASSERT_EQ(response->GetHeaders()["X-Timestamp"].length(), 16u);

    if (std::string(method) == "GET") {
      ASSERT_TRUE(*client.mClosed);
    }
  }
}

TEST(AccountHandler, AutocreateOnlyOnNotFound)
{
  MockAccountClient client;
  client.mCode = 503;
  ProxyContext ctx;
  ctx.accountAutocreate = true;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("HEAD");
  handler.HandleRequest(&request);
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 503);
}

TEST(AccountHandler, AccountNameTooLong)
{
  std::string name(257, 'a');

  for (const char* method : {
         "GET", "HEAD", "PUT", "POST"
       }) {
    MockAccountClient client;
    ProxyContext ctx;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method, "/" + name);
    handler.HandleRequest(&request);
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 400) << method;
    ASSERT_EQ(handler.GetResponse()->GetBody(),
              "Account name length of 257 longer than 256");
    ASSERT_TRUE(client.mCalls.empty());
  }

  MockAccountClient client;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("HEAD", "/" + std::string(256, 'a'));
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls.size(), 1u);
}

TEST(AccountHandler, DeleteWithQuery)
{
  MockAccountClient client;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("DELETE", "/acct", "multipart-manifest=get");
  handler.HandleRequest(&request);
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 400);
  ASSERT_TRUE(client.mCalls.empty());
}

TEST(AccountHandler, AccountManagementDisabled)
{
  for (const char* method : {
         "PUT", "DELETE"
       }) {
    MockAccountClient client;
    ProxyContext ctx;
    ctx.allowAccountManagement = false;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method);
    handler.HandleRequest(&request);
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 405) << method;
    ASSERT_EQ(handler.GetResponse()->GetHeaders()["Allow"], "GET, HEAD, POST");
    ASSERT_TRUE(client.mCalls.empty());
  }

  MockAccountClient client;
  client.mCode = 204;
  ProxyContext ctx;
  ctx.allowAccountManagement = false;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("POST");
  handler.HandleRequest(&request);
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 204);
}

TEST(AccountHandler, UnsupportedMethod)
{
  for (const char* method : {
         "PATCH", "OPTIONS", "FOO"
       }) {
    MockAccountClient client;
    ProxyContext ctx;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method);
    handler.HandleRequest(&request);
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 405) << method;
    ASSERT_EQ(handler.GetResponse()->GetHeaders()["Allow"],
              "DELETE, GET, HEAD, POST, PUT");
    ASSERT_TRUE(client.mCalls.empty());
  }
}

TEST(AccountHandler, PostAutocreate)
{
  MockAccountClient client;
  client.mCodes = {404, 201, 204};
  ProxyContext ctx;
  ctx.accountAutocreate = true;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("POST");
  request.SetHeader("x-account-meta-color", "blue");
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls,
            (std::vector<std::string> {"POST", "PUT", "POST"}));
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 204);
  // the account is created bare, the retried POST carries the metadata
  const AccountClient::HeaderMap& create = client.mCallHeaders[1];
  ASSERT_EQ(create.size(), 1u);
  ASSERT_EQ(create.at("x-timestamp").length(), 16u);
  ASSERT_EQ(client.mCallHeaders[2].at("x-account-meta-color"), "blue");
  ASSERT_EQ(client.mCallHeaders[2].count("x-timestamp"), 1u);
}

TEST(AccountHandler, PostWithoutAutocreate)
{
  MockAccountClient client;
  client.mCode = 404;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("POST");
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls, std::vector<std::string> {"POST"});
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 404);
}

TEST(AccountHandler, PostAutocreateFailureRelayed)
{
  MockAccountClient client;
  client.mCodes = {404, 507, 404};
  ProxyContext ctx;
  ctx.accountAutocreate = true;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("POST");
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls,
            (std::vector<std::string> {"POST", "PUT", "POST"}));
  ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 404);
}

TEST(AccountHandler, MetadataWithinLimits)
{
  for (const char* method : {
         "PUT", "POST"
       }) {
    MockAccountClient client;
    client.mCode = 204;
    ProxyContext ctx;
    AccountHandler handler(client, &ctx);
    HttpRequest request = MakeRequest(method);
    request.SetHeader("x-account-meta-" + std::string(128, 'n'),
                      std::string(256, 'v'));

    for (int i = 0; i < 89; ++i) {
      request.SetHeader("x-account-meta-k" + std::to_string(i), "v");
    }

    handler.HandleRequest(&request);
    ASSERT_EQ(client.mCalls.size(), 1u) << method;
    ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 204) << method;
  }
}

TEST(AccountHandler, MetadataLimits)
{
  struct Case {
    std::map<std::string, std::string> headers;
    std::string body;
  };
  std::string long_name = "x-account-meta-" + std::string(129, 'n');
  std::vector<Case> cases;
  cases.push_back({{{"x-account-meta-", "v"}}, "Metadata name cannot be empty"});
  cases.push_back({{{long_name, "v"}}, "Metadata name too long: " + long_name});
  cases.push_back({{{"x-account-meta-color", std::string(257, 'v')}},
    "Metadata value longer than 256: x-account-meta-color"
  });
  Case too_many;

  for (int i = 0; i < 91; ++i) {
    too_many.headers["x-account-meta-k" + std::to_string(i)] = "v";
  }

  too_many.body = "Too many metadata items; max 90";
  cases.push_back(too_many);
  Case too_large;

  for (int i = 0; i < 20; ++i) {
    too_large.headers["x-account-meta-k" + std::to_string(i)] =
      std::string(250, 'v');
  }

  too_large.body = "Total metadata too large; max 4096";
  cases.push_back(too_large);

  for (const auto& c : cases) {
    for (const char* method : {
           "PUT", "POST"
         }) {
      MockAccountClient client;
      ProxyContext ctx;
      AccountHandler handler(client, &ctx);
      HttpRequest request = MakeRequest(method);

      for (const auto& header : c.headers) {
        request.SetHeader(header.first, header.second);
      }

      handler.HandleRequest(&request);
      ASSERT_EQ(handler.GetResponse()->GetResponseCode(), 400) << c.body;
      ASSERT_EQ(handler.GetResponse()->GetBody(), c.body) << method;
      ASSERT_TRUE(client.mCalls.empty()) << c.body;
    }
  }
}

TEST(AccountHandler, MetadataOfOtherResourcesIgnored)
{
  MockAccountClient client;
  client.mCode = 204;
  ProxyContext ctx;
  AccountHandler handler(client, &ctx);
  HttpRequest request = MakeRequest("POST");
  request.SetHeader("x-container-meta-color", std::string(1024, 'v'));
  handler.HandleRequest(&request);
  ASSERT_EQ(client.mCalls, std::vector<std::string> {"POST"});
}
