// ----------------------------------------------------------------------
// File: AccountHandler.cc
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
#include "common/StringConversion.hh"
#include "common/Timing.hh"

XMDPROXYNAMESPACE_BEGIN

using xmd::common::HttpRequest;
using xmd::common::HttpResponse;
using xmd::common::PlainHttpResponse;

constexpr size_t AccountHandler::kMaxAccountNameLength;
constexpr size_t AccountHandler::kMaxMetaNameLength;
constexpr size_t AccountHandler::kMaxMetaValueLength;
constexpr size_t AccountHandler::kMaxMetaCount;
constexpr size_t AccountHandler::kMaxMetaOverallSize;

namespace
{
const std::string sMetaPrefix = "x-account-meta-";
}

/*----------------------------------------------------------------------------*/
bool
AccountHandler::ParseAccount(const std::string& url, std::string& account)
{
  if (url.empty() || (url[0] != '/')) {
    return false;
  }

  std::string path = url.substr(1);

  if (!path.empty() && (path.back() == '/')) {
    path.pop_back();
  }

  if (path.empty() || (path.find('/') != std::string::npos)) {
    return false;
  }

  account = path;
  return true;
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::HandleRequest(HttpRequest* request)
{
  DeleteResponse();
  mHttpResponse = new PlainHttpResponse();

  if (!mContext) {
    xmd_err("msg=\"no proxy context for request\" method=%s url=\"%s\"",
            request->GetMethod().c_str(), request->GetUrl().c_str());
    Response()->SetStandardResponse(HttpResponse::INTERNAL_SERVER_ERROR);
    return;
  }

  if (mContext->Authorize && !mContext->Authorize(*request)) {
    xmd_info("msg=\"request not authorized\" method=%s url=\"%s\"",
             request->GetMethod().c_str(), request->GetUrl().c_str());
    Response()->SetStandardResponse(HttpResponse::UNAUTHORIZED);
    return;
  }

  std::string account;

  if (!ParseAccount(request->GetUrl(), account)) {
    Response()->SetStandardResponse(HttpResponse::NOT_FOUND);
    return;
  }

  xmd_debug("method=%s account=\"%s\" query=\"%s\"",
            request->GetMethod().c_str(), account.c_str(),
            request->GetQuery().c_str());

  switch (ParseMethodString(request->GetMethod())) {
  case GET:
    Get(request, account);
    break;

  case HEAD:
    Head(request, account);
    break;

  case PUT:
    Put(request, account);
    break;

  case POST:
    Post(request, account);
    break;

  case DELETE:
    Delete(request, account);
    break;

  default:
    MethodNotAllowed();
    break;
  }
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::Get(HttpRequest* request, const std::string& account)
{
  if (RejectLongName(account)) {
    return;
  }

  AccountClient::HeaderMap options;

  for (const char* name : {
         "format", "limit", "marker", "end_marker", "prefix", "delimiter"
       }) {
    options[name] = request->GetParam(name);
  }

  AccountClient::HeaderMap respHeaders;
  std::unique_ptr<xmd::common::ResponseStream> body;
  int code = mClient.GetAccount(account, options, request->GetHeaders(),
                                respHeaders, body);

  if ((code == HttpResponse::NOT_FOUND) && mContext->accountAutocreate) {
    // the backend stream is closed when body goes out of scope
    AutocreateResponse();
    return;
  }

  RelayHeaders(respHeaders, code);

  if (body) {
    Response()->SetBodyStream(std::move(body));
  }
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::Head(HttpRequest* request, const std::string& account)
{
  if (RejectLongName(account)) {
    return;
  }

  AccountClient::HeaderMap respHeaders;
  int code = mClient.HeadAccount(account, request->GetHeaders(), respHeaders);

  if ((code == HttpResponse::NOT_FOUND) && mContext->accountAutocreate) {
    AutocreateResponse();
    return;
  }

  RelayHeaders(respHeaders, code);
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::Put(HttpRequest* request, const std::string& account)
{
  if (!mContext->allowAccountManagement) {
    MethodNotAllowed();
    return;
  }

  if (RejectBadMetadata(*request) || RejectLongName(account)) {
    return;
  }

  request->SetHeader("x-timestamp", xmd::common::Timing::GetTimestamp());
  Response()->SetStandardResponse(mClient.PutAccount(account,
                                  request->GetHeaders()));
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::Post(HttpRequest* request, const std::string& account)
{
  if (RejectLongName(account) || RejectBadMetadata(*request)) {
    return;
  }

  request->SetHeader("x-timestamp", xmd::common::Timing::GetTimestamp());
  int code = mClient.PostAccount(account, request->GetHeaders());

  if ((code == HttpResponse::NOT_FOUND) && mContext->accountAutocreate) {
    AccountClient::HeaderMap create;
    create["x-timestamp"] = xmd::common::Timing::GetTimestamp();
    int put_code = mClient.PutAccount(account, create);

    if ((put_code < 200) || (put_code >= 300)) {
      xmd_warning("msg=\"could not autocreate account\" account=\"%s\" "
                  "code=%d", account.c_str(), put_code);
    }

    code = mClient.PostAccount(account, request->GetHeaders());
  }

  Response()->SetStandardResponse(code);
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::Delete(HttpRequest* request, const std::string& account)
{
  if (!request->GetQuery().empty()) {
    Response()->SetStandardResponse(HttpResponse::BAD_REQUEST);
    return;
  }

  if (!mContext->allowAccountManagement) {
    MethodNotAllowed();
    return;
  }

  request->SetHeader("x-timestamp", xmd::common::Timing::GetTimestamp());
  Response()->SetStandardResponse(mClient.DeleteAccount(account,
                                  request->GetHeaders()));
}

/*----------------------------------------------------------------------------*/
bool
AccountHandler::RejectLongName(const std::string& account)
{
  if (account.length() <= kMaxAccountNameLength) {
    return false;
  }

  BadRequest("Account name length of " + std::to_string(account.length()) +
             " longer than " + std::to_string(kMaxAccountNameLength));
  return true;
}

/*----------------------------------------------------------------------------*/
bool
AccountHandler::RejectBadMetadata(const HttpRequest& request)
{
  size_t count = 0;
  size_t size = 0;

  for (auto it = request.GetHeaders().begin();
       it != request.GetHeaders().end(); ++it) {
    if (!xmd::common::StringConversion::StartsWithNoCase(it->first,
        sMetaPrefix)) {
      continue;
    }

    std::string name = it->first.substr(sMetaPrefix.length());
    const std::string& value = it->second;

    if (name.empty()) {
      BadRequest("Metadata name cannot be empty");
      return true;
    }

    ++count;
    size += name.length() + value.length();

    if (name.length() > kMaxMetaNameLength) {
      BadRequest("Metadata name too long: " + it->first);
      return true;
    }

    if (value.length() > kMaxMetaValueLength) {
      BadRequest("Metadata value longer than " +
                 std::to_string(kMaxMetaValueLength) + ": " + it->first);
      return true;
    }

    if (count > kMaxMetaCount) {
      BadRequest("Too many metadata items; max " +
                 std::to_string(kMaxMetaCount));
      return true;
    }

    if (size > kMaxMetaOverallSize) {
      BadRequest("Total metadata too large; max " +
                 std::to_string(kMaxMetaOverallSize));
      return true;
    }
  }

  return false;
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::BadRequest(const std::string& reason)
{
  xmd_info("msg=\"rejecting request\" reason=\"%s\"", reason.c_str());
  Response()->SetResponseCode(HttpResponse::BAD_REQUEST);
  Response()->SetBody(reason);
  Response()->AddHeader("Content-Type", "text/plain; charset=UTF-8");
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::MethodNotAllowed()
{
  Response()->SetStandardResponse(HttpResponse::METHOD_NOT_ALLOWED);
  Response()->AddHeader("Allow", mContext->allowAccountManagement ?
                        "DELETE, GET, HEAD, POST, PUT" : "GET, HEAD, POST");
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::AutocreateResponse()
{
  Response()->SetResponseCode(HttpResponse::NO_CONTENT);
  Response()->SetBody("");
  Response()->AddHeader("Content-Length", "0");
  Response()->AddHeader("Accept-Ranges", "bytes");
  Response()->AddHeader("Content-Type", "text/plain; charset=utf-8");
  Response()->AddHeader("X-Timestamp", xmd::common::Timing::GetTimestamp());
  Response()->AddHeader("X-Account-Bytes-Used", "0");
  Response()->AddHeader("X-Account-Container-Count", "0");
  Response()->AddHeader("X-Account-Object-Count", "0");
}

/*----------------------------------------------------------------------------*/
void
AccountHandler::RelayHeaders(const AccountClient::HeaderMap& headers, int code)
{
  for (auto it = headers.begin(); it != headers.end(); ++it) {
    Response()->AddHeader(it->first, it->second);
  }

  Response()->SetResponseCode(code);
}

XMDPROXYNAMESPACE_END
