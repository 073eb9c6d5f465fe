// ----------------------------------------------------------------------
// File: LocalAccountClient.cc
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

#include "proxy/LocalAccountClient.hh"
#include "common/ErrnoToString.hh"
#include "common/ScopedFd.hh"
#include "common/StringConversion.hh"
#include "common/Timing.hh"
#include "common/http/HttpResponse.hh"
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

XMDPROXYNAMESPACE_BEGIN

using xmd::common::HttpResponse;
using xmd::common::ScopedFd;
using xmd::common::Status;
using xmd::common::StringConversion;
using xmd::node::MetadataMap;

namespace
{
const std::string sMetaPrefix = "x-account-meta-";

std::string
HeaderValue(const AccountClient::HeaderMap& headers, const std::string& key)
{
  auto it = headers.find(key);
  return (it == headers.end()) ? std::string() : it->second;
}

std::string
XmlEscape(const std::string& in)
{
  std::string out;

  for (char c : in) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;

    case '<':
      out += "&lt;";
      break;

    case '>':
      out += "&gt;";
      break;

    case '"':
      out += "&quot;";
      break;

    case '\'':
      out += "&apos;";
      break;

    default:
      out += c;
    }
  }

  return out;
}

//------------------------------------------------------------------------------
// Check that a directory has no entries
//------------------------------------------------------------------------------
int
IsEmptyDir(const std::string& path, bool& empty)
{
  DIR* dir = opendir(path.c_str());

  if (!dir) {
    return errno;
  }

  struct dirent* entry;
  empty = true;

  while ((entry = readdir(dir))) {
    if (strcmp(entry->d_name, ".") && strcmp(entry->d_name, "..")) {
      empty = false;
      break;
    }
  }

  closedir(dir);
  return 0;
}
}

/*----------------------------------------------------------------------------*/
LocalAccountClient::LocalAccountClient(const std::string& root,
                                       const xmd::node::Config& config) :
  mRoot(root), mCodec(), mStore(mCodec, config),
  mHandler(mStore, config.MetadataKey)
{
  while ((mRoot.length() > 1) && (mRoot.back() == '/')) {
    mRoot.pop_back();
  }
}

/*----------------------------------------------------------------------------*/
bool
LocalAccountClient::ValidAccountName(const std::string& account)
{
  return !account.empty() && (account != ".") && (account != "..") &&
         (account.find('/') == std::string::npos) &&
         (account.find('\0') == std::string::npos);
}

/*----------------------------------------------------------------------------*/
void
LocalAccountClient::MergeMeta(const HeaderMap& headers, MetadataMap& md)
{
  for (auto it = headers.begin(); it != headers.end(); ++it) {
    std::string key = LC_STRING(it->first);

    if ((key.length() <= sMetaPrefix.length()) ||
        !StringConversion::StartsWithNoCase(key, sMetaPrefix)) {
      continue;
    }

    if (it->second.empty()) {
      md.erase(key);
    } else {
      md[key] = it->second;
    }
  }
}

/*----------------------------------------------------------------------------*/
void
LocalAccountClient::FillHeaders(const MetadataMap& md, HeaderMap& respHeaders)
{
  for (auto it = md.begin(); it != md.end(); ++it) {
    respHeaders[StringConversion::HeaderCase(it->first)] = it->second;
  }

  respHeaders["X-Account-Container-Count"] = "0";
  respHeaders["X-Account-Object-Count"] = "0";
  respHeaders["X-Account-Bytes-Used"] = "0";
}

/*----------------------------------------------------------------------------*/
int
LocalAccountClient::Load(const std::string& account, int& fd, MetadataMap& md)
{
  if (!ValidAccountName(account)) {
    return HttpResponse::BAD_REQUEST;
  }

  std::string path = AccountPath(account);
  fd = open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);

  if (fd < 0) {
    int err = errno;

    if ((err == ENOENT) || (err == ENOTDIR)) {
      return HttpResponse::NOT_FOUND;
    }

    xmd_err("msg=\"failed to open account\" path=\"%s\" errno=%d err=\"%s\"",
            path.c_str(), err, xmd::common::ErrnoToString(err).c_str());
    return HttpResponse::INTERNAL_SERVER_ERROR;
  }

  auto ret = mHandler.LocalRetrieveMetadata(fd);

  if (ret.first.IsNotFound()) {
    md.clear();
    return 0;
  }

  if (!ret.first) {
    xmd_err("msg=\"failed to load account metadata\" path=\"%s\" %s",
            path.c_str(), ret.first.toString().c_str());
    return HttpResponse::INTERNAL_SERVER_ERROR;
  }

  md.swap(ret.second);
  return 0;
}

/*----------------------------------------------------------------------------*/
int
LocalAccountClient::GetAccount(const std::string& account,
                               const HeaderMap& options,
                               const HeaderMap& headers,
                               HeaderMap& respHeaders,
                               std::unique_ptr<xmd::common::ResponseStream>& body)
{
  int code = HeadAccount(account, headers, respHeaders);

  if (code != HttpResponse::NO_CONTENT) {
    return code;
  }

  std::string format = LC_STRING(HeaderValue(options, "format"));
  std::string listing;

  if (format == "json") {
    listing = "[]";
    respHeaders["Content-Type"] = "application/json; charset=utf-8";
  } else if (format == "xml") {
    listing = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<account name=\"" +
              XmlEscape(account) + "\"></account>";
    respHeaders["Content-Type"] = "application/xml; charset=utf-8";
  } else {
    respHeaders["Content-Type"] = "text/plain; charset=utf-8";
    respHeaders["Content-Length"] = "0";
    return HttpResponse::NO_CONTENT;
  }

  respHeaders["Content-Length"] = std::to_string(listing.length());
  body.reset(new xmd::common::StringResponseStream(listing));
  return HttpResponse::OK;
}

/*----------------------------------------------------------------------------*/
int
LocalAccountClient::HeadAccount(const std::string& account,
                                const HeaderMap& headers,
                                HeaderMap& respHeaders)
{
  int raw_fd = -1;
  MetadataMap md;
  int code = Load(account, raw_fd, md);
  ScopedFd fd(raw_fd);

  if (code) {
    return code;
  }

  FillHeaders(md, respHeaders);
  return HttpResponse::NO_CONTENT;
}

/*----------------------------------------------------------------------------*/
int
LocalAccountClient::PutAccount(const std::string& account,
                               const HeaderMap& headers)
{
  if (!ValidAccountName(account)) {
    return HttpResponse::BAD_REQUEST;
  }

  std::string path = AccountPath(account);
  bool created = true;

  if (mkdir(path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH)) {
    int err = errno;

    if (err != EEXIST) {
      xmd_err("msg=\"failed to create account\" path=\"%s\" errno=%d err=\"%s\"",
              path.c_str(), err, xmd::common::ErrnoToString(err).c_str());
      return HttpResponse::INTERNAL_SERVER_ERROR;
    }

    created = false;
  }

  int raw_fd = -1;
  MetadataMap md;
  int code = Load(account, raw_fd, md);
  ScopedFd fd(raw_fd);

  if (code) {
    return (code == HttpResponse::NOT_FOUND) ?
           HttpResponse::INTERNAL_SERVER_ERROR : code;
  }

  std::string timestamp = HeaderValue(headers, "x-timestamp");

  if (timestamp.empty()) {
    timestamp = xmd::common::Timing::GetTimestamp();
  }

  if (!md.count("x-timestamp")) {
    md["x-timestamp"] = timestamp;
  }

  md["x-put-timestamp"] = timestamp;
  MergeMeta(headers, md);
  Status st = mHandler.LocalPutMetadata(fd.get(), md);

  if (!st) {
    xmd_err("msg=\"failed to store account metadata\" path=\"%s\" %s",
            path.c_str(), st.toString().c_str());
    return HttpResponse::INTERNAL_SERVER_ERROR;
  }

  xmd_info("msg=\"account %s\" account=\"%s\"", created ? "created" : "updated",
           account.c_str());
  return created ? HttpResponse::CREATED : HttpResponse::ACCEPTED;
}

/*----------------------------------------------------------------------------*/
int
LocalAccountClient::PostAccount(const std::string& account,
                                const HeaderMap& headers)
{
  int raw_fd = -1;
  MetadataMap md;
  int code = Load(account, raw_fd, md);
  ScopedFd fd(raw_fd);

  if (code) {
    return code;
  }

  MergeMeta(headers, md);
  Status st = mHandler.LocalPutMetadata(fd.get(), md);

  if (!st) {
    xmd_err("msg=\"failed to update account metadata\" account=\"%s\" %s",
            account.c_str(), st.toString().c_str());
    return HttpResponse::INTERNAL_SERVER_ERROR;
  }

  return HttpResponse::NO_CONTENT;
}

/*----------------------------------------------------------------------------*/
int
LocalAccountClient::DeleteAccount(const std::string& account,
                                  const HeaderMap& headers)
{
  if (!ValidAccountName(account)) {
    return HttpResponse::BAD_REQUEST;
  }

  std::string path = AccountPath(account);
  bool empty = false;
  int err = IsEmptyDir(path, empty);

  if ((err == ENOENT) || (err == ENOTDIR)) {
    return HttpResponse::NOT_FOUND;
  }

  if (err) {
    xmd_err("msg=\"failed to inspect account\" path=\"%s\" errno=%d err=\"%s\"",
            path.c_str(), err, xmd::common::ErrnoToString(err).c_str());
    return HttpResponse::INTERNAL_SERVER_ERROR;
  }

  if (!empty) {
    return HttpResponse::CONFLICT;
  }

  {
    ScopedFd fd(open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));

    if (!fd.valid()) {
      err = errno;
      return (err == ENOENT) ? HttpResponse::NOT_FOUND :
             HttpResponse::INTERNAL_SERVER_ERROR;
    }

    Status st = mHandler.LocalDeleteMetadata(fd.get());

    if (!st) {
      xmd_err("msg=\"failed to delete account metadata\" path=\"%s\" %s",
              path.c_str(), st.toString().c_str());
      return HttpResponse::INTERNAL_SERVER_ERROR;
    }
  }

  if (rmdir(path.c_str())) {
    err = errno;

    if ((err == ENOTEMPTY) || (err == EEXIST)) {
      return HttpResponse::CONFLICT;
    }

    if (err == ENOENT) {
      return HttpResponse::NOT_FOUND;
    }

    xmd_err("msg=\"failed to remove account\" path=\"%s\" errno=%d err=\"%s\"",
            path.c_str(), err, xmd::common::ErrnoToString(err).c_str());
    return HttpResponse::INTERNAL_SERVER_ERROR;
  }

  xmd_info("msg=\"account deleted\" account=\"%s\"", account.c_str());
  return HttpResponse::NO_CONTENT;
}

XMDPROXYNAMESPACE_END
