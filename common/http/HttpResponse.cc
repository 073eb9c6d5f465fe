// ----------------------------------------------------------------------
// File: HttpResponse.cc
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

#include "common/http/HttpResponse.hh"
#include <cctype>
#include <sstream>

XMDCOMMONNAMESPACE_BEGIN

/*----------------------------------------------------------------------------*/
void
HttpResponse::AddHeader(const std::string& key, const std::string& value)
{
  mResponseHeaders[key] = value;
}

/*----------------------------------------------------------------------------*/
std::string
HttpResponse::GetReasonPhrase(int code)
{
  switch (code) {
  case CONTINUE:
    return "Continue";

  case OK:
    return "OK";

  case CREATED:
    return "Created";

  case ACCEPTED:
    return "Accepted";

  case NO_CONTENT:
    return "No Content";

  case PARTIAL_CONTENT:
    return "Partial Content";

  case NOT_MODIFIED:
    return "Not Modified";

  case TEMPORARY_REDIRECT:
    return "Temporary Redirect";

  case BAD_REQUEST:
    return "Bad Request";

  case UNAUTHORIZED:
    return "Unauthorized";

  case FORBIDDEN:
    return "Forbidden";

  case NOT_FOUND:
    return "Not Found";

  case METHOD_NOT_ALLOWED:
    return "Method Not Allowed";

  case CONFLICT:
    return "Conflict";

  case LENGTH_REQUIRED:
    return "Length Required";

  case PRECONDITION_FAILED:
    return "Precondition Failed";

  case REQUEST_ENTITY_TOO_LARGE:
    return "Request Entity Too Large";

  case UNPROCESSABLE_ENTITY:
    return "Unprocessable Entity";

  case INTERNAL_SERVER_ERROR:
    return "Internal Server Error";

  case NOT_IMPLEMENTED:
    return "Not Implemented";

  case BAD_GATEWAY:
    return "Bad Gateway";

  case SERVICE_UNAVAILABLE:
    return "Service Unavailable";

  case INSUFFICIENT_STORAGE:
    return "Insufficient Storage";

  default:
    return "Unknown";
  }
}

/*----------------------------------------------------------------------------*/
std::string
HttpResponse::StandardBody(int code)
{
  if ((code < 200) || (code == NO_CONTENT) || (code == NOT_MODIFIED)) {
    return "";
  }

  std::ostringstream oss;
  oss << "<html><h1>" << GetReasonPhrase(code) << "</h1><p>";

  switch (code) {
  case BAD_REQUEST:
    oss << "The server could not comply with the request since it is either "
        "malformed or otherwise incorrect.";
    break;

  case UNAUTHORIZED:
    oss << "This server could not verify that you are authorized to access "
        "the document you requested.";
    break;

  case NOT_FOUND:
    oss << "The resource could not be found.";
    break;

  case METHOD_NOT_ALLOWED:
    oss << "The method is not allowed for this resource.";
    break;

  case CONFLICT:
    oss << "There was a conflict when trying to complete your request.";
    break;

  case INTERNAL_SERVER_ERROR:
    oss << "The server has either erred or is incapable of performing the "
        "requested operation.";
    break;

  case SERVICE_UNAVAILABLE:
    oss << "The server is currently unavailable. Please try again at a later "
        "time.";
    break;

  default:
    oss << "The request completed with status " << code << ".";
    break;
  }

  oss << "</p></html>";
  return oss.str();
}

/*----------------------------------------------------------------------------*/
std::string
HttpResponse::GetResponseCodeDescription() const
{
  std::string desc = GetReasonPhrase(mResponseCode);

  for (auto& c : desc) {
    c = (c == ' ') ? '_' : toupper(c);
  }

  return desc;
}

/*----------------------------------------------------------------------------*/
std::string
HttpResponse::ToString() const
{
  std::stringstream ss;
  ss << "Response code: " << mResponseCode << std::endl;

  for (auto it = mResponseHeaders.begin(); it != mResponseHeaders.end(); ++it) {
    ss << it->first << ": " << it->second << std::endl;
  }

  if (mBodyStream) {
    ss << "\n\n<streamed body>" << std::endl;
  } else {
    ss << "\n\n" << mResponseBody << std::endl;
  }

  return ss.str();
}

XMDCOMMONNAMESPACE_END
