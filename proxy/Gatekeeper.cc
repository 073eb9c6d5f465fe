// ----------------------------------------------------------------------
// File: Gatekeeper.cc
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
#include "common/Logging.hh"
#include "common/StringConversion.hh"

XMDPROXYNAMESPACE_BEGIN

namespace
{
const char* const sSysMetaPrefixes[] = {
  "x-account-sysmeta-",
  "x-container-sysmeta-",
  "x-object-sysmeta-"
};

std::string
Join(const std::vector<std::string>& names)
{
  std::string out;

  for (const auto& name : names) {
    if (!out.empty()) {
      out += ",";
    }

    out += name;
  }

  return out;
}
}

//------------------------------------------------------------------------------
// Check for a system metadata header
//------------------------------------------------------------------------------
bool
Gatekeeper::IsSysMeta(const std::string& name)
{
  for (const char* prefix : sSysMetaPrefixes) {
    if (xmd::common::StringConversion::StartsWithNoCase(name, prefix)) {
      return true;
    }
  }

  return false;
}

//------------------------------------------------------------------------------
// Remove system metadata headers
//------------------------------------------------------------------------------
std::vector<std::string>
Gatekeeper::RemoveSysMeta(std::map<std::string, std::string>& headers)
{
  std::vector<std::string> removed;

  for (auto it = headers.begin(); it != headers.end();) {
    if (IsSysMeta(it->first)) {
      removed.push_back(it->first);
      it = headers.erase(it);
    } else {
      ++it;
    }
  }

  return removed;
}

//------------------------------------------------------------------------------
// Filter request headers
//------------------------------------------------------------------------------
void
Gatekeeper::FilterRequest(xmd::common::HttpRequest& request)
{
  std::vector<std::string> removed = RemoveSysMeta(request.GetHeaders());

  if (!removed.empty()) {
    xmd_static_debug("msg=\"removed request headers\" headers=\"%s\"",
                     Join(removed).c_str());
  }
}

//------------------------------------------------------------------------------
// Filter response headers
//------------------------------------------------------------------------------
void
Gatekeeper::FilterResponse(xmd::common::HttpResponse& response)
{
  std::vector<std::string> removed = RemoveSysMeta(response.GetHeaders());

  if (!removed.empty()) {
    xmd_static_debug("msg=\"removed response headers\" headers=\"%s\"",
                     Join(removed).c_str());
  }
}

XMDPROXYNAMESPACE_END
