// ----------------------------------------------------------------------
// File: StringConversion.hh
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
 * @file   StringConversion.hh
 *
 * @brief  Convenience string helpers shared by the HTTP and metadata layers.
 */

#ifndef __XMDCOMMON_STRINGCONVERSION__HH__
#define __XMDCOMMON_STRINGCONVERSION__HH__

#include "common/Namespace.hh"
#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <strings.h>
#include <vector>

XMDCOMMONNAMESPACE_BEGIN

#define LC_STRING(x) xmd::common::StringConversion::ToLower((x))

class StringConversion
{
public:
  // ---------------------------------------------------------------------------
  /**
   * Return a lower case string
   *
   * @param input - input string
   * @return lower case string
   */
  // ---------------------------------------------------------------------------
  static std::string
  ToLower(std::string is)
  {
    std::transform(is.begin(), is.end(), is.begin(), [](unsigned char c) {
      return static_cast<char>(::tolower(c));
    });
    return is;
  }

  static std::string
  ToLower(const char* s_is)
  {
    return ToLower(std::string(s_is ? s_is : ""));
  }

  // ---------------------------------------------------------------------------
  /**
   * Case insensitive prefix match
   *
   * @param str - string to inspect
   * @param prefix - prefix to look for
   * @return true if str starts with prefix ignoring case
   */
  // ---------------------------------------------------------------------------
  static bool
  StartsWithNoCase(const std::string& str, const std::string& prefix)
  {
    return (str.length() >= prefix.length()) &&
           (strncasecmp(str.c_str(), prefix.c_str(), prefix.length()) == 0);
  }

  // ---------------------------------------------------------------------------
  /**
   * Tokenize a string, empty members are skipped
   *
   * @param str - string to split
   * @param tokens - output tokens
   * @param delimiters - set of delimiter characters
   */
  // ---------------------------------------------------------------------------
  static void
  Tokenize(const std::string& str, std::vector<std::string>& tokens,
           const std::string& delimiters = " ")
  {
    std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);
    std::string::size_type pos = str.find_first_of(delimiters, lastPos);

    while ((std::string::npos != pos) || (std::string::npos != lastPos)) {
      tokens.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = str.find_first_not_of(delimiters, pos);
      pos = str.find_first_of(delimiters, lastPos);
    }
  }

  // ---------------------------------------------------------------------------
  /**
   * Split a query string "k1=v1&k2=v2" into a map, the first occurrence of a
   * key wins and a key without '=' gets an empty value
   */
  // ---------------------------------------------------------------------------
  static void
  ParseQueryString(const std::string& query,
                   std::map<std::string, std::string>& params)
  {
    std::vector<std::string> tokens;
    Tokenize(query, tokens, "&");

    for (const auto& token : tokens) {
      std::string::size_type pos = token.find('=');
      std::string key = token.substr(0, pos);
      std::string value = (pos == std::string::npos) ? "" : token.substr(pos + 1);

      if (!key.empty() && !params.count(key)) {
        params[key] = value;
      }
    }
  }

  // ---------------------------------------------------------------------------
  /**
   * Canonical form of an HTTP header name, e.g. x-account-meta-color becomes
   * X-Account-Meta-Color
   */
  // ---------------------------------------------------------------------------
  static std::string
  HeaderCase(std::string name)
  {
    bool upper = true;

    for (auto& c : name) {
      c = upper ? ::toupper((unsigned char) c) : ::tolower((unsigned char) c);
      upper = (c == '-');
    }

    return name;
  }
};

XMDCOMMONNAMESPACE_END

#endif
