// ----------------------------------------------------------------------
// File: Config.cc
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

#include "proxy/Config.hh"
#include "common/Logging.hh"
#include "XrdOuc/XrdOucStream.hh"
#include "XrdSys/XrdSysError.hh"
#include <fcntl.h>
#include <string.h>
#include <strings.h>
#include <cerrno>
#include <cstdlib>

XMDPROXYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Parse boolean value
//------------------------------------------------------------------------------
bool
Config::ParseBool(const char* value, bool& result)
{
  if (!value) {
    return false;
  }

  if (!strcasecmp(value, "true") || !strcasecmp(value, "yes") ||
      !strcasecmp(value, "on") || !strcmp(value, "1")) {
    result = true;
    return true;
  }

  if (!strcasecmp(value, "false") || !strcasecmp(value, "no") ||
      !strcasecmp(value, "off") || !strcmp(value, "0")) {
    result = false;
    return true;
  }

  return false;
}

//------------------------------------------------------------------------------
// Parse the configuration file
//------------------------------------------------------------------------------
int
Config::Configure(const char* ConfigFN, XrdSysError& Eroute)
{
  int NoGo = 0;
  int cfgFD;
  char* var;

  if (!ConfigFN || !*ConfigFN) {
    Eroute.Say("=====> proxy: no configuration file, using defaults");
    return NoGo;
  }

  if ((cfgFD = open(ConfigFN, O_RDONLY, 0)) < 0) {
    Eroute.Emsg("Config", errno, "open config file fn=", ConfigFN);
    return 1;
  }

  XrdOucStream Config(&Eroute, getenv("XRDINSTANCE"));
  Config.Attach(cfgFD);

  while ((var = Config.GetMyFirstWord())) {
    if (!strncmp(var, "proxy.", 6)) {
      var += 6;

      if (ParseDirective(var, Config, Eroute)) {
        NoGo = 1;
      }
    } else if (!strncmp(var, "node.", 5)) {
      var += 5;

      if (Node.ParseDirective(var, Config, Eroute)) {
        NoGo = 1;
      }
    }
  }

  Config.Close();
  return NoGo;
}

//------------------------------------------------------------------------------
// Handle one proxy directive
//------------------------------------------------------------------------------
int
Config::ParseDirective(const char* var, XrdOucStream& Config,
                       XrdSysError& Eroute)
{
  char* val;

  if (!strcmp("port", var)) {
    if (!(val = Config.GetWord()) || (atoi(val) < 1) || (atoi(val) > 65535)) {
      Eroute.Emsg("Config", "argument 2 for port illegal or missing. "
                  "Must be a TCP port number!");
      return 1;
    }

    Port = atoi(val);
    Eroute.Say("=====> proxy.port : ", val);
    return 0;
  }

  if (!strcmp("root", var)) {
    if (!(val = Config.GetWord()) || (val[0] != '/')) {
      Eroute.Emsg("Config", "argument 2 for root illegal or missing. "
                  "Must be an absolute path!");
      return 1;
    }

    Root = val;
    Eroute.Say("=====> proxy.root : ", val);
    return 0;
  }

  if (!strcmp("authtoken", var)) {
    if (!(val = Config.GetWord())) {
      Eroute.Emsg("Config", "argument 2 for authtoken missing");
      return 1;
    }

    AuthToken = val;
    Eroute.Say("=====> proxy.authtoken : <configured>");
    return 0;
  }

  if (!strcmp("allow_account_management", var) ||
      !strcmp("account_autocreate", var)) {
    bool flag = false;

    if (!(val = Config.GetWord()) || !ParseBool(val, flag)) {
      Eroute.Emsg("Config", "argument 2 illegal or missing, must be true or "
                  "false for", var);
      return 1;
    }

    if (!strcmp("allow_account_management", var)) {
      AllowAccountManagement = flag;
    } else {
      AccountAutocreate = flag;
    }

    Eroute.Say("=====> proxy.", var, " : ", flag ? "true" : "false");
    return 0;
  }

  if (!strcmp("threadmodel", var)) {
    if (!(val = Config.GetWord()) ||
        (strcmp(val, "threads") && strcmp(val, "epoll") &&
         strcmp(val, "single"))) {
      Eroute.Emsg("Config", "argument 2 for threadmodel illegal or missing. "
                  "Must be threads, epoll or single!");
      return 1;
    }

    ThreadModel = val;
    Eroute.Say("=====> proxy.threadmodel : ", val);
    return 0;
  }

  if (!strcmp("threadpool", var)) {
    if (!(val = Config.GetWord()) || (atoi(val) < 1)) {
      Eroute.Emsg("Config", "argument 2 for threadpool illegal or missing. "
                  "Must be a positive number!");
      return 1;
    }

    ThreadPoolSize = atoi(val);
    Eroute.Say("=====> proxy.threadpool : ", val);
    return 0;
  }

  if (!strcmp("loglevel", var)) {
    if (!(val = Config.GetWord()) ||
        (xmd::common::Logging::GetInstance().GetPriorityByString(val) < 0)) {
      Eroute.Emsg("Config", "argument 2 for loglevel illegal or missing. "
                  "Must be debug, info, notice, warning, err or crit!");
      return 1;
    }

    LogLevel = val;
    Eroute.Say("=====> proxy.loglevel : ", val);
    return 0;
  }

  Eroute.Say("=====> proxy: ignoring unknown directive proxy.", var);
  return 0;
}

//------------------------------------------------------------------------------
// Environment overrides
//------------------------------------------------------------------------------
void
Config::ApplyEnv(XrdSysError& Eroute)
{
  const char* val = getenv("XMD_PROXY_PORT");

  if (val && *val) {
    int port = atoi(val);

    if ((port < 1) || (port > 65535)) {
      Eroute.Say("=====> proxy: ignoring illegal XMD_PROXY_PORT=", val);
    } else {
      Port = port;
      Eroute.Say("=====> proxy.port (XMD_PROXY_PORT) : ", val);
    }
  }
}

//------------------------------------------------------------------------------
// Per-request context
//------------------------------------------------------------------------------
ProxyContext
Config::MakeContext() const
{
  ProxyContext ctx;
  ctx.allowAccountManagement = AllowAccountManagement;
  ctx.accountAutocreate = AccountAutocreate;

  if (!AuthToken.empty()) {
    std::string token = AuthToken;
    ctx.Authorize = [token](const xmd::common::HttpRequest & request) {
      return (request.GetHeader("x-auth-token") == token);
    };
  }

  return ctx;
}

XMDPROXYNAMESPACE_END
