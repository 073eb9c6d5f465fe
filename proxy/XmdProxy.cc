// ----------------------------------------------------------------------
// File: XmdProxy.cc
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
#include "proxy/HttpServer.hh"
#include "proxy/LocalAccountClient.hh"
#include "common/ErrnoToString.hh"
#include "common/Logging.hh"
#include "XrdSys/XrdSysError.hh"
#include "XrdSys/XrdSysLogger.hh"
#include <getopt.h>
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace xmd::proxy;

//------------------------------------------------------------------------------
// Display help message
//------------------------------------------------------------------------------
void print_usage(const char* prg_name)
{
  std::cerr << "Usage: " << prg_name << " [--config <file>] [--port <port>] "
            << "[--root <dir>] [--debug]" << std::endl
            << "   --config <file> : configuration file with proxy.* and "
            << "node.* directives" << std::endl
            << "   --port <port>   : listening port, overrides proxy.port"
            << std::endl
            << "   --root <dir>    : account directory, overrides proxy.root"
            << std::endl
            << "   --debug         : enable debug logging" << std::endl;
}

int main(int argc, char* argv[])
{
  int c;
  int long_index = 0;
  bool debug = false;
  std::string cfg_file, root;
  int port = 0;
  extern char* optarg;
  static struct option long_options[] = {
    {"config",  required_argument, 0,  'c'},
    {"port",    required_argument, 0,  'p'},
    {"root",    required_argument, 0,  'r'},
    {"debug",   no_argument,       0,  'd'},
    {"help",    no_argument,       0,  'h'},
    {0,         0,                 0,   0 }
  };

  while ((c = getopt_long(argc, argv, "c:p:r:dh", long_options,
                          &long_index)) != -1) {
    switch (c) {
    case 'c':
      cfg_file = optarg;
      break;

    case 'p':
      port = atoi(optarg);

      if ((port < 1) || (port > 65535)) {
        std::cerr << "error: illegal port " << optarg << std::endl;
        return -1;
      }

      break;

    case 'r':
      root = optarg;
      break;

    case 'd':
      debug = true;
      break;

    default:
      print_usage(argv[0]);
      return -1;
    }
  }

  XrdSysLogger logger;
  XrdSysError eroute(&logger, "xmd-proxy");
  Config config;

  if (config.Configure(cfg_file.c_str(), eroute)) {
    std::cerr << "error: failed to parse configuration file " << cfg_file
              << std::endl;
    return -1;
  }

  config.ApplyEnv(eroute);

  if (port) {
    config.Port = port;
  }

  if (!root.empty()) {
    config.Root = root;
  }

  xmd::common::Logging& g_logging = xmd::common::Logging::GetInstance();
  g_logging.SetUnit("proxy");
  g_logging.SetLogPriority(debug ? LOG_DEBUG :
                           g_logging.GetPriorityByString(config.LogLevel.c_str()));
  struct stat buf;
  int err = stat(config.Root.c_str(), &buf) ? errno :
            (S_ISDIR(buf.st_mode) ? 0 : ENOTDIR);

  if (err) {
    xmd_static_crit("msg=\"unusable account root\" root=\"%s\" err=\"%s\"",
                    config.Root.c_str(), xmd::common::ErrnoToString(err).c_str());
    return -1;
  }

  // the serving threads inherit the blocked signals, only main waits for them
  sigset_t sigset;
  sigemptyset(&sigset);
  sigaddset(&sigset, SIGINT);
  sigaddset(&sigset, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigset, 0);
  LocalAccountClient client(config.Root, config.Node);
  HttpServer server(config, client);

  if (!server.Start()) {
    xmd_static_crit("msg=\"failed to start http server\" port=%d", config.Port);
    return -1;
  }

  xmd_static_notice("msg=\"proxy running\" port=%d root=\"%s\" "
                    "threadmodel=%s", config.Port, config.Root.c_str(),
                    config.ThreadModel.c_str());
  int sig = 0;

  err = sigwait(&sigset, &sig);

  if (err) {
    xmd_static_err("msg=\"waiting for signals failed\" err=\"%s\"",
                   xmd::common::ErrnoToString(err).c_str());
  }

  xmd_static_notice("msg=\"shutting down\" signal=%d", sig);
  server.Stop();
  return 0;
}
