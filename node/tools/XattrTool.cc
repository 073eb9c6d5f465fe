// ----------------------------------------------------------------------
// File: XattrTool.cc
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

#include "node/Config.hh"
#include "node/MetadataHandler.hh"
#include "node/MetadataStore.hh"
#include "node/io/FsAttrCodec.hh"
#include "common/ErrnoToString.hh"
#include "common/Logging.hh"
#include "common/ScopedFd.hh"
#include "XrdSys/XrdSysError.hh"
#include "XrdSys/XrdSysLogger.hh"
#include <fcntl.h>
#include <getopt.h>
#include <string.h>
#include <unistd.h>
#include <cerrno>
#include <iostream>
#include <string>
#include <vector>

using namespace xmd::node;
using xmd::common::ScopedFd;

//------------------------------------------------------------------------------
// Display help message
//------------------------------------------------------------------------------
void print_usage(const char* prg_name)
{
  std::cerr << "Usage: " << prg_name << " --path <file_or_dir> [--config <file>] "
            << "<action>" << std::endl
            << "   --probe <key>             : display the size of an attribute"
            << std::endl
            << "   --get <key>               : display an attribute value"
            << std::endl
            << "   --set <key> --value <val> : set an attribute value"
            << std::endl
            << "   --remove <key>            : remove an attribute" << std::endl
            << "   --list                    : list attribute names" << std::endl
            << "   --dump                    : display the metadata dictionary"
            << std::endl
            << "   --debug                   : enable debug logging" << std::endl;
}

int main(int argc, char* argv[])
{
  int c;
  int long_index = 0;
  bool do_list = false;
  bool do_dump = false;
  bool has_value = false;
  std::string path, cfg_file, probe_key, get_key, set_key, remove_key, value;
  extern char* optarg;
  static struct option long_options[] = {
    {"path",    required_argument, 0,   0 },
    {"config",  required_argument, 0,   0 },
    {"probe",   required_argument, 0,   0 },
    {"get",     required_argument, 0,   0 },
    {"set",     required_argument, 0,   0 },
    {"value",   required_argument, 0,   0 },
    {"remove",  required_argument, 0,   0 },
    {"list",    no_argument,       0,  'l'},
    {"dump",    no_argument,       0,  'd'},
    {"debug",   no_argument,       0,  'D'},
    {0,         0,                 0,   0 }
  };
  xmd::common::Logging& g_logging = xmd::common::Logging::GetInstance();
  g_logging.SetUnit("xmd-xattr");
  g_logging.SetLogPriority(LOG_WARNING);

  while ((c = getopt_long(argc, argv, "", long_options, &long_index)) != -1) {
    switch (c) {
    case 0: {
      std::string name = long_options[long_index].name;

      if (name == "path") {
        path = optarg;
      } else if (name == "config") {
        cfg_file = optarg;
      } else if (name == "probe") {
        probe_key = optarg;
      } else if (name == "get") {
        get_key = optarg;
      } else if (name == "set") {
        set_key = optarg;
      } else if (name == "value") {
        value = optarg;
        has_value = true;
      } else if (name == "remove") {
        remove_key = optarg;
      }

      break;
    }

    case 'l':
      do_list = true;
      break;

    case 'd':
      do_dump = true;
      break;

    case 'D':
      g_logging.SetLogPriority(LOG_DEBUG);
      break;

    default:
      print_usage(argv[0]);
      return -1;
    }
  }

  if (path.empty() || (!set_key.empty() && !has_value)) {
    print_usage(argv[0]);
    return -1;
  }

  if (!set_key.empty() && value.empty()) {
    std::cerr << "error: --value must not be empty, use --remove to drop "
              << "an attribute" << std::endl;
    return -1;
  }

  XrdSysLogger logger;
  XrdSysError eroute(&logger, "xmd-xattr");
  Config config;

  if (!cfg_file.empty() && config.Configure(cfg_file.c_str(), eroute)) {
    std::cerr << "error: failed to parse configuration file " << cfg_file
              << std::endl;
    return -1;
  }

  int flags = (set_key.empty() && remove_key.empty()) ? O_RDONLY : O_RDWR;
  int raw_fd = open(path.c_str(), flags | O_CLOEXEC);

  if ((raw_fd < 0) && (errno == EISDIR)) {
    // directories only open read-only, their xattrs are still writable
    raw_fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  }

  ScopedFd fd(raw_fd);

  if (fd.get() < 0) {
    std::cerr << "error: failed to open " << path << ": "
              << xmd::common::ErrnoToString(errno) << std::endl;
    return -1;
  }

  FsAttrCodec codec;
  MetadataStore store(codec, config);
  int retc = 0;

  if (!probe_key.empty()) {
    size_t size = 0;
    xmd::common::Status st = codec.Get(fd.get(), probe_key, AttrBuffer(), size);

    if (st) {
      std::cout << probe_key << " size=" << size << std::endl;
    } else {
      std::cerr << "error: " << st.toString() << std::endl;
      retc = -1;
    }
  }

  if (!get_key.empty()) {
    std::string val;
    xmd::common::Status st = store.ReadMetadata(fd.get(), get_key, val);

    if (st) {
      std::cout << get_key << "=\"" << val << "\"" << std::endl;
    } else {
      std::cerr << "error: " << st.toString() << std::endl;
      retc = -1;
    }
  }

  if (!set_key.empty()) {
    xmd::common::Status st = store.WriteMetadata(fd.get(), set_key, value);

    if (!st) {
      std::cerr << "error: " << st.toString() << std::endl;
      retc = -1;
    }
  }

  if (!remove_key.empty()) {
    xmd::common::Status st = codec.Remove(fd.get(), remove_key);

    if (!st) {
      std::cerr << "error: " << st.toString() << std::endl;
      retc = -1;
    }
  }

  if (do_list) {
    std::vector<std::string> keys;
    xmd::common::Status st = codec.List(fd.get(), keys);

    if (st) {
      for (const auto& key : keys) {
        std::cout << key << std::endl;
      }
    } else {
      std::cerr << "error: " << st.toString() << std::endl;
      retc = -1;
    }
  }

  if (do_dump) {
    MetadataHandler handler(store, config.MetadataKey);
    auto result = handler.LocalRetrieveMetadata(fd.get());

    if (result.first) {
      for (const auto& elem : result.second) {
        std::cout << elem.first << ": " << elem.second << std::endl;
      }
    } else {
      std::cerr << "error: " << result.first.toString() << std::endl;
      retc = -1;
    }
  }

  return retc;
}
