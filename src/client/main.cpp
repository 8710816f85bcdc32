#include <chrono>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fmt/core.h>
#include <getopt.h>
#include <signal.h>
#include <stdexcept>
#include <string>

#include "tftprx/client/tftp_client.hpp"
#include "tftprx/common/debug_macros.hpp"
#include "tftprx/common/tftp.hpp"
#include "tftprx/common/utils.hpp"

//==========================================================
void sig_handler(int signum)
{
  dbg_info("Received signal {}", signum);
  exit(signum);
}

//==========================================================
void print_help(char *argv0)
{
  const char help_msg[] = R"({}: [OPTIONS] [FILE]
  FILE            : Name of the file to request (default: data.txt)
  -h --host       : IP address of the TFTP server (default: 127.0.0.1)
  -p --port       : Port of the TFTP server (default: {})
  -i --interface  : IP address of the local interface to send requests from (optional)
  -m --mode       : Transfer mode, only rx (read) is supported (default: rx)
  -o --output     : File to write the received data to (default: FILE)
  -t --timeout    : Seconds to wait for each packet (default: 2)
  -r --retries    : Timeouts tolerated before giving up (default: 3)
  -v --verbose    : Trace logging
     --help       : Print this message
)";
  fmt::print(help_msg, argv0, tftprx::DEFAULT_PORT);
}

//==========================================================
unsigned long parse_option(const char *arg, const unsigned long min, const unsigned long max)
{
  const auto value = tftprx::utils::parse_unsigned(arg, min, max);
  if (!value)
  {
    throw std::out_of_range(fmt::format("expected a number between {} and {}", min, max));
  }
  return value.value();
}

//==========================================================
int main(int argc, char **argv)
{
  signal(SIGTERM, sig_handler);
  signal(SIGHUP, sig_handler);

  int verbose_flag = 0;
  int help_flag    = 0;

  static struct option long_options[] = {/* These options set a flag. */
                                         {"verbose", no_argument, &verbose_flag, 1},
                                         {"help", no_argument, &help_flag, 1},
                                         /* These options don’t set a flag.
                                            We distinguish them by their indices. */
                                         {"host", required_argument, 0, 'h'},
                                         {"port", required_argument, 0, 'p'},
                                         {"interface", required_argument, 0, 'i'},
                                         {"mode", required_argument, 0, 'm'},
                                         {"output", required_argument, 0, 'o'},
                                         {"timeout", required_argument, 0, 't'},
                                         {"retries", required_argument, 0, 'r'},
                                         {0, 0, 0, 0}};

  tftprx::client::client_config_t config;
  std::string                     mode = "rx";

  while (true)
  {
    int option_index = 0;

    int c = getopt_long(argc, argv, "vh:p:i:m:o:t:r:", long_options, &option_index);

    if (c == -1)
      break;

    try
    {
      switch (c)
      {
      case 'h': {
        config.host = optarg;
        break;
      }
      case 'p': {
        config.port = static_cast<uint16_t>(parse_option(optarg, 1, UINT16_MAX));
        break;
      }
      case 'i': {
        config.local_interface = optarg;
        break;
      }
      case 'm': {
        mode = optarg;
        break;
      }
      case 'o': {
        config.output = optarg;
        break;
      }
      case 't': {
        config.transfer.timeout = std::chrono::seconds(parse_option(optarg, 0, UINT_MAX));
        break;
      }
      case 'r': {
        config.transfer.max_retries = static_cast<unsigned int>(parse_option(optarg, 0, UINT_MAX));
        break;
      }
      case 'v': {
        verbose_flag = 1;
        break;
      }
      case '?': {
        print_help(argv[0]);
        return 1;
      }
      }
    }
    catch (const std::exception &err)
    {
      fmt::print(stderr, "Invalid value '{}' for option -{} : {}\n", optarg, static_cast<char>(c), err.what());
      return 1;
    }
  }

  if (optind < argc)
  {
    config.filename = argv[optind++];
  }

  if (help_flag)
  {
    print_help(argv[0]);
    return 0;
  }

  if (tftprx::initialise_logger(verbose_flag))
  {
    return 1;
  }

  if (mode != "rx")
  {
    dbg_err("Unsupported mode '{}', use -m rx for reading a file", mode);
    return 1;
  }

  try
  {
    if (!tftprx::client::get_file(config))
    {
      return 1;
    }
  }
  catch (const std::exception &err)
  {
    dbg_err("Failure : {}", err.what());
    return 1;
  }

  dbg_trace("Exiting...");
  return 0;
}
