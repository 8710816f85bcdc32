#pragma once

#include <arpa/inet.h>
#include <functional>
#include <optional>
#include <string>

#include "tftprx/client/transfer_engine.hpp"
#include "tftprx/common/tftp.hpp"
#include "tftprx/common/transport.hpp"

namespace tftprx::client
{

  enum class request_error_t
  {
    FILE_NOT_FOUND,
    PERMISSION_DENIED
  };

  std::string request_error_to_string(const request_error_t err);

  struct client_config_t
  {
    client_config_t() :
        filename("data.txt"), output{}, host("127.0.0.1"), port(DEFAULT_PORT), local_interface{}, transfer{} {};
    std::string       filename;
    std::string       output;
    std::string       host;
    uint16_t          port;
    std::string       local_interface;
    transfer_config_t transfer;
  };

  using readable_check_t = std::function<bool(const std::string &)>;

  /* access(2) with R_OK */
  bool is_readable(const std::string &filename);

  /**
   * @brief Sends a read request for filename to server
   *
   * filename must name a regular file on the local machine that readable accepts, nothing is
   * sent otherwise.
   * @return the failed precondition, or an empty optional once the request has been sent
   */
  std::optional<request_error_t> issue_request(transport &udp, const struct sockaddr_in &server,
                                               const std::string &filename,
                                               const readable_check_t &readable = is_readable);

  /* Request followed by transfer, returns true if the whole file was received */
  bool get_file(const client_config_t &config);

}; // namespace tftprx::client
