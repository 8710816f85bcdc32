#pragma once

#include <arpa/inet.h>
#include <chrono>
#include <optional>
#include <vector>

namespace tftprx
{

  struct datagram_t
  {
    datagram_t() : data{}, from{} {};
    datagram_t(const std::vector<char> &d, const struct sockaddr_in &f) : data(d), from(f){};
    std::vector<char>  data;
    struct sockaddr_in from;
  };

  /**
   * @brief Datagram send/receive seam used by the request issuer and the transfer engine
   *
   * Implemented by udp_connection for real sockets, and by fakes in the tests.
   */
  class transport
  {
  public:
    virtual ~transport() = default;

    virtual void send_to(const struct sockaddr_in &destination, const std::vector<char> &data) = 0;

    /* Returns an empty optional if nothing arrived within timeout */
    virtual std::optional<datagram_t> receive(const size_t max_size, const std::chrono::milliseconds timeout) = 0;
  };

} // namespace tftprx
