#pragma once

#include <arpa/inet.h>
#include <string>
#include <vector>

#include "tftprx/common/transport.hpp"

namespace tftprx
{

  class udp_connection : public transport
  {
  public:
    udp_connection();
    udp_connection(const udp_connection &)            = delete;
    udp_connection(udp_connection &&)                 = delete;
    udp_connection &operator=(const udp_connection &) = delete;
    udp_connection &operator=(udp_connection &&)      = delete;
    ~udp_connection() override;

    void               bind(const std::string &ip_address, const uint16_t port_num);
    struct sockaddr_in local_address() const;

    void                      send_to(const struct sockaddr_in &destination, const std::vector<char> &data) override;
    std::optional<datagram_t> receive(const size_t max_size, const std::chrono::milliseconds timeout) override;

  private:
    int _sd;
  };

} // namespace tftprx
