#include "tftprx/common/udp_connection.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "tftprx/common/debug_macros.hpp"
#include "tftprx/common/utils.hpp"

//========================================================
tftprx::udp_connection::udp_connection() : _sd(-1)
{
  _sd = socket(AF_INET, SOCK_DGRAM, 0);

  if (_sd < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
tftprx::udp_connection::~udp_connection()
{
  if (_sd >= 0)
  {
    close(_sd);
  }
}

//========================================================
void tftprx::udp_connection::bind(const std::string &ip_address, const uint16_t port_num)
{
  const auto sa = utils::to_sockaddr_in(ip_address, port_num);
  if (!sa)
  {
    throw std::runtime_error("Invalid address");
  }

  if (::bind(_sd, (const struct sockaddr *)&sa.value(), sizeof(struct sockaddr_in)) < 0)
  {
    dbg_err("Bind failed");
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
struct sockaddr_in tftprx::udp_connection::local_address() const
{
  struct sockaddr_in sa;
  socklen_t          sa_len = sizeof(sa);
  std::memset(&sa, 0, sizeof(struct sockaddr_in));

  if (getsockname(_sd, (struct sockaddr *)&sa, &sa_len) < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  return sa;
}

//========================================================
void tftprx::udp_connection::send_to(const struct sockaddr_in &destination, const std::vector<char> &data)
{
  const ssize_t sent =
      ::sendto(_sd, data.data(), data.size(), 0, (const struct sockaddr *)&destination, sizeof(struct sockaddr_in));
  if (sent < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
std::optional<tftprx::datagram_t> tftprx::udp_connection::receive(const size_t                    max_size,
                                                                  const std::chrono::milliseconds timeout)
{
  pollfd pfd = {
      .fd      = _sd,
      .events  = POLLIN,
      .revents = 0,
  };

  int ready = 0;
  do
  {
    ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while ((ready < 0) && (errno == EINTR));

  if (ready < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  if ((ready == 0) || !(pfd.revents & POLLIN))
  {
    return {};
  }

  datagram_t ret;
  ret.data.resize(max_size, 0);
  socklen_t sa_len = sizeof(ret.from);

  const ssize_t received = ::recvfrom(_sd, ret.data.data(), max_size, 0, (struct sockaddr *)&ret.from, &sa_len);
  if (received < 0)
  {
    if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
    {
      return {};
    }
    throw std::runtime_error(utils::string_error(errno));
  }

  ret.data.resize(static_cast<size_t>(received));
  return ret;
}
