#include "tftprx/common/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

//========================================================
std::optional<struct sockaddr_in> tftprx::utils::to_sockaddr_in(const std::string &addr, const uint16_t port)
{
  struct sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_port   = htons(port);
  sa.sin_family = AF_INET;
  if (addr.empty())
  {
    sa.sin_addr.s_addr = INADDR_ANY;
  }
  else
  {
    if (inet_pton(AF_INET, addr.c_str(), &(sa.sin_addr)) != 1)
    {
      return {};
    }
  }
  return sa;
}

//========================================================
bool tftprx::utils::same_endpoint(const struct sockaddr_in &a, const struct sockaddr_in &b)
{
  return (a.sin_family == b.sin_family) && (a.sin_port == b.sin_port) && (a.sin_addr.s_addr == b.sin_addr.s_addr);
}

//========================================================
std::vector<std::string> tftprx::utils::extract_c_strings_from_buffer(const std::vector<char> &buffer,
                                                                      const size_t             offset)
{
  std::vector<std::string> ret;
  if (offset >= buffer.size())
  {
    return ret;
  }
  auto start = buffer.begin() + offset;
  for (auto end = std::find(start, buffer.end(), 0); end != buffer.end(); end = std::find(start, buffer.end(), 0))
  {
    ret.emplace_back(start, end);
    start = std::next(end);
  }
  return ret;
}

//========================================================
std::optional<unsigned long> tftprx::utils::parse_unsigned(const std::string &str, const unsigned long min,
                                                           const unsigned long max)
{
  if (str.empty() || !std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); }))
  {
    return {};
  }

  errno                     = 0;
  const unsigned long value = std::strtoul(str.c_str(), NULL, 10);
  if ((errno == ERANGE) || (value < min) || (value > max))
  {
    return {};
  }
  return value;
}
