#pragma once

#include <arpa/inet.h>
#include <cstring>
#include <fmt/core.h>
#include <optional>
#include <string>
#include <vector>

/* formatter for struct sockaddr_in, required to be in the global namespace */
template<> class fmt::formatter<struct sockaddr_in>
{
  public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    auto format (const struct sockaddr_in& sa, Context& ctx) const
    {
      char addr_buf[INET_ADDRSTRLEN] = {0};
      if (inet_ntop(AF_INET, &(sa.sin_addr), addr_buf, INET_ADDRSTRLEN) == NULL)
      {
        return format_to(ctx.out(), "unknown:{}", ntohs(sa.sin_port));
      }
      else
      {
        return format_to(ctx.out(), "{}:{}", addr_buf, ntohs(sa.sin_port));
      }
    }
};

namespace tftprx::utils
{

  inline std::string string_error(const int errnum)
  {
    return std::string(std::strerror(errnum));
  }

  std::optional<struct sockaddr_in> to_sockaddr_in(const std::string &addr, const uint16_t port);

  /* Compares family, address and port only */
  bool same_endpoint(const struct sockaddr_in &a, const struct sockaddr_in &b);

  std::vector<std::string> extract_c_strings_from_buffer(const std::vector<char> &buffer, const size_t offset = 0);

  /* Decimal digits only, no sign or surrounding whitespace. Empty if out of [min, max] */
  std::optional<unsigned long> parse_unsigned(const std::string &str, const unsigned long min,
                                              const unsigned long max);

}; // namespace tftprx::utils
