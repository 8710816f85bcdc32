#include <gtest/gtest.h>

#include <climits>
#include <fmt/format.h>

#include "tftprx/common/utils.hpp"
#include "tftprx/tests/test_utils.hpp"

using namespace tftprx::test_utils;
namespace utils = tftprx::utils;

TEST(extract_c_strings_from_buffer, empty)
{
    const std::vector<char> data{};
    
    const auto ret = utils::extract_c_strings_from_buffer(data);
    EXPECT_EQ(ret.size(), 0);
}

TEST(extract_c_strings_from_buffer, one_string)
{
    const std::string                    fname   = "test_file.txt";
    const std::vector<char>              data    = string_to_vector_null(fname);

    const auto ret = utils::extract_c_strings_from_buffer(data);

    EXPECT_EQ(ret.size(), 1);
    EXPECT_EQ(ret[0], fname);
}

TEST(extract_c_strings_from_buffer, two_strings_one_zero_length)
{
    const std::string                    fname   = "test_file.txt";
    const std::string                    mode    = "";
    const std::vector<std::vector<char>> strings = {string_to_vector_null(fname), string_to_vector_null(mode)};
    const std::vector<char>              data    = join_vectors(strings);

    const auto ret = utils::extract_c_strings_from_buffer(data);

    ASSERT_EQ(ret.size(), 2);
    EXPECT_EQ(ret[0], fname);
    EXPECT_EQ(ret[1], mode);
}

TEST(extract_c_strings_from_buffer, two_strings_one_missing_null)
{
    const std::vector<char> data = {'t', 'h', 'i', 's', ' ', 'i', 's', '\0', 'a', ' ', 't', 'e', 's', 't'};

    const auto ret = utils::extract_c_strings_from_buffer(data);

    ASSERT_EQ(ret.size(), 1);
    EXPECT_EQ(ret[0], std::string("this is"));
}

TEST(extract_c_strings_from_buffer, offset_past_end)
{
    const std::vector<char> data = {0x00, 0x01};

    const auto ret = utils::extract_c_strings_from_buffer(data, 2);

    EXPECT_TRUE(ret.empty());
}

TEST(to_sockaddr_in, loopback)
{
  const auto sa = utils::to_sockaddr_in("127.0.0.1", 6969);

  ASSERT_TRUE(sa.has_value());
  EXPECT_EQ(sa->sin_family, AF_INET);
  EXPECT_EQ(ntohs(sa->sin_port), 6969);
  EXPECT_EQ(ntohl(sa->sin_addr.s_addr), INADDR_LOOPBACK);
}

TEST(to_sockaddr_in, empty_is_any)
{
  const auto sa = utils::to_sockaddr_in("", 0);

  ASSERT_TRUE(sa.has_value());
  EXPECT_EQ(sa->sin_addr.s_addr, htonl(INADDR_ANY));
}

TEST(to_sockaddr_in, invalid)
{
  EXPECT_FALSE(utils::to_sockaddr_in("localhost", 69).has_value());
  EXPECT_FALSE(utils::to_sockaddr_in("256.1.1.1", 69).has_value());
}

TEST(same_endpoint, port_matters)
{
  EXPECT_TRUE(utils::same_endpoint(endpoint("10.0.0.1", 69), endpoint("10.0.0.1", 69)));
  EXPECT_FALSE(utils::same_endpoint(endpoint("10.0.0.1", 69), endpoint("10.0.0.1", 5000)));
  EXPECT_FALSE(utils::same_endpoint(endpoint("10.0.0.1", 69), endpoint("10.0.0.2", 69)));
}

TEST(sockaddr_format, address_and_port)
{
  EXPECT_EQ(fmt::format("{}", endpoint("192.168.1.20", 6969)), "192.168.1.20:6969");
}

TEST(parse_unsigned, accepts_digits_in_range)
{
  EXPECT_EQ(utils::parse_unsigned("0", 0, 10), 0UL);
  EXPECT_EQ(utils::parse_unsigned("6969", 1, UINT16_MAX), 6969UL);
  EXPECT_EQ(utils::parse_unsigned("65535", 1, UINT16_MAX), 65535UL);
}

TEST(parse_unsigned, rejects_signs)
{
  EXPECT_FALSE(utils::parse_unsigned("-1", 0, UINT_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned("+3", 0, UINT_MAX).has_value());
}

TEST(parse_unsigned, rejects_non_digits)
{
  EXPECT_FALSE(utils::parse_unsigned("", 0, UINT_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned("abc", 0, UINT_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned("12x", 0, UINT_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned(" 12", 0, UINT_MAX).has_value());
}

TEST(parse_unsigned, rejects_out_of_range)
{
  EXPECT_FALSE(utils::parse_unsigned("0", 1, UINT16_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned("65536", 1, UINT16_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned("4294967296", 0, UINT_MAX).has_value());
  EXPECT_FALSE(utils::parse_unsigned("99999999999999999999999", 0, ULONG_MAX).has_value());
}
