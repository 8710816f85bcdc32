#include <gtest/gtest.h>

#include "tftprx/common/tftp.hpp"
#include "tftprx/tests/test_utils.hpp"

using namespace tftprx::test_utils;

TEST(tftp_serdes_tests, read_request_layout)
{
  const std::vector<char> expected = {0x00, 0x01, 'd', 'a', 't', 'a', '.', 't', 'x',
                                      't', '\0', 'o', 'c', 't', 'e', 't', '\0'};

  const auto data = tftprx::serialise_read_request(tftprx::read_request_t("data.txt"));

  EXPECT_EQ(data, expected);
}

TEST(tftp_serdes_tests, read_request_with_path)
{
  const std::string                    filename = "/root/path/to/a/file.bin";
  const std::vector<std::vector<char>> strings  = {{0x00, 0x01}, string_to_vector_null(filename),
                                                  string_to_vector_null("octet")};

  const auto data = tftprx::serialise_read_request(tftprx::read_request_t(filename));

  EXPECT_EQ(data, join_vectors(strings));
}

TEST(tftp_serdes_tests, good_read_request_octet)
{
  const std::vector<char> data = {0x00, 0x01, '/', 'r', 'o', 'o', 't', '/', 'd',
                                  'i', 'r', '\0', 'o', 'c', 't', 'e', 't', '\0'};

  const auto packet = tftprx::deserialise_read_request(data);

  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ(packet->filename, "/root/dir");
}

TEST(tftp_serdes_tests, read_request_mode_is_case_insensitive)
{
  const std::vector<char> data = {0x00, 0x01, 'f', '\0', 'O', 'C', 'T', 'E', 'T', '\0'};

  const auto packet = tftprx::deserialise_read_request(data);

  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ(packet->filename, "f");
}

TEST(tftp_serdes_tests, read_request_mode_with_high_bytes)
{
  const std::vector<char> data = {0x00, 0x01, 'f', '\0', 'o', 'c', static_cast<char>(0xC3), static_cast<char>(0xA9),
                                  't', '\0'};

  EXPECT_FALSE(tftprx::deserialise_read_request(data).has_value());
}

TEST(tftp_serdes_tests, read_request_with_wrong_packet_type)
{
  const std::vector<char> data = {0x00, 0x02, '/', 'r', 'o', 'o', 't', '/', 'd',
                                  'i', 'r', '\0', 'o', 'c', 't', 'e', 't', '\0'};

  EXPECT_FALSE(tftprx::deserialise_read_request(data).has_value());
}

TEST(tftp_serdes_tests, read_request_with_netascii_mode)
{
  const std::vector<char> data = {0x00, 0x01, '/', 'r', 'o', 'o', 't', '/', 'd', 'i', 'r',
                                  '\0', 'n', 'e', 't', 'a', 's', 'c', 'i', 'i', '\0'};

  EXPECT_FALSE(tftprx::deserialise_read_request(data).has_value());
}

TEST(tftp_serdes_tests, read_request_no_mode)
{
  const std::vector<char> data = {0x00, 0x01, '/', 'r', 'o', 'o', 't', '/', 'd', 'i', 'r', '\0'};

  EXPECT_FALSE(tftprx::deserialise_read_request(data).has_value());
}

TEST(tftp_serdes_tests, data_packet_layout)
{
  const std::vector<char> expected = {0x00, 0x03, 0x01, 0x02, 'a', 'b', 'c'};

  const auto data = tftprx::serialise_data_packet(tftprx::data_packet_t(0x0102, {'a', 'b', 'c'}));

  EXPECT_EQ(data, expected);
}

TEST(tftp_serdes_tests, data_packet_high_block_number)
{
  const std::vector<char> data = {0x00, 0x03, static_cast<char>(0xFF), static_cast<char>(0xFE), 'x'};

  const auto packet = tftprx::deserialise_data_packet(data);

  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ(packet->block_number, 65534);
  EXPECT_EQ(packet->data, std::vector<char>{'x'});
}

TEST(tftp_serdes_tests, data_packet_empty_payload)
{
  const std::vector<char> data = {0x00, 0x03, 0x00, 0x02};

  const auto packet = tftprx::deserialise_data_packet(data);

  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ(packet->block_number, 2);
  EXPECT_TRUE(packet->data.empty());
}

TEST(tftp_serdes_tests, data_packet_too_short)
{
  const std::vector<char> data = {0x00, 0x03, 0x00};

  EXPECT_FALSE(tftprx::deserialise_data_packet(data).has_value());
}

TEST(tftp_serdes_tests, data_packet_wrong_high_opcode_byte)
{
  const std::vector<char> data = {0x01, 0x03, 0x00, 0x01};

  EXPECT_FALSE(tftprx::deserialise_data_packet(data).has_value());
}

TEST(tftp_serdes_tests, ack_packet_layout)
{
  const std::vector<char> expected = {0x00, 0x04, static_cast<char>(0xAB), 0x01};

  EXPECT_EQ(tftprx::serialise_ack_packet(tftprx::ack_packet_t(0xAB01)), expected);
}

TEST(tftp_serdes_tests, ack_packet_parse)
{
  const auto packet = tftprx::deserialise_ack_packet({0x00, 0x04, 0x00, 0x07});

  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ(packet->block_number, 7);
  EXPECT_FALSE(tftprx::deserialise_ack_packet({0x00, 0x03, 0x00, 0x07}).has_value());
}

TEST(tftp_serdes_tests, error_packet)
{
  const tftprx::error_packet_t error(tftprx::error_t::FILE_NOT_FOUND, "no such file");

  const auto packet = tftprx::deserialise_error_packet(tftprx::serialise_error_packet(error));

  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ(packet->error_code, static_cast<uint16_t>(tftprx::error_t::FILE_NOT_FOUND));
  EXPECT_EQ(packet->error_msg, "no such file");
}

TEST(tftp_serdes_tests, error_packet_missing_null)
{
  const std::vector<char> data = {0x00, 0x05, 0x00, 0x01, 'o', 'o', 'p', 's'};

  EXPECT_FALSE(tftprx::deserialise_error_packet(data).has_value());
}

TEST(tftp_serdes_tests, peek_opcode)
{
  EXPECT_EQ(tftprx::peek_opcode({0x00, 0x05, 0x00}), 5);
  EXPECT_EQ(tftprx::peek_opcode({0x01, 0x00}), 256);
  EXPECT_FALSE(tftprx::peek_opcode({0x00}).has_value());
  EXPECT_FALSE(tftprx::peek_opcode({}).has_value());
}
