#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tftprx
{

  static const size_t   DATA_PKT_MAX_SIZE      = 516;
  static const size_t   DATA_PKT_DATA_MAX_SIZE = 512;
  static const size_t   ACK_PKT_MAX_SIZE       = 4;
  static const size_t   PKT_HEADER_SIZE        = 4;
  static const uint16_t DEFAULT_PORT           = 6969;

  enum class packet_t : uint16_t
  {
    READ = 1,
    WRITE,
    DATA,
    ACK,
    ERROR
  };

  enum class error_t : uint16_t
  {
    NOT_DEFINED,
    FILE_NOT_FOUND,
    ACCESS_ERROR,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_EXISTS,
    NO_USER
  };

  std::string error_code_to_string(const error_t err);
  std::string packet_type_to_string(const packet_t type);

  /* Only octet mode is ever requested */
  struct read_request_t
  {
    read_request_t() : filename(""){};
    explicit read_request_t(const std::string &f) : filename(f){};
    std::string filename;
  };

  struct data_packet_t
  {
    data_packet_t() : data{}, block_number(0){};
    data_packet_t(const uint16_t bn, const std::vector<char> &d) : data(d), block_number(bn){};
    std::vector<char> data;
    uint16_t          block_number;
  };

  struct ack_packet_t
  {
    explicit ack_packet_t(const uint16_t bn) : block_number(bn){};
    uint16_t block_number;
  };

  struct error_packet_t
  {
    error_packet_t() : error_msg(""), error_code(0){};
    error_packet_t(const error_t code, const std::string &msg) :
        error_msg(msg), error_code(static_cast<uint16_t>(code)){};
    std::string error_msg;
    uint16_t    error_code;
  };

  std::vector<char> serialise_read_request(const read_request_t &packet);
  std::vector<char> serialise_data_packet(const data_packet_t &packet);
  std::vector<char> serialise_ack_packet(const ack_packet_t &packet);
  std::vector<char> serialise_error_packet(const error_packet_t &packet);

  std::optional<read_request_t> deserialise_read_request(const std::vector<char> &data);
  std::optional<data_packet_t>  deserialise_data_packet(const std::vector<char> &data);
  std::optional<ack_packet_t>   deserialise_ack_packet(const std::vector<char> &data);
  std::optional<error_packet_t> deserialise_error_packet(const std::vector<char> &data);

  /* Big endian opcode from the first two bytes, empty if the buffer is too short */
  std::optional<uint16_t> peek_opcode(const std::vector<char> &data);

} // namespace tftprx
