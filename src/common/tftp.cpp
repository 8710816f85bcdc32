#include "tftprx/common/tftp.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "tftprx/common/utils.hpp"

namespace
{
  const char OCTET_MODE_STR[] = "octet";

  uint16_t read_u16(const std::vector<char> &data, const size_t offset)
  {
    return (static_cast<uint16_t>(static_cast<unsigned char>(data.at(offset))) << 8) |
           static_cast<uint16_t>(static_cast<unsigned char>(data.at(offset + 1)));
  }

  void append_u16(std::vector<char> &data, const uint16_t value)
  {
    data.push_back(static_cast<char>(value >> 8));
    data.push_back(static_cast<char>(value & 0xFF));
  }
}; // namespace

//========================================================
std::optional<uint16_t> tftprx::peek_opcode(const std::vector<char> &data)
{
  if (data.size() < 2)
  {
    return {};
  }
  return read_u16(data, 0);
}

//========================================================
std::vector<char> tftprx::serialise_read_request(const read_request_t &packet)
{
  const size_t packet_size =
      2 + packet.filename.size() + 1 + sizeof(OCTET_MODE_STR); // opcode + filename + null byte + mode + null_byte
  std::vector<char> ret;
  ret.reserve(packet_size);
  append_u16(ret, static_cast<uint16_t>(packet_t::READ));
  ret.insert(ret.end(), packet.filename.begin(), packet.filename.end());
  ret.push_back(0);
  ret.insert(ret.end(), OCTET_MODE_STR, OCTET_MODE_STR + std::strlen(OCTET_MODE_STR));
  ret.push_back(0);
  return ret;
}

//========================================================
std::optional<tftprx::read_request_t> tftprx::deserialise_read_request(const std::vector<char> &data)
{
  if ((data.size() < 4) || (read_u16(data, 0) != static_cast<uint16_t>(packet_t::READ)))
  {
    return {};
  }

  std::vector<std::string> params = utils::extract_c_strings_from_buffer(data, 2);
  if (params.size() < 2)
  {
    return {};
  }

  std::string mode = params[1];
  std::transform(mode.begin(), mode.end(), mode.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (mode != OCTET_MODE_STR)
  {
    return {};
  }
  return read_request_t(params[0]);
}

//========================================================
std::vector<char> tftprx::serialise_data_packet(const data_packet_t &packet)
{
  const size_t      packet_size = 2 + 2 + packet.data.size(); // opcode + block_number + data
  std::vector<char> ret;
  ret.reserve(packet_size);
  append_u16(ret, static_cast<uint16_t>(packet_t::DATA));
  append_u16(ret, packet.block_number);
  ret.insert(ret.end(), packet.data.begin(), packet.data.end());
  return ret;
}

//========================================================
std::optional<tftprx::data_packet_t> tftprx::deserialise_data_packet(const std::vector<char> &data)
{
  data_packet_t packet;
  if ((data.size() < PKT_HEADER_SIZE) || (read_u16(data, 0) != static_cast<uint16_t>(packet_t::DATA)))
  {
    return {};
  }

  packet.block_number = read_u16(data, 2);
  packet.data.assign(data.begin() + PKT_HEADER_SIZE, data.end());
  return packet;
}

//========================================================
std::vector<char> tftprx::serialise_ack_packet(const ack_packet_t &packet)
{
  const size_t      packet_size = 2 + 2; // opcode + block_number
  std::vector<char> ret;
  ret.reserve(packet_size);
  append_u16(ret, static_cast<uint16_t>(packet_t::ACK));
  append_u16(ret, packet.block_number);
  return ret;
}

//========================================================
std::optional<tftprx::ack_packet_t> tftprx::deserialise_ack_packet(const std::vector<char> &data)
{
  if ((data.size() < ACK_PKT_MAX_SIZE) || (read_u16(data, 0) != static_cast<uint16_t>(packet_t::ACK)))
  {
    return {};
  }
  return ack_packet_t(read_u16(data, 2));
}

//========================================================
std::vector<char> tftprx::serialise_error_packet(const error_packet_t &packet)
{
  const size_t      packet_size = 2 + 2 + packet.error_msg.size() + 1; // opcode + erron_num + error_msg + null byte
  std::vector<char> ret;
  ret.reserve(packet_size);
  append_u16(ret, static_cast<uint16_t>(packet_t::ERROR));
  append_u16(ret, packet.error_code);
  ret.insert(ret.end(), packet.error_msg.begin(), packet.error_msg.end());
  ret.push_back(0);
  return ret;
}

//========================================================
std::optional<tftprx::error_packet_t> tftprx::deserialise_error_packet(const std::vector<char> &data)
{
  error_packet_t packet;
  if ((data.size() < 5) || (read_u16(data, 0) != static_cast<uint16_t>(packet_t::ERROR)))
  {
    return {};
  }

  packet.error_code = read_u16(data, 2);

  const auto null = std::find(data.begin() + 4, data.end(), 0);
  if (null == data.end())
  {
    return {};
  }
  packet.error_msg = std::string(data.begin() + 4, null);
  return packet;
}

//========================================================
std::string tftprx::packet_type_to_string(const tftprx::packet_t type)
{
  switch (type)
  {
  case packet_t::READ: {
    return std::string("RRQ");
  }
  case packet_t::WRITE: {
    return std::string("WRQ");
  }
  case packet_t::DATA: {
    return std::string("DATA");
  }
  case packet_t::ACK: {
    return std::string("ACK");
  }
  case packet_t::ERROR: {
    return std::string("ERROR");
  }
  default: {
    return std::string("UNKNOWN");
  }
  }
}

//========================================================
std::string tftprx::error_code_to_string(const tftprx::error_t err)
{
  switch (err)
  {
  default:
  case error_t::NOT_DEFINED: {
    return std::string("Not defined");
  }
  case error_t::FILE_NOT_FOUND: {
    return std::string("File not found");
  }
  case error_t::ACCESS_ERROR: {
    return std::string("Access violation");
  }
  case error_t::DISK_FULL: {
    return std::string("Disk full or allocation exceeded");
  }
  case error_t::ILLEGAL_OPERATION: {
    return std::string("Illegal TFTP operation");
  }
  case error_t::UNKNOWN_TID: {
    return std::string("Unknown transfer ID");
  }
  case error_t::FILE_EXISTS: {
    return std::string("File already exists");
  }
  case error_t::NO_USER: {
    return std::string("No such user");
  }
  }
  return std::string("");
}
