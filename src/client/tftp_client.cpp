#include "tftprx/client/tftp_client.hpp"

#include <cerrno>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include "tftprx/common/debug_macros.hpp"
#include "tftprx/common/file_sink.hpp"
#include "tftprx/common/udp_connection.hpp"
#include "tftprx/common/utils.hpp"

//========================================================
bool tftprx::client::is_readable(const std::string &filename)
{
  if (access(filename.c_str(), R_OK) != 0)
  {
    dbg_dbg("access({}) : {}", filename, utils::string_error(errno));
    return false;
  }
  return true;
}

//========================================================
std::optional<tftprx::client::request_error_t> tftprx::client::issue_request(transport &udp,
                                                                             const struct sockaddr_in &server,
                                                                             const std::string &filename,
                                                                             const readable_check_t &readable)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(filename, ec))
  {
    dbg_err("The file '{}' does not exist", filename);
    return request_error_t::FILE_NOT_FOUND;
  }

  if (!readable(filename))
  {
    dbg_err("The file '{}' cannot be read", filename);
    return request_error_t::PERMISSION_DENIED;
  }

  const read_request_t request(filename);
  udp.send_to(server, serialise_read_request(request));
  dbg_info("Starting TFTP transfer from {} to get file '{}'", server, filename);
  return {};
}

//========================================================
bool tftprx::client::get_file(const client_config_t &config)
{
  const auto server = utils::to_sockaddr_in(config.host, config.port);
  if (!server)
  {
    throw std::runtime_error(fmt::format("Invalid server address '{}'", config.host));
  }

  udp_connection udp;
  udp.bind(config.local_interface, 0);

  const auto request_error = issue_request(udp, server.value(), config.filename);
  if (request_error)
  {
    dbg_err("Request for '{}' failed : {}", config.filename, request_error_to_string(request_error.value()));
    return false;
  }

  const std::string output = config.output.empty() ? config.filename : config.output;
  file_sink         out_file(output);

  const auto result = run_transfer(udp, server.value(), out_file, config.transfer);
  if (!result.ok())
  {
    dbg_err("Transfer of '{}' failed after {} bytes : {}", config.filename, result.bytes_written,
            transfer_error_to_string(result.error.value()));
    return false;
  }

  dbg_info("Finished receiving '{}' ({} bytes written to '{}')", config.filename, result.bytes_written, output);
  return true;
}

//========================================================
std::string tftprx::client::request_error_to_string(const request_error_t err)
{
  switch (err)
  {
  case request_error_t::FILE_NOT_FOUND: {
    return std::string("File not found");
  }
  case request_error_t::PERMISSION_DENIED: {
    return std::string("Permission denied");
  }
  }
  return std::string("Unknown");
}
