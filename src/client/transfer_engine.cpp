#include "tftprx/client/transfer_engine.hpp"

#include "tftprx/common/debug_macros.hpp"
#include "tftprx/common/utils.hpp"

namespace
{
  std::shared_ptr<spdlog::logger> console_logger()
  {
    auto logger = spdlog::get("console");
    return logger ? logger : spdlog::default_logger();
  }
}; // namespace

//========================================================
tftprx::client::transfer_engine::transfer_engine(transport &udp, const struct sockaddr_in &server, output_sink &sink,
                                                 const transfer_config_t &config) :
    _logger(console_logger()),
    _udp(udp),
    _server(server),
    _sink(sink),
    _config(config),
    _state()
{
}

//========================================================
tftprx::client::transfer_result_t tftprx::client::transfer_engine::run()
{
  log_debug(_logger, "Waiting for data from {}", _server);

  while (_state.state == transfer_state_t::state_t::AWAITING_SEGMENT)
  {
    _state = transition(_state, _udp.receive(DATA_PKT_MAX_SIZE, _config.timeout));
  }

  transfer_result_t result;
  result.bytes_written = _state.bytes_written;
  result.error         = _state.error;
  return result;
}

//========================================================
/**
 * @brief Advances the state machine by one event
 *
 * An empty optional is a receive timeout. Terminal states are returned unchanged.
 */
tftprx::client::transfer_state_t
tftprx::client::transfer_engine::transition(const transfer_state_t &current, const std::optional<datagram_t> &received)
{
  transfer_state_t next = current;
  if (current.state != transfer_state_t::state_t::AWAITING_SEGMENT)
  {
    return next;
  }

  if (received)
  {
    on_datagram(next, received.value());
  }
  else
  {
    on_timeout(next);
  }
  return next;
}

//========================================================
void tftprx::client::transfer_engine::on_datagram(transfer_state_t &next, const datagram_t &received)
{
  const auto opcode = peek_opcode(received.data);
  if (!opcode || (received.data.size() < PKT_HEADER_SIZE))
  {
    log_error(_logger, "Received {} byte datagram from {}, too short for a header", received.data.size(),
              received.from);
    terminate(next, transfer_error_t::MALFORMED_PACKET);
    return;
  }

  if (opcode.value() != static_cast<uint16_t>(packet_t::DATA))
  {
    const auto error_packet = deserialise_error_packet(received.data);
    if (error_packet)
    {
      log_error(_logger, "Server replied with error {} ({}) : {}", error_packet->error_code,
                error_code_to_string(static_cast<error_t>(error_packet->error_code)), error_packet->error_msg);
    }
    else
    {
      log_error(_logger, "Received packet with unexpected opcode {} ({})", opcode.value(),
                packet_type_to_string(static_cast<packet_t>(opcode.value())));
    }
    terminate(next, transfer_error_t::UNEXPECTED_OPCODE);
    return;
  }

  const auto data_packet = deserialise_data_packet(received.data);
  if (data_packet->block_number != next.expected_block)
  {
    log_error(_logger, "Received out of order block {}, expected block {}", data_packet->block_number,
              next.expected_block);
    terminate(next, transfer_error_t::OUT_OF_ORDER_BLOCK);
    return;
  }

  if (next.peer && !utils::same_endpoint(next.peer.value(), received.from))
  {
    log_warn(_logger, "Block {} arrived from {}, previous blocks came from {}", data_packet->block_number,
             received.from, next.peer.value());
  }
  log_trace(_logger, "Received block {} of {} bytes", data_packet->block_number, data_packet->data.size());

  _sink.write(data_packet->data);
  next.bytes_written += data_packet->data.size();

  const ack_packet_t ack(data_packet->block_number);
  log_trace(_logger, "Sending ack to block {}", ack.block_number);
  _udp.send_to(received.from, serialise_ack_packet(ack));

  next.last_ack = ack;
  next.peer     = received.from;
  next.retries  = 0;
  ++next.expected_block;

  if (data_packet->data.size() < DATA_PKT_DATA_MAX_SIZE)
  {
    log_debug(_logger, "Final block is {} ({} bytes)", data_packet->block_number, data_packet->data.size());
    next.state = transfer_state_t::state_t::TERMINATED_OK;
  }
}

//========================================================
void tftprx::client::transfer_engine::on_timeout(transfer_state_t &next)
{
  next.retries += 1;
  if (next.retries > _config.max_retries)
  {
    log_error(_logger, "Timed out waiting for block {}, maximum retries reached", next.expected_block);
    terminate(next, transfer_error_t::MAX_RETRIES_EXCEEDED);
    return;
  }

  log_warn(_logger, "Timed out waiting for block {}, retrying ({}/{})", next.expected_block, next.retries,
           _config.max_retries);

  if (next.last_ack && next.peer)
  {
    log_trace(_logger, "Resending ack to block {} to {}", next.last_ack->block_number, next.peer.value());
    _udp.send_to(next.peer.value(), serialise_ack_packet(next.last_ack.value()));
  }
}

//========================================================
void tftprx::client::transfer_engine::terminate(transfer_state_t &next, const transfer_error_t err) const
{
  next.state = transfer_state_t::state_t::TERMINATED_ERROR;
  next.error = err;
}

//========================================================
tftprx::client::transfer_result_t tftprx::client::run_transfer(transport &udp, const struct sockaddr_in &server,
                                                               output_sink &sink, const transfer_config_t &config)
{
  transfer_engine engine(udp, server, sink, config);
  return engine.run();
}

//========================================================
std::string tftprx::client::transfer_error_to_string(const transfer_error_t err)
{
  switch (err)
  {
  case transfer_error_t::UNEXPECTED_OPCODE: {
    return std::string("Unexpected opcode");
  }
  case transfer_error_t::OUT_OF_ORDER_BLOCK: {
    return std::string("Out of order block");
  }
  case transfer_error_t::MALFORMED_PACKET: {
    return std::string("Malformed packet");
  }
  case transfer_error_t::MAX_RETRIES_EXCEEDED: {
    return std::string("Maximum retries exceeded");
  }
  }
  return std::string("Unknown");
}

//========================================================
std::string tftprx::client::state_to_string(const transfer_state_t::state_t state)
{
  switch (state)
  {
  case transfer_state_t::state_t::AWAITING_SEGMENT: {
    return std::string("AWAITING_SEGMENT");
  }
  case transfer_state_t::state_t::TERMINATED_OK: {
    return std::string("TERMINATED_OK");
  }
  case transfer_state_t::state_t::TERMINATED_ERROR: {
    return std::string("TERMINATED_ERROR");
  }
  }
  return std::string("UNKNOWN");
}
