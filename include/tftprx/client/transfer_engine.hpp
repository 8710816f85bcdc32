#pragma once

#include <arpa/inet.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include "tftprx/common/file_sink.hpp"
#include "tftprx/common/tftp.hpp"
#include "tftprx/common/transport.hpp"

namespace tftprx::client
{

  enum class transfer_error_t
  {
    UNEXPECTED_OPCODE,
    OUT_OF_ORDER_BLOCK,
    MALFORMED_PACKET,
    MAX_RETRIES_EXCEEDED
  };

  std::string transfer_error_to_string(const transfer_error_t err);

  struct transfer_config_t
  {
    transfer_config_t() : timeout(std::chrono::seconds(2)), max_retries(3){};
    std::chrono::milliseconds timeout;
    unsigned int              max_retries;
  };

  struct transfer_state_t
  {
    enum class state_t
    {
      AWAITING_SEGMENT,
      TERMINATED_OK,
      TERMINATED_ERROR
    };

    transfer_state_t() :
        state(state_t::AWAITING_SEGMENT), expected_block(1), retries(0), last_ack{}, peer{}, bytes_written(0),
        error{} {};

    state_t                           state;
    uint16_t                          expected_block;
    unsigned int                      retries;
    std::optional<ack_packet_t>       last_ack;
    std::optional<struct sockaddr_in> peer;
    size_t                            bytes_written;
    std::optional<transfer_error_t>   error;
  };

  std::string state_to_string(const transfer_state_t::state_t state);

  struct transfer_result_t
  {
    transfer_result_t() : bytes_written(0), error{} {};
    size_t                          bytes_written;
    std::optional<transfer_error_t> error;

    bool ok() const
    {
      return !error.has_value();
    }
  };

  /**
   * @brief Receive/acknowledge loop of a read transfer
   *
   * Each received datagram or receive timeout is fed through transition(), which returns the
   * next transfer_state_t. The loop in run() ends once the state leaves AWAITING_SEGMENT.
   * Acknowledgments go to wherever the accepted segment came from, which need not be the
   * endpoint the request was sent to.
   */
  class transfer_engine
  {
  public:
    transfer_engine(transport &udp, const struct sockaddr_in &server, output_sink &sink,
                    const transfer_config_t &config = transfer_config_t());
    transfer_engine()                                   = delete;
    transfer_engine(const transfer_engine &)            = delete;
    transfer_engine(transfer_engine &&)                 = delete;
    transfer_engine &operator=(const transfer_engine &) = delete;
    transfer_engine &operator=(transfer_engine &&)      = delete;

    transfer_result_t run();

    transfer_state_t transition(const transfer_state_t &current, const std::optional<datagram_t> &received);

  private:
    std::shared_ptr<spdlog::logger> _logger;
    transport                      &_udp;
    struct sockaddr_in              _server;
    output_sink                    &_sink;
    transfer_config_t               _config;
    transfer_state_t                _state;

    void on_datagram(transfer_state_t &next, const datagram_t &received);
    void on_timeout(transfer_state_t &next);
    void terminate(transfer_state_t &next, const transfer_error_t err) const;
  };

  transfer_result_t run_transfer(transport &udp, const struct sockaddr_in &server, output_sink &sink,
                                 const transfer_config_t &config = transfer_config_t());

} // namespace tftprx::client
