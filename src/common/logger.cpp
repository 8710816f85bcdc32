#include <fmt/core.h>

#include "tftprx/common/debug_macros.hpp"

//==========================================================
int tftprx::initialise_logger(const bool trace)
{
  try
  {
    spdlog::set_pattern(TFTPRX_LOGGER_PATTERN);
    auto err_logger = spdlog::stderr_color_st("console");
    err_logger->set_pattern(TFTPRX_LOGGER_PATTERN);
    if (trace)
    {
      spdlog::set_level(spdlog::level::trace);
      dbg_dbg("Debug prints on");
    }
    else
    {
      spdlog::set_level(spdlog::level::info);
    }
    dbg_dbg("Initialised log");
  }
  catch (const std::exception &e)
  {
    fmt::print(stderr, "Failed to setup logger : {}\n", e.what());
    return 1;
  }
  return 0;
}
