#include <fmt/core.h>
#include <string>

#include "tftprx/common/debug_macros.hpp"
#include "tftprx/common/sample_data.hpp"

//==========================================================
void print_usage(char *argv0)
{
  fmt::print(stderr, "Usage: {} [OUTPUT] [NUM_BLOCKS] [BLOCK_SIZE]\n", argv0);
  fmt::print(stderr, "\tOUTPUT:     (Optional) File to create (default: data.txt)\n");
  fmt::print(stderr, "\tNUM_BLOCKS: (Optional) Number of blocks to write (default: 5)\n");
  fmt::print(stderr, "\tBLOCK_SIZE: (Optional) Size of each block in bytes (default: 512)\n");
}

//==========================================================
int main(int argc, char **argv)
{
  std::string output     = "data.txt";
  size_t      num_blocks = 5;
  size_t      block_size = 512;

  try
  {
    if (argc > 1)
    {
      output = argv[1];
    }
    if (argc > 2)
    {
      num_blocks = std::stoul(argv[2]);
    }
    if (argc > 3)
    {
      block_size = std::stoul(argv[3]);
    }
  }
  catch (const std::exception &err)
  {
    fmt::print(stderr, "Failed to parse arguments : {}\n", err.what());
    print_usage(argv[0]);
    return 1;
  }

  if (tftprx::initialise_logger(false))
  {
    return 1;
  }

  try
  {
    tftprx::sample_data::write_file(output, num_blocks, block_size);
  }
  catch (const std::exception &e)
  {
    dbg_err("Failed to write '{}' : {}", output, e.what());
    return 1;
  }

  dbg_info("Wrote {} blocks of {} bytes to '{}'", num_blocks, block_size, output);
  return 0;
}
