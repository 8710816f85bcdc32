#pragma once

#include <cstddef>
#include <string>

namespace tftprx::sample_data
{

  /**
   * @brief Builds a test file of num_blocks blocks of block_size bytes
   *
   * Every block starts with "Block <n>\n" (n counting from 1) and is padded with 'A'.
   * A header longer than block_size is truncated to block_size.
   */
  std::string generate(const size_t num_blocks, const size_t block_size = 512);

  void write_file(const std::string &filename, const size_t num_blocks, const size_t block_size = 512);

} // namespace tftprx::sample_data
