#include "tftprx/common/sample_data.hpp"

#include <fmt/core.h>
#include <vector>

#include "tftprx/common/file_sink.hpp"

//========================================================
std::string tftprx::sample_data::generate(const size_t num_blocks, const size_t block_size)
{
  std::string ret;
  ret.reserve(num_blocks * block_size);

  for (size_t i = 0; i < num_blocks; ++i)
  {
    std::string block = fmt::format("Block {}\n", i + 1);
    if (block.size() > block_size)
    {
      block.resize(block_size);
    }
    block.append(block_size - block.size(), 'A');
    ret += block;
  }
  return ret;
}

//========================================================
void tftprx::sample_data::write_file(const std::string &filename, const size_t num_blocks, const size_t block_size)
{
  const std::string content = generate(num_blocks, block_size);
  file_sink         out(filename);
  out.write(std::vector<char>(content.begin(), content.end()));
}
