#include "tftprx/common/file_sink.hpp"

#include <cerrno>
#include <stdexcept>

#include "tftprx/common/debug_macros.hpp"
#include "tftprx/common/utils.hpp"

//========================================================
tftprx::file_sink::file_sink(const std::string &filename) : _fd(NULL), _filename(filename)
{
  _fd = fopen(filename.c_str(), "wb");
  if (_fd == NULL)
  {
    throw std::runtime_error(fmt::format("Failed to open '{}' for writing : {}", filename, utils::string_error(errno)));
  }
}

//========================================================
tftprx::file_sink::~file_sink()
{
  if (_fd != NULL)
  {
    if (fclose(_fd) != 0)
    {
      dbg_warn("Failed to close '{}' : {}", _filename, utils::string_error(errno));
    }
  }
}

//========================================================
void tftprx::file_sink::write(const std::vector<char> &data)
{
  size_t bytes_written = 0;
  while (!ferror(_fd) && (bytes_written < data.size()))
  {
    bytes_written += fwrite(data.data() + bytes_written, 1, data.size() - bytes_written, _fd);
  }

  if (ferror(_fd))
  {
    throw std::runtime_error(fmt::format("Failed to write to '{}' : {}", _filename, utils::string_error(errno)));
  }
  dbg_trace("Wrote {} bytes to file", bytes_written);
}
