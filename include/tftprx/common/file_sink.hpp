#pragma once

#include <stdio.h>
#include <string>
#include <vector>

namespace tftprx
{

  /* Destination for received payload bytes, written strictly in block order */
  class output_sink
  {
  public:
    virtual ~output_sink() = default;

    virtual void write(const std::vector<char> &data) = 0;
  };

  /**
   * @brief Binary file output, truncated on open
   *
   * Data is flushed and the file closed when the object goes out of scope.
   */
  class file_sink : public output_sink
  {
  public:
    explicit file_sink(const std::string &filename);
    file_sink(const file_sink &t)            = delete;
    file_sink(file_sink &&t)                 = delete;
    file_sink &operator=(const file_sink &) = delete;
    file_sink &operator=(file_sink &&)      = delete;
    ~file_sink() override;

    void write(const std::vector<char> &data) override;

  private:
    FILE       *_fd;
    std::string _filename;
  };

} // namespace tftprx
