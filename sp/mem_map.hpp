#pragma once

#include <sp/error.hpp>
#include <string>

namespace sp
{

  // read-only memory-mapped file (used for key files)
  class mem_map : public error
  {
  public:
    mem_map();
    ~mem_map();

    // file to map
    void set_file( const std::string& );

    // map file into memory
    bool init();

    // access to file data
    const char *data() const;
    size_t size() const;

  private:
    void close();
    int         fd_;
    size_t      len_;
    const char *buf_;
    std::string file_;
  };

  inline const char *mem_map::data() const
  {
    return buf_;
  }

  inline size_t mem_map::size() const
  {
    return len_;
  }

}
