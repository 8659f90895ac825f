#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace luasync {

// Truncating writer for a regular file.
class FileWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in);
    Result FsyncNow();
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace luasync
