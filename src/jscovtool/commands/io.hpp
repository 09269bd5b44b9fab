#pragma once

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace jscovtool::commands {

inline std::string read_text_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("error reading file: " + path);
  }
  return buffer.str();
}

} // namespace jscovtool::commands
