/**
 * @file istanbul.hpp
 * @brief Header-only model and JSON writer for Istanbul file coverage
 *
 * A file coverage object is `{path, statementMap, s, fnMap, f, branchMap, b}`; ids are the keys
 * of the maps and are written in insertion order. A coverage map is `{"<path>": file_coverage}`.
 *
 * Example usage:
 * @code
 * istanbul::file_coverage file;
 * file.path = "/src/app.js";
 * file.statements.push_back({"s0", {{1, 0}, {1, 10}}, 3});
 * istanbul::write(std::cout, istanbul::coverage_map{file}, 2);
 * @endcode
 */

#ifndef ISTANBUL_HPP
#define ISTANBUL_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace istanbul {

enum class error_code { success = 0, file_not_found, invalid_json, invalid_format, io_error };

class format_error : public std::runtime_error {
public:
  explicit format_error(error_code code, const std::string& message) : std::runtime_error(message), code_(code) {}

  error_code code() const noexcept { return code_; }

private:
  error_code code_;
};

// 1-based line, 0-based column
struct position {
  uint32_t line = 0;
  uint32_t column = 0;

  bool operator==(const position& other) const { return line == other.line && column == other.column; }
};

struct range {
  position start{};
  position end{};

  bool operator==(const range& other) const { return start == other.start && end == other.end; }
};

struct statement_entry {
  std::string id;
  range loc{};
  uint64_t count = 0;

  bool operator==(const statement_entry& other) const {
    return id == other.id && loc == other.loc && count == other.count;
  }
};

struct function_entry {
  std::string id;
  std::string name;
  range decl{};
  range loc{};
  uint32_t line = 0;
  uint64_t count = 0;

  bool operator==(const function_entry& other) const {
    return id == other.id && name == other.name && decl == other.decl && loc == other.loc && line == other.line &&
           count == other.count;
  }
};

/**
 * @brief Coverage of one file. Branch maps are always written empty.
 */
struct file_coverage {
  std::string path;
  std::vector<statement_entry> statements;
  std::vector<function_entry> functions;

  bool operator==(const file_coverage& other) const {
    return path == other.path && statements == other.statements && functions == other.functions;
  }
};

using coverage_map = std::vector<file_coverage>;

inline void to_json(nlohmann::ordered_json& j, const position& value) {
  j = nlohmann::ordered_json{{"line", value.line}, {"column", value.column}};
}

inline void from_json(const nlohmann::ordered_json& j, position& value) {
  j.at("line").get_to(value.line);
  j.at("column").get_to(value.column);
}

inline void to_json(nlohmann::ordered_json& j, const range& value) {
  j = nlohmann::ordered_json{{"start", value.start}, {"end", value.end}};
}

inline void from_json(const nlohmann::ordered_json& j, range& value) {
  j.at("start").get_to(value.start);
  j.at("end").get_to(value.end);
}

inline void to_json(nlohmann::ordered_json& j, const file_coverage& file) {
  nlohmann::ordered_json statement_map = nlohmann::ordered_json::object();
  nlohmann::ordered_json s = nlohmann::ordered_json::object();
  for (const auto& statement : file.statements) {
    statement_map[statement.id] = statement.loc;
    s[statement.id] = statement.count;
  }

  nlohmann::ordered_json fn_map = nlohmann::ordered_json::object();
  nlohmann::ordered_json f = nlohmann::ordered_json::object();
  for (const auto& function : file.functions) {
    fn_map[function.id] = nlohmann::ordered_json{
        {"name", function.name}, {"decl", function.decl}, {"loc", function.loc}, {"line", function.line}
    };
    f[function.id] = function.count;
  }

  j = nlohmann::ordered_json::object();
  j["path"] = file.path;
  j["statementMap"] = std::move(statement_map);
  j["s"] = std::move(s);
  j["fnMap"] = std::move(fn_map);
  j["f"] = std::move(f);
  j["branchMap"] = nlohmann::ordered_json::object();
  j["b"] = nlohmann::ordered_json::object();
}

inline void from_json(const nlohmann::ordered_json& j, file_coverage& file) {
  file.path = j.at("path").get<std::string>();

  const auto& statement_map = j.at("statementMap");
  const auto& s = j.at("s");
  file.statements.clear();
  for (auto it = statement_map.begin(); it != statement_map.end(); ++it) {
    statement_entry entry;
    entry.id = it.key();
    entry.loc = it.value().get<range>();
    entry.count = s.at(it.key()).get<uint64_t>();
    file.statements.push_back(std::move(entry));
  }

  const auto& fn_map = j.at("fnMap");
  const auto& f = j.at("f");
  file.functions.clear();
  for (auto it = fn_map.begin(); it != fn_map.end(); ++it) {
    const auto& value = it.value();
    function_entry entry;
    entry.id = it.key();
    entry.name = value.value("name", std::string{});
    entry.decl = value.at("decl").get<range>();
    entry.loc = value.at("loc").get<range>();
    entry.line = value.at("line").get<uint32_t>();
    entry.count = f.at(it.key()).get<uint64_t>();
    file.functions.push_back(std::move(entry));
  }
}

inline nlohmann::ordered_json to_document(const coverage_map& map) {
  nlohmann::ordered_json document = nlohmann::ordered_json::object();
  for (const auto& file : map) {
    document[file.path] = file;
  }
  return document;
}

/**
 * @throws format_error with error_code::invalid_format when an entry is malformed
 */
inline coverage_map from_document(const nlohmann::ordered_json& document) {
  if (!document.is_object()) {
    throw format_error(error_code::invalid_format, "coverage map must be an object");
  }

  coverage_map map;
  try {
    for (auto it = document.begin(); it != document.end(); ++it) {
      map.push_back(it.value().get<file_coverage>());
    }
  } catch (const nlohmann::ordered_json::exception& e) {
    throw format_error(error_code::invalid_format, std::string("malformed file coverage: ") + e.what());
  }
  return map;
}

inline coverage_map parse(std::string_view text) {
  nlohmann::ordered_json document;
  try {
    document = nlohmann::ordered_json::parse(text.begin(), text.end());
  } catch (const nlohmann::ordered_json::parse_error& e) {
    throw format_error(error_code::invalid_json, std::string("invalid json: ") + e.what());
  }
  return from_document(document);
}

inline coverage_map read(const std::string& filepath) {
  std::ifstream file(filepath, std::ios::binary);
  if (!file.is_open()) {
    throw format_error(error_code::file_not_found, "cannot open file: " + filepath);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw format_error(error_code::io_error, "error reading file: " + filepath);
  }
  return parse(buffer.str());
}

inline void write(std::ostream& stream, const coverage_map& map, int indent = -1) {
  stream << to_document(map).dump(indent) << "\n";
  if (!stream) {
    throw format_error(error_code::io_error, "error writing coverage map");
  }
}

inline void write(const std::string& filepath, const coverage_map& map, int indent = -1) {
  std::ofstream file(filepath, std::ios::binary);
  if (!file.is_open()) {
    throw format_error(error_code::io_error, "cannot create file: " + filepath);
  }
  write(file, map, indent);
}

} // namespace istanbul

#endif // ISTANBUL_HPP
