/**
 * @file v8cov.hpp
 * @brief Header-only reader and writer for V8 precise coverage JSON
 *
 * Covers the documents produced by `NODE_V8_COVERAGE` and by the inspector's
 * `Profiler.takePreciseCoverage`: a process object `{"result": [script, ...]}`, a bare array of
 * scripts, or a single script object.
 *
 * Example usage:
 * @code
 * auto process = v8cov::read("coverage-1234.json");
 * for (const auto& script : process.result) {
 *   std::cout << script.url << " " << script.functions.size() << "\n";
 * }
 * @endcode
 */

#ifndef V8COV_HPP
#define V8COV_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace v8cov {

/**
 * @brief Error codes for read/write operations
 */
enum class error_code { success = 0, file_not_found, invalid_json, invalid_format, io_error };

/**
 * @brief Exception thrown by read/write operations
 */
class format_error : public std::runtime_error {
public:
  explicit format_error(error_code code, const std::string& message) : std::runtime_error(message), code_(code) {}

  error_code code() const noexcept { return code_; }

private:
  error_code code_;
};

/**
 * @brief One counted range `[start_offset, end_offset)` in utf-16 code units
 */
struct range_coverage {
  uint32_t start_offset = 0;
  uint32_t end_offset = 0;
  uint64_t count = 0;

  bool operator==(const range_coverage& other) const {
    return start_offset == other.start_offset && end_offset == other.end_offset && count == other.count;
  }
};

/**
 * @brief Coverage of one function; `ranges[0]` is the function's own span and call count
 */
struct function_coverage {
  std::string function_name;
  std::vector<range_coverage> ranges;
  bool is_block_coverage = false;

  bool operator==(const function_coverage& other) const {
    return function_name == other.function_name && ranges == other.ranges &&
           is_block_coverage == other.is_block_coverage;
  }
};

struct script_coverage {
  std::string script_id;
  std::string url;
  std::vector<function_coverage> functions;

  bool operator==(const script_coverage& other) const {
    return script_id == other.script_id && url == other.url && functions == other.functions;
  }
};

struct process_coverage {
  std::vector<script_coverage> result;

  // scripts whose url equals `url`, in document order
  std::vector<const script_coverage*> find(const std::string& url) const {
    std::vector<const script_coverage*> matches;
    for (const auto& script : result) {
      if (script.url == url) {
        matches.push_back(&script);
      }
    }
    return matches;
  }
};

namespace detail {

inline const nlohmann::json& require(const nlohmann::json& object, const char* key, const char* owner) {
  auto it = object.find(key);
  if (it == object.end()) {
    throw format_error(error_code::invalid_format, std::string(owner) + " is missing '" + key + "'");
  }
  return *it;
}

inline uint32_t to_offset(const nlohmann::json& value, const char* key) {
  if (!value.is_number_integer() || value.get<int64_t>() < 0 || value.get<int64_t>() > UINT32_MAX) {
    throw format_error(error_code::invalid_format, std::string("'") + key + "' must be a non-negative offset");
  }
  return static_cast<uint32_t>(value.get<int64_t>());
}

} // namespace detail

inline void from_json(const nlohmann::json& j, range_coverage& range) {
  if (!j.is_object()) {
    throw format_error(error_code::invalid_format, "range entry must be an object");
  }
  range.start_offset = detail::to_offset(detail::require(j, "startOffset", "range"), "startOffset");
  range.end_offset = detail::to_offset(detail::require(j, "endOffset", "range"), "endOffset");

  const auto& count = detail::require(j, "count", "range");
  if (!count.is_number_integer() || count.get<int64_t>() < 0) {
    throw format_error(error_code::invalid_format, "'count' must be a non-negative integer");
  }
  range.count = count.get<uint64_t>();
}

inline void to_json(nlohmann::json& j, const range_coverage& range) {
  j = nlohmann::json{{"startOffset", range.start_offset}, {"endOffset", range.end_offset}, {"count", range.count}};
}

inline void from_json(const nlohmann::json& j, function_coverage& function) {
  if (!j.is_object()) {
    throw format_error(error_code::invalid_format, "function entry must be an object");
  }
  function.function_name = j.value("functionName", std::string{});
  const auto& ranges = detail::require(j, "ranges", "function");
  if (!ranges.is_array()) {
    throw format_error(error_code::invalid_format, "'ranges' must be an array");
  }
  function.ranges = ranges.get<std::vector<range_coverage>>();
  function.is_block_coverage = j.value("isBlockCoverage", false);
}

inline void to_json(nlohmann::json& j, const function_coverage& function) {
  nlohmann::json ranges = nlohmann::json::array();
  for (const auto& range : function.ranges) {
    ranges.push_back(range);
  }
  j = nlohmann::json{
      {"functionName", function.function_name},
      {"ranges", std::move(ranges)},
      {"isBlockCoverage", function.is_block_coverage}
  };
}

inline void from_json(const nlohmann::json& j, script_coverage& script) {
  if (!j.is_object()) {
    throw format_error(error_code::invalid_format, "script entry must be an object");
  }
  const auto& script_id = j.find("scriptId");
  if (script_id != j.end() && script_id->is_number_integer()) {
    script.script_id = std::to_string(script_id->get<int64_t>());
  } else {
    script.script_id = j.value("scriptId", std::string{});
  }
  script.url = j.value("url", std::string{});
  const auto& functions = detail::require(j, "functions", "script");
  if (!functions.is_array()) {
    throw format_error(error_code::invalid_format, "'functions' must be an array");
  }
  script.functions = functions.get<std::vector<function_coverage>>();
}

inline void to_json(nlohmann::json& j, const script_coverage& script) {
  nlohmann::json functions = nlohmann::json::array();
  for (const auto& function : script.functions) {
    functions.push_back(function);
  }
  j = nlohmann::json{{"scriptId", script.script_id}, {"url", script.url}, {"functions", std::move(functions)}};
}

/**
 * @brief Interprets a parsed document as process coverage
 *
 * Accepts `{"result": [...]}`, an array of scripts or a single script object.
 *
 * @throws format_error with error_code::invalid_format when the shape is not recognized
 */
inline process_coverage from_document(const nlohmann::json& document) {
  process_coverage process;
  try {
    if (document.is_array()) {
      process.result = document.get<std::vector<script_coverage>>();
    } else if (document.is_object() && document.contains("result")) {
      const auto& result = document.at("result");
      if (!result.is_array()) {
        throw format_error(error_code::invalid_format, "'result' must be an array");
      }
      process.result = result.get<std::vector<script_coverage>>();
    } else if (document.is_object() && document.contains("functions")) {
      process.result.push_back(document.get<script_coverage>());
    } else {
      throw format_error(error_code::invalid_format, "document is not V8 coverage");
    }
  } catch (const nlohmann::json::exception& e) {
    throw format_error(error_code::invalid_format, std::string("malformed coverage: ") + e.what());
  }
  return process;
}

inline process_coverage parse(std::string_view text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    throw format_error(error_code::invalid_json, std::string("invalid json: ") + e.what());
  }
  return from_document(document);
}

inline process_coverage read(std::istream& stream) {
  std::stringstream buffer;
  buffer << stream.rdbuf();
  if (stream.bad()) {
    throw format_error(error_code::io_error, "error reading coverage stream");
  }
  return parse(buffer.str());
}

inline process_coverage read(const std::string& filepath) {
  std::ifstream file(filepath, std::ios::binary);
  if (!file.is_open()) {
    throw format_error(error_code::file_not_found, "cannot open file: " + filepath);
  }
  return read(file);
}

inline nlohmann::json to_document(const process_coverage& process) {
  nlohmann::json result = nlohmann::json::array();
  for (const auto& script : process.result) {
    result.push_back(script);
  }
  return nlohmann::json{{"result", std::move(result)}};
}

inline void write(std::ostream& stream, const process_coverage& process, int indent = -1) {
  stream << to_document(process).dump(indent) << "\n";
  if (!stream) {
    throw format_error(error_code::io_error, "error writing coverage stream");
  }
}

inline void write(const std::string& filepath, const process_coverage& process, int indent = -1) {
  std::ofstream file(filepath, std::ios::binary);
  if (!file.is_open()) {
    throw format_error(error_code::io_error, "cannot create file: " + filepath);
  }
  write(file, process, indent);
}

} // namespace v8cov

#endif // V8COV_HPP
