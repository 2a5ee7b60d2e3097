#include "infra/task_loader.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace taskrun::infra {

namespace {

using Descriptions = std::vector<core::TaskDescription>;
using LoadResult = core::Result<Descriptions, core::TaskError>;

void append_utf8(std::string &out, unsigned long cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<unsigned long> read_hex4(const std::string &raw, size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  unsigned long value = 0;
  for (size_t i = pos; i < pos + 4; ++i) {
    const char c = raw[i];
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<unsigned long>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<unsigned long>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<unsigned long>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

/// Decode the body of a JSON string literal. nullopt on a malformed escape.
std::optional<std::string> unescape_json(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\') {
      out.push_back(raw[i]);
      continue;
    }
    if (++i >= raw.size()) {
      return std::nullopt;
    }
    switch (raw[i]) {
    case '"':
    case '\\':
    case '/':
      out.push_back(raw[i]);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      auto cp = read_hex4(raw, i + 1);
      if (!cp.has_value()) {
        return std::nullopt;
      }
      i += 4;
      if (*cp >= 0xD800 && *cp <= 0xDBFF) {
        // High surrogate: a low surrogate escape must follow.
        if (i + 2 >= raw.size() || raw[i + 1] != '\\' || raw[i + 2] != 'u') {
          return std::nullopt;
        }
        auto low = read_hex4(raw, i + 3);
        if (!low.has_value() || *low < 0xDC00 || *low > 0xDFFF) {
          return std::nullopt;
        }
        i += 6;
        cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
      } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
        return std::nullopt;
      }
      append_utf8(out, *cp);
      break;
    }
    default:
      return std::nullopt;
    }
  }
  return out;
}

/// Raw (still escaped) body of a string field in a flat object.
std::optional<std::string> extract_json_string(const std::string &json,
                                               const std::string &key) {
  std::regex pattern("\"" + key + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
  std::smatch match;
  if (!std::regex_search(json, match, pattern) || match.size() < 2) {
    return std::nullopt;
  }
  return match[1].str();
}

std::optional<int> extract_json_int(const std::string &json,
                                    const std::string &key) {
  std::regex pattern("\"" + key + "\"\\s*:\\s*(-?\\d+)\\s*[,}]");
  std::smatch match;
  if (!std::regex_search(json, match, pattern) || match.size() < 2) {
    return std::nullopt;
  }
  try {
    return std::stoi(match[1].str());
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

LoadResult invalid(const std::string &msg, size_t index) {
  return LoadResult::Err(core::TaskError::InvalidInput(
      msg, {{"index", std::to_string(index)}}));
}

} // namespace

LoadResult parse_task_descriptions(const std::string &json) {
  const std::string doc = trim(json);
  if (doc.size() < 2 || doc.front() != '[' || doc.back() != ']') {
    return LoadResult::Err(core::TaskError::InvalidInput(
        "Task document must be a JSON array"));
  }

  const std::string body = doc.substr(1, doc.size() - 2);

  Descriptions out;
  size_t pos = 0;
  while (pos < body.size()) {
    const char c = body[pos];
    if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
      ++pos;
      continue;
    }
    const size_t index = out.size();
    if (c != '{') {
      return invalid(std::string("Unexpected content in task array near '") +
                         c + "'",
                     index);
    }

    // Find the closing brace, skipping over string literals.
    size_t close = std::string::npos;
    bool in_string = false;
    for (size_t i = pos + 1; i < body.size(); ++i) {
      const char ch = body[i];
      if (in_string) {
        if (ch == '\\') {
          ++i;
        } else if (ch == '"') {
          in_string = false;
        }
        continue;
      }
      if (ch == '"') {
        in_string = true;
      } else if (ch == '{' || ch == '[') {
        return invalid("Task description must be a flat object", index);
      } else if (ch == '}') {
        close = i;
        break;
      }
    }
    if (close == std::string::npos) {
      return invalid("Unterminated task description object", index);
    }
    const std::string object = body.substr(pos, close - pos + 1);
    pos = close + 1;

    auto id = extract_json_int(object, "task_id");
    if (!id.has_value()) {
      id = extract_json_int(object, "taskId");
    }
    if (!id.has_value()) {
      return invalid("Task description is missing integer \"task_id\"", index);
    }
    auto raw_name = extract_json_string(object, "name");
    if (!raw_name.has_value()) {
      return invalid("Task description is missing string \"name\"", index);
    }
    auto raw_type = extract_json_string(object, "type");
    if (!raw_type.has_value()) {
      return invalid("Task description is missing string \"type\"", index);
    }
    auto name = unescape_json(*raw_name);
    auto type = unescape_json(*raw_type);
    if (!name.has_value() || !type.has_value()) {
      return invalid("Task description has a malformed string escape", index);
    }

    core::TaskDescription desc;
    desc.task_id = *id;
    desc.name = std::move(*name);
    desc.type = std::move(*type);
    out.push_back(std::move(desc));
  }
  return LoadResult::Ok(std::move(out));
}

LoadResult load_task_descriptions(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return LoadResult::Err(core::TaskError::InvalidInput(
        "Task document not found: " + path, {{"path", path}}));
  }

  std::ifstream ifs(path);
  if (!ifs) {
    return LoadResult::Err(core::TaskError::InvalidInput(
        "Cannot open task document: " + path, {{"path", path}}));
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return parse_task_descriptions(oss.str());
}

} // namespace taskrun::infra
