#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace meetscribe_common
{

/// Lower-cases ASCII letters in place
inline std::string to_lower(std::string value)
{
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Strips leading and trailing whitespace
inline std::string trim(const std::string & value)
{
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(start, end - start);
}

/// Single-quote escaping for /bin/sh (e.g. "it's" -> "'it'\''s'")
inline std::string shell_escape_single_quote(const std::string & value)
{
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out += "'";
  return out;
}

/// Number of UTF-8 code points (continuation bytes are not counted)
inline size_t utf8_length(const std::string & value)
{
  size_t count = 0;
  for (const char c : value) {
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

inline bool ends_with(const std::string & value, const std::string & suffix)
{
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// True when the text (ignoring trailing whitespace) ends with a sentence or
/// clause terminal: 。？！，、；： or their ASCII forms .?!,;:
inline bool ends_with_sentence_terminal(const std::string & text)
{
  const std::string t = trim(text);
  if (t.empty()) {
    return false;
  }
  const char last = t.back();
  if (last == '.' || last == '?' || last == '!' || last == ',' || last == ';' || last == ':') {
    return true;
  }
  static const char * const kWideTerminals[] = {
    "\xE3\x80\x82",  // 。
    "\xEF\xBC\x9F",  // ？
    "\xEF\xBC\x81",  // ！
    "\xEF\xBC\x8C",  // ，
    "\xE3\x80\x81",  // 、
    "\xEF\xBC\x9B",  // ；
    "\xEF\xBC\x9A",  // ：
  };
  for (const char * terminal : kWideTerminals) {
    if (ends_with(t, terminal)) {
      return true;
    }
  }
  return false;
}

/// File extension including the dot, lower-cased; empty when there is none
inline std::string file_extension(const std::string & filename)
{
  const size_t slash = filename.find_last_of('/');
  const size_t dot = filename.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return "";
  }
  return to_lower(filename.substr(dot));
}

}  // namespace meetscribe_common
