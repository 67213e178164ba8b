#pragma once

#include <json/json.h>

#include <memory>
#include <string>
#include <vector>

namespace meetscribe_common
{

/// Parses exactly one JSON document; trailing non-whitespace is an error
inline bool parse_json(const std::string & text, Json::Value & out, std::string & error)
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  error.clear();
  return reader->parse(text.data(), text.data() + text.size(), &out, &error);
}

/// Single-line serialization (NDJSON and HTTP bodies)
inline std::string to_compact_json(const Json::Value & value)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

inline std::string string_member(
  const Json::Value & object, const char * key, const std::string & fallback = "")
{
  if (!object.isObject() || !object.isMember(key) || !object[key].isString()) {
    return fallback;
  }
  return object[key].asString();
}

inline bool number_member(const Json::Value & object, const char * key, double & out)
{
  if (!object.isObject() || !object.isMember(key) || !object[key].isNumeric()) {
    return false;
  }
  out = object[key].asDouble();
  return true;
}

/// Reads an array of numbers; false on any non-numeric element
inline bool read_float_array(const Json::Value & value, std::vector<float> & out)
{
  out.clear();
  if (!value.isArray()) {
    return false;
  }
  out.reserve(value.size());
  for (const auto & item : value) {
    if (!item.isNumeric()) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<float>(item.asDouble()));
  }
  return true;
}

}  // namespace meetscribe_common
