#pragma once

#include <json/json.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace shielded::recv::shared::json
{

// -----------------------------------------------------------------------------
// parse_strict(text)
//  - RFC 8259 JSON only: no comments, object/array root, no trailing data.
//  - A repeated key is accepted and its last value wins.
//  - Returns nullopt instead of throwing; callers decide what a bad document
//    means for them.
// -----------------------------------------------------------------------------
inline std::optional<Json::Value> parse_strict(std::string_view text)
{
  if (text.empty()) return std::nullopt;

  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  builder.settings_["rejectDupKeys"] = false;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  Json::String errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) return std::nullopt;
  return root;
}

// Same as parse_strict, but only an object root is accepted.
inline std::optional<Json::Value> parse_object(std::string_view text)
{
  auto root = parse_strict(text);
  if (!root || !root->isObject()) return std::nullopt;
  return root;
}

// -----------------------------------------------------------------------------
// write_compact(value)
//  - Single line, no indentation, UTF-8 emitted as-is.
// -----------------------------------------------------------------------------
inline std::string write_compact(const Json::Value& v)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, v);
}

}  // namespace shielded::recv::shared::json
