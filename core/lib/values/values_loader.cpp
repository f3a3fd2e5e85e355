// chartscan/values/values_loader.cpp - Values file loading implementation
//
#include "chartscan/values/values_loader.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace chartscan
{

namespace
{

/// Structural problem found while converting an already parsed document.
class ValuesConversionError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

Value convert_node(const YAML::Node & node);

/// `<<` written as a plain scalar; a quoted "<<" is an ordinary key.
bool is_merge_key(const YAML::Node & key)
{
  return key.IsScalar() && key.Scalar() == "<<" && key.Tag() != "!";
}

std::string mapping_key(const YAML::Node & key)
{
  if (key.IsScalar()) {
    return key.Scalar();
  }
  // Non-scalar keys are rendered back to YAML text.
  YAML::Emitter emitter;
  emitter << YAML::Flow << key;
  return emitter.c_str();
}

/// Add the entries of a `<<` source that are not present yet, so earlier
/// sources take precedence over later ones.
void merge_source_into(ValueMapping & merged, const YAML::Node & source)
{
  if (!source.IsMap()) {
    throw ValuesConversionError(fmt::format(
      "line {}: map merge requires map or sequence of maps as the value", source.Mark().line + 1));
  }
  Value converted = convert_node(source);
  for (auto & [key, value] : converted.as_mapping()) {
    merged.emplace(key, std::move(value));
  }
}

ValueMapping convert_mapping(const YAML::Node & node)
{
  ValueMapping explicit_entries;
  ValueMapping merged;

  for (const auto & entry : node) {
    if (is_merge_key(entry.first)) {
      if (entry.second.IsSequence()) {
        for (const auto & source : entry.second) {
          merge_source_into(merged, source);
        }
      } else {
        merge_source_into(merged, entry.second);
      }
      continue;
    }

    std::string key = mapping_key(entry.first);
    if (explicit_entries.count(key) != 0) {
      throw ValuesConversionError(fmt::format(
        "line {}: mapping key \"{}\" already defined", entry.first.Mark().line + 1, key));
    }
    explicit_entries.emplace(std::move(key), convert_node(entry.second));
  }

  // Explicit keys override merged ones.
  for (auto & [key, value] : explicit_entries) {
    merged.insert_or_assign(key, std::move(value));
  }
  return merged;
}

Value convert_node(const YAML::Node & node)
{
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return Value::make_null();

    case YAML::NodeType::Scalar: {
      const std::string & text = node.Scalar();
      // Quoted scalars carry the non-specific "!" tag and are always strings.
      if (node.Tag() == "!") {
        return Value::make_string(text);
      }
      if (node.Tag() == "?" || node.Tag().empty()) {
        return Value::make_scalar(classify_plain_scalar(text), text);
      }
      // Explicitly tagged scalars (!!str, !!int, ...) keep their text.
      if (node.Tag() == "tag:yaml.org,2002:int") {
        return Value::make_scalar(ScalarKind::Integer, text);
      }
      if (node.Tag() == "tag:yaml.org,2002:float") {
        return Value::make_scalar(ScalarKind::Float, text);
      }
      if (node.Tag() == "tag:yaml.org,2002:bool") {
        return Value::make_scalar(ScalarKind::Bool, text);
      }
      return Value::make_string(text);
    }

    case YAML::NodeType::Sequence: {
      ValueSequence items;
      items.reserve(node.size());
      for (const auto & item : node) {
        items.push_back(convert_node(item));
      }
      return Value::make_sequence(std::move(items));
    }

    case YAML::NodeType::Map:
      return Value::make_mapping(convert_mapping(node));
  }
  return Value::make_null();
}

ValuesLoadResult convert_document(const YAML::Node & root)
{
  if (!root || root.IsNull()) {
    return ValuesLoadResult::ok({});
  }
  if (!root.IsMap()) {
    return ValuesLoadResult::fail(
      ErrorKind::ParseError, "values document must be a mapping at the top level");
  }
  Value doc = convert_node(root);
  return ValuesLoadResult::ok(std::move(doc.as_mapping()));
}

}  // namespace

ValuesLoadResult load_values_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return ValuesLoadResult::fail(
      ErrorKind::LoadError, "open " + path.string() + ": " + std::strerror(errno));
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return ValuesLoadResult::fail(ErrorKind::LoadError, "read " + path.string() + " failed");
  }

  return parse_values(buffer.str());
}

ValuesLoadResult parse_values(const std::string & text)
{
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception & e) {
    return ValuesLoadResult::fail(ErrorKind::ParseError, "failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return convert_document(root);
  } catch (const YAML::Exception & e) {
    return ValuesLoadResult::fail(ErrorKind::ParseError, "failed to parse YAML: " + std::string(e.what()));
  } catch (const ValuesConversionError & e) {
    return ValuesLoadResult::fail(ErrorKind::ParseError, "failed to parse YAML: " + std::string(e.what()));
  }
}

}  // namespace chartscan
