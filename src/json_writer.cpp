#include <citegraph/json_writer.h>

#include <cstdio>
#include <unordered_map>

namespace citegraph {

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},  {'\\', "\\\\"}, {'\n', "\\n"},
      {'\r', "\\r"},  {'\t', "\\t"},  {'\b', "\\b"},
      {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
      continue;
    }
    const auto code = static_cast<unsigned char>(character);
    if (code < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x", code);
      escaped.append(buffer);
      continue;
    }
    escaped.push_back(character);
  }
  return escaped;
}

void JsonWriter::BeforeValue() {
  if (pending_key_) {
    pending_key_ = false;
    return;
  }
  if (!first_in_scope_.empty()) {
    if (!first_in_scope_.back()) {
      output_.push_back(',');
    }
    first_in_scope_.back() = false;
  }
}

JsonWriter &JsonWriter::BeginObject() {
  BeforeValue();
  output_.push_back('{');
  first_in_scope_.push_back(true);
  return *this;
}

JsonWriter &JsonWriter::EndObject() {
  first_in_scope_.pop_back();
  output_.push_back('}');
  return *this;
}

JsonWriter &JsonWriter::BeginArray() {
  BeforeValue();
  output_.push_back('[');
  first_in_scope_.push_back(true);
  return *this;
}

JsonWriter &JsonWriter::EndArray() {
  first_in_scope_.pop_back();
  output_.push_back(']');
  return *this;
}

JsonWriter &JsonWriter::Key(const std::string &name) {
  BeforeValue();
  output_.push_back('"');
  output_.append(EscapeJsonString(name));
  output_.append("\":");
  pending_key_ = true;
  return *this;
}

JsonWriter &JsonWriter::String(const std::string &value) {
  BeforeValue();
  output_.push_back('"');
  output_.append(EscapeJsonString(value));
  output_.push_back('"');
  return *this;
}

JsonWriter &
JsonWriter::OptionalString(const std::optional<std::string> &value) {
  if (!value) {
    return Null();
  }
  return String(*value);
}

JsonWriter &JsonWriter::Number(std::size_t value) {
  BeforeValue();
  output_.append(std::to_string(value));
  return *this;
}

JsonWriter &JsonWriter::Integer(long long value) {
  BeforeValue();
  output_.append(std::to_string(value));
  return *this;
}

JsonWriter &JsonWriter::Bool(bool value) {
  BeforeValue();
  output_.append(value ? "true" : "false");
  return *this;
}

JsonWriter &JsonWriter::Null() {
  BeforeValue();
  output_.append("null");
  return *this;
}

JsonWriter &JsonWriter::StringArray(const std::vector<std::string> &values) {
  BeginArray();
  for (const auto &value : values) {
    String(value);
  }
  return EndArray();
}

} // namespace citegraph
