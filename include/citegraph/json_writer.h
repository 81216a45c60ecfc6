#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace citegraph {

std::string EscapeJsonString(const std::string &value);

// Compact, field-order-preserving JSON emitter. Identical call sequences
// always produce identical bytes.
class JsonWriter {
public:
  JsonWriter &BeginObject();
  JsonWriter &EndObject();
  JsonWriter &BeginArray();
  JsonWriter &EndArray();
  JsonWriter &Key(const std::string &name);

  JsonWriter &String(const std::string &value);
  JsonWriter &OptionalString(const std::optional<std::string> &value);
  JsonWriter &Number(std::size_t value);
  JsonWriter &Integer(long long value);
  JsonWriter &Bool(bool value);
  JsonWriter &Null();
  JsonWriter &StringArray(const std::vector<std::string> &values);

  const std::string &str() const { return output_; }

private:
  void BeforeValue();

  std::string output_;
  std::vector<bool> first_in_scope_;
  bool pending_key_ = false;
};

} // namespace citegraph
