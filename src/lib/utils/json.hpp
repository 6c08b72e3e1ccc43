#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

namespace seqpart {

/**
 * Converts @param vector into a JSON array. Strings and integral values are stored as JSON primitives; any other type
 * must provide `Aws::Utils::Json::JsonValue ToJson() const`.
 */
template <typename T>
Aws::Utils::Array<Aws::Utils::Json::JsonValue> VectorToJsonArray(const std::vector<T>& vector) {
  Aws::Utils::Array<Aws::Utils::Json::JsonValue> result(vector.size());
  for (size_t i = 0; i < vector.size(); ++i) {
    Aws::Utils::Json::JsonValue value;

    if constexpr (std::is_same_v<T, std::string>) {
      value.AsString(vector[i]);
    } else if constexpr (std::is_integral_v<T>) {
      value.AsInt64(static_cast<int64_t>(vector[i]));
    } else {
      value = vector[i].ToJson();
    }

    result[i] = std::move(value);
  }
  return result;
}

/**
 * Inverse of VectorToJsonArray. Non-primitive types must provide `static T FromJson(const JsonView&)`.
 */
template <typename T>
std::vector<T> JsonArrayToVector(const Aws::Utils::Array<Aws::Utils::Json::JsonView>& array) {
  std::vector<T> result;
  result.reserve(array.GetLength());
  for (size_t i = 0; i < array.GetLength(); ++i) {
    // NOLINTNEXTLINE(bugprone-branch-clone)
    if constexpr (std::is_same_v<T, std::string>) {
      result.emplace_back(array[i].AsString());
    } else if constexpr (std::is_integral_v<T>) {
      result.emplace_back(static_cast<T>(array[i].AsInt64()));
    } else {
      result.emplace_back(T::FromJson(array[i]));
    }
  }

  return result;
}

}  // namespace seqpart
