#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace quantbox {
namespace engine {

// JSON tagged union (null/bool/int/float/string/array/object) with
// insertion-ordered objects, shared by context, output and table records.
using Value = nlohmann::ordered_json;

bool isNumeric(const Value& v);
double toDouble(const Value& v);

// Equality with integers and floats compared numerically (1 == 1.0).
bool valuesEqual(const Value& a, const Value& b);

// -1/0/1 for comparable pairs (number/number, string/string, bool/bool),
// nullopt otherwise.
std::optional<int> compareValues(const Value& a, const Value& b);

// Total order used for sorting: bool < number < string < other, null last.
int orderValues(const Value& a, const Value& b);

// Hashable text form; integral floats collapse onto their integer spelling so
// that keys equal under valuesEqual map to the same string.
std::string canonicalKey(const Value& v);

// True when every leaf is JSON representable (finite numbers, no binary).
bool isRepresentable(const Value& v, std::string* where = nullptr);

const char* typeName(const Value& v);

}
}
