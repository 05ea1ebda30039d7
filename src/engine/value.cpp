#include "engine/value.h"
#include <cmath>
#include <limits>

namespace quantbox {
namespace engine {

bool isNumeric(const Value& v) {
    return v.is_number();
}

double toDouble(const Value& v) {
    if (v.is_number_unsigned()) return static_cast<double>(v.get<uint64_t>());
    if (v.is_number_integer()) return static_cast<double>(v.get<int64_t>());
    if (v.is_number_float()) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    return 0.0;
}

bool valuesEqual(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_number_float() || b.is_number_float()) {
            return toDouble(a) == toDouble(b);
        }
        return a == b;
    }
    if (a.type() != b.type()) return false;
    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); i++) {
            if (!valuesEqual(a[i], b[i])) return false;
        }
        return true;
    }
    return a == b;
}

std::optional<int> compareValues(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (!a.is_number_float() && !b.is_number_float()) {
            if (a == b) return 0;
            return a < b ? -1 : 1;
        }
        double x = toDouble(a), y = toDouble(b);
        if (std::isnan(x) || std::isnan(y)) return std::nullopt;
        if (x < y) return -1;
        if (x > y) return 1;
        return 0;
    }
    if (a.is_string() && b.is_string()) {
        int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_boolean() && b.is_boolean()) {
        bool x = a.get<bool>(), y = b.get<bool>();
        if (x == y) return 0;
        return x ? 1 : -1;
    }
    return std::nullopt;
}

static int typeRank(const Value& v) {
    if (v.is_boolean()) return 0;
    if (v.is_number()) return 1;
    if (v.is_string()) return 2;
    if (v.is_null()) return 4;
    return 3;
}

int orderValues(const Value& a, const Value& b) {
    int ra = typeRank(a), rb = typeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;
    auto c = compareValues(a, b);
    if (c) return *c;
    if (ra == 3) {
        std::string da = a.dump(), db = b.dump();
        return da < db ? -1 : (da > db ? 1 : 0);
    }
    return 0;
}

std::string canonicalKey(const Value& v) {
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return Value(static_cast<int64_t>(d)).dump();
        }
        return v.dump();
    }
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return Value(static_cast<int64_t>(u)).dump();
        }
        return v.dump();
    }
    if (v.is_array()) {
        std::string out = "[";
        for (size_t i = 0; i < v.size(); i++) {
            if (i > 0) out += ",";
            out += canonicalKey(v[i]);
        }
        return out + "]";
    }
    return v.dump();
}

bool isRepresentable(const Value& v, std::string* where) {
    switch (v.type()) {
        case Value::value_t::number_float:
            if (!std::isfinite(v.get<double>())) {
                if (where) *where = "non-finite number";
                return false;
            }
            return true;
        case Value::value_t::binary:
            if (where) *where = "binary value";
            return false;
        case Value::value_t::discarded:
            if (where) *where = "discarded value";
            return false;
        case Value::value_t::array:
            for (const auto& item : v) {
                if (!isRepresentable(item, where)) return false;
            }
            return true;
        case Value::value_t::object:
            for (auto it = v.begin(); it != v.end(); ++it) {
                if (!isRepresentable(it.value(), where)) {
                    if (where) *where = "'" + it.key() + "': " + *where;
                    return false;
                }
            }
            return true;
        default:
            return true;
    }
}

const char* typeName(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "bool";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "int";
        case Value::value_t::number_float: return "float";
        case Value::value_t::string: return "text";
        case Value::value_t::array: return "array";
        case Value::value_t::object: return "object";
        default: return "other";
    }
}

}
}
