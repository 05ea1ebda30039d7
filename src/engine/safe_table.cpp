#include "engine/safe_table.h"
#include "engine/safe_array.h"
#include "infrastructure/error_handling.h"
#include <algorithm>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <sstream>

namespace quantbox {
namespace engine {

static const std::vector<Value>& emptyRows() {
    static const std::vector<Value> empty;
    return empty;
}

static Value getCell(const Value& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return Value(nullptr);
    return *it;
}

static void requireRecords(const std::vector<Value>& records) {
    for (size_t i = 0; i < records.size(); i++) {
        if (!records[i].is_object()) {
            throw ValidationError("Row " + std::to_string(i) + " is not a record (got " +
                                  typeName(records[i]) + ")");
        }
    }
}

static std::vector<std::string> keysOf(const Value& record) {
    std::vector<std::string> keys;
    for (auto it = record.begin(); it != record.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

static std::vector<Value> nonNullValues(const std::vector<Value>& rows, const std::string& column) {
    std::vector<Value> values;
    for (const auto& row : rows) {
        Value v = getCell(row, column);
        if (!v.is_null()) values.push_back(std::move(v));
    }
    return values;
}

SafeTable::SafeTable() : rows_(std::make_shared<const std::vector<Value>>()) {}

SafeTable::SafeTable(std::vector<Value> records) {
    requireRecords(records);
    if (!records.empty()) columns_ = keysOf(records.front());
    rows_ = std::make_shared<const std::vector<Value>>(std::move(records));
}

SafeTable::SafeTable(std::vector<Value> records, std::vector<std::string> columns)
    : columns_(std::move(columns)) {
    requireRecords(records);
    rows_ = std::make_shared<const std::vector<Value>>(std::move(records));
}

SafeTable SafeTable::fromRecords(const Value& records) {
    if (!records.is_array()) {
        throw ValidationError(std::string("Expected a list of records, got ") + typeName(records));
    }
    return SafeTable(std::vector<Value>(records.begin(), records.end()));
}

SafeTable SafeTable::fromColumns(const Value& columns) {
    if (!columns.is_object()) {
        throw ValidationError(std::string("Expected a column mapping, got ") + typeName(columns));
    }

    std::vector<std::string> names;
    size_t numRows = 0;
    bool first = true;
    for (auto it = columns.begin(); it != columns.end(); ++it) {
        if (!it.value().is_array()) {
            throw ValidationError("Column '" + it.key() + "' is not a list");
        }
        if (first) {
            numRows = it.value().size();
            first = false;
        } else if (it.value().size() != numRows) {
            throw ValidationError("Column '" + it.key() + "' has " + std::to_string(it.value().size()) +
                                  " values, expected " + std::to_string(numRows));
        }
        names.push_back(it.key());
    }

    std::vector<Value> records;
    records.reserve(numRows);
    for (size_t i = 0; i < numRows; i++) {
        Value row = Value::object();
        for (const auto& name : names) {
            row[name] = columns[name][i];
        }
        records.push_back(std::move(row));
    }
    return SafeTable(std::move(records), std::move(names));
}

SafeTable SafeTable::fromJson(const Value& data) {
    if (data.is_array()) return fromRecords(data);
    if (data.is_object()) return fromColumns(data);
    if (data.is_null()) return SafeTable();
    throw ValidationError(std::string("Cannot build a table from ") + typeName(data));
}

size_t SafeTable::size() const {
    return rows().size();
}

bool SafeTable::empty() const {
    return size() == 0;
}

const std::vector<std::string>& SafeTable::columns() const {
    return columns_;
}

const std::vector<Value>& SafeTable::rows() const {
    return rows_ ? *rows_ : emptyRows();
}

Value SafeTable::cell(size_t row, const std::string& column) const {
    if (row >= size()) return Value(nullptr);
    return getCell(rows()[row], column);
}

bool SafeTable::hasColumn(const std::string& column) const {
    return std::find(columns_.begin(), columns_.end(), column) != columns_.end();
}

std::vector<Value> SafeTable::column(const std::string& name) const {
    std::vector<Value> out;
    out.reserve(size());
    for (const auto& row : rows()) out.push_back(getCell(row, name));
    return out;
}

SafeTable SafeTable::select(const std::vector<std::string>& columns) const {
    std::vector<Value> out;
    out.reserve(size());
    for (const auto& row : rows()) {
        Value r = Value::object();
        for (const auto& c : columns) r[c] = getCell(row, c);
        out.push_back(std::move(r));
    }
    return SafeTable(std::move(out), columns);
}

SafeTable SafeTable::filter(const std::function<bool(const Value&)>& pred) const {
    std::vector<Value> out;
    for (const auto& row : rows()) {
        if (pred(row)) out.push_back(row);
    }
    return SafeTable(std::move(out), columns_);
}

SafeTable SafeTable::where(const std::string& column, const std::string& op, const Value& value) const {
    std::function<bool(const Value&)> test;

    if (op == "==") {
        test = [&value](const Value& c) { return valuesEqual(c, value); };
    } else if (op == "!=") {
        test = [&value](const Value& c) { return !valuesEqual(c, value); };
    } else if (op == ">" || op == "<" || op == ">=" || op == "<=") {
        test = [&value, op](const Value& c) {
            auto cmp = compareValues(c, value);
            if (!cmp) return false;
            if (op == ">") return *cmp > 0;
            if (op == "<") return *cmp < 0;
            if (op == ">=") return *cmp >= 0;
            return *cmp <= 0;
        };
    } else if (op == "in") {
        if (value.is_array()) {
            test = [&value](const Value& c) {
                for (const auto& item : value) {
                    if (valuesEqual(c, item)) return true;
                }
                return false;
            };
        } else if (value.is_string()) {
            test = [&value](const Value& c) {
                if (!c.is_string()) return false;
                return value.get_ref<const std::string&>().find(c.get_ref<const std::string&>()) != std::string::npos;
            };
        } else {
            throw ValidationError(std::string("Operator 'in' needs a list or text value, got ") + typeName(value));
        }
    } else {
        throw ValidationError("Unknown operator: " + op);
    }

    std::vector<Value> out;
    for (const auto& row : rows()) {
        if (test(getCell(row, column))) out.push_back(row);
    }
    return SafeTable(std::move(out), columns_);
}

std::vector<Group> SafeTable::groupby(const std::string& column) const {
    std::vector<Group> groups;
    std::unordered_map<std::string, size_t> index;
    for (const auto& row : rows()) {
        Value key = getCell(row, column);
        std::string k = canonicalKey(key);
        auto it = index.find(k);
        if (it == index.end()) {
            index.emplace(k, groups.size());
            groups.emplace_back(std::move(key), std::vector<Value>{row});
        } else {
            groups[it->second].second.push_back(row);
        }
    }
    return groups;
}

std::vector<Group> SafeTable::groupby(const std::vector<std::string>& columns) const {
    std::vector<Group> groups;
    std::unordered_map<std::string, size_t> index;
    for (const auto& row : rows()) {
        Value key = Value::array();
        for (const auto& c : columns) key.push_back(getCell(row, c));
        std::string k = canonicalKey(key);
        auto it = index.find(k);
        if (it == index.end()) {
            index.emplace(k, groups.size());
            groups.emplace_back(std::move(key), std::vector<Value>{row});
        } else {
            groups[it->second].second.push_back(row);
        }
    }
    return groups;
}

Value SafeTable::agg(const std::string& column, const AggFn& fn) const {
    auto values = nonNullValues(rows(), column);
    if (values.empty()) return Value(nullptr);
    return fn(values);
}

GroupedValues SafeTable::aggBy(const std::string& column, const AggFn& fn, const std::string& groupBy) const {
    GroupedValues out;
    for (auto& group : groupby(groupBy)) {
        auto values = nonNullValues(group.second, column);
        out.emplace_back(std::move(group.first), values.empty() ? Value(nullptr) : fn(values));
    }
    return out;
}

Value SafeTable::sum(const std::string& column) const {
    return agg(column, sumValues);
}

Value SafeTable::mean(const std::string& column) const {
    return agg(column, meanValues);
}

Value SafeTable::min(const std::string& column) const {
    return agg(column, minValues);
}

Value SafeTable::max(const std::string& column) const {
    return agg(column, maxValues);
}

size_t SafeTable::count() const {
    return size();
}

size_t SafeTable::count(const std::string& column) const {
    return nonNullValues(rows(), column).size();
}

GroupedValues SafeTable::sumBy(const std::string& column, const std::string& groupBy) const {
    return aggBy(column, sumValues, groupBy);
}

GroupedValues SafeTable::meanBy(const std::string& column, const std::string& groupBy) const {
    return aggBy(column, meanValues, groupBy);
}

GroupedValues SafeTable::minBy(const std::string& column, const std::string& groupBy) const {
    return aggBy(column, minValues, groupBy);
}

GroupedValues SafeTable::maxBy(const std::string& column, const std::string& groupBy) const {
    return aggBy(column, maxValues, groupBy);
}

GroupedValues SafeTable::countBy(const std::string& groupBy) const {
    GroupedValues out;
    for (auto& group : groupby(groupBy)) {
        out.emplace_back(std::move(group.first), Value(group.second.size()));
    }
    return out;
}

SafeTable SafeTable::sortValues(const std::string& by, bool ascending) const {
    return sortValues(std::vector<std::string>{by}, ascending);
}

SafeTable SafeTable::sortValues(const std::vector<std::string>& by, bool ascending) const {
    std::vector<Value> out(rows().begin(), rows().end());

    // Nulls go last in either direction.
    auto less = [&by, ascending](const Value& a, const Value& b) {
        for (const auto& col : by) {
            Value x = getCell(a, col);
            Value y = getCell(b, col);
            if (x.is_null() || y.is_null()) {
                if (x.is_null() && y.is_null()) continue;
                return y.is_null();
            }
            int c = orderValues(x, y);
            if (c != 0) return ascending ? c < 0 : c > 0;
        }
        return false;
    };
    std::stable_sort(out.begin(), out.end(), less);
    return SafeTable(std::move(out), columns_);
}

SafeTable SafeTable::head(int64_t n) const {
    if (n <= 0) return SafeTable(std::vector<Value>{}, columns_);
    size_t count = std::min(static_cast<size_t>(n), size());
    return SafeTable(std::vector<Value>(rows().begin(), rows().begin() + count), columns_);
}

SafeTable SafeTable::tail(int64_t n) const {
    if (n <= 0) return SafeTable(std::vector<Value>{}, columns_);
    size_t count = std::min(static_cast<size_t>(n), size());
    return SafeTable(std::vector<Value>(rows().end() - count, rows().end()), columns_);
}

SafeTable SafeTable::drop(const std::vector<std::string>& columns) const {
    std::unordered_set<std::string> dropped(columns.begin(), columns.end());
    std::vector<std::string> kept;
    for (const auto& c : columns_) {
        if (!dropped.count(c)) kept.push_back(c);
    }

    std::vector<Value> out;
    out.reserve(size());
    for (const auto& row : rows()) {
        Value r = Value::object();
        for (auto it = row.begin(); it != row.end(); ++it) {
            if (!dropped.count(it.key())) r[it.key()] = it.value();
        }
        out.push_back(std::move(r));
    }
    return SafeTable(std::move(out), std::move(kept));
}

SafeTable SafeTable::rename(const std::map<std::string, std::string>& mapping) const {
    auto renamed = [&mapping](const std::string& name) {
        auto it = mapping.find(name);
        return it != mapping.end() ? it->second : name;
    };

    std::vector<std::string> cols;
    for (const auto& c : columns_) {
        std::string n = renamed(c);
        if (std::find(cols.begin(), cols.end(), n) == cols.end()) cols.push_back(n);
    }

    std::vector<Value> out;
    out.reserve(size());
    for (const auto& row : rows()) {
        Value r = Value::object();
        for (auto it = row.begin(); it != row.end(); ++it) {
            r[renamed(it.key())] = it.value();
        }
        out.push_back(std::move(r));
    }
    return SafeTable(std::move(out), std::move(cols));
}

SafeTable SafeTable::apply(const std::function<Value(const Value&)>& fn) const {
    std::vector<Value> out;
    out.reserve(size());
    for (const auto& row : rows()) {
        Value r = fn(row);
        if (!r.is_object()) {
            throw ValidationError(std::string("apply() must return a record, got ") + typeName(r));
        }
        out.push_back(std::move(r));
    }
    return SafeTable(std::move(out));
}

Value SafeTable::describe() const {
    Value out = Value::object();
    for (const auto& col : columns_) {
        auto values = nonNullValues(rows(), col);
        if (values.empty()) continue;
        bool numeric = std::all_of(values.begin(), values.end(), [](const Value& v) { return v.is_number(); });
        if (!numeric) continue;

        std::vector<double> nums;
        nums.reserve(values.size());
        for (const auto& v : values) nums.push_back(toDouble(v));
        out[col] = SafeArray(std::move(nums)).describe();
    }
    return out;
}

Value SafeTable::inferDtypes() const {
    Value out = Value::object();
    for (const auto& col : columns_) {
        auto values = nonNullValues(rows(), col);
        auto all = [&values](bool (*pred)(const Value&)) {
            return std::all_of(values.begin(), values.end(), pred);
        };
        if (all([](const Value& v) { return v.is_boolean(); })) {
            out[col] = "bool";
        } else if (all([](const Value& v) { return v.is_number_integer(); })) {
            out[col] = "int";
        } else if (all([](const Value& v) { return v.is_number_float(); })) {
            out[col] = "float";
        } else if (all([](const Value& v) { return v.is_string(); })) {
            out[col] = "text";
        } else {
            out[col] = "mixed";
        }
    }
    return out;
}

Value SafeTable::info() const {
    Value out = Value::object();
    out["shape"] = Value::array({size(), columns_.size()});
    out["columns"] = columns_;
    out["dtypes"] = inferDtypes();
    out["memory_usage"] = "N/A";
    return out;
}

Value SafeTable::toRecords() const {
    Value out = Value::array();
    for (const auto& row : rows()) out.push_back(row);
    return out;
}

Value SafeTable::toColumns() const {
    Value out = Value::object();
    for (const auto& col : columns_) {
        Value values = Value::array();
        for (const auto& row : rows()) values.push_back(getCell(row, col));
        out[col] = std::move(values);
    }
    return out;
}

std::string SafeTable::toString() const {
    std::ostringstream oss;
    oss << "SafeTable(" << size() << " rows, " << columns_.size() << " columns)";
    return oss.str();
}

SafeTable concat(const std::vector<SafeTable>& tables) {
    std::vector<Value> rows;
    std::vector<std::string> columns;
    for (const auto& t : tables) {
        for (const auto& c : t.columns()) {
            if (std::find(columns.begin(), columns.end(), c) == columns.end()) columns.push_back(c);
        }
        rows.insert(rows.end(), t.rows().begin(), t.rows().end());
    }
    return SafeTable(std::move(rows), std::move(columns));
}

SafeTable merge(const SafeTable& left, const SafeTable& right, const std::string& on, const std::string& how) {
    if (how != "inner" && how != "left") {
        throw ValidationError("Unsupported merge type: " + how + " (expected inner or left)");
    }

    std::unordered_map<std::string, std::vector<size_t>> rightIndex;
    for (size_t i = 0; i < right.rows().size(); i++) {
        rightIndex[canonicalKey(getCell(right.rows()[i], on))].push_back(i);
    }

    std::vector<std::string> columns = left.columns();
    for (const auto& c : right.columns()) {
        if (std::find(columns.begin(), columns.end(), c) == columns.end()) columns.push_back(c);
    }

    std::vector<Value> out;
    for (const auto& lrow : left.rows()) {
        auto it = rightIndex.find(canonicalKey(getCell(lrow, on)));
        if (it == rightIndex.end()) {
            if (how == "left") out.push_back(lrow);
            continue;
        }
        for (size_t idx : it->second) {
            Value merged = lrow;
            const Value& rrow = right.rows()[idx];
            for (auto r = rrow.begin(); r != rrow.end(); ++r) {
                merged[r.key()] = r.value();
            }
            out.push_back(std::move(merged));
        }
    }
    return SafeTable(std::move(out), std::move(columns));
}

Value sumValues(const std::vector<Value>& values) {
    bool allInt = true;
    for (const auto& v : values) {
        if (!v.is_number()) {
            throw ValidationError(std::string("Cannot sum non-numeric value of type ") + typeName(v));
        }
        if (!v.is_number_integer()) allInt = false;
    }
    if (allInt) {
        // Stays integral while the running total fits in int64_t.
        int64_t total = 0;
        bool overflow = false;
        for (const auto& v : values) {
            if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
                overflow = true;
                break;
            }
            if (__builtin_add_overflow(total, v.get<int64_t>(), &total)) {
                overflow = true;
                break;
            }
        }
        if (!overflow) return Value(total);
    }
    double total = 0.0;
    for (const auto& v : values) total += toDouble(v);
    return Value(total);
}

Value meanValues(const std::vector<Value>& values) {
    if (values.empty()) return Value(nullptr);
    double total = 0.0;
    for (const auto& v : values) {
        if (!v.is_number()) {
            throw ValidationError(std::string("Cannot average non-numeric value of type ") + typeName(v));
        }
        total += toDouble(v);
    }
    return Value(total / static_cast<double>(values.size()));
}

static Value extremum(const std::vector<Value>& values, int sign) {
    if (values.empty()) return Value(nullptr);
    const Value* best = &values.front();
    for (size_t i = 1; i < values.size(); i++) {
        auto c = compareValues(values[i], *best);
        if (!c) {
            throw ValidationError(std::string("Cannot compare ") + typeName(values[i]) +
                                  " with " + typeName(*best));
        }
        if (*c * sign > 0) best = &values[i];
    }
    if (values.size() == 1 && !compareValues(*best, *best)) {
        throw ValidationError(std::string("Cannot order value of type ") + typeName(*best));
    }
    return *best;
}

Value minValues(const std::vector<Value>& values) {
    return extremum(values, -1);
}

Value maxValues(const std::vector<Value>& values) {
    return extremum(values, 1);
}

}
}
