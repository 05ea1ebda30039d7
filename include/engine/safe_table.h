#pragma once

#include "engine/value.h"
#include <vector>
#include <string>
#include <memory>
#include <functional>
#include <map>
#include <utility>
#include <cstdint>

namespace quantbox {
namespace engine {

// (group key, rows) in first-seen order. Composite keys are JSON arrays.
using Group = std::pair<Value, std::vector<Value>>;
using GroupedValues = std::vector<std::pair<Value, Value>>;
using AggFn = std::function<Value(const std::vector<Value>&)>;

// Row-oriented table of ordered records. Column order is fixed when the table
// is built; cells missing from a record read as null.
class SafeTable {
public:
    SafeTable();
    explicit SafeTable(std::vector<Value> records);
    SafeTable(std::vector<Value> records, std::vector<std::string> columns);

    static SafeTable fromRecords(const Value& records);
    static SafeTable fromColumns(const Value& columns);
    static SafeTable fromJson(const Value& data);

    size_t size() const;
    bool empty() const;
    const std::vector<std::string>& columns() const;
    const std::vector<Value>& rows() const;
    Value cell(size_t row, const std::string& column) const;
    bool hasColumn(const std::string& column) const;

    std::vector<Value> column(const std::string& name) const;
    SafeTable select(const std::vector<std::string>& columns) const;

    SafeTable filter(const std::function<bool(const Value&)>& pred) const;
    // Operators: == != > < >= <= in
    SafeTable where(const std::string& column, const std::string& op, const Value& value) const;

    std::vector<Group> groupby(const std::string& column) const;
    std::vector<Group> groupby(const std::vector<std::string>& columns) const;

    Value agg(const std::string& column, const AggFn& fn) const;
    GroupedValues aggBy(const std::string& column, const AggFn& fn, const std::string& groupBy) const;

    Value sum(const std::string& column) const;
    Value mean(const std::string& column) const;
    Value min(const std::string& column) const;
    Value max(const std::string& column) const;
    size_t count() const;
    size_t count(const std::string& column) const;

    GroupedValues sumBy(const std::string& column, const std::string& groupBy) const;
    GroupedValues meanBy(const std::string& column, const std::string& groupBy) const;
    GroupedValues minBy(const std::string& column, const std::string& groupBy) const;
    GroupedValues maxBy(const std::string& column, const std::string& groupBy) const;
    GroupedValues countBy(const std::string& groupBy) const;

    SafeTable sortValues(const std::string& by, bool ascending = true) const;
    SafeTable sortValues(const std::vector<std::string>& by, bool ascending = true) const;

    SafeTable head(int64_t n = 5) const;
    SafeTable tail(int64_t n = 5) const;
    SafeTable drop(const std::vector<std::string>& columns) const;
    SafeTable rename(const std::map<std::string, std::string>& mapping) const;
    SafeTable apply(const std::function<Value(const Value&)>& fn) const;

    Value describe() const;
    Value inferDtypes() const;
    Value info() const;

    Value toRecords() const;
    Value toColumns() const;
    std::string toString() const;

private:
    std::shared_ptr<const std::vector<Value>> rows_;
    std::vector<std::string> columns_;
};

SafeTable concat(const std::vector<SafeTable>& tables);
// how: "inner" or "left"
SafeTable merge(const SafeTable& left, const SafeTable& right,
                const std::string& on, const std::string& how = "inner");

// Reducers used by the named aggregations; inputs are the non-null cells.
Value sumValues(const std::vector<Value>& values);
Value meanValues(const std::vector<Value>& values);
Value minValues(const std::vector<Value>& values);
Value maxValues(const std::vector<Value>& values);

}
}
