#include "engine/safe_table.h"
#include "infrastructure/error_handling.h"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>

namespace quantbox {
namespace tests {

using engine::SafeTable;
using engine::Value;

static SafeTable trades() {
    return SafeTable::fromRecords(Value::parse(R"([
        {"symbol": "AAPL", "side": "buy",  "qty": 10, "price": 150.5},
        {"symbol": "MSFT", "side": "sell", "qty": 5,  "price": 310.0},
        {"symbol": "AAPL", "side": "sell", "qty": 4,  "price": 152.0},
        {"symbol": "GOOG", "side": "buy",  "qty": 2,  "price": null},
        {"symbol": "MSFT", "side": "buy",  "qty": 7,  "price": 305.25}
    ])"));
}

template <typename Fn>
static bool throwsValidation(Fn fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

class SafeTableTests {
public:
    static void runAll() {
        std::cout << "Running SafeTable Tests...\n";

        testConstruction();
        testFromColumns();
        testWhere();
        testGroupBy();
        testAggregations();
        testSorting();
        testReshape();
        testMerge();
        testDescribeAndInfo();
        testExport();

        std::cout << "All SafeTable Tests Passed!\n";
    }

private:
    static void testConstruction() {
        std::cout << "  Testing construction... ";

        auto t = trades();
        assert(t.size() == 5);
        assert(t.columns().size() == 4);
        assert(t.columns()[0] == "symbol");
        assert(t.hasColumn("qty"));
        assert(!t.hasColumn("fee"));
        assert(t.cell(1, "symbol") == "MSFT");
        assert(t.cell(0, "fee").is_null());

        assert(SafeTable::fromJson(Value(nullptr)).empty());
        assert(SafeTable::fromJson(Value::parse("[]")).empty());
        assert(throwsValidation([] { SafeTable::fromRecords(Value::parse("[1, 2]")); }));
        assert(t.toString() == "SafeTable(5 rows, 4 columns)");

        std::cout << "PASSED\n";
    }

    static void testFromColumns() {
        std::cout << "  Testing column-oriented input... ";

        auto t = SafeTable::fromJson(Value::parse(R"({"a": [1, 2, 3], "b": ["x", "y", "z"]})"));
        assert(t.size() == 3);
        assert(t.cell(2, "b") == "z");
        assert(throwsValidation([] { SafeTable::fromColumns(Value::parse(R"({"a": [1, 2], "b": [1]})")); }));
        assert(throwsValidation([] { SafeTable::fromColumns(Value::parse(R"({"a": 1})")); }));

        std::cout << "PASSED\n";
    }

    static void testWhere() {
        std::cout << "  Testing where... ";

        auto t = trades();
        assert(t.where("symbol", "==", "AAPL").size() == 2);
        assert(t.where("symbol", "!=", "AAPL").size() == 3);
        assert(t.where("qty", ">", 4).size() == 3);
        assert(t.where("qty", ">=", 4.0).size() == 4);
        assert(t.where("qty", "<", 5).size() == 2);
        assert(t.where("qty", "<=", 5).size() == 3);
        // null price never satisfies an ordering comparison
        assert(t.where("price", "<", 1000).size() == 4);
        assert(t.where("symbol", "in", Value::parse(R"(["GOOG", "MSFT"])")).size() == 3);
        assert(t.where("side", "in", "buy-only").size() == 3);
        assert(t.where("qty", "==", 10.0).size() == 1);

        assert(throwsValidation([&t] { t.where("qty", "~=", 1); }));
        assert(throwsValidation([&t] { t.where("qty", "in", 3); }));

        auto big = t.filter([](const Value& row) { return row["qty"].get<int>() * 2 > 10; });
        assert(big.size() == 2);

        std::cout << "PASSED\n";
    }

    static void testGroupBy() {
        std::cout << "  Testing groupby... ";

        auto groups = trades().groupby("symbol");
        assert(groups.size() == 3);
        assert(groups[0].first == "AAPL");
        assert(groups[0].second.size() == 2);
        assert(groups[1].first == "MSFT");
        assert(groups[2].first == "GOOG");

        auto mixed = SafeTable::fromRecords(Value::parse(R"([{"k": 1}, {"k": 1.0}, {"k": 2}])"));
        assert(mixed.groupby("k").size() == 2);

        auto composite = trades().groupby(std::vector<std::string>{"symbol", "side"});
        assert(composite.size() == 5);
        assert(composite[0].first.is_array());
        assert(composite[0].first[1] == "buy");

        std::cout << "PASSED\n";
    }

    static void testAggregations() {
        std::cout << "  Testing aggregations... ";

        auto t = trades();
        Value qty = t.sum("qty");
        assert(qty.is_number_integer() && qty.get<int64_t>() == 28);
        assert(std::fabs(t.mean("qty").get<double>() - 5.6) < 1e-9);
        assert(t.min("price").get<double>() == 150.5);
        assert(t.max("symbol") == "MSFT");
        assert(t.count() == 5);
        assert(t.count("price") == 4);
        assert(t.sum("fee").is_null());

        auto bySymbol = t.sumBy("qty", "symbol");
        assert(bySymbol.size() == 3);
        assert(bySymbol[0].first == "AAPL" && bySymbol[0].second.get<int64_t>() == 14);
        assert(bySymbol[1].second.get<int64_t>() == 12);
        int64_t groupedTotal = 0;
        for (const auto& g : bySymbol) groupedTotal += g.second.get<int64_t>();
        assert(groupedTotal == qty.get<int64_t>());

        auto priceBySymbol = t.meanBy("price", "symbol");
        assert(priceBySymbol[2].first == "GOOG" && priceBySymbol[2].second.is_null());

        auto cheapest = t.minBy("price", "symbol");
        assert(cheapest[0].second.get<double>() == 150.5);
        assert(cheapest[2].second.is_null());
        auto largest = t.maxBy("qty", "side");
        assert(largest[0].first == "buy" && largest[0].second == 10);
        assert(largest[1].first == "sell" && largest[1].second == 5);

        auto sidesPerSymbol = t.aggBy("side", [](const std::vector<Value>& values) {
            return Value(values.size());
        }, "symbol");
        assert(sidesPerSymbol.size() == 3);
        assert(sidesPerSymbol[0].second.get<size_t>() == 2);
        assert(sidesPerSymbol[2].second.get<size_t>() == 1);

        auto counts = t.countBy("side");
        assert(counts[0].first == "buy" && counts[0].second.get<size_t>() == 3);

        auto longest = t.agg("symbol", [](const std::vector<Value>& values) {
            return Value(values.size());
        });
        assert(longest.get<size_t>() == 5);

        auto huge = SafeTable::fromRecords(Value::parse(R"([{"x": 9223372036854775807}, {"x": 1}])"));
        Value hugeSum = huge.sum("x");
        assert(hugeSum.is_number_float());
        assert(hugeSum.get<double>() == 9223372036854775808.0);
        auto beyond = SafeTable::fromRecords(Value::parse(R"([{"x": 18446744073709551615}, {"x": -1}])"));
        assert(beyond.sum("x").is_number_float());
        auto negatives = SafeTable::fromRecords(Value::parse(R"([{"x": -9223372036854775807}, {"x": -1}])"));
        assert(negatives.sum("x").get<int64_t>() == INT64_MIN);

        assert(throwsValidation([&t] { t.sum("symbol"); }));
        auto mixed = SafeTable::fromRecords(Value::parse(R"([{"v": 1}, {"v": "a"}])"));
        assert(throwsValidation([&mixed] { mixed.max("v"); }));

        std::cout << "PASSED\n";
    }

    static void testSorting() {
        std::cout << "  Testing sort_values... ";

        auto t = trades();
        auto byPrice = t.sortValues("price");
        assert(byPrice.cell(0, "price").get<double>() == 150.5);
        assert(byPrice.cell(4, "price").is_null());

        auto desc = t.sortValues("price", false);
        assert(desc.cell(0, "price").get<double>() == 310.0);
        assert(desc.cell(4, "price").is_null());

        auto multi = t.sortValues(std::vector<std::string>{"symbol", "qty"});
        assert(multi.cell(0, "symbol") == "AAPL" && multi.cell(0, "qty") == 4);
        assert(multi.cell(4, "symbol") == "MSFT" && multi.cell(4, "qty") == 7);

        // original table is untouched
        assert(t.cell(0, "symbol") == "AAPL" && t.cell(0, "qty") == 10);

        std::cout << "PASSED\n";
    }

    static void testReshape() {
        std::cout << "  Testing head/tail/drop/rename/apply... ";

        auto t = trades();
        assert(t.head(2).size() == 2);
        assert(t.head(0).empty());
        assert(t.head(100).size() == 5);
        assert(t.tail(1).cell(0, "symbol") == "MSFT");

        auto dropped = t.drop({"price", "side"});
        assert(dropped.columns().size() == 2);
        assert(!dropped.toRecords()[0].contains("price"));

        auto renamed = t.rename({{"qty", "quantity"}});
        assert(renamed.hasColumn("quantity") && !renamed.hasColumn("qty"));
        assert(renamed.cell(0, "quantity") == 10);

        auto notional = t.apply([](const Value& row) {
            Value out = row;
            out["double_qty"] = row["qty"].get<int>() * 2;
            return out;
        });
        assert(notional.cell(3, "double_qty") == 4);
        assert(throwsValidation([&t] { t.apply([](const Value&) { return Value(1); }); }));

        auto sel = t.select({"qty"});
        assert(sel.columns().size() == 1 && sel.size() == 5);

        std::cout << "PASSED\n";
    }

    static void testMerge() {
        std::cout << "  Testing merge/concat... ";

        auto left = trades();
        auto sectors = SafeTable::fromRecords(Value::parse(R"([
            {"symbol": "AAPL", "sector": "tech"},
            {"symbol": "MSFT", "sector": "software"}
        ])"));

        auto inner = engine::merge(left, sectors, "symbol");
        assert(inner.size() == 4);
        assert(inner.columns().back() == "sector");
        assert(inner.cell(1, "sector") == "software");
        assert(inner.size() <= left.size() * sectors.size());
        for (const auto& row : inner.rows()) {
            bool found = false;
            for (const auto& s : sectors.rows()) found = found || s["symbol"] == row["symbol"];
            assert(found);
        }

        auto outer = engine::merge(left, sectors, "symbol", "left");
        assert(outer.size() == 5);
        assert(outer.cell(3, "sector").is_null());

        assert(throwsValidation([&] { engine::merge(left, sectors, "symbol", "outer"); }));

        auto more = SafeTable::fromRecords(Value::parse(R"([{"symbol": "TSLA", "venue": "XNAS"}])"));
        auto all = engine::concat({left, more});
        assert(all.size() == 6);
        assert(all.hasColumn("venue"));
        assert(all.cell(0, "venue").is_null());

        std::cout << "PASSED\n";
    }

    static void testDescribeAndInfo() {
        std::cout << "  Testing describe/info... ";

        auto t = trades();
        Value d = t.describe();
        assert(d.contains("qty") && d.contains("price"));
        assert(!d.contains("symbol"));
        assert(d["price"]["count"].get<int>() == 4);

        Value dtypes = t.inferDtypes();
        assert(dtypes["symbol"] == "text");
        assert(dtypes["qty"] == "int");
        assert(dtypes["price"] == "float");

        Value info = t.info();
        assert(info["shape"][0] == 5 && info["shape"][1] == 4);
        assert(info["memory_usage"] == "N/A");

        std::cout << "PASSED\n";
    }

    static void testExport() {
        std::cout << "  Testing export... ";

        auto t = trades().head(2);
        Value records = t.toRecords();
        assert(records.is_array() && records.size() == 2);
        Value cols = t.toColumns();
        assert(cols["qty"].size() == 2 && cols["qty"][1] == 5);
        assert(t.column("symbol")[1] == "MSFT");

        std::cout << "PASSED\n";
    }
};

}
}

int main() {
    quantbox::tests::SafeTableTests::runAll();
    return 0;
}
