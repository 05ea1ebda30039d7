#include <gtest/gtest.h>
#include "sandbox/sandbox_factory.h"
#include "sandbox/child_process.h"
#include "utils/config.h"

using namespace quantbox;
using namespace quantbox::sandbox;
using quantbox::engine::Value;

// Runs scripts that use the quantbox_safe extension inside the sandbox. The
// module directory comes from sandbox.engine_path.
class SafeModuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (resolveInterpreter().empty()) {
            GTEST_SKIP() << "python3 is not installed";
        }
        if (utils::Config::instance().getSandboxSettings().enginePath.empty()) {
            GTEST_SKIP() << "quantbox_safe was not built";
        }
        manager = SandboxFactory::createDefaultSandbox();
    }

    Value run(const std::string& script, const Value& context = Value::object()) {
        auto result = manager.execute(script, context);
        EXPECT_TRUE(result.success) << result.error.value_or("") << "\n" << result.stderrText;
        return result.output;
    }

    SandboxManager manager;
};

TEST_F(SafeModuleTest, ArrayStatistics) {
    Value out = run(
        "from quantbox_safe import array, linspace\n"
        "a = array(prices)\n"
        "result = {'mean': a.mean(), 'median': a.median(), 'std': a.std(), 'len': len(a),\n"
        "          'last': a[-1], 'p50': a.percentile(50), 'grid': linspace(0, 1, 3).to_list()}\n",
        Value::parse(R"({"prices": [2, 4, 4, 4, 5, 5, 7, 9]})"));
    EXPECT_DOUBLE_EQ(out["mean"].get<double>(), 5.0);
    EXPECT_DOUBLE_EQ(out["median"].get<double>(), 4.5);
    EXPECT_DOUBLE_EQ(out["std"].get<double>(), 2.0);
    EXPECT_EQ(out["len"], 8);
    EXPECT_DOUBLE_EQ(out["last"].get<double>(), 9.0);
    EXPECT_EQ(out["grid"].size(), 3u);
}

TEST_F(SafeModuleTest, ArrayCallbacksAndSerialization) {
    Value out = run(
        "import quantbox_safe as qs\n"
        "a = qs.array([1, 2, 3, 4])\n"
        "result = {'big': a.filter(lambda x: x > 2), 'sq': a.map(lambda x: x * x).sum(),\n"
        "          'desc': a.describe()}\n");
    EXPECT_EQ(out["big"].size(), 2u);
    EXPECT_DOUBLE_EQ(out["sq"].get<double>(), 30.0);
    EXPECT_EQ(out["desc"]["count"], 4);
}

TEST_F(SafeModuleTest, TableGroupingAndMerge) {
    Value context = Value::parse(R"({"trades": [
        {"symbol": "AAPL", "qty": 10, "price": 150.0},
        {"symbol": "MSFT", "qty": 5, "price": 310.0},
        {"symbol": "AAPL", "qty": 4, "price": 152.0}
    ]})");
    Value out = run(
        "from quantbox_safe import SafeTable, DataFrame, merge\n"
        "t = SafeTable(trades)\n"
        "sectors = DataFrame({'symbol': ['AAPL', 'MSFT'], 'sector': ['tech', 'software']})\n"
        "joined = merge(t, sectors, on='symbol')\n"
        "result = {\n"
        "    'qty_by_symbol': t.sum('qty', group_by='symbol'),\n"
        "    'count': t.count(),\n"
        "    'big': len(t.where('qty', '>', 4)),\n"
        "    'sectors': joined['sector'],\n"
        "    'top': t.sort_values('price', ascending=False).head(1).to_dict(),\n"
        "    'columns': t.columns,\n"
        "}\n",
        context);
    EXPECT_EQ(out["qty_by_symbol"]["AAPL"], 14);
    EXPECT_EQ(out["qty_by_symbol"]["MSFT"], 5);
    EXPECT_EQ(out["count"], 3);
    EXPECT_EQ(out["big"], 2);
    EXPECT_EQ(out["sectors"].size(), 3u);
    EXPECT_EQ(out["top"][0]["symbol"], "MSFT");
    EXPECT_EQ(out["columns"].size(), 3u);
}

TEST_F(SafeModuleTest, TableIsJsonSerializable) {
    Value out = run(
        "from quantbox_safe import SafeTable\n"
        "result = SafeTable([{'a': 1}, {'a': 2}]).where('a', '==', 2)\n");
    ASSERT_TRUE(out.is_array());
    EXPECT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["a"], 2);
}

TEST_F(SafeModuleTest, ValidationErrorIsCatchable) {
    Value out = run(
        "from quantbox_safe import SafeTable, ValidationError\n"
        "try:\n"
        "    SafeTable([{'a': 1}]).where('a', '~', 1)\n"
        "    result = 'no error'\n"
        "except ValidationError as e:\n"
        "    result = {'msg': str(e), 'is_value_error': isinstance(e, ValueError)}\n");
    EXPECT_EQ(out["msg"], "Unknown operator: ~");
    EXPECT_EQ(out["is_value_error"], true);
}

TEST_F(SafeModuleTest, UncaughtEngineErrorFailsScript) {
    auto result = manager.execute("import quantbox_safe\nquantbox_safe.array([1, 'x'])");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::SCRIPT_FAILED);
    EXPECT_NE(result.error->find("ValidationError"), std::string::npos);
}
