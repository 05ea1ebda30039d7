#include "engine/safe_array.h"
#include "engine/safe_table.h"
#include "infrastructure/error_handling.h"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <vector>
#include <map>

namespace py = pybind11;

namespace quantbox {
namespace python {

using engine::Value;
using engine::SafeArray;
using engine::SafeTable;

static Value toValue(py::handle obj);

static py::object fromValue(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null: return py::none();
        case Value::value_t::boolean: return py::bool_(v.get<bool>());
        case Value::value_t::number_integer: return py::int_(v.get<int64_t>());
        case Value::value_t::number_unsigned: return py::int_(v.get<uint64_t>());
        case Value::value_t::number_float: return py::float_(v.get<double>());
        case Value::value_t::string: return py::str(v.get_ref<const std::string&>());
        case Value::value_t::array: {
            py::list out;
            for (const auto& item : v) out.append(fromValue(item));
            return out;
        }
        case Value::value_t::object: {
            py::dict out;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out[py::str(it.key())] = fromValue(it.value());
            }
            return out;
        }
        default:
            throw py::type_error("Value cannot be represented in Python");
    }
}

// Dict keys must be hashable, so list keys become tuples.
static py::object keyFromValue(const Value& v) {
    if (v.is_array()) {
        py::tuple out(v.size());
        for (size_t i = 0; i < v.size(); i++) out[i] = keyFromValue(v[i]);
        return out;
    }
    return fromValue(v);
}

static Value toValue(py::handle obj) {
    if (obj.is_none()) return Value(nullptr);
    if (py::isinstance<py::bool_>(obj)) return Value(obj.cast<bool>());
    if (py::isinstance<py::int_>(obj)) {
        try {
            return Value(obj.cast<int64_t>());
        } catch (const py::cast_error&) {
            return Value(obj.cast<double>());
        }
    }
    if (py::isinstance<py::float_>(obj)) return Value(obj.cast<double>());
    if (py::isinstance<py::str>(obj)) return Value(obj.cast<std::string>());
    if (py::isinstance<SafeArray>(obj)) return obj.cast<const SafeArray&>().toList();
    if (py::isinstance<SafeTable>(obj)) return obj.cast<const SafeTable&>().toRecords();
    if (py::isinstance<py::dict>(obj)) {
        Value out = Value::object();
        for (auto item : py::reinterpret_borrow<py::dict>(obj)) {
            if (!py::isinstance<py::str>(item.first)) {
                throw py::type_error("Record keys must be strings");
            }
            out[item.first.cast<std::string>()] = toValue(item.second);
        }
        return out;
    }
    if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
        Value out = Value::array();
        for (auto item : py::reinterpret_borrow<py::sequence>(obj)) out.push_back(toValue(item));
        return out;
    }
    throw py::type_error("Unsupported value of type " + std::string(py::str(obj.get_type().attr("__name__"))));
}

static py::dict groupedToDict(const engine::GroupedValues& grouped) {
    py::dict out;
    for (const auto& g : grouped) out[keyFromValue(g.first)] = fromValue(g.second);
    return out;
}

static std::vector<std::string> columnList(const py::object& columns) {
    if (py::isinstance<py::str>(columns)) return {columns.cast<std::string>()};
    return columns.cast<std::vector<std::string>>();
}

static SafeArray arrayFrom(const py::iterable& data) {
    std::vector<double> values;
    for (auto item : data) {
        if (py::isinstance<py::bool_>(item) ||
            !(py::isinstance<py::int_>(item) || py::isinstance<py::float_>(item))) {
            throw ValidationError("SafeArray values must be numbers");
        }
        values.push_back(item.cast<double>());
    }
    return SafeArray(std::move(values));
}

static py::object optionalToPy(const std::optional<double>& v) {
    return v ? py::object(py::float_(*v)) : py::object(py::none());
}

static bool truthy(const py::object& obj) {
    return static_cast<bool>(py::bool_(obj));
}

static void bindSafeArray(py::module_& m) {
    py::class_<SafeArray>(m, "SafeArray")
        .def(py::init(&arrayFrom), py::arg("data"))
        .def("__len__", &SafeArray::size)
        .def("__getitem__", &SafeArray::at)
        .def("__repr__", &SafeArray::toString)
        .def("mean", &SafeArray::mean)
        .def("sum", &SafeArray::sum)
        .def("min", [](const SafeArray& a) { return optionalToPy(a.min()); })
        .def("max", [](const SafeArray& a) { return optionalToPy(a.max()); })
        .def("median", &SafeArray::median)
        .def("std", &SafeArray::stddev, py::arg("ddof") = 0)
        .def("var", &SafeArray::var, py::arg("ddof") = 0)
        .def("percentile", [](const SafeArray& a, double p) { return optionalToPy(a.percentile(p)); })
        .def("quartile", [](const SafeArray& a, int q) { return optionalToPy(a.quartile(q)); })
        .def("filter", [](const SafeArray& a, const py::function& pred) {
            return a.filter([&pred](double x) { return truthy(pred(x)); });
        })
        .def("map", [](const SafeArray& a, const py::function& fn) {
            return a.map([&fn](double x) { return fn(x).cast<double>(); });
        })
        .def("sort", &SafeArray::sort, py::arg("reverse") = false)
        .def("cumsum", &SafeArray::cumsum)
        .def("cumprod", &SafeArray::cumprod)
        .def("greater_than", &SafeArray::greaterThan)
        .def("less_than", &SafeArray::lessThan)
        .def("equal", &SafeArray::equal)
        .def("describe", [](const SafeArray& a) { return fromValue(a.describe()); })
        .def("to_list", [](const SafeArray& a) { return fromValue(a.toList()); })
        .def("to_json", [](const SafeArray& a) { return fromValue(a.toList()); });

    m.def("array", [](const py::object& data) { return engine::array(toValue(data)); }, py::arg("data"));
    m.def("zeros", &engine::zeros, py::arg("n"));
    m.def("ones", &engine::ones, py::arg("n"));
    m.def("linspace", &engine::linspace, py::arg("start"), py::arg("stop"), py::arg("num") = 50);
    m.def("arange", &engine::arange, py::arg("start"), py::arg("stop"), py::arg("step") = 1.0);
}

static SafeTable tableFrom(const py::object& data, const py::object& columns) {
    if (data.is_none()) return SafeTable();
    Value v = toValue(data);
    if (columns.is_none()) return SafeTable::fromJson(v);
    if (!v.is_array()) throw ValidationError("Explicit columns need a list of records");
    return SafeTable(std::vector<Value>(v.begin(), v.end()), columnList(columns));
}

static void bindSafeTable(py::module_& m) {
    py::class_<SafeTable>(m, "SafeTable")
        .def(py::init(&tableFrom), py::arg("data") = py::none(), py::arg("columns") = py::none())
        .def("__len__", &SafeTable::size)
        .def("__repr__", &SafeTable::toString)
        .def_property_readonly("columns", &SafeTable::columns)
        .def("__getitem__", [](const SafeTable& t, const py::object& key) -> py::object {
            if (py::isinstance<py::str>(key)) {
                py::list out;
                for (const auto& v : t.column(key.cast<std::string>())) out.append(fromValue(v));
                return out;
            }
            return py::cast(t.select(columnList(key)));
        })
        .def("filter", [](const SafeTable& t, const py::function& pred) {
            return t.filter([&pred](const Value& row) { return truthy(pred(fromValue(row))); });
        })
        .def("where", [](const SafeTable& t, const std::string& column, const std::string& op, const py::object& value) {
            return t.where(column, op, toValue(value));
        })
        .def("groupby", [](const SafeTable& t, const py::object& by) {
            auto groups = py::isinstance<py::str>(by) ? t.groupby(by.cast<std::string>()) : t.groupby(columnList(by));
            py::dict out;
            for (const auto& g : groups) {
                py::list rows;
                for (const auto& r : g.second) rows.append(fromValue(r));
                out[keyFromValue(g.first)] = rows;
            }
            return out;
        })
        .def("agg", [](const SafeTable& t, const std::string& column, const py::function& fn, const py::object& groupBy) -> py::object {
            engine::AggFn reducer = [&fn](const std::vector<Value>& values) {
                py::list items;
                for (const auto& v : values) items.append(fromValue(v));
                return toValue(fn(items));
            };
            if (groupBy.is_none()) return fromValue(t.agg(column, reducer));
            return groupedToDict(t.aggBy(column, reducer, groupBy.cast<std::string>()));
        }, py::arg("column"), py::arg("func"), py::arg("group_by") = py::none())
        .def("sum", [](const SafeTable& t, const std::string& column, const py::object& groupBy) -> py::object {
            if (groupBy.is_none()) return fromValue(t.sum(column));
            return groupedToDict(t.sumBy(column, groupBy.cast<std::string>()));
        }, py::arg("column"), py::arg("group_by") = py::none())
        .def("mean", [](const SafeTable& t, const std::string& column, const py::object& groupBy) -> py::object {
            if (groupBy.is_none()) return fromValue(t.mean(column));
            return groupedToDict(t.meanBy(column, groupBy.cast<std::string>()));
        }, py::arg("column"), py::arg("group_by") = py::none())
        .def("min", [](const SafeTable& t, const std::string& column, const py::object& groupBy) -> py::object {
            if (groupBy.is_none()) return fromValue(t.min(column));
            return groupedToDict(t.minBy(column, groupBy.cast<std::string>()));
        }, py::arg("column"), py::arg("group_by") = py::none())
        .def("max", [](const SafeTable& t, const std::string& column, const py::object& groupBy) -> py::object {
            if (groupBy.is_none()) return fromValue(t.max(column));
            return groupedToDict(t.maxBy(column, groupBy.cast<std::string>()));
        }, py::arg("column"), py::arg("group_by") = py::none())
        .def("count", [](const SafeTable& t, const py::object& column, const py::object& groupBy) -> py::object {
            if (!groupBy.is_none()) return groupedToDict(t.countBy(groupBy.cast<std::string>()));
            if (!column.is_none()) return py::int_(t.count(column.cast<std::string>()));
            return py::int_(t.count());
        }, py::arg("column") = py::none(), py::arg("group_by") = py::none())
        .def("apply", [](const SafeTable& t, const py::function& fn) {
            return t.apply([&fn](const Value& row) { return toValue(fn(fromValue(row))); });
        })
        .def("drop", [](const SafeTable& t, const py::object& columns) { return t.drop(columnList(columns)); })
        .def("rename", [](const SafeTable& t, const std::map<std::string, std::string>& mapping) { return t.rename(mapping); })
        .def("sort_values", [](const SafeTable& t, const py::object& by, bool ascending) {
            return t.sortValues(columnList(by), ascending);
        }, py::arg("by"), py::arg("ascending") = true)
        .def("head", &SafeTable::head, py::arg("n") = 5)
        .def("tail", &SafeTable::tail, py::arg("n") = 5)
        .def("describe", [](const SafeTable& t) { return fromValue(t.describe()); })
        .def("info", [](const SafeTable& t) { return fromValue(t.info()); })
        .def("infer_dtypes", [](const SafeTable& t) { return fromValue(t.inferDtypes()); })
        .def("to_dict", [](const SafeTable& t, const std::string& orient) {
            return fromValue(orient == "list" ? t.toColumns() : t.toRecords());
        }, py::arg("orient") = "records")
        .def("to_list", [](const SafeTable& t) { return fromValue(t.toRecords()); })
        .def("to_json", [](const SafeTable& t) { return fromValue(t.toRecords()); });

    m.attr("DataFrame") = m.attr("SafeTable");
    m.def("concat", [](const std::vector<SafeTable>& tables) { return engine::concat(tables); }, py::arg("tables"));
    m.def("merge", &engine::merge, py::arg("left"), py::arg("right"), py::arg("on"), py::arg("how") = "inner");
}

}
}

PYBIND11_MODULE(quantbox_safe, m) {
    m.doc() = "Restricted numeric array and table engines for sandboxed scripts";
    py::register_exception<quantbox::ValidationError>(m, "ValidationError", PyExc_ValueError);
    quantbox::python::bindSafeArray(m);
    quantbox::python::bindSafeTable(m);
}
