#include "engine/safe_array.h"
#include "infrastructure/error_handling.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace quantbox {
namespace engine {

static const std::vector<double>& emptyStorage() {
    static const std::vector<double> empty;
    return empty;
}

static Value optionalToValue(const std::optional<double>& v) {
    return v ? Value(*v) : Value(nullptr);
}

SafeArray::SafeArray() : data_(std::make_shared<const std::vector<double>>()) {}

SafeArray::SafeArray(std::vector<double> data)
    : data_(std::make_shared<const std::vector<double>>(std::move(data))) {}

SafeArray::SafeArray(std::initializer_list<double> data)
    : data_(std::make_shared<const std::vector<double>>(data)) {}

size_t SafeArray::size() const {
    return data_ ? data_->size() : 0;
}

bool SafeArray::empty() const {
    return size() == 0;
}

const std::vector<double>& SafeArray::data() const {
    return data_ ? *data_ : emptyStorage();
}

double SafeArray::at(int64_t index) const {
    int64_t n = static_cast<int64_t>(size());
    int64_t i = index < 0 ? n + index : index;
    if (i < 0 || i >= n) {
        throw std::out_of_range("SafeArray index " + std::to_string(index) +
                                " out of range for length " + std::to_string(n));
    }
    return (*data_)[static_cast<size_t>(i)];
}

double SafeArray::operator[](size_t index) const {
    return (*data_)[index];
}

double SafeArray::mean() const {
    if (empty()) return 0.0;
    return sum() / static_cast<double>(size());
}

double SafeArray::sum() const {
    double total = 0.0;
    for (double x : data()) total += x;
    return total;
}

std::optional<double> SafeArray::min() const {
    if (empty()) return std::nullopt;
    return *std::min_element(data_->begin(), data_->end());
}

std::optional<double> SafeArray::max() const {
    if (empty()) return std::nullopt;
    return *std::max_element(data_->begin(), data_->end());
}

double SafeArray::median() const {
    if (empty()) return 0.0;
    std::vector<double> sorted(data_->begin(), data_->end());
    std::sort(sorted.begin(), sorted.end());
    size_t n = sorted.size();
    if (n % 2 == 1) return sorted[n / 2];
    return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
}

double SafeArray::stddev(int ddof) const {
    size_t n = size();
    if (n < 2 || ddof >= static_cast<int>(n)) return 0.0;

    double m = mean();
    double sq = 0.0;
    for (double x : *data_) {
        double d = x - m;
        sq += d * d;
    }
    double population = std::sqrt(sq / static_cast<double>(n));
    if (ddof == 0) return population;
    return population * std::sqrt(static_cast<double>(n) / static_cast<double>(static_cast<int>(n) - ddof));
}

double SafeArray::var(int ddof) const {
    double s = stddev(ddof);
    return s * s;
}

std::optional<double> SafeArray::percentile(double p) const {
    if (empty() || !(p >= 0.0 && p <= 100.0)) return std::nullopt;

    std::vector<double> sorted(data_->begin(), data_->end());
    std::sort(sorted.begin(), sorted.end());
    if (p == 0.0) return sorted.front();
    if (p == 100.0) return sorted.back();

    double index = (p / 100.0) * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(index);
    size_t upper = lower + 1;
    if (upper >= sorted.size()) return sorted[lower];

    double weight = index - static_cast<double>(lower);
    return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
}

std::optional<double> SafeArray::quartile(int q) const {
    switch (q) {
        case 1: return percentile(25);
        case 2: return percentile(50);
        case 3: return percentile(75);
        default: return std::nullopt;
    }
}

SafeArray SafeArray::filter(const std::function<bool(double)>& pred) const {
    std::vector<double> out;
    for (double x : data()) {
        if (pred(x)) out.push_back(x);
    }
    return SafeArray(std::move(out));
}

SafeArray SafeArray::map(const std::function<double(double)>& fn) const {
    std::vector<double> out;
    out.reserve(size());
    for (double x : data()) out.push_back(fn(x));
    return SafeArray(std::move(out));
}

SafeArray SafeArray::sort(bool reverse) const {
    std::vector<double> out(data().begin(), data().end());
    if (reverse) {
        std::stable_sort(out.begin(), out.end(), [](double a, double b) { return a > b; });
    } else {
        std::stable_sort(out.begin(), out.end());
    }
    return SafeArray(std::move(out));
}

SafeArray SafeArray::cumsum() const {
    std::vector<double> out;
    out.reserve(size());
    double total = 0.0;
    for (double x : data()) {
        total += x;
        out.push_back(total);
    }
    return SafeArray(std::move(out));
}

SafeArray SafeArray::cumprod() const {
    std::vector<double> out;
    out.reserve(size());
    double product = 1.0;
    for (double x : data()) {
        product *= x;
        out.push_back(product);
    }
    return SafeArray(std::move(out));
}

SafeArray SafeArray::greaterThan(double value) const {
    return map([value](double x) { return x > value ? 1.0 : 0.0; });
}

SafeArray SafeArray::lessThan(double value) const {
    return map([value](double x) { return x < value ? 1.0 : 0.0; });
}

SafeArray SafeArray::equal(double value) const {
    return map([value](double x) { return x == value ? 1.0 : 0.0; });
}

Value SafeArray::describe() const {
    Value out = Value::object();
    out["count"] = size();
    out["mean"] = mean();
    out["std"] = stddev();
    out["min"] = optionalToValue(min());
    out["25%"] = optionalToValue(percentile(25));
    out["50%"] = optionalToValue(percentile(50));
    out["75%"] = optionalToValue(percentile(75));
    out["max"] = optionalToValue(max());
    return out;
}

Value SafeArray::toList() const {
    Value out = Value::array();
    for (double x : data()) out.push_back(x);
    return out;
}

std::string SafeArray::toString() const {
    std::ostringstream oss;
    oss << "SafeArray([";
    const auto& d = data();
    for (size_t i = 0; i < d.size(); i++) {
        if (i > 0) oss << ", ";
        oss << d[i];
    }
    oss << "])";
    return oss.str();
}

static void appendNumber(std::vector<double>& out, const Value& v) {
    if (!v.is_number()) {
        throw ValidationError(std::string("SafeArray values must be numbers, got ") + typeName(v));
    }
    out.push_back(toDouble(v));
}

SafeArray array(const Value& data) {
    if (!data.is_array()) {
        throw ValidationError(std::string("array() expects a list, got ") + typeName(data));
    }
    std::vector<double> out;
    bool nested = !data.empty() && data[0].is_array();
    for (const auto& item : data) {
        if (nested) {
            if (!item.is_array()) {
                throw ValidationError("array() expects every row of a nested list to be a list");
            }
            for (const auto& inner : item) appendNumber(out, inner);
        } else {
            appendNumber(out, item);
        }
    }
    return SafeArray(std::move(out));
}

SafeArray zeros(int64_t n) {
    return SafeArray(std::vector<double>(n > 0 ? static_cast<size_t>(n) : 0, 0.0));
}

SafeArray ones(int64_t n) {
    return SafeArray(std::vector<double>(n > 0 ? static_cast<size_t>(n) : 0, 1.0));
}

SafeArray linspace(double start, double stop, int64_t num) {
    if (num <= 1) return SafeArray({start});
    std::vector<double> out;
    out.reserve(static_cast<size_t>(num));
    double step = (stop - start) / static_cast<double>(num - 1);
    for (int64_t i = 0; i < num; i++) {
        out.push_back(start + static_cast<double>(i) * step);
    }
    return SafeArray(std::move(out));
}

SafeArray arange(double start, double stop, double step) {
    std::vector<double> out;
    if (step == 0.0 || !std::isfinite(step)) return SafeArray(std::move(out));
    double current = start;
    if (step > 0) {
        while (current < stop) {
            out.push_back(current);
            current += step;
        }
    } else {
        while (current > stop) {
            out.push_back(current);
            current += step;
        }
    }
    return SafeArray(std::move(out));
}

}
}
