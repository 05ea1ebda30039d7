#pragma once

#include "engine/value.h"
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <initializer_list>
#include <cstdint>
#include <string>

namespace quantbox {
namespace engine {

// One-dimensional numeric vector. Storage is shared between copies and never
// mutated; every transform allocates a new backing vector.
class SafeArray {
public:
    SafeArray();
    explicit SafeArray(std::vector<double> data);
    SafeArray(std::initializer_list<double> data);

    size_t size() const;
    bool empty() const;
    const std::vector<double>& data() const;

    // Negative indices count from the end; out of range throws std::out_of_range.
    double at(int64_t index) const;
    double operator[](size_t index) const;

    double mean() const;
    double sum() const;
    std::optional<double> min() const;
    std::optional<double> max() const;
    double median() const;

    double stddev(int ddof = 0) const;
    double var(int ddof = 0) const;

    std::optional<double> percentile(double p) const;
    std::optional<double> quartile(int q) const;

    SafeArray filter(const std::function<bool(double)>& pred) const;
    SafeArray map(const std::function<double(double)>& fn) const;
    SafeArray sort(bool reverse = false) const;

    SafeArray cumsum() const;
    SafeArray cumprod() const;

    SafeArray greaterThan(double value) const;
    SafeArray lessThan(double value) const;
    SafeArray equal(double value) const;

    Value describe() const;
    Value toList() const;
    std::string toString() const;

private:
    std::shared_ptr<const std::vector<double>> data_;
};

// Builds an array from a JSON number list; a list of lists is flattened one level.
SafeArray array(const Value& data);
SafeArray zeros(int64_t n);
SafeArray ones(int64_t n);
SafeArray linspace(double start, double stop, int64_t num = 50);
SafeArray arange(double start, double stop, double step = 1.0);

}
}
