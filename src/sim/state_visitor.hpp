// src/sim/state_visitor.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sim {

/**
 * FieldVisitor - Type-erasing visitor that converts all numeric types to double
 *
 * Lets MicrogridState expose its fields to the CSV writer and the telemetry
 * client without field-by-field mapping.
 *
 * Usage:
 *   FieldVisitor v([](const char* name, double value) { ... });
 *   state.accept_fields(v);
 */
class FieldVisitor {
public:
    using Callback = std::function<void(const char*, double)>;

    explicit FieldVisitor(Callback cb) : callback_(std::move(cb)) {}

    void visit(const char* name, double value) { callback_(name, value); }
    void visit(const char* name, int value) { callback_(name, static_cast<double>(value)); }
    void visit(const char* name, uint32_t value) { callback_(name, static_cast<double>(value)); }
    void visit(const char* name, bool value) { callback_(name, value ? 1.0 : 0.0); }

private:
    Callback callback_;
};

/**
 * Lambda-based visitor - allows direct lambda usage
 */
template<typename Lambda>
class LambdaVisitor {
public:
    explicit LambdaVisitor(Lambda&& lambda) : lambda_(std::forward<Lambda>(lambda)) {}

    template<typename T>
    void visit(const char* name, T value) {
        lambda_(name, static_cast<double>(value));
    }

private:
    Lambda lambda_;
};

template<typename Lambda>
LambdaVisitor<Lambda> make_visitor(Lambda&& lambda) {
    return LambdaVisitor<Lambda>(std::forward<Lambda>(lambda));
}

// Field names of any type with accept_fields(), in visiting order.
template<typename State>
std::vector<std::string> field_names(const State& s) {
    std::vector<std::string> names;
    auto v = make_visitor([&](const char* name, double) { names.emplace_back(name); });
    s.accept_fields(v);
    return names;
}

template<typename State>
std::vector<double> field_values(const State& s) {
    std::vector<double> values;
    auto v = make_visitor([&](const char*, double value) { values.push_back(value); });
    s.accept_fields(v);
    return values;
}

} // namespace sim
