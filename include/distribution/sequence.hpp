// ____________________________________ LICENSE ____________________________________
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Lazy, forward-only, single-pass sequence of samples. Values are produced on
// demand by a generating function, so a sequence of 10^9 samples costs nothing
// until it is iterated. Sequences that draw from a 'random_generator' hold a
// reference to it, the generator must outlive them.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>


namespace rdist {

template <class T>
class sequence {
public:
    using value_type = T;

    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type       = T;
        using difference_type  = std::ptrdiff_t;

        iterator() = default;
        explicit iterator(sequence* parent) : parent(parent), current(parent->next()) {}

        [[nodiscard]] const T& operator*() const { return *this->current; }

        iterator& operator++() {
            this->current = this->parent->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        [[nodiscard]] friend bool operator==(const iterator& it, std::default_sentinel_t) { return !it.current; }

    private:
        sequence*        parent = nullptr;
        std::optional<T> current;
    };

    // Negative counts produce an empty sequence
    sequence(std::ptrdiff_t count, std::function<T()> generate)
        : remaining(count > 0 ? static_cast<std::size_t>(count) : 0), generate(std::move(generate)) {}

    sequence(const sequence&)            = delete;
    sequence& operator=(const sequence&) = delete;
    sequence(sequence&&)                 = default;
    sequence& operator=(sequence&&)      = default;

    [[nodiscard]] std::optional<T> next() {
        if (!this->remaining) return std::nullopt;
        --this->remaining;
        return this->generate();
    }

    [[nodiscard]] std::size_t size() const noexcept { return this->remaining; } // values left

    // Drains the rest of the sequence
    [[nodiscard]] std::vector<T> collect() {
        std::vector<T> values;
        values.reserve(this->remaining);
        while (auto value = this->next()) values.push_back(std::move(*value));
        return values;
    }

    [[nodiscard]] iterator                begin() { return iterator{this}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

private:
    std::size_t        remaining = 0;
    std::function<T()> generate;
};

template <class T>
[[nodiscard]] sequence<T> constant_sequence(std::ptrdiff_t count, T value) {
    return sequence<T>(count, [value] { return value; });
}

// Lazily maps every value, the source sequence is moved inside
template <class T, class Func, class R = std::invoke_result_t<Func&, T>>
[[nodiscard]] sequence<R> transform(sequence<T> source, Func func) {
    const auto count = static_cast<std::ptrdiff_t>(source.size());
    auto       state = std::make_shared<sequence<T>>(std::move(source));

    return sequence<R>(count, [state, func]() mutable { return func(*state->next()); });
}

} // namespace rdist
