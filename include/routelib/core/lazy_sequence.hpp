#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace routelib::core {

    /**
     * @brief Finite, restartable lazy sequence
     *
     * Wraps a factory of generators. Every call to begin() asks the factory
     * for a fresh generator, so the same sequence can be traversed any number
     * of times. A generator returns std::nullopt once it is exhausted.
     */
    template <class T>
    class LazySequence {
        public:
            using value_type = T;
            using Generator = std::function<std::optional<T>()>;
            using Factory = std::function<Generator()>;

            class iterator {
                public:
                    using iterator_category = std::input_iterator_tag;
                    using value_type = T;
                    using difference_type = std::ptrdiff_t;
                    using pointer = const T*;
                    using reference = const T&;

                    iterator() = default;

                    explicit iterator(Generator gen) : gen_(std::move(gen)) {
                        advance();
                    }

                    reference operator*() const { return *current_; }
                    pointer operator->() const { return &*current_; }

                    iterator& operator++() {
                        advance();
                        return *this;
                    }

                    void operator++(int) { advance(); }

                    friend bool operator==(const iterator& it, std::default_sentinel_t) {
                        return !it.current_.has_value();
                    }

                private:
                    void advance() {
                        current_ = gen_ ? gen_() : std::nullopt;
                    }

                    Generator gen_;
                    std::optional<T> current_;
            };

            LazySequence() : factory_([] { return Generator([]() -> std::optional<T> { return std::nullopt; }); }) {}

            explicit LazySequence(Factory factory) : factory_(std::move(factory)) {}

            iterator begin() const { return iterator(factory_()); }
            std::default_sentinel_t end() const { return std::default_sentinel; }

            // first element of a fresh traversal
            std::optional<T> first() const {
                return factory_()();
            }

            std::vector<T> collect() const {
                std::vector<T> out;
                for (const T& value : *this)
                    out.push_back(value);
                return out;
            }

            bool empty() const { return !first().has_value(); }

        private:
            Factory factory_;
    };

    /**
     * Method: FromVector
     * Description: sequence over a snapshot of values (copied once, replayed on every traversal)
     */
    template <class T>
    LazySequence<T> FromVector(std::vector<T> values)
    {
        auto shared = std::make_shared<const std::vector<T>>(std::move(values));
        return LazySequence<T>([shared] {
            std::size_t pos = 0;
            return typename LazySequence<T>::Generator([shared, pos]() mutable -> std::optional<T> {
                if (pos >= shared->size()) return std::nullopt;
                return (*shared)[pos++];
            });
        });
    }

} // namespace routelib::core
