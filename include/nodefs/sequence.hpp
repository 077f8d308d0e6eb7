#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace nodefs {

// Lazy, single-pass sequence driven by a generator
// The generator yields one value per call and an empty optional at the end.
// Each call to a producing operation (children(), recurse(), read_blocks())
// builds a fresh sequence, so restarting means calling the operation again;
// a given Sequence object is consumed as it is iterated.
//
//   for (const auto& node : folder.children()) { ... }
template <typename T>
class Sequence {
public:
    using Generator = std::function<std::optional<T>()>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() : owner_(nullptr) {}
        explicit iterator(Sequence* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return owner_ == other.owner_; }
        bool operator!=(const iterator& other) const { return owner_ != other.owner_; }

    private:
        void advance() {
            if (!owner_) return;
            current_ = owner_->next();
            if (!current_) {
                owner_ = nullptr;
            }
        }

        Sequence* owner_;
        std::optional<T> current_;
    };

    Sequence() : generator_([]() { return std::optional<T>(); }) {}
    explicit Sequence(Generator generator) : generator_(std::move(generator)) {}

    static Sequence from_vector(std::vector<T> values) {
        auto shared = std::make_shared<std::vector<T>>(std::move(values));
        auto index = std::make_shared<size_t>(0);
        return Sequence([shared, index]() -> std::optional<T> {
            if (*index >= shared->size()) {
                return std::nullopt;
            }
            return (*shared)[(*index)++];
        });
    }

    // Pull the next value; empty once the sequence is exhausted
    std::optional<T> next() {
        if (done_) {
            return std::nullopt;
        }
        auto value = generator_();
        if (!value) {
            done_ = true;
            generator_ = nullptr;  // release captured resources (open streams, cursors)
        }
        return value;
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // Drain the remaining values into a vector
    std::vector<T> to_vector() {
        std::vector<T> values;
        while (auto value = next()) {
            values.push_back(std::move(*value));
        }
        return values;
    }

private:
    Generator generator_;
    bool done_ = false;
};

} // namespace nodefs
