#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace confwire::binding {

/**
 * @brief Fixed-size array whose length is chosen at construction
 *
 * Unlike std::vector it cannot grow; it is the materialization target for
 * the array shape, sized to the number of configuration children.
 */
template <typename T>
class Array {
public:
    using value_type = T;
    using size_type = std::size_t;
    using iterator = T*;
    using const_iterator = const T*;

    Array() = default;

    explicit Array(size_type size)
        : data_(size > 0 ? std::make_unique<T[]>(size) : nullptr),
          size_(size) {}

    Array(std::initializer_list<T> values) : Array(values.size()) {
        std::copy(values.begin(), values.end(), begin());
    }

    Array(const Array& other) : Array(other.size_) {
        std::copy(other.begin(), other.end(), begin());
    }

    Array& operator=(const Array& other) {
        if (this != &other) {
            Array copy(other);
            swap(copy);
        }
        return *this;
    }

    Array(Array&& other) noexcept
        : data_(std::move(other.data_)), size_(other.size_) {
        other.size_ = 0;
    }

    Array& operator=(Array&& other) noexcept {
        data_ = std::move(other.data_);
        size_ = other.size_;
        other.size_ = 0;
        return *this;
    }

    size_type size() const { return size_; }
    bool empty() const { return size_ == 0; }

    T& operator[](size_type index) { return data_[index]; }
    const T& operator[](size_type index) const { return data_[index]; }

    T& at(size_type index) {
        check_index(index);
        return data_[index];
    }

    const T& at(size_type index) const {
        check_index(index);
        return data_[index];
    }

    T* data() { return data_.get(); }
    const T* data() const { return data_.get(); }

    iterator begin() { return data_.get(); }
    iterator end() { return data_.get() + size_; }
    const_iterator begin() const { return data_.get(); }
    const_iterator end() const { return data_.get() + size_; }

    void swap(Array& other) noexcept {
        std::swap(data_, other.data_);
        std::swap(size_, other.size_);
    }

    friend bool operator==(const Array& lhs, const Array& rhs) {
        return lhs.size_ == rhs.size_ &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin());
    }

    friend bool operator!=(const Array& lhs, const Array& rhs) {
        return !(lhs == rhs);
    }

private:
    void check_index(size_type index) const {
        if (index >= size_) {
            throw std::out_of_range("Array index " + std::to_string(index) +
                                    " out of range for size " +
                                    std::to_string(size_));
        }
    }

    std::unique_ptr<T[]> data_;
    size_type size_ = 0;
};

/**
 * @brief Immutable, cheaply copyable view over a shared sequence
 */
template <typename T>
class ReadOnlyList {
public:
    using value_type = T;
    using size_type = std::size_t;
    using const_iterator = typename std::vector<T>::const_iterator;

    ReadOnlyList() : items_(std::make_shared<const std::vector<T>>()) {}

    explicit ReadOnlyList(std::vector<T> items)
        : items_(std::make_shared<const std::vector<T>>(std::move(items))) {}

    size_type size() const { return items_->size(); }
    bool empty() const { return items_->empty(); }

    const T& operator[](size_type index) const { return (*items_)[index]; }
    const T& at(size_type index) const { return items_->at(index); }

    const_iterator begin() const { return items_->begin(); }
    const_iterator end() const { return items_->end(); }

    friend bool operator==(const ReadOnlyList& lhs, const ReadOnlyList& rhs) {
        return *lhs.items_ == *rhs.items_;
    }

    friend bool operator!=(const ReadOnlyList& lhs, const ReadOnlyList& rhs) {
        return !(lhs == rhs);
    }

private:
    std::shared_ptr<const std::vector<T>> items_;
};

template <typename T>
ReadOnlyList<T> as_read_only(Array<T> array) {
    std::vector<T> items;
    items.reserve(array.size());
    std::move(array.begin(), array.end(), std::back_inserter(items));
    return ReadOnlyList<T>(std::move(items));
}

}  // namespace confwire::binding
