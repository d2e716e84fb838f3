#ifndef KMEANIX_MATRIX_HPP
#define KMEANIX_MATRIX_HPP

#include "kmeanix/common.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace kmeanix {

/**
 * Non-owning view of a dense row-major matrix: data[i * cols + j] is the
 * j-th feature of the i-th row. The caller keeps the storage alive for the
 * duration of every call that receives the view.
 */
template <typename T>
struct MatrixView {
    const T* data = nullptr;
    size_t rows = 0;
    size_t cols = 0;

    MatrixView() = default;
    MatrixView(const T* d, size_t r, size_t c) : data(d), rows(r), cols(c) {}

    const T* row(size_t i) const { return data + i * cols; }
    size_t size() const { return rows * cols; }
    bool empty() const { return rows == 0 || cols == 0; }

    // Rows [offset, offset + count) as a view of their own.
    MatrixView slice(size_t offset, size_t count) const {
        return MatrixView(data + offset * cols, count, cols);
    }
};

// Owning row-major matrix.
template <typename T>
class Matrix {
public:
    Matrix() = default;
    Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols) {}
    Matrix(size_t rows, size_t cols, std::vector<T> values)
        : rows_(rows), cols_(cols), data_(std::move(values)) {}

    static Matrix copy_of(MatrixView<T> v) {
        return Matrix(v.rows, v.cols, std::vector<T>(v.data, v.data + v.size()));
    }

    T*       data()       { return data_.data(); }
    const T* data() const { return data_.data(); }
    T*       row(size_t i)       { return data_.data() + i * cols_; }
    const T* row(size_t i) const { return data_.data() + i * cols_; }

    T&       operator()(size_t i, size_t j)       { return data_[i * cols_ + j]; }
    const T& operator()(size_t i, size_t j) const { return data_[i * cols_ + j]; }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    MatrixView<T> view() const { return MatrixView<T>(data_.data(), rows_, cols_); }

    const std::vector<T>& values() const { return data_; }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
};

}  // namespace kmeanix

#endif  // KMEANIX_MATRIX_HPP
