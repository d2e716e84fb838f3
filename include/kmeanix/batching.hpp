#ifndef KMEANIX_BATCHING_HPP
#define KMEANIX_BATCHING_HPP

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>

namespace kmeanix {

struct Batch {
    size_t offset;
    size_t size;
};

/**
 * Range of consecutive [offset, offset + size) chunks covering [0, total),
 * each at most `batch` long. The last chunk may be shorter.
 *
 *   for (Batch b : RowBatches(n, bs)) { ... }
 */
class RowBatches {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Batch;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Batch*;
        using reference         = Batch;

        iterator() = default;
        iterator(size_t pos, size_t total, size_t batch)
            : pos_(pos), total_(total), batch_(batch) {}

        Batch operator*() const { return {pos_, std::min(batch_, total_ - pos_)}; }

        iterator& operator++() {
            pos_ = std::min(total_, pos_ + batch_);
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const iterator& o) const { return pos_ == o.pos_; }
        bool operator!=(const iterator& o) const { return pos_ != o.pos_; }

    private:
        size_t pos_ = 0;
        size_t total_ = 0;
        size_t batch_ = 1;
    };

    RowBatches(size_t total, size_t batch) : total_(total), batch_(batch) {
        if (batch_ == 0)
            throw std::invalid_argument("RowBatches: batch size must be > 0");
    }

    iterator begin() const { return iterator(0, total_, batch_); }
    iterator end() const { return iterator(total_, total_, batch_); }

    size_t count() const { return (total_ + batch_ - 1) / batch_; }
    size_t max_batch() const { return std::min(batch_, total_); }

private:
    size_t total_;
    size_t batch_;
};

}  // namespace kmeanix

#endif  // KMEANIX_BATCHING_HPP
