#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

/**
 * @file field2d.hpp
 * @brief Cache-friendly contiguous 2D float raster container.
 *
 * Provides row-major storage with `(row, col)` access.
 * Includes size checking for allocations and overflow-safe dimension math.
 * Used by grids, motion fields, pyramids, and scratch buffers.
 */

namespace nowcast
{

class Field2D
{
public:
    /**
     * @brief Constructs an empty field.
     */
    Field2D() : rows_(0), cols_(0) {}

    /**
     * @brief Constructs a zero-initialized field.
     * @param rows Row count (y dimension).
     * @param cols Column count (x dimension).
     */
    Field2D(int rows, int cols) : rows_(rows), cols_(cols)
    {
        data_.resize(checked_size(rows, cols), 0.0f);
    }

    /**
     * @brief Constructs a field initialized with a constant value.
     * @param rows Row count.
     * @param cols Column count.
     * @param init_value Fill value.
     */
    Field2D(int rows, int cols, float init_value) : rows_(rows), cols_(cols)
    {
        data_.resize(checked_size(rows, cols), init_value);
    }

    /**
     * @brief Constructs a field from a flat row-major buffer.
     * @param rows Row count.
     * @param cols Column count.
     * @param values Flat values, size must equal rows*cols.
     */
    Field2D(int rows, int cols, std::vector<float> values) : rows_(rows), cols_(cols)
    {
        if (values.size() != checked_size(rows, cols))
        {
            throw std::invalid_argument("Field2D flat buffer size does not match rows*cols");
        }
        data_ = std::move(values);
    }

    Field2D(const Field2D& other) = default;

    Field2D(Field2D&& other) noexcept
        : rows_(other.rows_), cols_(other.cols_), data_(std::move(other.data_))
    {
        other.rows_ = other.cols_ = 0;
    }

    Field2D& operator=(const Field2D& other) = default;

    Field2D& operator=(Field2D&& other) noexcept
    {
        if (this != &other)
        {
            rows_ = other.rows_;
            cols_ = other.cols_;
            data_ = std::move(other.data_);
            other.rows_ = other.cols_ = 0;
        }
        return *this;
    }

    /**
     * @brief Resizes and fills field storage with a constant value.
     * @param rows Row count.
     * @param cols Column count.
     * @param init_value Fill value.
     */
    void resize(int rows, int cols, float init_value = 0.0f)
    {
        const size_t new_size = checked_size(rows, cols);
        rows_ = rows;
        cols_ = cols;

        if (data_.size() != new_size)
        {
            data_.assign(new_size, init_value);
        }
        else
        {
            std::fill(data_.begin(), data_.end(), init_value);
        }
    }

    void fill(float value) { std::fill(data_.begin(), data_.end(), value); }

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    float* data() { return data_.data(); }
    const float* data() const { return data_.data(); }

    /**
     * @brief Returns the flat row-major storage.
     */
    const std::vector<float>& values() const { return data_; }

    /**
     * @brief Returns a mutable pointer to the start of one row.
     */
    float* row(int r) { return data_.data() + row_offset(r); }

    /**
     * @brief Returns a const pointer to the start of one row.
     */
    const float* row(int r) const { return data_.data() + row_offset(r); }

    float& operator()(int r, int c) { return data_[flatten_index(r, c)]; }
    float operator()(int r, int c) const { return data_[flatten_index(r, c)]; }

    /**
     * @brief Reports whether two fields have identical shape.
     */
    bool same_shape(const Field2D& other) const
    {
        return rows_ == other.rows_ && cols_ == other.cols_;
    }

    bool operator==(const Field2D& other) const
    {
        return same_shape(other) && data_ == other.data_;
    }

    bool operator!=(const Field2D& other) const { return !(*this == other); }

    /**
     * @brief Computes a bounds-checked element count for a raster shape.
     */
    static size_t checked_size(int rows, int cols)
    {
        if (rows < 0 || cols < 0)
        {
            throw std::invalid_argument("Field2D dimensions must be non-negative");
        }

        const size_t rows_sz = static_cast<size_t>(rows);
        const size_t cols_sz = static_cast<size_t>(cols);

        if (rows_sz != 0 && cols_sz > std::numeric_limits<size_t>::max() / rows_sz)
        {
            throw std::overflow_error("Field2D size overflow on rows*cols");
        }

        return rows_sz * cols_sz;
    }

private:
    size_t row_offset(int r) const
    {
        assert(r >= 0 && r < rows_);
        return static_cast<size_t>(r) * static_cast<size_t>(cols_);
    }

    size_t flatten_index(int r, int c) const
    {
        assert(c >= 0 && c < cols_);
        return row_offset(r) + static_cast<size_t>(c);
    }

    int rows_;
    int cols_;
    std::vector<float> data_;
};

} // namespace nowcast
