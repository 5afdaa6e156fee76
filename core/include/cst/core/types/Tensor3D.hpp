#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cst
{

/**
 * @brief Dense 3D array with row-major (C) memory layout.
 *
 * Memory layout: last index varies fastest.
 * Index calculation: i * shape[1] * shape[2] + j * shape[2] + k
 *
 * For label volumes in the volume frame the dimensions are [z, y, x].
 *
 * @tparam T Element type; only the label type is instantiated
 */
template <typename T>
class Tensor3D
{
public:
    using value_type = T;
    using size_type = std::size_t;
    using shape_type = std::array<size_type, 3>;

    /** @brief Default constructor - creates empty tensor */
    Tensor3D() = default;

    /**
     * @brief Construct zero-initialised tensor with given shape
     * @param d0 Size of first dimension
     * @param d1 Size of second dimension
     * @param d2 Size of third dimension
     */
    Tensor3D(size_type d0, size_type d1, size_type d2);

    /**
     * @brief Construct tensor with given shape, filled with value
     * @param fill Value to fill the tensor with
     */
    Tensor3D(size_type d0, size_type d1, size_type d2, T fill);

    explicit Tensor3D(const shape_type& shape);

    Tensor3D(const shape_type& shape, T fill);

    Tensor3D(const Tensor3D& other) = default;
    Tensor3D(Tensor3D&& other) noexcept = default;
    Tensor3D& operator=(const Tensor3D& other) = default;
    Tensor3D& operator=(Tensor3D&& other) noexcept = default;
    ~Tensor3D() = default;

    T& operator()(size_type i, size_type j, size_type k)
    {
        return data_[linearIndex(i, j, k)];
    }

    const T& operator()(size_type i, size_type j, size_type k) const
    {
        return data_[linearIndex(i, j, k)];
    }

    T* data() noexcept { return data_.data(); }
    const T* data() const noexcept { return data_.data(); }

    const shape_type& shape() const noexcept { return shape_; }

    size_type size() const noexcept
    {
        return shape_[0] * shape_[1] * shape_[2];
    }

    size_type nbytes() const noexcept { return size() * sizeof(T); }

    /** @brief Largest element, 0 for an empty tensor */
    T max() const noexcept;

    bool operator==(const Tensor3D& other) const
    {
        return shape_ == other.shape_ && data_ == other.data_;
    }

    bool operator!=(const Tensor3D& other) const { return !(*this == other); }

private:
    std::vector<T> data_;
    shape_type shape_{0, 0, 0};
    size_type stride0_{0};  // shape_[1] * shape_[2]
    size_type stride1_{0};  // shape_[2]

    void updateStrides() noexcept
    {
        stride0_ = shape_[1] * shape_[2];
        stride1_ = shape_[2];
    }

    size_type linearIndex(size_type i, size_type j, size_type k) const noexcept
    {
        return i * stride0_ + j * stride1_ + k;
    }
};

extern template class Tensor3D<std::uint32_t>;

}  // namespace cst
