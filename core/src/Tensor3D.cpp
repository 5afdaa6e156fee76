#include "cst/core/types/Tensor3D.hpp"

#include <algorithm>

namespace cst
{

template <typename T>
Tensor3D<T>::Tensor3D(size_type d0, size_type d1, size_type d2)
    : data_(d0 * d1 * d2, T{0}), shape_{d0, d1, d2}
{
    updateStrides();
}

template <typename T>
Tensor3D<T>::Tensor3D(size_type d0, size_type d1, size_type d2, T fill)
    : data_(d0 * d1 * d2, fill), shape_{d0, d1, d2}
{
    updateStrides();
}

template <typename T>
Tensor3D<T>::Tensor3D(const shape_type& shape)
    : data_(shape[0] * shape[1] * shape[2], T{0}), shape_(shape)
{
    updateStrides();
}

template <typename T>
Tensor3D<T>::Tensor3D(const shape_type& shape, T fill)
    : data_(shape[0] * shape[1] * shape[2], fill), shape_(shape)
{
    updateStrides();
}

template <typename T>
T Tensor3D<T>::max() const noexcept
{
    if (data_.empty()) {
        return T{0};
    }
    return *std::max_element(data_.begin(), data_.end());
}

template class Tensor3D<std::uint32_t>;

}  // namespace cst
