/**
 * @file   grid/finite_differences.cc
 *
 * @author FRIDOM developers
 *
 * @date   27 Sep 2024
 *
 * @brief  Second order finite differences on staggered Cartesian grids
 *
 * Copyright © 2024 FRIDOM developers
 *
 * FRIDOM is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License as
 * published by the Free Software Foundation, either version 3, or (at
 * your option) any later version.
 *
 * FRIDOM is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with FRIDOM; see the file COPYING. If not, write to the
 * Free Software Foundation, Inc., 59 Temple Place - Suite 330,
 * Boston, MA 02111-1307, USA.
 *
 * Additional permission under GNU GPL version 3 section 7
 *
 * If you modify this Program, or any covered work, by linking or combining it
 * with proprietary FFT implementations or numerical libraries, containing parts
 * covered by the terms of those libraries' licenses, the licensors of this
 * Program grant you additional permission to convey the resulting work.
 *
 */

#include "grid/finite_differences.hh"

#include <numeric>
#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    FiniteDifferences::FiniteDifferences()
        : DiffModule{"Finite Differences", 1} {}

    /* ---------------------------------------------------------------------- */
    void FiniteDifferences::set_grid_spacing(const DynGridPoint & dx) {
        DynGridPoint dx1(dx.get_dim());
        for (Dim_t i{0}; i < dx.get_dim(); ++i) {
            if (!(dx[i] > 0.)) {
                std::stringstream error{};
                error << "The grid spacing in the direction " << i
                      << " must be positive, but is " << dx[i] << ".";
                throw ConfigurationError(error.str());
            }
            dx1[i] = 1. / dx[i];
        }
        this->dx1 = dx1;
    }

    /* ---------------------------------------------------------------------- */
    void FiniteDifferences::initialise(const ModelSettings & /*settings*/) {
        if (this->dx1.get_dim() == 0) {
            throw ConfigurationError(
                "Finite differences need the grid spacing before the setup.");
        }
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> FiniteDifferences::diff(const Array<Real> & arr, Dim_t axis,
                                        DiffType type) const {
        switch (type) {
        case DiffType::Forward: {
            return this->diff_forward(arr, axis);
        }
        case DiffType::Backward: {
            return this->diff_backward(arr, axis);
        }
        case DiffType::Centered: {
            return this->diff_centered(arr, axis);
        }
        default:
            throw RuntimeError("unknown difference type");
            break;
        }
    }

    /* ---------------------------------------------------------------------- */
    std::vector<Array<Real>>
    FiniteDifferences::grad(const Array<Real> & arr,
                            const AxisList & axes) const {
        std::vector<Array<Real>> retval{};
        for (auto && axis : this->complete_axes(arr, axes)) {
            retval.push_back(this->diff_forward(arr, axis));
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> FiniteDifferences::div(const std::vector<Array<Real>> & arrs,
                                       const AxisList & axes) const {
        if (arrs.empty() or Dim_t(arrs.size()) != arrs.front().get_dim()) {
            std::stringstream error{};
            error << "The divergence needs one component per axis, but "
                  << arrs.size() << " components were given.";
            throw RuntimeError(error.str());
        }
        Array<Real> retval(arrs.front().get_shape());
        for (auto && axis : this->complete_axes(arrs.front(), axes)) {
            retval += this->diff_backward(arrs[axis], axis);
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> FiniteDifferences::laplacian(const Array<Real> & arr,
                                             const AxisList & axes) const {
        Array<Real> retval(arr.get_shape());
        for (auto && axis : this->complete_axes(arr, axes)) {
            retval += this->diff_forward(this->diff_backward(arr, axis), axis);
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    std::vector<Array<Real>>
    FiniteDifferences::curl(const std::vector<Array<Real>> & arrs) const {
        const Dim_t dim{arrs.empty() ? 0 : arrs.front().get_dim()};
        if (Dim_t(arrs.size()) != dim or (dim != twoD and dim != threeD)) {
            std::stringstream error{};
            error << "The curl is only implemented for two- and "
                  << "three-dimensional vector fields, but " << arrs.size()
                  << " components of a " << dim
                  << "-dimensional field were given.";
            throw RuntimeError(error.str());
        }
        std::vector<Array<Real>> retval{};
        if (dim == twoD) {
            retval.push_back(this->diff_forward(arrs[1], 0));
            retval.back() -= this->diff_forward(arrs[0], 1);
            return retval;
        }
        for (Dim_t i{0}; i < threeD; ++i) {
            const Dim_t j{(i + 1) % threeD};
            const Dim_t k{(i + 2) % threeD};
            retval.push_back(this->diff_forward(arrs[k], j));
            retval.back() -= this->diff_forward(arrs[j], k);
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> FiniteDifferences::diff_forward(const Array<Real> & arr,
                                                Dim_t axis) const {
        this->check_axis(arr, axis);
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        const Real factor{this->dx1[axis]};
        for_each_index(axis_region(arr.get_shape(), axis, 0, 1),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord)};
                           retval[i] = (arr[i + stride] - arr[i]) * factor;
                       });
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> FiniteDifferences::diff_backward(const Array<Real> & arr,
                                                 Dim_t axis) const {
        this->check_axis(arr, axis);
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        const Real factor{this->dx1[axis]};
        for_each_index(axis_region(arr.get_shape(), axis, 1, 0),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord)};
                           retval[i] = (arr[i] - arr[i - stride]) * factor;
                       });
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> FiniteDifferences::diff_centered(const Array<Real> & arr,
                                                 Dim_t axis) const {
        this->check_axis(arr, axis);
        Array<Real> retval(arr.get_shape());
        const Index_t stride{arr.get_strides()[axis]};
        const Real factor{0.5 * this->dx1[axis]};
        for_each_index(axis_region(arr.get_shape(), axis, 1, 1),
                       [&](const DynGridIndex & ccoord) {
                           const auto i{arr.offset(ccoord)};
                           retval[i] =
                               (arr[i + stride] - arr[i - stride]) * factor;
                       });
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    void FiniteDifferences::check_axis(const Array<Real> & arr,
                                       Dim_t axis) const {
        this->check_configured("differentiate with");
        if (axis < 0 or axis >= arr.get_dim() or
            axis >= this->dx1.get_dim()) {
            std::stringstream error{};
            error << "Cannot differentiate a " << arr.get_dim()
                  << "-dimensional array along the axis " << axis
                  << " of a " << this->dx1.get_dim() << "-dimensional grid.";
            throw RuntimeError(error.str());
        }
    }

    /* ---------------------------------------------------------------------- */
    AxisList FiniteDifferences::complete_axes(const Array<Real> & arr,
                                              const AxisList & axes) const {
        if (!axes.empty()) {
            return axes;
        }
        AxisList retval(arr.get_dim());
        std::iota(retval.begin(), retval.end(), 0);
        return retval;
    }

}  // namespace fridom
