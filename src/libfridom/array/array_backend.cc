/**
 * @file   array/array_backend.cc
 *
 * @author FRIDOM developers
 *
 * @date   05 Sep 2024
 *
 * @brief  Array backend strategy selected once at startup
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

#include "array/array_backend.hh"
#include "core/exception.hh"

#include <sstream>

namespace fridom {

    namespace {
        /**
         * Splits a column-major shape at `axis` into the number of points
         * before the axis (contiguous), on the axis and after the axis.
         */
        struct AxisLayout {
            Index_t inner;
            Index_t n;
            Index_t outer;
        };

        AxisLayout get_axis_layout(const DynGridIndex & shape, Dim_t axis) {
            if (axis < 0 or axis >= shape.get_dim()) {
                std::stringstream error{};
                error << "Axis " << axis << " is out of range for an array of "
                      << "shape " << shape << ".";
                throw RuntimeError(error.str());
            }
            AxisLayout layout{1, shape[axis], 1};
            for (Dim_t i{0}; i < axis; ++i) {
                layout.inner *= shape[i];
            }
            for (Dim_t i{axis + 1}; i < shape.get_dim(); ++i) {
                layout.outer *= shape[i];
            }
            return layout;
        }

        template <typename T>
        void apply_matrix(Array<T> & array, Dim_t axis,
                          const Eigen::MatrixXd & matrix) {
            using Matrix_t = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
            const auto layout{get_axis_layout(array.get_shape(), axis)};
            if (matrix.rows() != layout.n or matrix.cols() != layout.n) {
                std::stringstream error{};
                error << "A " << matrix.rows() << "x" << matrix.cols()
                      << " matrix cannot be applied along axis " << axis
                      << " with " << layout.n << " points.";
                throw RuntimeError(error.str());
            }
            const Matrix_t weights{matrix.transpose().cast<T>()};
            for (Index_t o{0}; o < layout.outer; ++o) {
                // every row of the block is one lane along `axis`
                Eigen::Map<Matrix_t> block(
                    array.data() + o * layout.inner * layout.n, layout.inner,
                    layout.n);
                block = block * weights;
            }
        }
    }  // namespace

    /* ---------------------------------------------------------------------- */
    HostArrayBackend::HostArrayBackend()
        : fft_backend{get_host_fft_backend()} {}

    /* ---------------------------------------------------------------------- */
    Array<Real>
    HostArrayBackend::zeros_real(const DynGridIndex & shape) const {
        return Array<Real>(shape, 0.);
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex>
    HostArrayBackend::zeros_complex(const DynGridIndex & shape) const {
        return Array<Complex>(shape, Complex{0., 0.});
    }

    /* ---------------------------------------------------------------------- */
    void HostArrayBackend::c2c(Array<Complex> & array, Dim_t axis,
                               FFTDirection direction) const {
        const auto layout{get_axis_layout(array.get_shape(), axis)};
        for (Index_t o{0}; o < layout.outer; ++o) {
            Complex * lanes{array.data() + o * layout.inner * layout.n};
            if (direction == FFTDirection::Forward) {
                this->fft_backend->c2c_forward(layout.n, layout.inner, lanes,
                                               layout.inner, 1, lanes,
                                               layout.inner, 1);
            } else {
                this->fft_backend->c2c_backward(layout.n, layout.inner, lanes,
                                                layout.inner, 1, lanes,
                                                layout.inner, 1);
            }
        }
    }

    /* ---------------------------------------------------------------------- */
    void HostArrayBackend::apply_along_axis(
        Array<Real> & array, Dim_t axis, const Eigen::MatrixXd & matrix) const {
        apply_matrix(array, axis, matrix);
    }

    /* ---------------------------------------------------------------------- */
    void HostArrayBackend::apply_along_axis(
        Array<Complex> & array, Dim_t axis,
        const Eigen::MatrixXd & matrix) const {
        apply_matrix(array, axis, matrix);
    }

    /* ---------------------------------------------------------------------- */
    void HostArrayBackend::scale(Array<Complex> & array, Real factor) const {
        for (auto && value : array.get_values()) {
            value *= factor;
        }
    }

    /* ---------------------------------------------------------------------- */
    std::shared_ptr<ArrayBackend>
    make_array_backend(const std::string & name) {
        if (name == "host" or name == "numpy") {
            return std::make_shared<HostArrayBackend>();
        }
        std::stringstream error{};
        error << "Unknown array backend '" << name
              << "'. This build provides the backends: host (alias numpy).";
        throw ConfigurationError(error.str());
    }

    /* ---------------------------------------------------------------------- */
    std::shared_ptr<ArrayBackend> default_array_backend() {
        static std::shared_ptr<ArrayBackend> backend{
            std::make_shared<HostArrayBackend>()};
        return backend;
    }

}  // namespace fridom
