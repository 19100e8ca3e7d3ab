/**
 * @file   array/array_backend.hh
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

#ifndef SRC_LIBFRIDOM_ARRAY_ARRAY_BACKEND_HH_
#define SRC_LIBFRIDOM_ARRAY_ARRAY_BACKEND_HH_

#include "array/ndarray.hh"
#include "core/enums.hh"
#include "fft/fft_1d_backend.hh"

#include "Eigen/Dense"

#include <memory>
#include <string>

namespace fridom {

    /**
     * @class ArrayBackend
     * @brief Strategy that allocates arrays and runs the numerical kernels
     * on the memory space they live in.
     *
     * One backend is created from the model settings with
     * `make_array_backend` and handed to every component that allocates or
     * transforms arrays. No component looks a backend up from global state.
     */
    class ArrayBackend {
       public:
        virtual ~ArrayBackend() = default;

        virtual const char * name() const = 0;

        //! waits until all pending kernels on the backend have finished
        virtual void synchronize() const = 0;

        virtual Array<Real> zeros_real(const DynGridIndex & shape) const = 0;
        virtual Array<Complex>
        zeros_complex(const DynGridIndex & shape) const = 0;

        //! zero-initialised array of `shape`
        template <typename T>
        Array<T> zeros(const DynGridIndex & shape) const;

        /**
         * Unnormalised complex FFT along one axis, in place. The backward
         * direction is not divided by the number of points.
         */
        virtual void c2c(Array<Complex> & array, Dim_t axis,
                         FFTDirection direction) const = 0;

        /**
         * Replaces every lane `x` of `array` along `axis` by `matrix * x`.
         * The matrix must be square with the extent of the axis.
         */
        virtual void apply_along_axis(Array<Real> & array, Dim_t axis,
                                      const Eigen::MatrixXd & matrix) const = 0;
        virtual void apply_along_axis(Array<Complex> & array, Dim_t axis,
                                      const Eigen::MatrixXd & matrix) const = 0;

        //! multiplies every entry by `factor`
        virtual void scale(Array<Complex> & array, Real factor) const = 0;
    };

    template <>
    inline Array<Real>
    ArrayBackend::zeros<Real>(const DynGridIndex & shape) const {
        return this->zeros_real(shape);
    }

    template <>
    inline Array<Complex>
    ArrayBackend::zeros<Complex>(const DynGridIndex & shape) const {
        return this->zeros_complex(shape);
    }

    /**
     * @class HostArrayBackend
     * @brief Array backend on host memory: pocketfft for the FFTs and Eigen
     * for the dense lane transforms.
     */
    class HostArrayBackend : public ArrayBackend {
       public:
        HostArrayBackend();
        ~HostArrayBackend() override = default;

        const char * name() const override { return "host"; }

        //! nothing to wait for on the host
        void synchronize() const override {}

        Array<Real> zeros_real(const DynGridIndex & shape) const override;
        Array<Complex>
        zeros_complex(const DynGridIndex & shape) const override;

        void c2c(Array<Complex> & array, Dim_t axis,
                 FFTDirection direction) const override;

        void apply_along_axis(Array<Real> & array, Dim_t axis,
                              const Eigen::MatrixXd & matrix) const override;
        void apply_along_axis(Array<Complex> & array, Dim_t axis,
                              const Eigen::MatrixXd & matrix) const override;

        void scale(Array<Complex> & array, Real factor) const override;

       protected:
        std::unique_ptr<FFT1DBackend> fft_backend;
    };

    /**
     * @brief Creates the array backend named `name`.
     *
     * `"host"` (and its alias `"numpy"`) select the HostArrayBackend.
     *
     * @throws ConfigurationError for any other name, in particular for the
     * device backends, which this build does not provide.
     */
    std::shared_ptr<ArrayBackend> make_array_backend(const std::string & name);

    //! the host backend shared by components that are not given one
    std::shared_ptr<ArrayBackend> default_array_backend();

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_ARRAY_ARRAY_BACKEND_HH_
