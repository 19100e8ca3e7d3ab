/**
 * @file   grid/capabilities.hh
 *
 * @author FRIDOM developers
 *
 * @date   26 Sep 2024
 *
 * @brief  Operation interfaces a grid can offer to physics modules
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

#ifndef SRC_LIBFRIDOM_GRID_CAPABILITIES_HH_
#define SRC_LIBFRIDOM_GRID_CAPABILITIES_HH_

#include "array/ndarray.hh"
#include "core/enums.hh"
#include "decomposition/subdomain.hh"
#include "grid/position.hh"

#include <vector>

namespace fridom {

    /**
     * @class Syncable
     * @brief Fills the halo of local arrays from the neighbouring subdomains.
     */
    class Syncable {
       public:
        virtual ~Syncable() = default;

        virtual void sync(Array<Real> & arr) const = 0;
        virtual void sync(Array<Complex> & arr) const = 0;

        //! synchronises several arrays in one batch of messages
        virtual void sync_multi(const std::vector<Array<Real> *> & arrs)
            const = 0;
        virtual void sync_multi(const std::vector<Array<Complex> *> & arrs)
            const = 0;
    };

    /**
     * @class SpectrallyTransformable
     * @brief Transforms local arrays between physical space and spectral
     * space. `transform_types` selects the transform of every non-periodic
     * axis, an empty list selects DCT-II on all of them.
     */
    class SpectrallyTransformable {
       public:
        virtual ~SpectrallyTransformable() = default;

        virtual Array<Complex>
        fft(const Array<Real> & arr,
            const std::vector<TransformType> & transform_types = {}) const = 0;
        virtual Array<Complex>
        fft(const Array<Complex> & arr,
            const std::vector<TransformType> & transform_types = {}) const = 0;

        virtual Array<Complex>
        ifft(const Array<Complex> & arr,
             const std::vector<TransformType> & transform_types = {}) const = 0;

        //! local subdomain of the physical or of the spectral decomposition
        virtual const Subdomain & get_subdomain(bool spectral = false)
            const = 0;

        //! wavenumber meshes on the local spectral subdomain, one per axis
        virtual const std::vector<Array<Real>> & get_K() const = 0;

        //! per axis periodicity, bounded axes use cosine or sine transforms
        virtual const std::vector<bool> & get_periodic_bounds() const = 0;
    };

    /**
     * @class Differentiable
     * @brief Discrete differential operators on local arrays. An empty list
     * of axes stands for all axes.
     */
    class Differentiable {
       public:
        virtual ~Differentiable() = default;

        //! first derivative along `axis`
        virtual Array<Real> diff(const Array<Real> & arr, Dim_t axis,
                                 DiffType type = DiffType::Centered) const = 0;

        //! forward derivatives, one per entry of `axes`
        virtual std::vector<Array<Real>>
        grad(const Array<Real> & arr, const AxisList & axes = {}) const = 0;

        //! sum of the backward derivatives of `arrs[axis]` along `axis`
        virtual Array<Real> div(const std::vector<Array<Real>> & arrs,
                                const AxisList & axes = {}) const = 0;

        virtual Array<Real> laplacian(const Array<Real> & arr,
                                      const AxisList & axes = {}) const = 0;
    };

    /**
     * @class Interpolatable
     * @brief Moves local arrays between staggered positions.
     */
    class Interpolatable {
       public:
        virtual ~Interpolatable() = default;

        virtual Array<Real> interpolate(const Array<Real> & arr,
                                        const Position & origin,
                                        const Position & destination) const = 0;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_CAPABILITIES_HH_
