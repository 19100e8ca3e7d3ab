/**
 * @file   decomposition/parallel_fft.hh
 *
 * @author FRIDOM developers
 *
 * @date   16 Sep 2024
 *
 * @brief  Distributed multi-dimensional FFT built from local FFTs and
 *         transposes
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

#ifndef SRC_LIBFRIDOM_DECOMPOSITION_PARALLEL_FFT_HH_
#define SRC_LIBFRIDOM_DECOMPOSITION_PARALLEL_FFT_HH_

#include "decomposition/transformer.hh"

#include <functional>
#include <memory>
#include <vector>

namespace fridom {

    /**
     * @class ParallelFFT
     * @brief Multi-dimensional spectral transform of an array distributed by
     * a DomainDecomposition.
     *
     * Local transforms can only be applied along axes that are not split
     * across processes. The class therefore builds a chain of
     * decompositions, each with a different set of shared axes, and
     * transposes the data along this chain (with `Transformer`) so that
     * every axis is shared at exactly one step of the chain, where it is
     * transformed locally.
     *
     * The chain starts at `domain_in` and ends at `domain_out`, a
     * decomposition whose shared axes are `shared_axes_out` (completed from
     * the input's shared axes and the remaining axes to the same number of
     * shared axes as `domain_in`). All intermediate decompositions have no
     * halo. `get_fft_axes()[i]` lists the axes transformed before the
     * `i`-th transpose; the last entry lists the axes transformed on
     * `domain_out`.
     *
     * `forward` and `backward` perform the complex FFT and its inverse
     * (normalised by the number of grid points). With `forward_apply` and
     * `backward_apply` any in-place transform of the local lanes can be
     * plugged in, e.g. cosine and sine transforms along non-periodic axes.
     */
    class ParallelFFT {
       public:
        using Domain_ptr = std::shared_ptr<const DomainDecomposition>;

        //! local transform applied in place along the given axes
        using ApplyFun =
            std::function<void(Array<Complex> &, const AxisList &)>;

        /**
         * @param domain_in decomposition of the physical space arrays, must
         * have at least one shared axis
         * @param shared_axes_out requested shared axes of the spectral space
         * decomposition
         * @param halo_out halo of the spectral space decomposition
         *
         * @throws ConfigurationError if `domain_in` has no shared axis, if
         * more output shared axes than input shared axes are requested, or
         * if an output shared axis is out of range or repeated
         */
        explicit ParallelFFT(Domain_ptr domain_in,
                             const AxisList & shared_axes_out = {},
                             Index_t halo_out = 0);

        //! complex FFT over all axes, the input may be real or complex
        template <typename T>
        Array<Complex> forward(const Array<T> & arr) const;

        //! inverse complex FFT over all axes, normalised
        Array<Complex> backward(const Array<Complex> & arr) const;

        //! transposes along the chain, applying `fun` at every step
        template <typename T>
        Array<Complex> forward_apply(const Array<T> & arr,
                                     const ApplyFun & fun) const;

        //! transposes backwards along the chain, applying `fun` at every step
        Array<Complex> backward_apply(const Array<Complex> & arr,
                                      const ApplyFun & fun) const;

        const DomainDecomposition & get_domain_in() const {
            return *this->domain_in;
        }
        const DomainDecomposition & get_domain_out() const {
            return *this->domain_out;
        }
        const Domain_ptr & get_domain_in_ptr() const {
            return this->domain_in;
        }
        const Domain_ptr & get_domain_out_ptr() const {
            return this->domain_out;
        }

        //! axes transformed at every step of the chain
        const std::vector<AxisList> & get_fft_axes() const {
            return this->fft_axes;
        }

        //! shared axes of every decomposition of the chain
        const std::vector<AxisList> & get_all_shared_axes() const {
            return this->all_shared_axes;
        }

        //! number of transposes of one forward transform
        size_t get_nb_transforms() const {
            return this->forward_transforms.size();
        }

        /**
         * Requested shared axes of every decomposition of the chain, from
         * `shared_axes_in` to the completed output shared axes. The axes
         * shared in neither are split into intermediate steps of at most
         * `shared_axes_in.size()` axes each.
         *
         * @throws ConfigurationError as the constructor
         */
        static std::vector<AxisList>
        plan_shared_axes(Dim_t n_dims, const AxisList & shared_axes_in,
                         const AxisList & shared_axes_out = {});

        //! axes transformed at every step of the chain, each axis once
        static std::vector<AxisList>
        plan_fft_axes(Dim_t n_dims,
                      const std::vector<AxisList> & all_shared_axes);

       protected:
        static Array<Complex>
        transform(const Array<Complex> & arr_in,
                  const DomainDecomposition & domain_in,
                  const DomainDecomposition & domain_out,
                  const std::vector<std::function<Array<Complex>(
                      const Array<Complex> &)>> & transforms,
                  const std::vector<AxisList> & fft_axes,
                  const ApplyFun & apply_fun);

        //! complex FFT along the given axes
        void fft(Array<Complex> & arr, const AxisList & axes) const;

        //! normalised inverse complex FFT along the given axes
        void ifft(Array<Complex> & arr, const AxisList & axes) const;

        Domain_ptr domain_in;
        Domain_ptr domain_out;
        std::vector<AxisList> all_shared_axes;
        std::vector<Transformer> forward_transforms;
        std::vector<Transformer> backward_transforms;
        std::vector<AxisList> fft_axes;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_DECOMPOSITION_PARALLEL_FFT_HH_
