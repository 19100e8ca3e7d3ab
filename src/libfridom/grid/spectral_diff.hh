/**
 * @file   grid/spectral_diff.hh
 *
 * @author FRIDOM developers
 *
 * @date   21 Oct 2024
 *
 * @brief  Differential operators evaluated in spectral space
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

#ifndef SRC_LIBFRIDOM_GRID_SPECTRAL_DIFF_HH_
#define SRC_LIBFRIDOM_GRID_SPECTRAL_DIFF_HH_

#include "grid/diff_module.hh"

namespace fridom {

    /**
     * @class SpectralDiff
     * @brief Derivatives computed by multiplying the spectral coefficients
     * with powers of `i k`.
     *
     * The physical space operators transform the field with the grid's
     * spectral transforms, differentiate and transform back, so the result
     * is exact for band limited fields and the module needs no halo. Along
     * bounded axes the cosine or sine transform only maps even derivatives
     * back onto itself: odd derivatives are restricted to periodic axes.
     * The difference type of `diff` is ignored.
     *
     * The grid must provide spectral transforms, i.e. be constructed with
     * shared axes.
     */
    class SpectralDiff : public DiffModule {
       public:
        SpectralDiff();

        void
        set_spectral_transform(const SpectrallyTransformable & grid) override;

        /**
         * Derivative of order `order` of the spectral coefficients `u_hat`
         * along `axis`, i.e. `u_hat * (i k)^order`.
         *
         * @throws RuntimeError for an odd order along a bounded axis
         */
        Array<Complex> diff_spectral(const Array<Complex> & u_hat, Dim_t axis,
                                     int order = 1) const;

        Array<Real> diff(const Array<Real> & arr, Dim_t axis,
                         DiffType type = DiffType::Centered) const override;

        std::vector<Array<Real>>
        grad(const Array<Real> & arr,
             const AxisList & axes = {}) const override;

        Array<Real> div(const std::vector<Array<Real>> & arrs,
                        const AxisList & axes = {}) const override;

        Array<Real> laplacian(const Array<Real> & arr,
                              const AxisList & axes = {}) const override;

        std::vector<Array<Real>>
        curl(const std::vector<Array<Real>> & arrs) const override;

       protected:
        void initialise(const ModelSettings & settings) override;

        //! multiplies `u_hat` in place with `(i k)^order` along `axis`
        void apply_derivative(Array<Complex> & u_hat, Dim_t axis,
                              int order) const;

        AxisList complete_axes(Dim_t n_dims, const AxisList & axes) const;

        const SpectrallyTransformable * grid{nullptr};
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_GRID_SPECTRAL_DIFF_HH_
