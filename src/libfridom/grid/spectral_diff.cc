/**
 * @file   grid/spectral_diff.cc
 *
 * @author FRIDOM developers
 *
 * @date   21 Oct 2024
 *
 * @brief  Implementation of the spectral differential operators
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

#include "grid/spectral_diff.hh"

#include <numeric>
#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    SpectralDiff::SpectralDiff() : DiffModule{"Spectral Diff", 0} {}

    /* ---------------------------------------------------------------------- */
    void SpectralDiff::set_spectral_transform(
        const SpectrallyTransformable & grid) {
        this->grid = &grid;
    }

    /* ---------------------------------------------------------------------- */
    void SpectralDiff::initialise(const ModelSettings & /*settings*/) {
        if (this->grid == nullptr or this->grid->get_K().empty()) {
            throw ConfigurationError(
                "Spectral derivatives need a grid with spectral transforms, "
                "i.e. a grid constructed with shared axes.");
        }
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> SpectralDiff::diff_spectral(const Array<Complex> & u_hat,
                                               Dim_t axis, int order) const {
        this->check_configured("differentiate with");
        Array<Complex> retval{u_hat};
        this->apply_derivative(retval, axis, order);
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> SpectralDiff::diff(const Array<Real> & arr, Dim_t axis,
                                   DiffType /*type*/) const {
        this->check_configured("differentiate with");
        auto timing{this->time_scope()};
        auto u_hat{this->grid->fft(arr)};
        this->apply_derivative(u_hat, axis, 1);
        return real(this->grid->ifft(u_hat));
    }

    /* ---------------------------------------------------------------------- */
    std::vector<Array<Real>>
    SpectralDiff::grad(const Array<Real> & arr, const AxisList & axes) const {
        this->check_configured("differentiate with");
        auto timing{this->time_scope()};
        const auto u_hat{this->grid->fft(arr)};
        std::vector<Array<Real>> retval{};
        for (auto && axis : this->complete_axes(arr.get_dim(), axes)) {
            auto du_hat{u_hat};
            this->apply_derivative(du_hat, axis, 1);
            retval.push_back(real(this->grid->ifft(du_hat)));
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> SpectralDiff::div(const std::vector<Array<Real>> & arrs,
                                  const AxisList & axes) const {
        this->check_configured("differentiate with");
        if (arrs.empty() or Dim_t(arrs.size()) != arrs.front().get_dim()) {
            std::stringstream error{};
            error << "The divergence needs one component per axis, but "
                  << arrs.size() << " components were given.";
            throw RuntimeError(error.str());
        }
        auto timing{this->time_scope()};
        Array<Complex> div_hat{};
        bool first{true};
        for (auto && axis :
             this->complete_axes(arrs.front().get_dim(), axes)) {
            auto du_hat{this->grid->fft(arrs[axis])};
            this->apply_derivative(du_hat, axis, 1);
            if (first) {
                div_hat = std::move(du_hat);
                first = false;
            } else {
                div_hat += du_hat;
            }
        }
        if (first) {
            return Array<Real>(arrs.front().get_shape());
        }
        return real(this->grid->ifft(div_hat));
    }

    /* ---------------------------------------------------------------------- */
    Array<Real> SpectralDiff::laplacian(const Array<Real> & arr,
                                        const AxisList & axes) const {
        this->check_configured("differentiate with");
        auto timing{this->time_scope()};
        const auto u_hat{this->grid->fft(arr)};
        Array<Complex> lap_hat(u_hat.get_shape());
        for (auto && axis : this->complete_axes(arr.get_dim(), axes)) {
            auto du_hat{u_hat};
            this->apply_derivative(du_hat, axis, 2);
            lap_hat += du_hat;
        }
        return real(this->grid->ifft(lap_hat));
    }

    /* ---------------------------------------------------------------------- */
    std::vector<Array<Real>>
    SpectralDiff::curl(const std::vector<Array<Real>> & arrs) const {
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
            retval.push_back(this->diff(arrs[1], 0));
            retval.back() -= this->diff(arrs[0], 1);
            return retval;
        }
        for (Dim_t i{0}; i < threeD; ++i) {
            const Dim_t j{(i + 1) % threeD};
            const Dim_t k{(i + 2) % threeD};
            retval.push_back(this->diff(arrs[k], j));
            retval.back() -= this->diff(arrs[j], k);
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    void SpectralDiff::apply_derivative(Array<Complex> & u_hat, Dim_t axis,
                                        int order) const {
        const auto & K{this->grid->get_K()};
        if (axis < 0 or axis >= Dim_t(K.size())) {
            std::stringstream error{};
            error << "Cannot differentiate along the axis " << axis
                  << " of a " << K.size() << "-dimensional grid.";
            throw RuntimeError(error.str());
        }
        if (order < 0) {
            std::stringstream error{};
            error << "The order of a derivative must be non-negative, but "
                  << order << " was requested.";
            throw RuntimeError(error.str());
        }
        if (order % 2 == 1 and !this->grid->get_periodic_bounds()[axis]) {
            std::stringstream error{};
            error << "Spectral derivatives of odd order are only available "
                  << "along periodic axes, but the axis " << axis
                  << " is bounded.";
            throw RuntimeError(error.str());
        }
        const auto & k{K[axis]};
        if (k.get_shape() != u_hat.get_shape()) {
            std::stringstream error{};
            error << "Expected spectral coefficients of shape "
                  << k.get_shape() << ", got " << u_hat.get_shape() << ".";
            throw RuntimeError(error.str());
        }
        for (Index_t i{0}; i < u_hat.size(); ++i) {
            const Complex ik{0., k[i]};
            for (int n{0}; n < order; ++n) {
                u_hat[i] *= ik;
            }
        }
    }

    /* ---------------------------------------------------------------------- */
    AxisList SpectralDiff::complete_axes(Dim_t n_dims,
                                         const AxisList & axes) const {
        if (!axes.empty()) {
            return axes;
        }
        AxisList retval(n_dims);
        std::iota(retval.begin(), retval.end(), 0);
        return retval;
    }

}  // namespace fridom
