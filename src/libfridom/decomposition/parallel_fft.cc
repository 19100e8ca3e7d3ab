/**
 * @file   decomposition/parallel_fft.cc
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

#include "decomposition/parallel_fft.hh"

#include <algorithm>
#include <set>
#include <sstream>

namespace fridom {

    namespace {
        using TransformFun =
            std::function<Array<Complex>(const Array<Complex> &)>;

        //! sorted axes of `all` that are neither in `a` nor in `b`
        AxisList missing_axes(Dim_t n_dims, const AxisList & a,
                              const AxisList & b) {
            AxisList retval{};
            for (Dim_t i{0}; i < n_dims; ++i) {
                if (std::find(a.begin(), a.end(), i) == a.end() and
                    std::find(b.begin(), b.end(), i) == b.end()) {
                    retval.push_back(i);
                }
            }
            return retval;
        }

        //! sorted axes of `axes` that are still in `missing`, removed from it
        AxisList take_axes(const AxisList & axes, std::set<Dim_t> & missing) {
            AxisList retval{};
            for (auto && axis : axes) {
                if (missing.count(axis)) {
                    retval.push_back(axis);
                }
            }
            std::sort(retval.begin(), retval.end());
            for (auto && axis : retval) {
                missing.erase(axis);
            }
            return retval;
        }
    }  // namespace

    /* ---------------------------------------------------------------------- */
    std::vector<AxisList>
    ParallelFFT::plan_shared_axes(Dim_t n_dims, const AxisList & shared_axes_in,
                                  const AxisList & shared_axes_out) {
        const size_t n_shared_axes{shared_axes_in.size()};
        if (n_shared_axes == 0) {
            throw ConfigurationError(
                "The input domain of a parallel FFT must have at least one "
                "shared axis.");
        }
        if (shared_axes_out.size() > n_shared_axes) {
            std::stringstream error{};
            error << "The number of shared axes in the output domain ("
                  << shared_axes_out.size() << ") must be less than or equal "
                  << "to the number of shared axes in the input domain ("
                  << n_shared_axes << ").";
            throw ConfigurationError(error.str());
        }
        for (size_t i{0}; i < shared_axes_out.size(); ++i) {
            const auto axis{shared_axes_out[i]};
            if (axis < 0 or axis >= n_dims) {
                std::stringstream error{};
                error << "The shared axis " << axis << " is out of range for "
                      << "a " << n_dims << "-dimensional grid.";
                throw ConfigurationError(error.str());
            }
            if (std::count(shared_axes_out.begin(), shared_axes_out.end(),
                           axis) > 1) {
                std::stringstream error{};
                error << "The shared axis " << axis
                      << " is requested more than once.";
                throw ConfigurationError(error.str());
            }
        }

        // complete the output shared axes, taking the last candidates first
        AxisList out_axes{shared_axes_out};
        AxisList candidates{shared_axes_in};
        for (auto && axis : missing_axes(n_dims, shared_axes_in, out_axes)) {
            candidates.push_back(axis);
        }
        while (out_axes.size() < n_shared_axes) {
            const auto axis{candidates.back()};
            candidates.pop_back();
            if (std::find(out_axes.begin(), out_axes.end(), axis) ==
                out_axes.end()) {
                out_axes.push_back(axis);
            }
        }

        // axes that are shared neither at the start nor at the end of the
        // chain are shared in chunks of at most n_shared_axes axes, the last
        // chunk is filled up with output shared axes
        std::vector<AxisList> retval{shared_axes_in};
        const auto axes_missing{missing_axes(n_dims, shared_axes_in, out_axes)};
        for (size_t start{0}; start < axes_missing.size();
             start += n_shared_axes) {
            const size_t stop{
                std::min(start + n_shared_axes, axes_missing.size())};
            retval.emplace_back(axes_missing.begin() + start,
                                axes_missing.begin() + stop);
        }
        if (retval.size() > 1) {
            auto & last_mid{retval.back()};
            for (auto && axis : out_axes) {
                if (last_mid.size() >= n_shared_axes) {
                    break;
                }
                last_mid.push_back(axis);
            }
        }
        retval.push_back(out_axes);
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    std::vector<AxisList>
    ParallelFFT::plan_fft_axes(Dim_t n_dims,
                               const std::vector<AxisList> & all_shared_axes) {
        std::set<Dim_t> missing_fft_axes{};
        for (Dim_t i{0}; i < n_dims; ++i) {
            missing_fft_axes.insert(i);
        }
        std::vector<AxisList> retval{};
        for (auto && shared_axes : all_shared_axes) {
            retval.push_back(take_axes(shared_axes, missing_fft_axes));
        }
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    ParallelFFT::ParallelFFT(Domain_ptr domain_in,
                             const AxisList & shared_axes_out, Index_t halo_out)
        : domain_in{domain_in}, domain_out{}, all_shared_axes{},
          forward_transforms{}, backward_transforms{}, fft_axes{} {
        const Dim_t n_dims{domain_in->get_n_dims()};
        this->all_shared_axes = plan_shared_axes(
            n_dims, domain_in->get_shared_axes(), shared_axes_out);
        this->fft_axes = plan_fft_axes(n_dims, this->all_shared_axes);

        const auto & backend{domain_in->get_backend()};
        const auto & logger{domain_in->get_logger()};
        const auto & comm{domain_in->get_comm()};
        const bool reorder{domain_in->get_reorder_comm()};
        const auto & n_global{domain_in->get_n_global()};

        this->domain_out = std::make_shared<const DomainDecomposition>(
            comm, n_global, halo_out, this->all_shared_axes.back(), reorder,
            backend, logger);

        // the chain without halos
        std::vector<Domain_ptr> domain_list_all{};
        for (auto && shared_axes : this->all_shared_axes) {
            domain_list_all.push_back(
                std::make_shared<const DomainDecomposition>(
                    comm, n_global, 0, shared_axes, reorder, backend,
                    logger));
        }

        // the forward chain ends in domain_out, the backward chain starts
        // from domain_in
        const size_t nb_transforms{this->all_shared_axes.size() - 1};
        for (size_t i{0}; i < nb_transforms; ++i) {
            const auto & next_forward{i + 1 == nb_transforms
                                          ? this->domain_out
                                          : domain_list_all[i + 1]};
            this->forward_transforms.emplace_back(domain_list_all[i],
                                                  next_forward);
            const auto & prev_backward{i == 0 ? this->domain_in
                                              : domain_list_all[i]};
            this->backward_transforms.emplace_back(prev_backward,
                                                   domain_list_all[i + 1]);
        }

        std::stringstream message{};
        message << "Parallel FFT with " << nb_transforms
                << " transpose(s) through the shared axes";
        for (auto && shared_axes : this->all_shared_axes) {
            message << " " << shared_axes;
        }
        message << ", transformed axes per step";
        for (auto && axes : this->fft_axes) {
            message << " " << axes;
        }
        logger->verbose(message.str());
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> ParallelFFT::transform(
        const Array<Complex> & arr_in, const DomainDecomposition & domain_in,
        const DomainDecomposition & domain_out,
        const std::vector<TransformFun> & transforms,
        const std::vector<AxisList> & fft_axes, const ApplyFun & apply_fun) {
        auto arr_out{
            arr_in.extract(domain_in.get_my_subdomain().get_inner_slice())};
        for (size_t i{0}; i < transforms.size(); ++i) {
            apply_fun(arr_out, fft_axes[i]);
            arr_out = transforms[i](arr_out);
        }
        if (!fft_axes.back().empty()) {
            const auto & inner_slice{
                domain_out.get_my_subdomain().get_inner_slice()};
            auto inner{arr_out.extract(inner_slice)};
            apply_fun(inner, fft_axes.back());
            arr_out.assign(inner_slice, inner);
            domain_out.sync(arr_out);
        }
        return arr_out;
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    Array<Complex> ParallelFFT::forward_apply(const Array<T> & arr,
                                              const ApplyFun & fun) const {
        std::vector<TransformFun> transforms{};
        for (auto && transformer : this->forward_transforms) {
            transforms.push_back([&transformer](const Array<Complex> & a) {
                return transformer.forward(a);
            });
        }
        return transform(arr.template cast<Complex>(), *this->domain_in,
                         *this->domain_out, transforms, this->fft_axes, fun);
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> ParallelFFT::backward_apply(const Array<Complex> & arr,
                                               const ApplyFun & fun) const {
        std::vector<TransformFun> transforms{};
        for (auto it{this->backward_transforms.rbegin()};
             it != this->backward_transforms.rend(); ++it) {
            const auto & transformer{*it};
            transforms.push_back([&transformer](const Array<Complex> & a) {
                return transformer.backward(a);
            });
        }
        std::vector<AxisList> reversed_axes(this->fft_axes.rbegin(),
                                            this->fft_axes.rend());
        return transform(arr, *this->domain_out, *this->domain_in, transforms,
                         reversed_axes, fun);
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    Array<Complex> ParallelFFT::forward(const Array<T> & arr) const {
        return this->forward_apply(
            arr, [this](Array<Complex> & a, const AxisList & axes) {
                this->fft(a, axes);
            });
    }

    /* ---------------------------------------------------------------------- */
    Array<Complex> ParallelFFT::backward(const Array<Complex> & arr) const {
        return this->backward_apply(
            arr, [this](Array<Complex> & a, const AxisList & axes) {
                this->ifft(a, axes);
            });
    }

    /* ---------------------------------------------------------------------- */
    void ParallelFFT::fft(Array<Complex> & arr, const AxisList & axes) const {
        const auto & backend{this->domain_in->get_backend()};
        for (auto && axis : axes) {
            backend->c2c(arr, axis, FFTDirection::Forward);
        }
    }

    /* ---------------------------------------------------------------------- */
    void ParallelFFT::ifft(Array<Complex> & arr, const AxisList & axes) const {
        const auto & backend{this->domain_in->get_backend()};
        Index_t nb_points{1};
        for (auto && axis : axes) {
            backend->c2c(arr, axis, FFTDirection::Backward);
            nb_points *= arr.get_shape()[axis];
        }
        if (nb_points > 1) {
            backend->scale(arr, 1. / nb_points);
        }
    }

    template Array<Complex> ParallelFFT::forward(const Array<Real> &) const;
    template Array<Complex> ParallelFFT::forward(const Array<Complex> &) const;
    template Array<Complex>
    ParallelFFT::forward_apply(const Array<Real> &, const ApplyFun &) const;
    template Array<Complex>
    ParallelFFT::forward_apply(const Array<Complex> &, const ApplyFun &) const;

}  // namespace fridom
