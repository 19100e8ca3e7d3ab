/**
 * @file   decomposition/transformer.cc
 *
 * @author FRIDOM developers
 *
 * @date   12 Sep 2024
 *
 * @brief  Redistribution of arrays between two domain decompositions
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

#include "decomposition/transformer.hh"

#include <sstream>

namespace fridom {

    namespace {
        void check_compatible(const DomainDecomposition & domain_in,
                              const DomainDecomposition & domain_out) {
            if (domain_in.get_n_global() != domain_out.get_n_global()) {
                std::stringstream error{};
                error << "Cannot transform between decompositions of the grids "
                      << domain_in.get_n_global() << " and "
                      << domain_out.get_n_global() << ".";
                throw ConfigurationError(error.str());
            }
            if (domain_in.get_comm().size() != domain_out.get_comm().size()) {
                std::stringstream error{};
                error << "Cannot transform between decompositions on "
                      << domain_in.get_comm().size() << " and "
                      << domain_out.get_comm().size() << " processes.";
                throw ConfigurationError(error.str());
            }
        }
    }  // namespace

    /* ---------------------------------------------------------------------- */
    OverlapInfo::OverlapInfo(const DomainDecomposition & domain_in,
                             const DomainDecomposition & domain_out)
        : overlap_slices{}, processors{}, slice_same_proc{} {
        const auto & in_subdomain{domain_in.get_my_subdomain()};
        const int my_rank{domain_in.get_comm().rank()};
        const auto & out_cart_comm{domain_out.get_cart_comm()};
        for (auto && out_subdomain : domain_out.get_all_subdomains()) {
            if (!in_subdomain.has_overlap(out_subdomain)) {
                continue;
            }
            const auto overlap_slice{
                in_subdomain.get_overlap_slice(out_subdomain)};
            const int processor{
                out_cart_comm.get_parent_rank(out_subdomain.get_rank())};
            if (processor == my_rank) {
                this->slice_same_proc = overlap_slice;
            } else {
                this->overlap_slices.push_back(overlap_slice);
                this->processors.push_back(processor);
            }
        }
    }

    /* ---------------------------------------------------------------------- */
    Transformer::Transformer(Domain_ptr domain_in, Domain_ptr domain_out)
        : domain_in{domain_in}, domain_out{domain_out}, same_domain{false},
          overlap_info_in{}, overlap_info_out{} {
        check_compatible(*domain_in, *domain_out);
        this->overlap_info_in = OverlapInfo{*domain_in, *domain_out};
        this->overlap_info_out = OverlapInfo{*domain_out, *domain_in};
        this->same_domain =
            domain_in->get_n_procs() == domain_out->get_n_procs() and
            domain_in->get_halo() == domain_out->get_halo();
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    Array<T> Transformer::forward(const Array<T> & arr) const {
        return transform(*this->domain_in, *this->domain_out,
                         this->same_domain, this->overlap_info_in,
                         this->overlap_info_out, arr);
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    Array<T> Transformer::backward(const Array<T> & arr) const {
        return transform(*this->domain_out, *this->domain_in,
                         this->same_domain, this->overlap_info_out,
                         this->overlap_info_in, arr);
    }

    /* ---------------------------------------------------------------------- */
    template <typename T>
    Array<T> Transformer::transform(const DomainDecomposition & domain_in,
                                    const DomainDecomposition & domain_out,
                                    bool same_domain,
                                    const OverlapInfo & overlap_info_in,
                                    const OverlapInfo & overlap_info_out,
                                    const Array<T> & arr_in) {
        if (same_domain) {
            return arr_in;
        }
        if (arr_in.get_shape() != domain_in.get_my_subdomain().get_shape()) {
            std::stringstream error{};
            error << "Cannot transform an array of shape "
                  << arr_in.get_shape() << " from a subdomain of shape "
                  << domain_in.get_my_subdomain().get_shape() << ".";
            throw RuntimeError(error.str());
        }
        const auto & backend{domain_in.get_backend()};
        backend->synchronize();

        auto arr_out{domain_out.create_array<T>()};
        const auto & comm{domain_in.get_comm()};
        const int my_rank{comm.rank()};

        std::vector<MPI_Request> requests{};

        // every message is tagged with the rank of its sender
        std::vector<Array<T>> send_bufs{};
        for (auto && send_slice : overlap_info_in.overlap_slices) {
            send_bufs.push_back(arr_in.extract(send_slice));
        }
        for (size_t k{0}; k < send_bufs.size(); ++k) {
            requests.push_back(comm.isend(send_bufs[k].data(),
                                          send_bufs[k].size(),
                                          overlap_info_in.processors[k],
                                          my_rank));
        }

        std::vector<Array<T>> recv_bufs{};
        for (auto && recv_slice : overlap_info_out.overlap_slices) {
            recv_bufs.push_back(backend->zeros<T>(region_shape(recv_slice)));
        }
        for (size_t k{0}; k < recv_bufs.size(); ++k) {
            const int source{overlap_info_out.processors[k]};
            requests.push_back(comm.irecv(recv_bufs[k].data(),
                                          recv_bufs[k].size(), source,
                                          source));
        }

        comm.waitall(requests);

        for (size_t k{0}; k < recv_bufs.size(); ++k) {
            arr_out.assign(overlap_info_out.overlap_slices[k], recv_bufs[k]);
        }

        if (overlap_info_in.slice_same_proc) {
            arr_out.copy_region(*overlap_info_out.slice_same_proc, arr_in,
                                *overlap_info_in.slice_same_proc);
        }

        domain_out.sync(arr_out);
        return arr_out;
    }

    template Array<Real> Transformer::forward(const Array<Real> &) const;
    template Array<Complex> Transformer::forward(const Array<Complex> &) const;
    template Array<Real> Transformer::backward(const Array<Real> &) const;
    template Array<Complex>
    Transformer::backward(const Array<Complex> &) const;

}  // namespace fridom
