/**
 * @file   decomposition/subdomain.cc
 *
 * @author FRIDOM developers
 *
 * @date   09 Sep 2024
 *
 * @brief  The part of the global grid owned by one rank
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

#include "decomposition/subdomain.hh"

#include <algorithm>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    Subdomain::Subdomain(int rank, const CartesianCommunicator & comm,
                         const DynGridIndex & n_global, Index_t halo)
        : n_global{n_global}, halo{halo}, rank{rank},
          coord{comm.get_coordinates_of(rank)}, left_edge{}, right_edge{},
          inner_shape(n_global.get_dim()), shape(n_global.get_dim()),
          position(n_global.get_dim()), global_slice{}, inner_slice{} {
        const auto & n_procs{comm.get_nb_subdivisions()};
        for (Dim_t i{0}; i < n_global.get_dim(); ++i) {
            const Index_t n_base{n_global[i] / n_procs[i]};
            const Index_t remainder{
                this->coord[i] == n_procs[i] - 1 ? n_global[i] % n_procs[i]
                                                 : 0};
            this->left_edge.push_back(this->coord[i] == 0);
            this->right_edge.push_back(this->coord[i] == n_procs[i] - 1);
            this->inner_shape[i] = n_base + remainder;
            this->shape[i] = this->inner_shape[i] + 2 * halo;
            this->position[i] = this->coord[i] * n_base;
            this->global_slice.push_back(
                Slice{this->position[i],
                      this->position[i] + this->inner_shape[i]});
            this->inner_slice.push_back(
                Slice{halo, halo + this->inner_shape[i]});
        }
    }

    /* ---------------------------------------------------------------------- */
    bool Subdomain::has_overlap(const Subdomain & other) const {
        for (Dim_t i{0}; i < this->get_dim(); ++i) {
            const auto & me{this->global_slice[i]};
            const auto & you{other.global_slice[i]};
            if (me.start >= you.stop or you.start >= me.stop) {
                return false;
            }
        }
        return true;
    }

    /* ---------------------------------------------------------------------- */
    Region Subdomain::get_overlap_slice(const Subdomain & other) const {
        Region global_overlap{};
        for (Dim_t i{0}; i < this->get_dim(); ++i) {
            const auto & me{this->global_slice[i]};
            const auto & you{other.global_slice[i]};
            global_overlap.push_back(Slice{std::max(me.start, you.start),
                                           std::min(me.stop, you.stop)});
        }
        return this->g2l_slice(global_overlap);
    }

    /* ---------------------------------------------------------------------- */
    Region Subdomain::g2l_slice(const Region & global_slice) const {
        Region local_slice{};
        for (Dim_t i{0}; i < this->get_dim(); ++i) {
            const auto offset{this->halo - this->position[i]};
            local_slice.push_back(Slice{global_slice[i].start + offset,
                                        global_slice[i].stop + offset});
        }
        return local_slice;
    }

    /* ---------------------------------------------------------------------- */
    Region Subdomain::l2g_slice(const Region & local_slice) const {
        Region global_slice{};
        for (Dim_t i{0}; i < this->get_dim(); ++i) {
            const auto offset{this->position[i] - this->halo};
            global_slice.push_back(Slice{local_slice[i].start + offset,
                                         local_slice[i].stop + offset});
        }
        return global_slice;
    }

    /* ---------------------------------------------------------------------- */
    std::ostream & operator<<(std::ostream & os, const Subdomain & subdomain) {
        os << "Subdomain(rank = " << subdomain.get_rank()
           << ", coord = " << subdomain.get_coord()
           << ", position = " << subdomain.get_position()
           << ", inner shape = " << subdomain.get_inner_shape()
           << ", halo = " << subdomain.get_halo() << ")";
        return os;
    }

}  // namespace fridom
