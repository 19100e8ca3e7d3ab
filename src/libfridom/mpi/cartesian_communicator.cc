/**
 * @file   mpi/cartesian_communicator.cc
 *
 * @author FRIDOM developers
 *
 * @date   06 Sep 2024
 *
 * @brief  Periodic Cartesian process topology and its per-axis rings
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

#include "mpi/cartesian_communicator.hh"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace fridom {

    /* ---------------------------------------------------------------------- */
    CartesianCommunicator::CartesianCommunicator(
        const Parent_t & parent, const DynGridIndex & nb_subdivisions,
        bool reorder)
        : Parent_t{MPI_COMM_NULL}, parent{parent},
          nb_subdivisions{nb_subdivisions},
          coordinates(nb_subdivisions.get_dim(), 0), parent_ranks{},
          axis_comms{}, prev_ranks{}, next_ranks{} {
        // idiot check
        auto nb_total_subdivisions{nb_subdivisions.prod()};
        if (nb_total_subdivisions != static_cast<Index_t>(parent.size())) {
            std::stringstream s;
            s << "The total number of subdivisions (" << nb_total_subdivisions
              << ") does not match the size of the communicator ("
              << parent.size() << ").";
            throw ConfigurationError(s.str());
        }

        // the spatial dimension of the topology
        const int spatial_dim{static_cast<int>(nb_subdivisions.get_dim())};
        // the domain is periodic in all directions
        std::vector<int> is_periodic(spatial_dim, true);

        // create the new communicator with cartesian topology
        std::vector<int> narr(nb_subdivisions.begin(), nb_subdivisions.end());
        this->check(MPI_Cart_create(parent.get_mpi_comm(), spatial_dim,
                                    narr.data(), is_periodic.data(), reorder,
                                    &this->comm),
                    "MPI_Cart_create");

        this->coordinates = this->get_coordinates_of(this->rank());

        // translate every Cartesian rank into the parent communicator
        MPI_Group cart_group, parent_group;
        this->check(MPI_Comm_group(this->comm, &cart_group), "MPI_Comm_group");
        this->check(MPI_Comm_group(parent.get_mpi_comm(), &parent_group),
                    "MPI_Comm_group");
        std::vector<int> cart_ranks(this->size());
        std::iota(cart_ranks.begin(), cart_ranks.end(), 0);
        this->parent_ranks.resize(this->size());
        this->check(MPI_Group_translate_ranks(
                        cart_group, this->size(), cart_ranks.data(),
                        parent_group, this->parent_ranks.data()),
                    "MPI_Group_translate_ranks");
        MPI_Group_free(&cart_group);
        MPI_Group_free(&parent_group);

        // one ring per axis and the neighbours on it
        for (int direction{0}; direction < spatial_dim; ++direction) {
            std::vector<int> remain_dims(spatial_dim, false);
            remain_dims[direction] = true;
            MPI_Comm axis_comm;
            this->check(MPI_Cart_sub(this->comm, remain_dims.data(),
                                     &axis_comm),
                        "MPI_Cart_sub");
            this->axis_comms.emplace_back(axis_comm);

            int prev, next;
            this->check(MPI_Cart_shift(axis_comm, 0, 1, &prev, &next),
                        "MPI_Cart_shift");
            this->prev_ranks.push_back(prev);
            this->next_ranks.push_back(next);
        }
    }

    /* ---------------------------------------------------------------------- */
    CartesianCommunicator::~CartesianCommunicator() {
        int finalized{0};
        MPI_Finalized(&finalized);
        if (finalized) {
            return;
        }
        for (auto && axis_comm : this->axis_comms) {
            MPI_Comm handle{axis_comm.get_mpi_comm()};
            if (handle != MPI_COMM_NULL) {
                MPI_Comm_free(&handle);
            }
        }
        if (this->comm != MPI_COMM_NULL) {
            MPI_Comm_free(&this->comm);
        }
    }

    /* ---------------------------------------------------------------------- */
    DynGridIndex
    CartesianCommunicator::compute_dims(int nb_procs,
                                        const DynGridIndex & dims) {
        Index_t nb_fixed{1};
        AxisList fixed_axes{};
        for (Dim_t i{0}; i < dims.get_dim(); ++i) {
            if (dims[i] < 0) {
                std::stringstream error{};
                error << "Invalid process grid " << dims << ".";
                throw ConfigurationError(error.str());
            }
            if (dims[i] > 0) {
                nb_fixed *= dims[i];
                fixed_axes.push_back(i);
            }
        }
        // MPI_Dims_create cannot change a fully fixed grid
        if (Dim_t(fixed_axes.size()) == dims.get_dim() and
            nb_fixed != nb_procs) {
            std::stringstream error{};
            error << "Cannot distribute " << nb_procs
                  << " processes onto the process grid " << dims
                  << ": the axes " << fixed_axes
                  << " are all fixed (e.g. shared) and leave no axis to "
                  << "split. Share fewer axes or use " << nb_fixed
                  << " process(es).";
            throw ConfigurationError(error.str());
        }
        if (nb_procs % nb_fixed != 0) {
            std::stringstream error{};
            error << "Cannot distribute " << nb_procs
                  << " processes onto a process grid with fixed entries "
                  << dims << ".";
            throw ConfigurationError(error.str());
        }
        std::vector<int> narr(dims.begin(), dims.end());
        int message{MPI_Dims_create(nb_procs, static_cast<int>(narr.size()),
                                    narr.data())};
        if (message != MPI_SUCCESS) {
            std::stringstream error{};
            error << "Cannot distribute " << nb_procs
                  << " processes onto a process grid with fixed entries "
                  << dims << " (MPI_Dims_create failed with " << message
                  << ").";
            throw ConfigurationError(error.str());
        }
        DynGridIndex retval(dims.get_dim());
        std::copy(narr.begin(), narr.end(), retval.begin());
        return retval;
    }

    /* ---------------------------------------------------------------------- */
    DynGridIndex CartesianCommunicator::get_coordinates_of(int rank) const {
        const int spatial_dim{
            static_cast<int>(this->nb_subdivisions.get_dim())};
        std::vector<int> narr(spatial_dim);
        this->check(MPI_Cart_coords(this->comm, rank, spatial_dim, narr.data()),
                    "MPI_Cart_coords");
        DynGridIndex retval(spatial_dim);
        std::copy(narr.begin(), narr.end(), retval.begin());
        return retval;
    }

}  // namespace fridom
