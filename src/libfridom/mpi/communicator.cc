/**
 * @file   mpi/communicator.cc
 *
 * @author FRIDOM developers
 *
 * @date   06 Sep 2024
 *
 * @brief  Abstraction layer for the distributed memory communicator object
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

#include "mpi/communicator.hh"

namespace fridom {

    /* ---------------------------------------------------------------------- */
    Communicator::Communicator(MPI_Comm comm) : comm{comm} {}

    /* ---------------------------------------------------------------------- */
    void Communicator::barrier() const {
        if (this->comm == MPI_COMM_NULL) {
            return;
        }
        this->check(MPI_Barrier(this->comm), "MPI_Barrier");
    }

    /* ---------------------------------------------------------------------- */
    bool Communicator::logical_and(const bool & arg) const {
        if (this->comm == MPI_COMM_NULL) {
            return arg;
        }
        bool res;
        this->check(MPI_Allreduce(&arg, &res, 1, MPI_C_BOOL, MPI_LAND,
                                  this->comm),
                    "MPI_Allreduce");
        return res;
    }

    /* ---------------------------------------------------------------------- */
    void Communicator::waitall(std::vector<MPI_Request> & requests) const {
        if (requests.empty()) {
            return;
        }
        this->check(MPI_Waitall(static_cast<int>(requests.size()),
                                requests.data(), MPI_STATUSES_IGNORE),
                    "MPI_Waitall");
    }

}  // namespace fridom
