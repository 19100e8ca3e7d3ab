/**
 * @file   mpi/communicator.hh
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

#ifndef SRC_LIBFRIDOM_MPI_COMMUNICATOR_HH_
#define SRC_LIBFRIDOM_MPI_COMMUNICATOR_HH_

#include <mpi.h>

#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include "core/exception.hh"
#include "core/types.hh"

namespace fridom {

    template <typename T, typename T2 = T>
    inline decltype(auto) mpi_type() {
        static_assert(std::is_same<T, T2>::value,
                      "T2 is a SFINAE parameter, do not touch");
        static_assert(std::is_same<T, T2>::value and
                          not std::is_same<T, T2>::value,
                      "The type you're trying to map has not been declared.");
        return MPI_LONG;
    }
    template <>
    inline decltype(auto) mpi_type<char>() {
        return MPI_CHAR;
    }
    template <>
    inline decltype(auto) mpi_type<int>() {
        return MPI_INT;
    }
    template <>
    inline decltype(auto) mpi_type<long>() {  // NOLINT
        return MPI_LONG;
    }
    template <>
    inline decltype(auto) mpi_type<long long>() {  // NOLINT
        return MPI_LONG_LONG_INT;
    }
    template <>
    inline decltype(auto) mpi_type<unsigned int>() {
        return MPI_UNSIGNED;
    }
    template <>
    inline decltype(auto) mpi_type<unsigned long>() {  // NOLINT
        return MPI_UNSIGNED_LONG;
    }
    template <>
    inline decltype(auto) mpi_type<float>() {
        return MPI_FLOAT;
    }
    template <>
    inline decltype(auto) mpi_type<double>() {
        return MPI_DOUBLE;
    }
    template <>
    inline decltype(auto) mpi_type<Complex>() {
        return MPI_DOUBLE_COMPLEX;
    }

    /**
     * @class Communicator
     * @brief Lightweight, copyable handle of an MPI communicator. It does
     * not own the underlying `MPI_Comm`.
     *
     * Every MPI call made through this class is checked. A failing call
     * raises a `CommunicationError` that names the call, the MPI error code
     * and the rank.
     */
    class Communicator {
       public:
        explicit Communicator(MPI_Comm comm = MPI_COMM_WORLD);
        Communicator(const Communicator & other) = default;
        ~Communicator() = default;

        Communicator & operator=(const Communicator & other) = default;

        //! get rank of present process
        int rank() const {
            // allows using the communicator before MPI_Init
            if (this->comm == MPI_COMM_NULL)
                return 0;
            int res;
            MPI_Comm_rank(this->comm, &res);
            return res;
        }

        //! get total number of processes
        int size() const {
            if (this->comm == MPI_COMM_NULL)
                return 1;
            int res;
            MPI_Comm_size(this->comm, &res);
            return res;
        }

        //! Barrier synchronization, blocks until all processes in the
        //! communicator have reached this point
        void barrier() const;

        //! sum reduction on scalar types
        template <typename T>
        T sum(const T & arg) const {
            if (this->comm == MPI_COMM_NULL)
                return arg;
            T res;
            this->check(MPI_Allreduce(&arg, &res, 1, mpi_type<T>(), MPI_SUM,
                                      this->comm),
                        "MPI_Allreduce");
            return res;
        }

        //! max reduction on scalar types
        template <typename T>
        T max(const T & arg) const {
            if (this->comm == MPI_COMM_NULL)
                return arg;
            T res;
            this->check(MPI_Allreduce(&arg, &res, 1, mpi_type<T>(), MPI_MAX,
                                      this->comm),
                        "MPI_Allreduce");
            return res;
        }

        //! return logical and
        bool logical_and(const bool & arg) const;

        //! gathers one value from every rank, ordered by rank
        template <typename T>
        std::vector<T> allgather(const T & arg) const {
            if (this->comm == MPI_COMM_NULL)
                return std::vector<T>{arg};
            std::vector<T> res(this->size());
            this->check(MPI_Allgather(&arg, 1, mpi_type<T>(), res.data(), 1,
                                      mpi_type<T>(), this->comm),
                        "MPI_Allgather");
            return res;
        }

        //! non-blocking send of `count` contiguous values
        template <typename T>
        MPI_Request isend(const T * data, Index_t count, int dest,
                          int tag) const {
            MPI_Request request;
            this->check(MPI_Isend(data, static_cast<int>(count), mpi_type<T>(),
                                  dest, tag, this->comm, &request),
                        "MPI_Isend");
            return request;
        }

        //! non-blocking receive of `count` contiguous values
        template <typename T>
        MPI_Request irecv(T * data, Index_t count, int source,
                          int tag) const {
            MPI_Request request;
            this->check(MPI_Irecv(data, static_cast<int>(count), mpi_type<T>(),
                                  source, tag, this->comm, &request),
                        "MPI_Irecv");
            return request;
        }

        //! blocks until all `requests` have completed
        void waitall(std::vector<MPI_Request> & requests) const;

        MPI_Comm get_mpi_comm() const { return this->comm; }

       protected:
        //! throws a CommunicationError if `message` is not MPI_SUCCESS
        void check(int message, const char * call) const {
            if (message != MPI_SUCCESS) {
                std::stringstream error{};
                error << call << " failed with " << message << " on rank "
                      << this->rank();
                throw CommunicationError(error.str());
            }
        }

        MPI_Comm comm;
    };

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_MPI_COMMUNICATOR_HH_
