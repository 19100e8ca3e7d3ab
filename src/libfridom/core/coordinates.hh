/**
 * @file   core/coordinates.hh
 *
 * @author FRIDOM developers
 *
 * @date   02 Sep 2024
 *
 * @brief  Dynamically sized coordinates, shapes and offsets
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

#ifndef SRC_LIBFRIDOM_CORE_COORDINATES_HH_
#define SRC_LIBFRIDOM_CORE_COORDINATES_HH_

#include "core/exception.hh"
#include "core/types.hh"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <vector>

namespace fridom {

    /**
     * @class DynCoord
     * @brief Coordinate, shape or offset whose number of entries is chosen at
     * runtime, stored inline in a fixed-capacity array.
     *
     * The grids handled by FRIDOM have between one and `MaxDim` axes. All
     * shapes (global number of grid points, process grid, subdomain shape)
     * and all positions in the global index space are represented by this
     * type.
     *
     * @tparam MaxDim maximum number of entries
     * @tparam T entry type
     */
    template <size_t MaxDim, typename T = Index_t>
    class DynCoord {
       public:
        using iterator = typename std::array<T, MaxDim>::iterator;
        using const_iterator = typename std::array<T, MaxDim>::const_iterator;

        //! default constructor, zero entries
        DynCoord() : dim{}, long_array{} {};

        /**
         * @brief Constructs a coordinate from an initializer list.
         * @throws RuntimeError If the length exceeds MaxDim.
         */
        DynCoord(std::initializer_list<T> init_list)
            : dim(init_list.size()), long_array{} {
            if (this->dim > Dim_t(MaxDim)) {
                std::stringstream error{};
                error << "The maximum dimension representable by this dynamic "
                         "array is "
                      << MaxDim << ". You supplied an initialiser list with "
                      << init_list.size() << " entries.";
                throw RuntimeError(error.str());
            }
            std::copy(init_list.begin(), init_list.end(),
                      this->long_array.begin());
        }

        /**
         * @brief Constructs a coordinate with `dim` entries set to `value`.
         *
         * Note: Use round braces '()'. Curly braces '{}' invoke the
         * initializer list constructor.
         */
        explicit DynCoord(Dim_t dim, const T value = T{})
            : dim{dim}, long_array{} {
            if (this->dim > Dim_t(MaxDim) or this->dim < 0) {
                std::stringstream error{};
                error << "Cannot create a " << dim
                      << "-dimensional coordinate, the supported range is 0 "
                         "to "
                      << MaxDim << ".";
                throw RuntimeError(error.str());
            }
            std::fill(this->long_array.begin(), this->long_array.end(), value);
        }

        /**
         * @brief Constructs a coordinate from a std::vector.
         * @throws RuntimeError If the size exceeds MaxDim.
         */
        explicit DynCoord(const std::vector<T> & coord)
            : dim{Dim_t(coord.size())}, long_array{} {
            if (this->dim > Dim_t(MaxDim)) {
                std::stringstream error{};
                error << "The maximum dimension representable by this dynamic "
                         "array is "
                      << MaxDim << ". You supplied a vector with "
                      << coord.size() << " entries.";
                throw RuntimeError(error.str());
            }
            std::copy(coord.begin(), coord.end(), this->long_array.begin());
        }

        DynCoord(const DynCoord & other) = default;
        DynCoord(DynCoord && other) = default;
        ~DynCoord() = default;

        DynCoord & operator=(const DynCoord & other) = default;
        DynCoord & operator=(DynCoord && other) = default;

        bool operator==(const DynCoord & other) const {
            bool retval{this->get_dim() == other.get_dim()};
            for (Dim_t i{0}; retval and i < this->get_dim(); ++i) {
                retval &= this->long_array[i] == other[i];
            }
            return retval;
        }

        bool operator!=(const DynCoord & other) const {
            return !(*this == other);
        }

        //! element-wise addition
        DynCoord operator+(const DynCoord & other) const {
            this->check_same_dim(other, "add");
            DynCoord retval(this->get_dim());
            for (Dim_t i{0}; i < this->get_dim(); ++i) {
                retval[i] = this->operator[](i) + other[i];
            }
            return retval;
        }

        //! element-wise subtraction
        DynCoord operator-(const DynCoord & other) const {
            this->check_same_dim(other, "subtract");
            DynCoord retval(this->get_dim());
            for (Dim_t i{0}; i < this->get_dim(); ++i) {
                retval[i] = this->operator[](i) - other[i];
            }
            return retval;
        }

        //! element-wise non-negative modulo (periodic wrap-around)
        DynCoord operator%(const DynCoord & other) const {
            this->check_same_dim(other, "wrap");
            DynCoord retval(this->get_dim());
            for (Dim_t i{0}; i < this->get_dim(); ++i) {
                retval[i] = this->operator[](i) % other[i];
                if (retval[i] < 0) {
                    retval[i] += other[i];
                }
            }
            return retval;
        }

        T & operator[](const size_t & index) { return this->long_array[index]; }

        const T & operator[](const size_t & index) const {
            return this->long_array[index];
        }

        //! number of valid entries
        Dim_t get_dim() const { return this->dim; }

        //! number of valid entries, STL compatibility
        Dim_t size() const { return this->dim; }

        //! product of all entries (number of points of a shape)
        T prod() const {
            T retval{1};
            for (auto && val : *this) {
                retval *= val;
            }
            return retval;
        }

        iterator begin() { return this->long_array.begin(); }
        iterator end() { return this->long_array.begin() + this->dim; }
        const_iterator begin() const { return this->long_array.begin(); }
        const_iterator end() const {
            return this->long_array.begin() + this->dim;
        }

        T & back() { return this->long_array[this->dim - 1]; }
        const T & back() const { return this->long_array[this->dim - 1]; }

       protected:
        void check_same_dim(const DynCoord & other,
                            const char * operation) const {
            if (this->get_dim() != other.get_dim()) {
                std::stringstream error{};
                error << "you are trying to " << operation << " a "
                      << this->get_dim() << "-dimensional coord and a "
                      << other.get_dim() << "-dimensional coord element-wise.";
                throw RuntimeError(error.str());
            }
        }

        Dim_t dim;
        std::array<T, MaxDim> long_array;
    };

    //! integer grid index, shape or process grid with up to four axes
    using DynGridIndex = DynCoord<fourD>;

    //! real-valued per-axis quantity (domain lengths, grid spacings)
    using DynGridPoint = DynCoord<fourD, Real>;

    /**
     * Allows inserting `std::vector` into `std::ostream`s
     */
    template <typename T>
    std::ostream & operator<<(std::ostream & os,
                              const std::vector<T> & values) {
        os << "(";
        if (values.size() > 0) {
            for (size_t i = 0; i < values.size() - 1; ++i) {
                os << values[i] << ", ";
            }
            os << values.back();
        }
        os << ")";
        return os;
    }

    /**
     * Allows inserting `fridom::DynCoord` into `std::ostream`s
     */
    template <size_t MaxDim, typename T>
    std::ostream & operator<<(std::ostream & os,
                              const DynCoord<MaxDim, T> & values) {
        os << "(";
        if (values.get_dim() > 0) {
            for (Dim_t i = 0; i < values.get_dim() - 1; ++i) {
                os << values[i] << ", ";
            }
            os << values.back();
        }
        os << ")";
        return os;
    }

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_CORE_COORDINATES_HH_
