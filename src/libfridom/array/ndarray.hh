/**
 * @file   array/ndarray.hh
 *
 * @author FRIDOM developers
 *
 * @date   04 Sep 2024
 *
 * @brief  Owning n-dimensional arrays and rectangular regions
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

#ifndef SRC_LIBFRIDOM_ARRAY_NDARRAY_HH_
#define SRC_LIBFRIDOM_ARRAY_NDARRAY_HH_

#include "core/coordinates.hh"
#include "core/exception.hh"
#include "core/types.hh"
#include "grid/index_ops.hh"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

namespace fridom {

    /**
     * @class Slice
     * @brief Half-open index interval `[start, stop)` along one axis. A slice
     * with `start >= stop` is empty.
     */
    struct Slice {
        Index_t start{0};
        Index_t stop{0};

        Index_t size() const {
            return this->stop > this->start ? this->stop - this->start : 0;
        }
        bool empty() const { return this->start >= this->stop; }

        bool operator==(const Slice & other) const {
            return this->start == other.start and this->stop == other.stop;
        }
        bool operator!=(const Slice & other) const {
            return !(*this == other);
        }
    };

    inline std::ostream & operator<<(std::ostream & os, const Slice & slice) {
        os << "[" << slice.start << ":" << slice.stop << ")";
        return os;
    }

    //! one slice per axis
    using Region = std::vector<Slice>;

    //! the region `[0, shape)` covering a whole array
    inline Region full_region(const DynGridIndex & shape) {
        Region region{};
        for (auto && n : shape) {
            region.push_back(Slice{0, n});
        }
        return region;
    }

    /**
     * The whole array except `lower` points at the start and `upper` points
     * at the end of `axis`, e.g. the points that have a next neighbour along
     * `axis` for `lower = 0, upper = 1`.
     */
    inline Region axis_region(const DynGridIndex & shape, Dim_t axis,
                              Index_t lower, Index_t upper) {
        Region region(full_region(shape));
        region[axis] = Slice{lower, shape[axis] - upper};
        return region;
    }

    //! number of points of the region along each axis
    inline DynGridIndex region_shape(const Region & region) {
        DynGridIndex shape(Dim_t(region.size()));
        for (size_t i{0}; i < region.size(); ++i) {
            shape[i] = region[i].size();
        }
        return shape;
    }

    //! lower corner of the region
    inline DynGridIndex region_start(const Region & region) {
        DynGridIndex start(Dim_t(region.size()));
        for (size_t i{0}; i < region.size(); ++i) {
            start[i] = region[i].start;
        }
        return start;
    }

    //! true if the region contains no point
    inline bool region_is_empty(const Region & region) {
        return std::any_of(region.begin(), region.end(),
                           [](const Slice & s) { return s.empty(); });
    }

    /**
     * Calls `fun(ccoord)` for every point of `region` in column-major
     * order. Nothing is called for an empty region.
     */
    template <typename Fun>
    void for_each_index(const Region & region, Fun && fun) {
        if (region_is_empty(region)) {
            return;
        }
        const auto shape{region_shape(region)};
        const auto start{region_start(region)};
        DynGridIndex ccoord(start);
        do {
            fun(static_cast<const DynGridIndex &>(ccoord));
        } while (CcoordOps::increment(ccoord, shape, start));
    }

    /**
     * @class Array
     * @brief Owning, contiguous, column-major (first index fastest)
     * n-dimensional array with up to four axes.
     *
     * This is the payload type handed to the distributed components. The
     * components themselves hold topology only and never keep a reference
     * to an array beyond a call.
     *
     * @tparam T `Real` or `Complex`
     */
    template <typename T>
    class Array {
       public:
        using value_type = T;

        //! empty zero-dimensional array
        Array() : shape{}, strides{}, values{} {}

        //! array of `shape` with all entries set to `value`
        explicit Array(const DynGridIndex & shape, const T & value = T{})
            : shape{shape}, strides{CcoordOps::get_col_major_strides(shape)},
              values(shape.prod(), value) {}

        //! array of `shape` taking ownership of column-major `values`
        Array(const DynGridIndex & shape, std::vector<T> && values)
            : shape{shape}, strides{CcoordOps::get_col_major_strides(shape)},
              values{std::move(values)} {
            if (Index_t(this->values.size()) != shape.prod()) {
                std::stringstream error{};
                error << "An array of shape " << shape << " needs "
                      << shape.prod() << " values, but " << this->values.size()
                      << " were given.";
                throw RuntimeError(error.str());
            }
        }

        Array(const Array & other) = default;
        Array(Array && other) = default;
        ~Array() = default;

        Array & operator=(const Array & other) = default;
        Array & operator=(Array && other) = default;

        const DynGridIndex & get_shape() const { return this->shape; }
        const DynGridIndex & get_strides() const { return this->strides; }
        Dim_t get_dim() const { return this->shape.get_dim(); }
        Index_t size() const { return Index_t(this->values.size()); }

        T * data() { return this->values.data(); }
        const T * data() const { return this->values.data(); }

        std::vector<T> & get_values() { return this->values; }
        const std::vector<T> & get_values() const { return this->values; }

        //! linear offset of a point
        Index_t offset(const DynGridIndex & ccoord) const {
            Index_t retval{0};
            for (Dim_t i{0}; i < this->shape.get_dim(); ++i) {
                retval += this->strides[i] * ccoord[i];
            }
            return retval;
        }

        T & operator()(const DynGridIndex & ccoord) {
            return this->values[this->offset(ccoord)];
        }
        const T & operator()(const DynGridIndex & ccoord) const {
            return this->values[this->offset(ccoord)];
        }

        T & operator[](Index_t index) { return this->values[index]; }
        const T & operator[](Index_t index) const {
            return this->values[index];
        }

        void fill(const T & value) {
            std::fill(this->values.begin(), this->values.end(), value);
        }

        Array & operator+=(const Array & other) {
            this->check_same_shape(other, "add");
            for (size_t i{0}; i < this->values.size(); ++i) {
                this->values[i] += other.values[i];
            }
            return *this;
        }

        Array & operator-=(const Array & other) {
            this->check_same_shape(other, "subtract");
            for (size_t i{0}; i < this->values.size(); ++i) {
                this->values[i] -= other.values[i];
            }
            return *this;
        }

        Array & operator*=(const T & factor) {
            for (auto && value : this->values) {
                value *= factor;
            }
            return *this;
        }

        //! contiguous copy of the values inside `region`
        Array extract(const Region & region) const {
            this->check_region(region, "extract");
            Array retval(region_shape(region));
            Index_t i{0};
            for_each_index(region, [&](const DynGridIndex & ccoord) {
                retval.values[i++] = this->operator()(ccoord);
            });
            return retval;
        }

        //! writes the contiguous array `src` into `region`
        void assign(const Region & region, const Array & src) {
            this->check_region(region, "assign");
            if (src.get_shape() != region_shape(region)) {
                std::stringstream error{};
                error << "Cannot assign an array of shape " << src.get_shape()
                      << " to a region of shape " << region_shape(region)
                      << ".";
                throw RuntimeError(error.str());
            }
            Index_t i{0};
            for_each_index(region, [&](const DynGridIndex & ccoord) {
                this->operator()(ccoord) = src.values[i++];
            });
        }

        //! copies `src[src_region]` into `this[dst_region]`
        void copy_region(const Region & dst_region, const Array & src,
                         const Region & src_region) {
            this->check_region(dst_region, "copy into");
            src.check_region(src_region, "copy from");
            if (region_shape(dst_region) != region_shape(src_region)) {
                std::stringstream error{};
                error << "Cannot copy a region of shape "
                      << region_shape(src_region)
                      << " into a region of shape "
                      << region_shape(dst_region) << ".";
                throw RuntimeError(error.str());
            }
            if (region_is_empty(dst_region)) {
                return;
            }
            const auto offset{region_start(src_region) -
                              region_start(dst_region)};
            for_each_index(dst_region, [&](const DynGridIndex & ccoord) {
                this->operator()(ccoord) = src(ccoord + offset);
            });
        }

        //! element-wise conversion, e.g. `Real` to `Complex`
        template <typename T2>
        Array<T2> cast() const {
            std::vector<T2> converted(this->values.size());
            std::transform(this->values.begin(), this->values.end(),
                           converted.begin(),
                           [](const T & value) { return T2(value); });
            return Array<T2>(this->shape, std::move(converted));
        }

        //! largest absolute value
        Real max_abs() const {
            Real retval{0.};
            for (auto && value : this->values) {
                retval = std::max(retval, Real(std::abs(value)));
            }
            return retval;
        }

        //! largest absolute element-wise difference to an array of equal
        //! shape
        Real max_abs_diff(const Array & other) const {
            this->check_same_shape(other, "compare");
            Real retval{0.};
            for (size_t i{0}; i < this->values.size(); ++i) {
                retval = std::max(
                    retval, Real(std::abs(this->values[i] - other.values[i])));
            }
            return retval;
        }

       protected:
        template <typename>
        friend class Array;

        void check_same_shape(const Array & other,
                              const char * operation) const {
            if (this->shape != other.shape) {
                std::stringstream error{};
                error << "Cannot " << operation << " arrays of shapes "
                      << this->shape << " and " << other.shape << ".";
                throw RuntimeError(error.str());
            }
        }

        void check_region(const Region & region,
                          const char * operation) const {
            bool valid{Dim_t(region.size()) == this->shape.get_dim()};
            for (Dim_t i{0}; valid and i < this->shape.get_dim(); ++i) {
                const auto & slice{region[i]};
                valid = slice.empty() or
                        (slice.start >= 0 and slice.stop <= this->shape[i]);
            }
            if (!valid) {
                std::stringstream error{};
                error << "Cannot " << operation << " region " << region
                      << " of an array of shape " << this->shape << ".";
                throw RuntimeError(error.str());
            }
        }

        DynGridIndex shape;
        DynGridIndex strides;
        std::vector<T> values;
    };

    //! real part of a complex array
    inline Array<Real> real(const Array<Complex> & array) {
        std::vector<Real> values(array.size());
        for (Index_t i{0}; i < array.size(); ++i) {
            values[i] = array[i].real();
        }
        return Array<Real>(array.get_shape(), std::move(values));
    }

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_ARRAY_NDARRAY_HH_
