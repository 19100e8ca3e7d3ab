/**
 * @file   test_ndarray.cc
 *
 * @author FRIDOM developers
 *
 * @date   04 Sep 2024
 *
 * @brief  Tests for the n-dimensional array and its regions
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

#include "tests.hh"

#include "array/array_backend.hh"
#include "array/ndarray.hh"
#include "core/exception.hh"

namespace fridom {

  BOOST_AUTO_TEST_SUITE(ndarray_test);

  struct ArrayFixture {
    ArrayFixture() : array{DynGridIndex{4, 3, 2}} {
      for (Index_t i{0}; i < this->array.size(); ++i) {
        this->array[i] = Real(i);
      }
    }
    Array<Real> array;
  };

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(column_major_layout, ArrayFixture) {
    BOOST_CHECK_EQUAL(array.get_dim(), 3);
    BOOST_CHECK_EQUAL(array.size(), 24);
    BOOST_CHECK_EQUAL(array.get_strides(), (DynGridIndex{1, 4, 12}));
    BOOST_CHECK_EQUAL(array(DynGridIndex{1, 0, 0}), 1.);
    BOOST_CHECK_EQUAL(array(DynGridIndex{0, 1, 0}), 4.);
    BOOST_CHECK_EQUAL(array(DynGridIndex{3, 2, 1}), 23.);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(for_each_index_order) {
    Region region{Slice{1, 3}, Slice{2, 4}};
    std::vector<DynGridIndex> visited{};
    for_each_index(region, [&visited](const DynGridIndex & ccoord) {
      visited.push_back(ccoord);
    });
    std::vector<DynGridIndex> ref{DynGridIndex{1, 2}, DynGridIndex{2, 2},
                                  DynGridIndex{1, 3}, DynGridIndex{2, 3}};
    BOOST_CHECK_EQUAL(visited.size(), ref.size());
    for (size_t i{0}; i < ref.size(); ++i) {
      BOOST_CHECK_EQUAL(visited[i], ref[i]);
    }

    // an empty region visits nothing
    size_t counter{0};
    for_each_index(Region{Slice{0, 2}, Slice{3, 3}},
                   [&counter](const DynGridIndex &) { ++counter; });
    BOOST_CHECK_EQUAL(counter, 0);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(extract_and_assign, ArrayFixture) {
    Region region{Slice{1, 3}, Slice{0, 3}, Slice{1, 2}};
    auto slab{array.extract(region)};
    BOOST_CHECK_EQUAL(slab.get_shape(), (DynGridIndex{2, 3, 1}));
    BOOST_CHECK_EQUAL(slab(DynGridIndex{0, 0, 0}), 13.);
    BOOST_CHECK_EQUAL(slab(DynGridIndex{1, 2, 0}), 22.);

    Array<Real> target(array.get_shape(), -1.);
    target.assign(region, slab);
    for_each_index(full_region(target.get_shape()),
                   [&](const DynGridIndex & ccoord) {
                     const bool inside{ccoord[0] >= 1 and ccoord[0] < 3 and
                                       ccoord[2] == 1};
                     BOOST_CHECK_EQUAL(target(ccoord),
                                       inside ? array(ccoord) : -1.);
                   });
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(copy_region_within_array, ArrayFixture) {
    // copy the last layer along axis 0 onto the first one
    auto src{axis_region(array.get_shape(), 0, 3, 0)};
    auto dst{axis_region(array.get_shape(), 0, 0, 3)};
    array.copy_region(dst, array, src);
    for (Index_t j{0}; j < 3; ++j) {
      for (Index_t k{0}; k < 2; ++k) {
        BOOST_CHECK_EQUAL(array(DynGridIndex{0, j, k}),
                          array(DynGridIndex{3, j, k}));
      }
    }
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(invalid_regions, ArrayFixture) {
    BOOST_CHECK_THROW(array.extract(Region{Slice{0, 5}, Slice{0, 3},
                                           Slice{0, 2}}),
                      RuntimeError);
    BOOST_CHECK_THROW(array.extract(Region{Slice{0, 2}, Slice{0, 3}}),
                      RuntimeError);
    Array<Real> wrong_shape(DynGridIndex{2, 2, 2});
    BOOST_CHECK_THROW(array.assign(full_region(array.get_shape()),
                                   wrong_shape),
                      RuntimeError);
    BOOST_CHECK_THROW(array += wrong_shape, RuntimeError);
    BOOST_CHECK_THROW(Array<Real>(DynGridIndex{2, 2}, std::vector<Real>(3)),
                      RuntimeError);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_FIXTURE_TEST_CASE(arithmetic_and_conversion, ArrayFixture) {
    Array<Real> other(array.get_shape(), 2.);
    auto sum{array};
    sum += other;
    sum -= array;
    BOOST_CHECK_LT(sum.max_abs_diff(other), tol);
    sum *= 0.5;
    BOOST_CHECK_LT(std::abs(sum.max_abs() - 1.), tol);

    auto complex{array.cast<Complex>()};
    BOOST_CHECK_EQUAL(complex.get_shape(), array.get_shape());
    complex *= Complex{0., 1.};
    BOOST_CHECK_LT(real(complex).max_abs(), tol);
    BOOST_CHECK_LT(std::abs(complex.max_abs() - 23.), tol);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(region_helpers) {
    DynGridIndex shape{5, 4};
    auto region{axis_region(shape, 1, 1, 2)};
    BOOST_CHECK_EQUAL(region[0], (Slice{0, 5}));
    BOOST_CHECK_EQUAL(region[1], (Slice{1, 2}));
    BOOST_CHECK_EQUAL(region_shape(region), (DynGridIndex{5, 1}));
    BOOST_CHECK_EQUAL(region_start(region), (DynGridIndex{0, 1}));
    BOOST_CHECK(!region_is_empty(region));
    BOOST_CHECK(region_is_empty(axis_region(shape, 1, 2, 2)));
    BOOST_CHECK_EQUAL(Slice({3, 1}).size(), 0);
  }

  /* ---------------------------------------------------------------------- */
  BOOST_AUTO_TEST_CASE(host_backend) {
    auto backend{make_array_backend("numpy")};
    BOOST_CHECK_EQUAL(std::string(backend->name()), "host");
    auto zeros{backend->zeros<Complex>(DynGridIndex{3, 2})};
    BOOST_CHECK_EQUAL(zeros.size(), 6);
    BOOST_CHECK_EQUAL(zeros.max_abs(), 0.);
    BOOST_CHECK_THROW(make_array_backend("cupy"), ConfigurationError);

    // averaging matrix applied along the second axis
    Array<Real> array(DynGridIndex{2, 3});
    for (Index_t i{0}; i < array.size(); ++i) {
      array[i] = Real(i);
    }
    Eigen::MatrixXd average{Eigen::MatrixXd::Constant(3, 3, 1. / 3.)};
    backend->apply_along_axis(array, 1, average);
    BOOST_CHECK_LT(std::abs(array(DynGridIndex{0, 0}) - 2.), tol);
    BOOST_CHECK_LT(std::abs(array(DynGridIndex{1, 2}) - 3.), tol);
  }

  BOOST_AUTO_TEST_SUITE_END();

}  // namespace fridom
