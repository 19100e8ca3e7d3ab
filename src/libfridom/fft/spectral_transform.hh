/**
 * @file   fft/spectral_transform.hh
 *
 * @author FRIDOM developers
 *
 * @date   18 Sep 2024
 *
 * @brief  Local Fourier, cosine and sine transforms of Cartesian grids
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

#ifndef SRC_LIBFRIDOM_FFT_SPECTRAL_TRANSFORM_HH_
#define SRC_LIBFRIDOM_FFT_SPECTRAL_TRANSFORM_HH_

#include "array/array_backend.hh"
#include "core/enums.hh"

#include "Eigen/Dense"

#include <map>
#include <memory>
#include <tuple>
#include <vector>

namespace fridom {

/**
 * @brief Dense matrix of a cosine or sine transform of length `n`.
 *
 * The forward transforms are unnormalised,
 *
 *     DCT-II: y_k = 2 sum_n x_n cos(pi k (2n + 1) / 2N)
 *     DST-I:  y_k = 2 sum_n x_n sin(pi (k + 1)(n + 1) / (N + 1))
 *     DST-II: y_k = 2 sum_n x_n sin(pi (k + 1)(2n + 1) / 2N)
 *
 * and the backward matrices are their exact inverses (DCT-III / 2N,
 * DST-I / 2(N + 1) and DST-III / 2N). Entry `(k, n)` maps input `n` to
 * output `k`.
 */
Eigen::MatrixXd transform_matrix(TransformType type, Index_t n,
                                 FFTDirection direction);

/**
 * @brief Cosine or sine transform of a bounded axis for a field at
 * `position` with the boundary condition `bc_type`.
 *
 *     centre, Neumann:   DCT-II
 *     centre, Dirichlet: DST-II
 *     face, Dirichlet:   DST-I
 *
 * @throws ConfigurationError for a face centred field with a Neumann
 * boundary condition, which has no matching transform
 */
TransformType transform_type(AxisPosition position, BCType bc_type);

/**
 * @class CartesianFFT
 * @brief Spectral transform of a local array of a Cartesian grid.
 *
 * Periodic axes are transformed with the complex FFT, non-periodic axes
 * with a cosine or sine transform chosen per axis (DCT-II unless stated
 * otherwise). In the forward direction the cosine and sine transforms
 * are applied first, in the backward direction the inverse FFT is
 * applied first. The backward transform is the exact inverse of the
 * forward transform.
 *
 * All transformed axes must be complete in the local array, i.e. shared
 * axes of the decomposition.
 */
class CartesianFFT {
 public:
  explicit CartesianFFT(
      const std::vector<bool> & periodic,
      std::shared_ptr<ArrayBackend> backend = default_array_backend());

  /**
   * Wavenumbers along every axis of a grid with `shape` points and
   * spacing `dx`: `2 pi fftfreq(n, dx)` on periodic axes and the
   * cosine or sine wavenumbers on the other axes (see
   * `cosine_sine_freq`).
   */
  std::vector<std::vector<Real>>
  get_freq(const DynGridIndex & shape, const DynGridPoint & dx,
           const std::vector<TransformType> & transform_types = {}) const;

  //! transform along all axes, in place
  void forward(Array<Complex> & u,
               const std::vector<TransformType> & transform_types =
                   {}) const;

  /**
   * Transform along the given axes only, in place. An empty list of
   * axes leaves `u` untouched. `transform_types` is either empty or
   * has one entry per axis of the grid.
   */
  void forward(Array<Complex> & u, const AxisList & axes,
               const std::vector<TransformType> & transform_types =
                   {}) const;

  //! inverse of `forward` along all axes, in place
  void backward(Array<Complex> & u,
                const std::vector<TransformType> & transform_types =
                    {}) const;

  //! inverse of `forward` along the given axes, in place
  void backward(Array<Complex> & u, const AxisList & axes,
                const std::vector<TransformType> & transform_types =
                    {}) const;

  const std::vector<bool> & get_periodic() const {
    return this->periodic;
  }

  //! periodic axes, transformed with the FFT
  const AxisList & get_fft_axes() const { return this->fft_axes; }

  //! non-periodic axes, transformed with cosine or sine transforms
  const AxisList & get_dct_axes() const { return this->dct_axes; }

 protected:
  TransformType
  get_type(Dim_t axis,
           const std::vector<TransformType> & transform_types) const;

  void check_axes(const Array<Complex> & u, const AxisList & axes,
                  const std::vector<TransformType> & transform_types) const;

  //! cached transform matrix
  const Eigen::MatrixXd & get_matrix(TransformType type, Index_t n,
                                     FFTDirection direction) const;

  std::vector<bool> periodic;
  AxisList fft_axes;
  AxisList dct_axes;
  std::shared_ptr<ArrayBackend> backend;

  using MatrixKey = std::tuple<TransformType, Index_t, FFTDirection>;
  mutable std::map<MatrixKey, Eigen::MatrixXd> matrices;
};

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_FFT_SPECTRAL_TRANSFORM_HH_
