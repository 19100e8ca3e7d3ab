/**
 * @file   fft/spectral_transform.cc
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

#include "fft/spectral_transform.hh"
#include "fft/fft_utils.hh"
#include "core/exception.hh"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace fridom {

/* ---------------------------------------------------------------------- */
Eigen::MatrixXd transform_matrix(TransformType type, Index_t n,
                                 FFTDirection direction) {
  Eigen::MatrixXd weights(n, n);
  const Real N{static_cast<Real>(n)};
  const bool forward{direction == FFTDirection::Forward};
  for (Index_t k{0}; k < n; ++k) {
    for (Index_t j{0}; j < n; ++j) {
      switch (type) {
      case TransformType::DCT2: {
        if (forward) {
          weights(k, j) = 2 * std::cos(M_PI * k * (2 * j + 1) / (2 * N));
        } else if (j == 0) {
          // DCT-III, the zeroth mode enters with weight one
          weights(k, j) = 1. / (2 * N);
        } else {
          weights(k, j) = std::cos(M_PI * j * (2 * k + 1) / (2 * N)) / N;
        }
        break;
      }
      case TransformType::DST1: {
        weights(k, j) = 2 * std::sin(M_PI * (k + 1) * (j + 1) / (N + 1));
        if (!forward) {
          weights(k, j) /= 2 * (N + 1);
        }
        break;
      }
      case TransformType::DST2: {
        if (forward) {
          weights(k, j) =
              2 * std::sin(M_PI * (k + 1) * (2 * j + 1) / (2 * N));
        } else if (j == n - 1) {
          // DST-III, the last mode enters with weight (-1)^k
          weights(k, j) = (k % 2 == 0 ? 1. : -1.) / (2 * N);
        } else {
          weights(k, j) = std::sin(M_PI * (j + 1) * (2 * k + 1) / (2 * N)) / N;
        }
        break;
      }
      default:
        throw RuntimeError("unknown transform type");
        break;
      }
    }
  }
  return weights;
}

/* ---------------------------------------------------------------------- */
TransformType transform_type(AxisPosition position, BCType bc_type) {
  if (position == AxisPosition::Center) {
    return bc_type == BCType::Neumann ? TransformType::DCT2
                                      : TransformType::DST2;
  }
  if (bc_type == BCType::Dirichlet) {
    return TransformType::DST1;
  }
  std::stringstream error{};
  error << "There is no spectral transform for a field at the cell "
        << position << " with a " << bc_type << " boundary condition.";
  throw ConfigurationError(error.str());
}

/* ---------------------------------------------------------------------- */
CartesianFFT::CartesianFFT(const std::vector<bool> & periodic,
                           std::shared_ptr<ArrayBackend> backend)
    : periodic{periodic}, fft_axes{}, dct_axes{},
      backend{std::move(backend)}, matrices{} {
  for (size_t i{0}; i < periodic.size(); ++i) {
    if (periodic[i]) {
      this->fft_axes.push_back(Dim_t(i));
    } else {
      this->dct_axes.push_back(Dim_t(i));
    }
  }
}

/* ---------------------------------------------------------------------- */
std::vector<std::vector<Real>> CartesianFFT::get_freq(
    const DynGridIndex & shape, const DynGridPoint & dx,
    const std::vector<TransformType> & transform_types) const {
  if (shape.get_dim() != Dim_t(this->periodic.size()) or
      dx.get_dim() != Dim_t(this->periodic.size())) {
    std::stringstream error{};
    error << "Expected a shape and grid spacing with "
          << this->periodic.size() << " entries, got " << shape
          << " and " << dx << ".";
    throw RuntimeError(error.str());
  }
  std::vector<std::vector<Real>> k{};
  for (Dim_t i{0}; i < shape.get_dim(); ++i) {
    if (this->periodic[i]) {
      k.push_back(fft_freq(shape[i], dx[i] / (2 * M_PI)));
    } else {
      k.push_back(cosine_sine_freq(
          shape[i], dx[i], this->get_type(i, transform_types)));
    }
  }
  return k;
}

/* ---------------------------------------------------------------------- */
void CartesianFFT::forward(
    Array<Complex> & u,
    const std::vector<TransformType> & transform_types) const {
  AxisList axes(this->periodic.size());
  std::iota(axes.begin(), axes.end(), 0);
  this->forward(u, axes, transform_types);
}

/* ---------------------------------------------------------------------- */
void CartesianFFT::forward(
    Array<Complex> & u, const AxisList & axes,
    const std::vector<TransformType> & transform_types) const {
  this->check_axes(u, axes, transform_types);
  for (auto && axis : this->dct_axes) {
    if (std::find(axes.begin(), axes.end(), axis) == axes.end()) {
      continue;
    }
    this->backend->apply_along_axis(
        u, axis,
        this->get_matrix(this->get_type(axis, transform_types),
                         u.get_shape()[axis], FFTDirection::Forward));
  }
  for (auto && axis : this->fft_axes) {
    if (std::find(axes.begin(), axes.end(), axis) == axes.end()) {
      continue;
    }
    this->backend->c2c(u, axis, FFTDirection::Forward);
  }
}

/* ---------------------------------------------------------------------- */
void CartesianFFT::backward(
    Array<Complex> & u,
    const std::vector<TransformType> & transform_types) const {
  AxisList axes(this->periodic.size());
  std::iota(axes.begin(), axes.end(), 0);
  this->backward(u, axes, transform_types);
}

/* ---------------------------------------------------------------------- */
void CartesianFFT::backward(
    Array<Complex> & u, const AxisList & axes,
    const std::vector<TransformType> & transform_types) const {
  this->check_axes(u, axes, transform_types);
  Index_t nb_points{1};
  for (auto && axis : this->fft_axes) {
    if (std::find(axes.begin(), axes.end(), axis) == axes.end()) {
      continue;
    }
    this->backend->c2c(u, axis, FFTDirection::Backward);
    nb_points *= u.get_shape()[axis];
  }
  if (nb_points > 1) {
    this->backend->scale(u, 1. / nb_points);
  }
  for (auto && axis : this->dct_axes) {
    if (std::find(axes.begin(), axes.end(), axis) == axes.end()) {
      continue;
    }
    this->backend->apply_along_axis(
        u, axis,
        this->get_matrix(this->get_type(axis, transform_types),
                         u.get_shape()[axis], FFTDirection::Backward));
  }
}

/* ---------------------------------------------------------------------- */
TransformType CartesianFFT::get_type(
    Dim_t axis, const std::vector<TransformType> & transform_types) const {
  if (transform_types.empty()) {
    return TransformType::DCT2;
  }
  return transform_types[axis];
}

/* ---------------------------------------------------------------------- */
void CartesianFFT::check_axes(
    const Array<Complex> & u, const AxisList & axes,
    const std::vector<TransformType> & transform_types) const {
  const Dim_t n_dims{Dim_t(this->periodic.size())};
  if (u.get_dim() != n_dims) {
    std::stringstream error{};
    error << "Cannot transform a " << u.get_dim()
          << "-dimensional array on a " << n_dims
          << "-dimensional grid.";
    throw RuntimeError(error.str());
  }
  if (!transform_types.empty() and
      Dim_t(transform_types.size()) != n_dims) {
    std::stringstream error{};
    error << "Expected one transform type per axis (" << n_dims
          << "), got " << transform_types.size() << ".";
    throw RuntimeError(error.str());
  }
  for (auto && axis : axes) {
    if (axis < 0 or axis >= n_dims) {
      std::stringstream error{};
      error << "Axis " << axis << " is out of range for a "
            << n_dims << "-dimensional grid.";
      throw RuntimeError(error.str());
    }
  }
}

/* ---------------------------------------------------------------------- */
const Eigen::MatrixXd &
CartesianFFT::get_matrix(TransformType type, Index_t n,
                         FFTDirection direction) const {
  const MatrixKey key{type, n, direction};
  auto it{this->matrices.find(key)};
  if (it == this->matrices.end()) {
    it = this->matrices
             .emplace(key, transform_matrix(type, n, direction))
             .first;
  }
  return it->second;
}

}  // namespace fridom
