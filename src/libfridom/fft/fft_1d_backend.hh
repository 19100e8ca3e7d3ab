/**
 * @file   fft/fft_1d_backend.hh
 *
 * @author FRIDOM developers
 *
 * @date   05 Sep 2024
 *
 * @brief  Abstract interface for batched one-dimensional complex FFTs
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

#ifndef SRC_LIBFRIDOM_FFT_FFT_1D_BACKEND_HH_
#define SRC_LIBFRIDOM_FFT_FFT_1D_BACKEND_HH_

#include "core/types.hh"

#include <memory>

namespace fridom {

/**
 * Abstract interface for batched 1D complex-to-complex FFTs.
 *
 * A batch consists of `batch` transforms of length `n`. Element `k` of
 * transform `b` lives at `data[k * stride + b * dist]`. Transforms are
 * unnormalised in both directions and may be carried out in place
 * (`input == output`).
 */
class FFT1DBackend {
 public:
  virtual ~FFT1DBackend() = default;

  //! forward transform, exponent -2 pi i k n / N
  virtual void c2c_forward(Index_t n, Index_t batch, const Complex * input,
                           Index_t in_stride, Index_t in_dist, Complex * output,
                           Index_t out_stride, Index_t out_dist) = 0;

  //! backward transform, exponent +2 pi i k n / N, not divided by N
  virtual void c2c_backward(Index_t n, Index_t batch, const Complex * input,
                            Index_t in_stride, Index_t in_dist,
                            Complex * output, Index_t out_stride,
                            Index_t out_dist) = 0;

  //! true if the backend operates on device memory
  virtual bool supports_device_memory() const = 0;

  virtual const char * name() const = 0;
};

//! the FFT implementation used on host memory (pocketfft)
std::unique_ptr<FFT1DBackend> get_host_fft_backend();

}  // namespace fridom

#endif  // SRC_LIBFRIDOM_FFT_FFT_1D_BACKEND_HH_
