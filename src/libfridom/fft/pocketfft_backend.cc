/**
 * @file   fft/pocketfft_backend.cc
 *
 * @author FRIDOM developers
 *
 * @date   05 Sep 2024
 *
 * @brief  Batched complex FFTs on host memory through pocketfft
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

#include "fft/pocketfft_backend.hh"

#define POCKETFFT_NO_MULTITHREADING
#include "pocketfft_hdronly.h"

namespace fridom {

void PocketFFTBackend::c2c_forward(Index_t n, Index_t batch,
                                   const Complex * input, Index_t in_stride,
                                   Index_t in_dist, Complex * output,
                                   Index_t out_stride, Index_t out_dist) {
  this->c2c(true, n, batch, input, in_stride, in_dist, output, out_stride,
            out_dist);
}

void PocketFFTBackend::c2c_backward(Index_t n, Index_t batch,
                                    const Complex * input, Index_t in_stride,
                                    Index_t in_dist, Complex * output,
                                    Index_t out_stride, Index_t out_dist) {
  this->c2c(false, n, batch, input, in_stride, in_dist, output, out_stride,
            out_dist);
}

void PocketFFTBackend::c2c(bool forward, Index_t n, Index_t batch,
                           const Complex * input, Index_t in_stride,
                           Index_t in_dist, Complex * output,
                           Index_t out_stride, Index_t out_dist) {
  if (n == 0 or batch == 0) {
    return;
  }
  // the batch is the second (untransformed) axis of a 2D transform
  pocketfft::shape_t shape{static_cast<size_t>(n), static_cast<size_t>(batch)};
  pocketfft::shape_t axes{0};
  pocketfft::stride_t stride_in{
      static_cast<ptrdiff_t>(in_stride * sizeof(Complex)),
      static_cast<ptrdiff_t>(in_dist * sizeof(Complex))};
  pocketfft::stride_t stride_out{
      static_cast<ptrdiff_t>(out_stride * sizeof(Complex)),
      static_cast<ptrdiff_t>(out_dist * sizeof(Complex))};

  pocketfft::c2c(shape, stride_in, stride_out, axes,
                 forward ? pocketfft::FORWARD : pocketfft::BACKWARD,
                 reinterpret_cast<const std::complex<Real> *>(input),
                 reinterpret_cast<std::complex<Real> *>(output),
                 1.0  // scale factor
  );
}

std::unique_ptr<FFT1DBackend> get_host_fft_backend() {
  return std::make_unique<PocketFFTBackend>();
}

}  // namespace fridom
