/* Required Notice: Copyright (c) 2025 Robert E. Smith <robert.smith@florey.edu.au>;
 * Required Notice: The Florey Institute of Neuroscience and Mental Health.
 *
 * Licensed under the PolyForm Noncommercial License 1.0.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at:
 *
 *     https://polyformproject.org/licenses/noncommercial/1.0.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND,
 * either express or implied.
 * See the License of the specific language
 * governing permissions and limitations under the License.
 */

#include "rsa/noise.h"

#include <algorithm>

#include <Eigen/Cholesky>

#include "exception.h"
#include "math/math.h"
#include "mrtrix.h"

namespace MR::RSA::Noise {

matrix_type covariance_from_residuals(const matrix_type &residuals, const ssize_t dof) {
  const ssize_t n = residuals.rows();
  const ssize_t p = residuals.cols();
  if (dof <= 0)
    throw Exception("Insufficient degrees of freedom (" + str(dof) + ") for noise covariance estimation");
  if (!p)
    throw Exception("Cannot estimate noise covariance with zero channels");
  const matrix_type S = residuals.transpose() * residuals / default_type(dof);
  const default_type mu = S.trace() / default_type(p);
  const default_type d2 = (S - mu * matrix_type::Identity(p, p)).squaredNorm();
  // Zero dispersion of eigenvalues: sample covariance is already a scaled identity
  if (d2 <= 0.0)
    return S;
  // Variance of the sample covariance estimate, from the individual outer products
  default_type b2_bar = 0.0;
  const default_type S_norm2 = S.squaredNorm();
  for (ssize_t k = 0; k != n; ++k) {
    const vector_type x = residuals.row(k).transpose();
    b2_bar += Math::pow2(x.squaredNorm()) - 2.0 * x.dot(S * x) + S_norm2;
  }
  b2_bar /= Math::pow2(default_type(n));
  const default_type b2 = std::min(b2_bar, d2);
  const default_type shrinkage = b2 / d2;
  DEBUG("Noise covariance shrinkage intensity: " + str(shrinkage));
  return shrinkage * mu * matrix_type::Identity(p, p) + (1.0 - shrinkage) * S;
}

matrix_type precision_from_residuals(const matrix_type &residuals, const ssize_t dof) {
  const matrix_type covariance = covariance_from_residuals(residuals, dof);
  Eigen::LLT<matrix_type> llt(covariance);
  if (llt.info() != Eigen::Success)
    throw Exception("Noise covariance matrix is not positive definite; unable to compute precision");
  return llt.solve(matrix_type::Identity(covariance.rows(), covariance.cols()));
}

} // namespace MR::RSA::Noise
