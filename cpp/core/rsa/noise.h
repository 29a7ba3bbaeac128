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

#pragma once

#include "rsa/rsa.h"

namespace MR::RSA::Noise {

// Covariance of residuals (observations x channels),
//   shrunk toward a scaled identity matrix with a data-driven shrinkage intensity
//   (Ledoit & Wolf, 2004)
// dof: degrees of freedom of the residuals;
//   typically the number of observations minus the number of conditions
matrix_type covariance_from_residuals(const matrix_type &residuals, const ssize_t dof);

matrix_type precision_from_residuals(const matrix_type &residuals, const ssize_t dof);

} // namespace MR::RSA::Noise
