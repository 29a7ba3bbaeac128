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

#include <string>
#include <vector>

#include "rsa/descriptor.h"
#include "rsa/rsa.h"

namespace MR::RSA {

// A set of RDMs, each stored as the upper triangle of the square dissimilarity matrix
//   (row-major over condition pairs: (0,1), (0,2), ..., (1,2), ...);
//   one row of "dissimilarities" per RDM
class RDMs {
public:
  RDMs(const matrix_type &dissimilarities,
       const std::string &dissimilarity_measure,
       const descriptor_type &conditions = descriptor_type(),
       const Descriptors &rdm_descriptors = Descriptors());

  ssize_t n_rdm() const { return dissimilarities.rows(); }
  ssize_t n_cond() const { return conditions.size(); }
  ssize_t n_pairs() const { return dissimilarities.cols(); }

  // A set containing only one of these RDMs, along with its descriptors
  RDMs get(const size_t index) const;
  RDMs subset(const std::vector<size_t> &indices) const;
  matrix_type squareform(const size_t index) const;

  matrix_type dissimilarities;
  std::string dissimilarity_measure;
  descriptor_type conditions;
  Descriptors rdm_descriptors;
};

vector_type upper_triangle(const matrix_type &square);
matrix_type squareform(const vector_type &dissimilarities);

} // namespace MR::RSA
