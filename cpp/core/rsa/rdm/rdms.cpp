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

#include "rsa/rdm/rdms.h"

#include "exception.h"
#include "mrtrix.h"

namespace MR::RSA {

RDMs::RDMs(const matrix_type &dissimilarities,
           const std::string &dissimilarity_measure,
           const descriptor_type &conditions,
           const Descriptors &rdm_descriptors)
    : dissimilarities(dissimilarities),
      dissimilarity_measure(dissimilarity_measure),
      conditions(conditions),
      rdm_descriptors(rdm_descriptors) {
  if (this->conditions.empty()) {
    const ssize_t n = n_conditions(dissimilarities.cols());
    for (ssize_t i = 0; i != n; ++i)
      this->conditions.push_back(default_type(i));
  } else if (RSA::n_pairs(this->conditions.size()) != dissimilarities.cols()) {
    throw Exception("Number of dissimilarities per RDM (" + str(dissimilarities.cols()) + ")" +
                    " does not match number of conditions (" + str(this->conditions.size()) + ")");
  }
  Descriptor::check_length_error(this->rdm_descriptors, "RDM descriptors", dissimilarities.rows());
}

RDMs RDMs::get(const size_t index) const { return subset(std::vector<size_t>(1, index)); }

RDMs RDMs::subset(const std::vector<size_t> &indices) const {
  matrix_type selection(indices.size(), dissimilarities.cols());
  for (size_t i = 0; i != indices.size(); ++i) {
    if (indices[i] >= size_t(dissimilarities.rows()))
      throw Exception("RDM index " + str(indices[i]) + " out of range (" + str(dissimilarities.rows()) + " RDMs)");
    selection.row(i) = dissimilarities.row(indices[i]);
  }
  return RDMs(selection, dissimilarity_measure, conditions, Descriptor::subset(rdm_descriptors, indices));
}

matrix_type RDMs::squareform(const size_t index) const {
  if (index >= size_t(dissimilarities.rows()))
    throw Exception("RDM index " + str(index) + " out of range (" + str(dissimilarities.rows()) + " RDMs)");
  return RSA::squareform(dissimilarities.row(index).transpose());
}

vector_type upper_triangle(const matrix_type &square) {
  if (square.rows() != square.cols())
    throw Exception("Cannot extract upper triangle of non-square " + str(square.rows()) + "x" + str(square.cols()) +
                    " matrix");
  const ssize_t n = square.rows();
  vector_type result(n_pairs(n));
  ssize_t k = 0;
  for (ssize_t i = 0; i != n; ++i) {
    for (ssize_t j = i + 1; j != n; ++j)
      result[k++] = square(i, j);
  }
  return result;
}

matrix_type squareform(const vector_type &dissimilarities) {
  const ssize_t n = n_conditions(dissimilarities.size());
  matrix_type result = matrix_type::Zero(n, n);
  ssize_t k = 0;
  for (ssize_t i = 0; i != n; ++i) {
    for (ssize_t j = i + 1; j != n; ++j) {
      result(i, j) = result(j, i) = dissimilarities[k++];
    }
  }
  return result;
}

} // namespace MR::RSA
