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

#include "rsa/dataset.h"
#include "rsa/rdm/rdms.h"
#include "rsa/rsa.h"

namespace MR::RSA {

// Pairwise differences between rows, in upper-triangle order
matrix_type pairwise_differences(const matrix_type &means);

// Observation descriptor assigning each observation the number of times its condition
//   has already been observed (0, 1, 2, ...); used as default cross-validation folds
descriptor_type default_cv_descriptor(const descriptor_type &conditions);

vector_type calc_rdm_euclidean(const Dataset &dataset, const std::string &descriptor, descriptor_type &conditions);
vector_type calc_rdm_correlation(const Dataset &dataset, const std::string &descriptor, descriptor_type &conditions);
vector_type calc_rdm_mahalanobis(const Dataset &dataset,
                                 const std::string &descriptor,
                                 const matrix_type *precision,
                                 descriptor_type &conditions);
vector_type calc_rdm_crossnobis(const Dataset &dataset,
                                const std::string &descriptor,
                                const matrix_type *precision,
                                const std::string &cv_descriptor,
                                descriptor_type &conditions);

// RDM of a single dataset; the dataset descriptors become the RDM descriptors
// precision: optional noise precision matrix (channels x channels) for mahalanobis / crossnobis
// cv_descriptor: observation descriptor defining crossnobis folds;
//   if empty, the repetition number within each condition is used
RDMs calc_rdm(const Dataset &dataset,
              const method_type method,
              const std::string &descriptor,
              const matrix_type *precision = nullptr,
              const std::string &cv_descriptor = std::string());

// One RDM per dataset, in the order of the datasets;
//   all datasets must yield the same set of conditions
RDMs calc_rdm(const std::vector<Dataset> &datasets,
              const method_type method,
              const std::string &descriptor,
              const noise_type noise = noise_type::NONE,
              const size_t num_threads = 1);

} // namespace MR::RSA
