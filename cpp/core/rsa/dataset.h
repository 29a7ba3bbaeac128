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
#include <utility>
#include <vector>

#include "rsa/descriptor.h"
#include "rsa/rsa.h"

namespace MR::RSA {

// Measurements (observations x channels) along with named descriptors:
// - descriptors: one value describing the whole dataset
// - obs_descriptors: one value per observation (row)
// - channel_descriptors: one value per channel (column)
class Dataset {
public:
  Dataset(const matrix_type &measurements,
          const Descriptors &descriptors = Descriptors(),
          const Descriptors &obs_descriptors = Descriptors(),
          const Descriptors &channel_descriptors = Descriptors());
  Dataset(matrix_type &&measurements,
          const Descriptors &descriptors,
          const Descriptors &obs_descriptors,
          const Descriptors &channel_descriptors);

  ssize_t n_obs() const { return data.rows(); }
  ssize_t n_channel() const { return data.cols(); }
  const matrix_type &measurements() const { return data; }

  Dataset subset_obs(const std::string &by, const default_type value) const;
  Dataset subset_obs(const std::string &by, const descriptor_type &values) const;
  Dataset subset_channel(const std::string &by, const descriptor_type &values) const;

  // Mean pattern for each unique value of an observation descriptor;
  //   rows of the returned matrix follow the sorted unique values
  std::pair<matrix_type, descriptor_type> average_by(const std::string &by) const;

  // Deviation of each observation from the mean pattern of its group
  matrix_type residuals(const std::string &by) const;

  Descriptors descriptors;
  Descriptors obs_descriptors;
  Descriptors channel_descriptors;

protected:
  matrix_type data;

  void validate() const;
  Dataset select_obs(const std::vector<size_t> &rows) const;
};

} // namespace MR::RSA
