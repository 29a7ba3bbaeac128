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

#include "rsa/dataset.h"

#include <algorithm>

#include "exception.h"
#include "mrtrix.h"

namespace MR::RSA {

Dataset::Dataset(const matrix_type &measurements,
                 const Descriptors &descriptors,
                 const Descriptors &obs_descriptors,
                 const Descriptors &channel_descriptors)
    : descriptors(descriptors),
      obs_descriptors(obs_descriptors),
      channel_descriptors(channel_descriptors),
      data(measurements) {
  validate();
}

Dataset::Dataset(matrix_type &&measurements,
                 const Descriptors &descriptors,
                 const Descriptors &obs_descriptors,
                 const Descriptors &channel_descriptors)
    : descriptors(descriptors),
      obs_descriptors(obs_descriptors),
      channel_descriptors(channel_descriptors),
      data(std::move(measurements)) {
  validate();
}

void Dataset::validate() const {
  Descriptor::check_length_error(descriptors, "Dataset descriptors", 1);
  Descriptor::check_length_error(obs_descriptors, "Observation descriptors", data.rows());
  Descriptor::check_length_error(channel_descriptors, "Channel descriptors", data.cols());
}

Dataset Dataset::select_obs(const std::vector<size_t> &rows) const {
  matrix_type selection(rows.size(), data.cols());
  for (size_t i = 0; i != rows.size(); ++i)
    selection.row(i) = data.row(rows[i]);
  return Dataset(std::move(selection), descriptors, Descriptor::subset(obs_descriptors, rows), channel_descriptors);
}

Dataset Dataset::subset_obs(const std::string &by, const default_type value) const {
  return select_obs(Descriptor::where(Descriptor::bool_index(Descriptor::get(obs_descriptors, by), value)));
}

Dataset Dataset::subset_obs(const std::string &by, const descriptor_type &values) const {
  return select_obs(Descriptor::where(Descriptor::bool_index(Descriptor::get(obs_descriptors, by), values)));
}

Dataset Dataset::subset_channel(const std::string &by, const descriptor_type &values) const {
  const auto columns =
      Descriptor::where(Descriptor::bool_index(Descriptor::get(channel_descriptors, by), values));
  matrix_type selection(data.rows(), columns.size());
  for (size_t i = 0; i != columns.size(); ++i)
    selection.col(i) = data.col(columns[i]);
  return Dataset(std::move(selection), descriptors, obs_descriptors, Descriptor::subset(channel_descriptors, columns));
}

std::pair<matrix_type, descriptor_type> Dataset::average_by(const std::string &by) const {
  const descriptor_type &labels = Descriptor::get(obs_descriptors, by);
  const descriptor_type values = Descriptor::unique(labels);
  matrix_type means = matrix_type::Zero(values.size(), data.cols());
  vector_type counts = vector_type::Zero(values.size());
  for (ssize_t row = 0; row != data.rows(); ++row) {
    const size_t group = std::lower_bound(values.begin(), values.end(), labels[row]) - values.begin();
    means.row(group) += data.row(row);
    counts[group] += 1.0;
  }
  for (size_t group = 0; group != values.size(); ++group)
    means.row(group) /= counts[group];
  return std::make_pair(means, values);
}

matrix_type Dataset::residuals(const std::string &by) const {
  const descriptor_type &labels = Descriptor::get(obs_descriptors, by);
  const auto averages = average_by(by);
  matrix_type result(data.rows(), data.cols());
  for (ssize_t row = 0; row != data.rows(); ++row) {
    const size_t group =
        std::lower_bound(averages.second.begin(), averages.second.end(), labels[row]) - averages.second.begin();
    result.row(row) = data.row(row) - averages.first.row(group);
  }
  return result;
}

} // namespace MR::RSA
