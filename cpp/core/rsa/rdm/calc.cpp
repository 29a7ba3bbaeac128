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

#include "rsa/rdm/calc.h"

#include <map>

#include "exception.h"
#include "mrtrix.h"
#include "rsa/noise.h"
#include "rsa/parallel.h"

namespace MR::RSA {

namespace {

void check_precision(const matrix_type *precision, const Dataset &dataset) {
  if (precision && (precision->rows() != dataset.n_channel() || precision->cols() != dataset.n_channel()))
    throw Exception("Noise precision matrix dimensions (" + str(precision->rows()) + "x" + str(precision->cols()) +
                    ") do not match number of channels (" + str(dataset.n_channel()) + ")");
}

// Channel-normalised inner products between paired difference vectors
vector_type weighted_products(const matrix_type &diff_a, const matrix_type &diff_b, const matrix_type *precision) {
  const default_type n_channel = default_type(diff_a.cols());
  if (precision)
    return (diff_a * (*precision)).cwiseProduct(diff_b).rowwise().sum() / n_channel;
  return diff_a.cwiseProduct(diff_b).rowwise().sum() / n_channel;
}

} // namespace

matrix_type pairwise_differences(const matrix_type &means) {
  const ssize_t n = means.rows();
  matrix_type result(RSA::n_pairs(n), means.cols());
  ssize_t k = 0;
  for (ssize_t i = 0; i != n; ++i) {
    for (ssize_t j = i + 1; j != n; ++j)
      result.row(k++) = means.row(i) - means.row(j);
  }
  return result;
}

descriptor_type default_cv_descriptor(const descriptor_type &conditions) {
  std::map<default_type, default_type> counts;
  descriptor_type result(conditions.size());
  for (size_t i = 0; i != conditions.size(); ++i)
    result[i] = counts[conditions[i]]++;
  return result;
}

vector_type calc_rdm_euclidean(const Dataset &dataset, const std::string &descriptor, descriptor_type &conditions) {
  return calc_rdm_mahalanobis(dataset, descriptor, nullptr, conditions);
}

vector_type calc_rdm_correlation(const Dataset &dataset, const std::string &descriptor, descriptor_type &conditions) {
  auto averages = dataset.average_by(descriptor);
  conditions = averages.second;
  matrix_type &means(averages.first);
  for (ssize_t i = 0; i != means.rows(); ++i) {
    means.row(i).array() -= means.row(i).mean();
    const default_type norm = means.row(i).norm();
    // Flat patterns are left un-normalised; their correlation with anything is then zero
    if (norm > 1e-10)
      means.row(i) /= norm;
  }
  const matrix_type correlations = means * means.transpose();
  vector_type result(RSA::n_pairs(means.rows()));
  ssize_t k = 0;
  for (ssize_t i = 0; i != means.rows(); ++i) {
    for (ssize_t j = i + 1; j != means.rows(); ++j)
      result[k++] = 1.0 - correlations(i, j);
  }
  return result;
}

vector_type calc_rdm_mahalanobis(const Dataset &dataset,
                                 const std::string &descriptor,
                                 const matrix_type *precision,
                                 descriptor_type &conditions) {
  check_precision(precision, dataset);
  const auto averages = dataset.average_by(descriptor);
  conditions = averages.second;
  const matrix_type diff = pairwise_differences(averages.first);
  return weighted_products(diff, diff, precision);
}

vector_type calc_rdm_crossnobis(const Dataset &dataset,
                                const std::string &descriptor,
                                const matrix_type *precision,
                                const std::string &cv_descriptor,
                                descriptor_type &conditions) {
  check_precision(precision, dataset);
  Dataset data(dataset);
  std::string fold_descriptor(cv_descriptor);
  if (fold_descriptor.empty()) {
    fold_descriptor = "__cv__";
    data.obs_descriptors[fold_descriptor] =
        default_cv_descriptor(Descriptor::get(data.obs_descriptors, descriptor));
  }
  conditions = Descriptor::unique(Descriptor::get(data.obs_descriptors, descriptor));
  const descriptor_type folds = Descriptor::unique(Descriptor::get(data.obs_descriptors, fold_descriptor));
  if (folds.size() < 2)
    throw Exception("Crossnobis dissimilarity requires at least two cross-validation folds"
                    " (found " + str(folds.size()) + ")");

  vector_type result = vector_type::Zero(RSA::n_pairs(conditions.size()));
  for (const auto fold : folds) {
    descriptor_type training_folds;
    for (const auto f : folds) {
      if (f != fold)
        training_folds.push_back(f);
    }
    const auto test = data.subset_obs(fold_descriptor, fold).average_by(descriptor);
    const auto train = data.subset_obs(fold_descriptor, training_folds).average_by(descriptor);
    if (test.second != conditions || train.second != conditions)
      throw Exception("Not all conditions are present in cross-validation fold " + str(fold) +
                      "; crossnobis dissimilarity cannot be computed");
    result += weighted_products(pairwise_differences(train.first), pairwise_differences(test.first), precision);
  }
  return result / default_type(folds.size());
}

RDMs calc_rdm(const Dataset &dataset,
              const method_type method,
              const std::string &descriptor,
              const matrix_type *precision,
              const std::string &cv_descriptor) {
  descriptor_type conditions;
  vector_type dissimilarities;
  switch (method) {
  case method_type::EUCLIDEAN:
    dissimilarities = calc_rdm_euclidean(dataset, descriptor, conditions);
    break;
  case method_type::CORRELATION:
    dissimilarities = calc_rdm_correlation(dataset, descriptor, conditions);
    break;
  case method_type::MAHALANOBIS:
    dissimilarities = calc_rdm_mahalanobis(dataset, descriptor, precision, conditions);
    break;
  case method_type::CROSSNOBIS:
    dissimilarities = calc_rdm_crossnobis(dataset, descriptor, precision, cv_descriptor, conditions);
    break;
  }
  return RDMs(dissimilarities.transpose(), method_name(method), conditions, dataset.descriptors);
}

RDMs calc_rdm(const std::vector<Dataset> &datasets,
              const method_type method,
              const std::string &descriptor,
              const noise_type noise,
              const size_t num_threads) {
  if (datasets.empty())
    throw Exception("No datasets provided for RDM calculation");
  const descriptor_type conditions = Descriptor::unique(Descriptor::get(datasets.front().obs_descriptors, descriptor));
  const bool estimate_noise =
      noise == noise_type::RESIDUALS && (method == method_type::MAHALANOBIS || method == method_type::CROSSNOBIS);

  matrix_type dissimilarities(datasets.size(), RSA::n_pairs(conditions.size()));
  // One slot per dataset, such that worker threads never write to the same location
  std::vector<std::string> errors(datasets.size());
  auto func = [&](const size_t index) {
    const Dataset &dataset(datasets[index]);
    try {
      matrix_type precision;
      if (estimate_noise) {
        const ssize_t dof = dataset.n_obs() - ssize_t(conditions.size());
        precision = Noise::precision_from_residuals(dataset.residuals(descriptor), dof);
      }
      const RDMs rdm = calc_rdm(dataset, method, descriptor, estimate_noise ? &precision : nullptr);
      if (rdm.conditions != conditions) {
        errors[index] = "conditions of dataset " + str(index) + " (" + str(rdm.conditions.size()) + ")" +
                        " differ from those of the first dataset (" + str(conditions.size()) + ")";
        return;
      }
      dissimilarities.row(index) = rdm.dissimilarities.row(0);
    } catch (Exception &e) {
      errors[index] = "dataset " + str(index) + ": " + join(e.description, "; ");
    }
  };
  run_indexed(datasets.size(), func, num_threads, nullptr);
  for (const auto &e : errors) {
    if (!e.empty())
      throw Exception("Error computing RDMs: " + e);
  }

  Descriptors rdm_descriptors;
  for (const auto &d : datasets.front().descriptors) {
    descriptor_type values;
    values.reserve(datasets.size());
    for (const auto &dataset : datasets) {
      const auto it = dataset.descriptors.find(d.first);
      if (it == dataset.descriptors.end())
        throw Exception("Dataset descriptor \"" + d.first + "\" not present in all datasets");
      values.push_back(it->second.front());
    }
    rdm_descriptors[d.first] = std::move(values);
  }
  return RDMs(dissimilarities, method_name(method), conditions, rdm_descriptors);
}

} // namespace MR::RSA
