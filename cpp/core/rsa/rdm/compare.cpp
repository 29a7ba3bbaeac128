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

#include "rsa/rdm/compare.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "exception.h"
#include "mrtrix.h"

namespace MR::RSA::Compare {

namespace {

constexpr default_type degenerate_threshold = 1e-10;

default_type cosine(const vector_type &a, const vector_type &b) {
  const default_type norm_a = a.norm();
  const default_type norm_b = b.norm();
  if (norm_a < degenerate_threshold || norm_b < degenerate_threshold)
    return std::numeric_limits<default_type>::quiet_NaN();
  return a.dot(b) / (norm_a * norm_b);
}

default_type pearson(const vector_type &a, const vector_type &b) {
  const vector_type a_centred = a.array() - a.mean();
  const vector_type b_centred = b.array() - b.mean();
  return cosine(a_centred, b_centred);
}

} // namespace

compare_type from_name(const std::string &name) {
  const std::string lower = lowercase(name);
  for (size_t i = 0; i != comparisons.size(); ++i) {
    if (lower == comparisons[i])
      return compare_type(i);
  }
  throw Exception("Unknown RDM comparison method \"" + name + "\"; options are: " + join(comparisons, ","));
}

const std::string &name(const compare_type type) { return comparisons[size_t(type)]; }

vector_type ranks(const vector_type &x) {
  const ssize_t n = x.size();
  std::vector<std::pair<default_type, ssize_t>> indexed(n);
  for (ssize_t i = 0; i != n; ++i)
    indexed[i] = {x[i], i};
  std::sort(indexed.begin(), indexed.end());
  vector_type result(n);
  ssize_t i = 0;
  while (i < n) {
    ssize_t j = i;
    while (j < n && indexed[j].first == indexed[i].first)
      ++j;
    const default_type average_rank = 0.5 * (i + j - 1) + 1.0;
    for (ssize_t k = i; k < j; ++k)
      result[indexed[k].second] = average_rank;
    i = j;
  }
  return result;
}

default_type compare(const vector_type &a, const vector_type &b, const compare_type type) {
  if (a.size() != b.size())
    throw Exception("Cannot compare RDMs with different numbers of dissimilarities"
                    " (" + str(a.size()) + " vs. " + str(b.size()) + ")");
  std::vector<ssize_t> valid;
  for (ssize_t i = 0; i != a.size(); ++i) {
    if (std::isfinite(a[i]) && std::isfinite(b[i]))
      valid.push_back(i);
  }
  // Correlation of fewer than two entries is undefined
  if (valid.size() < 2)
    return std::numeric_limits<default_type>::quiet_NaN();
  vector_type a_valid(valid.size()), b_valid(valid.size());
  for (size_t i = 0; i != valid.size(); ++i) {
    a_valid[i] = a[valid[i]];
    b_valid[i] = b[valid[i]];
  }
  switch (type) {
  case compare_type::CORR:
    return pearson(a_valid, b_valid);
  case compare_type::COSINE:
    return cosine(a_valid, b_valid);
  case compare_type::SPEARMAN:
    return pearson(ranks(a_valid), ranks(b_valid));
  }
  return std::numeric_limits<default_type>::quiet_NaN();
}

} // namespace MR::RSA::Compare
