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

#include <functional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "app.h"
#include "progressbar.h"
#include "types.h"

namespace MR::RSA {

using matrix_type = Eigen::Matrix<default_type, Eigen::Dynamic, Eigen::Dynamic>;
using vector_type = Eigen::Matrix<default_type, Eigen::Dynamic, 1>;

// Invoked with the number of items processed so far and the total number of items;
//   long-running scans report progress through this rather than owning a ProgressBar
using progress_callback = std::function<void(const size_t, const size_t)>;
// Advances a terminal progress bar to the running count reported through a callback
progress_callback progress_to(ProgressBar &progress);

extern const char *searchlight_description;
extern const char *ordering_description;
extern const char *method_description;

const std::vector<std::string> methods = {"euclidean", "correlation", "mahalanobis", "crossnobis"};
enum class method_type { EUCLIDEAN, CORRELATION, MAHALANOBIS, CROSSNOBIS };
method_type method_from_name(const std::string &name);
const std::string &method_name(const method_type method);

const std::vector<std::string> noise_treatments = {"none", "residuals"};
enum class noise_type { NONE, RESIDUALS };

constexpr default_type default_radius = 2.0;
constexpr default_type default_threshold = 1.0;
constexpr size_t default_chunks = 100;

extern const App::OptionGroup searchlight_options;
extern const App::OptionGroup rdm_options;

// Number of unique condition pairs, i.e. the length of the upper triangle of an RDM
ssize_t n_pairs(const ssize_t n_conditions);
// Inverse of n_pairs(); throws if the value is not a triangular number
ssize_t n_conditions(const ssize_t n_pairs);

} // namespace MR::RSA
