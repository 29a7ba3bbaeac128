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

#include "rsa/model.h"
#include "rsa/rdm/compare.h"
#include "rsa/rdm/rdms.h"
#include "rsa/rsa.h"

namespace MR::RSA::Evaluation {

// Outcome of evaluating all models against the RDM of one searchlight
class Result {
public:
  Result() : valid(false) {}
  Result(const std::vector<std::string> &models, const vector_type &evaluations, const std::string &method)
      : models(models), evaluations(evaluations), method(method), valid(true) {}

  std::vector<std::string> models;
  vector_type evaluations;
  std::string method;
  bool valid;
  std::string error;
};

// Evaluates a set of models against a single-row RDMs
using eval_function = std::function<Result(const Model::model_list &, const RDMs &)>;

Result eval_fixed(const Model::model_list &models, const RDMs &rdm, const Compare::compare_type type);
eval_function make_eval_fixed(const Compare::compare_type type);

// ABORT: any failure throws once all workers have finished
// MARK: failed centres are flagged invalid, with NaN evaluations
enum class failure_policy { ABORT, MARK };

std::vector<Result> evaluate_searchlight(const RDMs &rdms,
                                         const Model::model_list &models,
                                         const eval_function &func,
                                         const size_t num_threads,
                                         const failure_policy policy = failure_policy::MARK,
                                         const progress_callback &progress = nullptr);

} // namespace MR::RSA::Evaluation
