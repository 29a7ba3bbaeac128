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

#include "rsa/evaluate.h"

#include <exception>
#include <limits>

#include "exception.h"
#include "mrtrix.h"
#include "rsa/parallel.h"

namespace MR::RSA::Evaluation {

Result eval_fixed(const Model::model_list &models, const RDMs &rdm, const Compare::compare_type type) {
  if (rdm.n_rdm() != 1)
    throw Exception("Fixed model evaluation expects a single RDM (received " + str(rdm.n_rdm()) + ")");
  const vector_type data = rdm.dissimilarities.row(0).transpose();
  std::vector<std::string> names;
  vector_type evaluations(models.size());
  for (size_t i = 0; i != models.size(); ++i) {
    names.push_back(models[i]->name);
    evaluations[i] = Compare::compare(models[i]->predict(), data, type);
  }
  return Result(names, evaluations, Compare::name(type));
}

eval_function make_eval_fixed(const Compare::compare_type type) {
  return [type](const Model::model_list &models, const RDMs &rdm) { return eval_fixed(models, rdm, type); };
}

std::vector<Result> evaluate_searchlight(const RDMs &rdms,
                                         const Model::model_list &models,
                                         const eval_function &func,
                                         const size_t num_threads,
                                         const failure_policy policy,
                                         const progress_callback &progress) {
  if (models.empty())
    throw Exception("No models provided for searchlight evaluation");
  for (const auto &model : models) {
    if (model->n_pairs() != rdms.n_pairs())
      throw Exception("Model \"" + model->name + "\" predicts " + str(model->n_pairs()) +
                      " dissimilarities, but data RDMs contain " + str(rdms.n_pairs()));
  }

  std::vector<std::string> names;
  for (const auto &model : models)
    names.push_back(model->name);

  const size_t count = rdms.n_rdm();
  std::vector<Result> results(count);
  auto mark_failed = [&](const size_t index, const std::string &error) {
    Result failed(names, vector_type::Constant(models.size(), std::numeric_limits<default_type>::quiet_NaN()), "");
    failed.valid = false;
    failed.error = error;
    results[index] = failed;
  };
  auto worker = [&](const size_t index) {
    try {
      results[index] = func(models, rdms.get(index));
    } catch (Exception &e) {
      mark_failed(index, join(e.description, "; "));
    } catch (std::exception &e) {
      mark_failed(index, e.what());
    }
  };
  run_indexed(count, worker, num_threads, progress);

  size_t failures = 0;
  for (size_t index = 0; index != count; ++index) {
    if (results[index].valid)
      continue;
    if (policy == failure_policy::ABORT)
      throw Exception("Evaluation failed for searchlight " + str(index) + ": " + results[index].error);
    ++failures;
  }
  if (failures)
    WARN(str(failures) + " of " + str(count) + " searchlights could not be evaluated;" +
         " these have been marked as invalid");
  else
    INFO("Evaluated " + str(models.size()) + " model" + (models.size() > 1 ? "s" : "") + " across " + str(count) +
         " searchlights");
  return results;
}

} // namespace MR::RSA::Evaluation
