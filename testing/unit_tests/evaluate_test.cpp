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

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

#include "exception.h"
#include "rsa/evaluate.h"

using namespace MR;
using namespace MR::RSA;
using namespace MR::RSA::Evaluation;

namespace {

RDMs random_rdms(const size_t count, std::mt19937 &rng) {
  std::uniform_real_distribution<default_type> uniform(0.0, 2.0);
  matrix_type data(count, 6);
  descriptor_type voxel_index(count);
  for (size_t i = 0; i != count; ++i) {
    for (ssize_t k = 0; k != 6; ++k)
      data(i, k) = uniform(rng);
    voxel_index[i] = default_type(i);
  }
  return RDMs(data, "correlation", descriptor_type(), Descriptors{{"voxel_index", voxel_index}});
}

Model::model_list make_models() {
  vector_type first(6), second(6);
  first << 1, 2, 3, 4, 5, 6;
  second << 0, 1, 0, 1, 0, 1;
  return {std::make_shared<Model::Fixed>("first", first), std::make_shared<Model::Fixed>("second", second)};
}

// Fails for any RDM whose first dissimilarity is negative
Result fragile_eval(const Model::model_list &models, const RDMs &rdm) {
  if (rdm.dissimilarities(0, 0) < 0.0)
    throw Exception("negative dissimilarity");
  return eval_fixed(models, rdm, Compare::compare_type::CORR);
}

// Throws a standard library exception for any RDM whose first dissimilarity is negative
Result throwing_eval(const Model::model_list &models, const RDMs &rdm) {
  if (rdm.dissimilarities(0, 0) < 0.0)
    throw std::runtime_error("out of range dissimilarity");
  return eval_fixed(models, rdm, Compare::compare_type::CORR);
}

} // namespace

TEST(Evaluate, FixedModelScores) {
  std::mt19937 rng(1);
  const RDMs rdms = random_rdms(1, rng);
  const auto models = make_models();
  const Result result = eval_fixed(models, rdms, Compare::compare_type::SPEARMAN);
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(result.models, std::vector<std::string>({"first", "second"}));
  EXPECT_EQ(result.method, "spearman");
  const vector_type data = rdms.dissimilarities.row(0).transpose();
  EXPECT_DOUBLE_EQ(result.evaluations[0],
                   Compare::compare(models[0]->predict(), data, Compare::compare_type::SPEARMAN));
}

TEST(Evaluate, OrderPreservedUnderThreading) {
  std::mt19937 rng(2);
  const RDMs rdms = random_rdms(200, rng);
  const auto models = make_models();
  const auto func = make_eval_fixed(Compare::compare_type::CORR);
  const auto serial = evaluate_searchlight(rdms, models, func, 1);
  const auto threaded = evaluate_searchlight(rdms, models, func, 8);
  ASSERT_EQ(serial.size(), 200);
  ASSERT_EQ(threaded.size(), 200);
  for (size_t i = 0; i != 200; ++i) {
    ASSERT_TRUE(threaded[i].valid);
    EXPECT_TRUE(threaded[i].evaluations.isApprox(serial[i].evaluations));
    const Result direct = eval_fixed(models, rdms.get(i), Compare::compare_type::CORR);
    EXPECT_TRUE(serial[i].evaluations.isApprox(direct.evaluations));
  }
}

TEST(Evaluate, OrderFollowsPermutedInput) {
  std::mt19937 rng(3);
  const RDMs rdms = random_rdms(50, rng);
  std::vector<size_t> permutation(50);
  std::iota(permutation.begin(), permutation.end(), 0);
  std::shuffle(permutation.begin(), permutation.end(), rng);
  const RDMs permuted = rdms.subset(permutation);
  const auto models = make_models();
  const auto func = make_eval_fixed(Compare::compare_type::COSINE);
  const auto original = evaluate_searchlight(rdms, models, func, 4);
  const auto shuffled = evaluate_searchlight(permuted, models, func, 4);
  for (size_t i = 0; i != 50; ++i)
    EXPECT_TRUE(shuffled[i].evaluations.isApprox(original[permutation[i]].evaluations));
}

TEST(Evaluate, FailuresMarked) {
  std::mt19937 rng(4);
  RDMs rdms = random_rdms(20, rng);
  rdms.dissimilarities(3, 0) = -1.0;
  rdms.dissimilarities(17, 0) = -1.0;
  const auto results = evaluate_searchlight(rdms, make_models(), fragile_eval, 4, failure_policy::MARK);
  ASSERT_EQ(results.size(), 20);
  for (size_t i = 0; i != 20; ++i) {
    if (i == 3 || i == 17) {
      EXPECT_FALSE(results[i].valid);
      EXPECT_FALSE(results[i].error.empty());
      ASSERT_EQ(results[i].evaluations.size(), 2);
      EXPECT_TRUE(std::isnan(results[i].evaluations[0]));
    } else {
      EXPECT_TRUE(results[i].valid);
      EXPECT_TRUE(results[i].error.empty());
    }
  }
}

TEST(Evaluate, StandardExceptionsMarked) {
  std::mt19937 rng(7);
  RDMs rdms = random_rdms(10, rng);
  rdms.dissimilarities(6, 0) = -1.0;
  const auto results = evaluate_searchlight(rdms, make_models(), throwing_eval, 3, failure_policy::MARK);
  ASSERT_EQ(results.size(), 10);
  EXPECT_FALSE(results[6].valid);
  EXPECT_EQ(results[6].error, "out of range dissimilarity");
  EXPECT_TRUE(std::isnan(results[6].evaluations[1]));
  EXPECT_TRUE(results[5].valid);
  EXPECT_THROW(evaluate_searchlight(rdms, make_models(), throwing_eval, 3, failure_policy::ABORT), Exception);
}

TEST(Evaluate, NonFiniteRowGivesNaN) {
  std::mt19937 rng(8);
  RDMs rdms = random_rdms(4, rng);
  rdms.dissimilarities.row(2).setConstant(std::numeric_limits<default_type>::quiet_NaN());
  const auto results =
      evaluate_searchlight(rdms, make_models(), make_eval_fixed(Compare::compare_type::CORR), 2, failure_policy::MARK);
  ASSERT_EQ(results.size(), 4);
  EXPECT_TRUE(results[2].valid);
  EXPECT_TRUE(std::isnan(results[2].evaluations[0]));
  EXPECT_TRUE(std::isnan(results[2].evaluations[1]));
  EXPECT_TRUE(std::isfinite(results[1].evaluations[0]));
}

TEST(Evaluate, FailuresAbort) {
  std::mt19937 rng(5);
  RDMs rdms = random_rdms(20, rng);
  rdms.dissimilarities(11, 0) = -1.0;
  EXPECT_THROW(evaluate_searchlight(rdms, make_models(), fragile_eval, 4, failure_policy::ABORT), Exception);
}

TEST(Evaluate, ModelPairCountChecked) {
  std::mt19937 rng(6);
  const RDMs rdms = random_rdms(5, rng);
  vector_type small(3);
  small << 1, 2, 3;
  const Model::model_list models({std::make_shared<Model::Fixed>("small", small)});
  EXPECT_THROW(evaluate_searchlight(rdms, models, make_eval_fixed(Compare::compare_type::CORR), 1), Exception);
  EXPECT_THROW(evaluate_searchlight(rdms, Model::model_list(), make_eval_fixed(Compare::compare_type::CORR), 1),
               Exception);
}

TEST(Evaluate, EmptyInput) {
  const RDMs rdms(matrix_type(0, 6), "correlation");
  const auto results = evaluate_searchlight(rdms, make_models(), make_eval_fixed(Compare::compare_type::CORR), 4);
  EXPECT_TRUE(results.empty());
}
