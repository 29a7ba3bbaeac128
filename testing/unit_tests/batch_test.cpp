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

#include <random>
#include <vector>

#include "exception.h"
#include "mask.h"
#include "rsa/rdm/calc.h"
#include "rsa/searchlight/batch.h"
#include "rsa/searchlight/generate.h"

using namespace MR;
using namespace MR::RSA;
using namespace MR::RSA::Searchlight;

namespace {

const shape_type shape({4, 4, 4});

// Four conditions with two repetitions each, over every voxel of the image
matrix_type random_observations(std::mt19937 &rng) {
  std::normal_distribution<default_type> normal;
  matrix_type data(8, voxel_count(shape));
  for (ssize_t i = 0; i != data.size(); ++i)
    data.data()[i] = normal(rng);
  return data;
}

const descriptor_type events({0, 1, 2, 3, 0, 1, 2, 3});

Searchlights full_searchlights() {
  Image<bool> mask = Testing::make_mask(shape, true);
  return generate(mask, 1.5, 0.0);
}

} // namespace

TEST(Batch, Partition) {
  const auto chunks = partition(10, 3);
  ASSERT_EQ(chunks.size(), 3);
  EXPECT_EQ(chunks[0], std::make_pair(size_t(0), size_t(3)));
  EXPECT_EQ(chunks[1], std::make_pair(size_t(3), size_t(6)));
  EXPECT_EQ(chunks[2], std::make_pair(size_t(6), size_t(10)));
  // More chunks than items: empty chunks are dropped
  const auto sparse = partition(3, 10);
  ASSERT_EQ(sparse.size(), 3);
  for (size_t i = 0; i != 3; ++i)
    EXPECT_EQ(sparse[i], std::make_pair(i, i + 1));
  EXPECT_TRUE(partition(0, 5).empty());
  EXPECT_THROW(partition(5, 0), Exception);
}

TEST(Batch, OneRowPerCentre) {
  std::mt19937 rng(1);
  const matrix_type observations = random_observations(rng);
  const auto searchlights = full_searchlights();
  const RDMs rdms = compute_rdms(observations, searchlights, events, method_type::CORRELATION,
                                 BatchConfig(7, 1, noise_type::NONE));
  EXPECT_EQ(rdms.n_rdm(), ssize_t(searchlights.size()));
  EXPECT_EQ(rdms.n_pairs(), 6);
  EXPECT_EQ(rdms.dissimilarity_measure, "correlation");
  const auto &voxel_index = Descriptor::get(rdms.rdm_descriptors, "voxel_index");
  for (size_t i = 0; i != searchlights.size(); ++i)
    EXPECT_EQ(voxel_index[i], default_type(searchlights.centres[i]));
  EXPECT_TRUE((rdms.dissimilarities.array() >= 0.0).all());
  EXPECT_TRUE((rdms.dissimilarities.array() <= 2.0).all());
}

TEST(Batch, MatchesDirectCalculation) {
  std::mt19937 rng(2);
  const matrix_type observations = random_observations(rng);
  const auto searchlights = full_searchlights();
  const RDMs rdms = compute_rdms(observations, searchlights, events, method_type::EUCLIDEAN,
                                 BatchConfig(5, 1, noise_type::NONE));
  for (const size_t i : {size_t(0), size_t(21), searchlights.size() - 1}) {
    const auto &neighbours = searchlights.neighbours[i];
    matrix_type patterns(observations.rows(), neighbours.size());
    for (size_t c = 0; c != neighbours.size(); ++c)
      patterns.col(c) = observations.col(neighbours[c]);
    const Dataset dataset(patterns, Descriptors(), Descriptors{{"events", events}});
    const RDMs direct = calc_rdm(dataset, method_type::EUCLIDEAN, "events");
    EXPECT_TRUE(rdms.dissimilarities.row(i).isApprox(direct.dissimilarities.row(0)));
  }
}

TEST(Batch, IndependentOfChunksAndThreads) {
  std::mt19937 rng(3);
  const matrix_type observations = random_observations(rng);
  const auto searchlights = full_searchlights();
  const RDMs reference = compute_rdms(observations, searchlights, events, method_type::CROSSNOBIS,
                                      BatchConfig(1, 1, noise_type::NONE));
  for (const size_t chunks : {size_t(3), size_t(64), size_t(1000)}) {
    const RDMs rdms = compute_rdms(observations, searchlights, events, method_type::CROSSNOBIS,
                                   BatchConfig(chunks, 4, noise_type::NONE));
    EXPECT_TRUE(rdms.dissimilarities.isApprox(reference.dissimilarities)) << chunks << " chunks";
  }
}

TEST(Batch, ProgressReachesTotal) {
  std::mt19937 rng(4);
  const matrix_type observations = random_observations(rng);
  const auto searchlights = full_searchlights();
  size_t last = 0;
  compute_rdms(observations, searchlights, events, method_type::EUCLIDEAN, BatchConfig(4, 1, noise_type::NONE),
               [&](const size_t done, const size_t total) {
                 EXPECT_GT(done, last);
                 EXPECT_EQ(total, searchlights.size());
                 last = done;
               });
  EXPECT_EQ(last, searchlights.size());
}

TEST(Batch, NoCentres) {
  std::mt19937 rng(5);
  const matrix_type observations = random_observations(rng);
  Image<bool> mask = Testing::make_mask(shape, false);
  const auto searchlights = generate(mask, 2.0, 0.5);
  const RDMs rdms = compute_rdms(observations, searchlights, events, method_type::CORRELATION);
  EXPECT_EQ(rdms.n_rdm(), 0);
  EXPECT_EQ(rdms.n_pairs(), 6);
}

TEST(Batch, InvalidInput) {
  std::mt19937 rng(6);
  const matrix_type observations = random_observations(rng);
  const auto searchlights = full_searchlights();
  EXPECT_THROW(compute_rdms(observations, searchlights, descriptor_type({0, 1, 2}), method_type::EUCLIDEAN),
               Exception);
  EXPECT_THROW(compute_rdms(observations, searchlights, descriptor_type(8, 1.0), method_type::EUCLIDEAN), Exception);
  Searchlights invalid(shape, 1.5, 0.0);
  invalid.centres.push_back(0);
  invalid.neighbours.push_back({0, voxel_count(shape)});
  EXPECT_THROW(compute_rdms(observations, invalid, events, method_type::EUCLIDEAN), Exception);
  invalid.neighbours.push_back({0});
  EXPECT_THROW(compute_rdms(observations, invalid, events, method_type::EUCLIDEAN), Exception);
}

TEST(Batch, MethodNames) {
  EXPECT_EQ(method_from_name("Crossnobis"), method_type::CROSSNOBIS);
  EXPECT_EQ(method_name(method_type::EUCLIDEAN), "euclidean");
  EXPECT_THROW(method_from_name("cosine"), Exception);
}
