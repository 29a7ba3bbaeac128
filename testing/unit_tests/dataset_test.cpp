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

#include "exception.h"
#include "rsa/dataset.h"

using namespace MR;
using namespace MR::RSA;

namespace {

// Six observations of three channels; two repetitions of three conditions
Dataset make_dataset() {
  matrix_type data(6, 3);
  data << 1, 2, 3,    //
          3, 4, 5,    //
          0, 0, 0,    //
          2, 2, 2,    //
          10, 10, 10, //
          20, 30, 40; //
  return Dataset(data,
                 Descriptors{{"subject", {7}}},
                 Descriptors{{"conds", {1, 1, 2, 2, 3, 3}}, {"run", {0, 1, 0, 1, 0, 1}}},
                 Descriptors{{"voxels", {100, 101, 102}}});
}

} // namespace

TEST(Dataset, Dimensions) {
  const Dataset dataset = make_dataset();
  EXPECT_EQ(dataset.n_obs(), 6);
  EXPECT_EQ(dataset.n_channel(), 3);
}

TEST(Dataset, DescriptorLengthsValidated) {
  const matrix_type data = matrix_type::Zero(4, 2);
  EXPECT_THROW(Dataset(data, Descriptors(), Descriptors{{"conds", {0, 1, 2}}}), Exception);
  EXPECT_THROW(Dataset(data, Descriptors(), Descriptors(), Descriptors{{"voxels", {0}}}), Exception);
  EXPECT_THROW(Dataset(data, Descriptors{{"subject", {0, 1}}}), Exception);
}

TEST(Dataset, AverageBy) {
  const auto averages = make_dataset().average_by("conds");
  EXPECT_EQ(averages.second, descriptor_type({1, 2, 3}));
  matrix_type expected(3, 3);
  expected << 2, 3, 4, //
              1, 1, 1, //
              15, 20, 25;
  EXPECT_TRUE(averages.first.isApprox(expected));
}

TEST(Dataset, Residuals) {
  const matrix_type residuals = make_dataset().residuals("conds");
  EXPECT_NEAR(residuals.colwise().sum().norm(), 0.0, 1e-12);
  EXPECT_DOUBLE_EQ(residuals(0, 0), -1.0);
  EXPECT_DOUBLE_EQ(residuals(5, 2), 15.0);
}

TEST(Dataset, SubsetObs) {
  const Dataset dataset = make_dataset();
  const Dataset run1 = dataset.subset_obs("run", 1.0);
  EXPECT_EQ(run1.n_obs(), 3);
  EXPECT_EQ(Descriptor::get(run1.obs_descriptors, "conds"), descriptor_type({1, 2, 3}));
  EXPECT_DOUBLE_EQ(run1.measurements()(2, 2), 40.0);
  const Dataset conds = dataset.subset_obs("conds", descriptor_type({2, 3}));
  EXPECT_EQ(conds.n_obs(), 4);
  EXPECT_EQ(conds.descriptors, dataset.descriptors);
}

TEST(Dataset, SubsetChannel) {
  const Dataset subset = make_dataset().subset_channel("voxels", descriptor_type({102, 100}));
  EXPECT_EQ(subset.n_channel(), 2);
  EXPECT_EQ(Descriptor::get(subset.channel_descriptors, "voxels"), descriptor_type({100, 102}));
  EXPECT_DOUBLE_EQ(subset.measurements()(5, 1), 40.0);
}

TEST(Dataset, MissingDescriptor) {
  EXPECT_THROW(make_dataset().average_by("stimulus"), Exception);
}
