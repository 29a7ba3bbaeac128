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

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include "datatype.h"
#include "exception.h"
#include "header.h"
#include "image.h"
#include "mask.h"
#include "rsa/evaluate.h"
#include "rsa/rdm/rdms.h"
#include "rsa/searchlight/volume.h"

using namespace MR;
using namespace MR::RSA;
using namespace MR::RSA::Searchlight;

namespace {

const shape_type shape({3, 4, 2});

// Scratch 4D image in which each voxel value encodes its volume and raveled position
Image<float> make_series(const ssize_t volumes) {
  Header H;
  H.ndim() = 4;
  for (size_t axis = 0; axis != 3; ++axis)
    H.size(axis) = shape[axis];
  H.size(3) = volumes;
  for (size_t axis = 0; axis != 4; ++axis) {
    H.spacing(axis) = 1.0;
    H.stride(axis) = axis + 1;
  }
  H.transform().setIdentity();
  H.datatype() = DataType::Float32;
  Image<float> image = Image<float>::scratch(H, "Test series");
  Voxel::index_type index({0, 0, 0});
  for (index[0] = 0; index[0] != shape[0]; ++index[0]) {
    image.index(0) = index[0];
    for (index[1] = 0; index[1] != shape[1]; ++index[1]) {
      image.index(1) = index[1];
      for (index[2] = 0; index[2] != shape[2]; ++index[2]) {
        image.index(2) = index[2];
        for (image.index(3) = 0; image.index(3) != volumes; ++image.index(3))
          image.value() = float(1000 * ssize_t(image.index(3)) + ravel(index, shape));
      }
    }
  }
  return image;
}

float value_at(Image<float> &image, const ssize_t raveled, const ssize_t volume) {
  const auto index = unravel(raveled, shape);
  for (size_t axis = 0; axis != 3; ++axis)
    image.index(axis) = index[axis];
  image.index(3) = volume;
  return image.value();
}

} // namespace

TEST(Volume, ObservationsInRavelOrder) {
  Image<float> series = make_series(3);
  const matrix_type observations = load_observations(series);
  ASSERT_EQ(observations.rows(), 3);
  ASSERT_EQ(observations.cols(), voxel_count(shape));
  for (ssize_t t = 0; t != 3; ++t) {
    for (ssize_t column = 0; column != observations.cols(); ++column)
      EXPECT_DOUBLE_EQ(observations(t, column), value_at(series, column, t));
  }
  // Last axis varies fastest
  EXPECT_DOUBLE_EQ(observations(2, ravel(Voxel::index_type({2, 1, 1}), shape)), 2000.0 + (2 * 4 + 1) * 2 + 1);
}

TEST(Volume, ObservationsRequireFourDimensions) {
  Image<bool> mask = Testing::make_mask(shape, true);
  EXPECT_THROW(load_observations(mask), Exception);
}

TEST(Volume, ScoresWrittenAtCentres) {
  const Image<bool> mask = Testing::make_mask(shape, true);
  const ssize_t first = ravel(Voxel::index_type({1, 2, 0}), shape);
  const ssize_t second = ravel(Voxel::index_type({2, 3, 1}), shape);
  const ssize_t failed = ravel(Voxel::index_type({0, 0, 1}), shape);
  vector_type scores(2);
  scores << 0.25, -0.5;
  std::vector<Evaluation::Result> results;
  results.emplace_back(std::vector<std::string>({"a", "b"}), scores, "corr");
  results.emplace_back(std::vector<std::string>({"a", "b"}), vector_type(-scores), "corr");
  results.emplace_back();
  const std::vector<ssize_t> centres({first, second, failed});

  const std::string path = ::testing::TempDir() + "searchlight_scores.mif";
  write_scores_image(results, centres, Header(mask), path);
  {
    Image<float> image = Image<float>::open(path);
    ASSERT_EQ(image.ndim(), 4);
    ASSERT_EQ(image.size(3), 2);
    for (ssize_t voxel = 0; voxel != voxel_count(shape); ++voxel) {
      for (ssize_t model = 0; model != 2; ++model) {
        const float value = value_at(image, voxel, model);
        if (voxel == first)
          EXPECT_FLOAT_EQ(value, float(scores[model]));
        else if (voxel == second)
          EXPECT_FLOAT_EQ(value, float(-scores[model]));
        else
          EXPECT_TRUE(std::isnan(value)) << "voxel " << voxel;
      }
    }
  }
  std::remove(path.c_str());

  EXPECT_THROW(write_scores_image(results, {first, second}, Header(mask), path), Exception);
}

TEST(Volume, RDMsWrittenAtCentres) {
  const Image<bool> mask = Testing::make_mask(shape, true);
  const ssize_t centre = ravel(Voxel::index_type({2, 0, 1}), shape);
  matrix_type dissimilarities(1, 3);
  dissimilarities << 1.0, 2.0, 3.0;
  const RDMs rdms(dissimilarities, "euclidean", descriptor_type(), Descriptors{{"voxel_index", {default_type(centre)}}});

  const std::string path = ::testing::TempDir() + "searchlight_rdms.mif";
  write_rdm_image(rdms, Header(mask), path);
  {
    Image<float> image = Image<float>::open(path);
    ASSERT_EQ(image.size(3), 3);
    for (ssize_t voxel = 0; voxel != voxel_count(shape); ++voxel) {
      for (ssize_t pair = 0; pair != 3; ++pair)
        EXPECT_FLOAT_EQ(value_at(image, voxel, pair), voxel == centre ? float(pair + 1) : 0.0f);
    }
  }
  std::remove(path.c_str());
}
