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

#include <string>
#include <vector>

#include "exception.h"
#include "header.h"
#include "image.h"
#include "rsa/evaluate.h"
#include "rsa/rdm/rdms.h"
#include "rsa/rsa.h"
#include "rsa/searchlight/voxel.h"

namespace MR::RSA::Searchlight {

Image<bool> load_mask(const std::string &path);

// Observation matrix from a 4D image:
//   one row per volume, one column per voxel in C order
template <class ImageType> matrix_type load_observations(ImageType &image) {
  if (image.ndim() != 4)
    throw Exception("Image \"" + image.name() + "\" must be 4-dimensional to provide searchlight observations");
  const shape_type shape({image.size(0), image.size(1), image.size(2)});
  matrix_type result(image.size(3), voxel_count(shape));
  Voxel::index_type index({0, 0, 0});
  for (index[0] = 0; index[0] != shape[0]; ++index[0]) {
    image.index(0) = index[0];
    for (index[1] = 0; index[1] != shape[1]; ++index[1]) {
      image.index(1) = index[1];
      for (index[2] = 0; index[2] != shape[2]; ++index[2]) {
        image.index(2) = index[2];
        const ssize_t column = ravel(index, shape);
        for (image.index(3) = 0; image.index(3) != image.size(3); ++image.index(3))
          result(ssize_t(image.index(3)), column) = image.value();
      }
    }
  }
  return result;
}

// Template header must be 3D; one output volume per condition pair,
//   zero-filled wherever there is no searchlight centre
void write_rdm_image(const RDMs &rdms, const Header &template_header, const std::string &path);

// One output volume per model;
//   NaN wherever there is no searchlight centre or evaluation failed
void write_scores_image(const std::vector<Evaluation::Result> &results,
                        const std::vector<ssize_t> &centres,
                        const Header &template_header,
                        const std::string &path);

} // namespace MR::RSA::Searchlight
