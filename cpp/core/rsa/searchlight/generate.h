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

#include "image.h"
#include "rsa/rsa.h"
#include "rsa/searchlight/sphere.h"
#include "rsa/searchlight/voxel.h"

namespace MR::RSA::Searchlight {

// Searchlight centres and their neighbours, all as C-order linear indices;
//   entries of the two vectors correspond one-to-one
class Searchlights {
public:
  Searchlights(const shape_type &shape, const default_type radius, const default_type threshold)
      : shape(shape), radius(radius), threshold(threshold) {}

  size_t size() const { return centres.size(); }
  bool empty() const { return centres.empty(); }

  void save(const std::string &path) const;
  static Searchlights load(const std::string &path);

  shape_type shape;
  default_type radius;
  default_type threshold;
  std::vector<ssize_t> centres;
  std::vector<std::vector<ssize_t>> neighbours;
};

// Fraction of the complete sphere around the centre that lies within the mask;
//   voxels outside of the image field of view count as outside the mask
default_type coverage(Image<bool> &mask, const Neighbourhood &neighbourhood);

Searchlights generate(Image<bool> &mask,
                      const default_type radius,
                      const default_type threshold,
                      const progress_callback &progress = nullptr);

} // namespace MR::RSA::Searchlight
