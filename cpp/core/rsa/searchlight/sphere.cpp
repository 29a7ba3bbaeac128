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

#include "rsa/searchlight/sphere.h"

#include <algorithm>
#include <cmath>

#include "exception.h"
#include "math/math.h"
#include "mrtrix.h"

namespace MR::RSA::Searchlight {

std::vector<ssize_t> Neighbourhood::raveled() const {
  std::vector<ssize_t> result;
  result.reserve(voxels.size());
  for (const auto &v : voxels)
    result.push_back(v.raveled);
  return result;
}

Sphere::Shared::Shared(const default_type radius) : max_radius(radius) {
  if (!std::isfinite(radius) || radius <= 0.0)
    throw Exception("Searchlight radius must be a positive finite value (got " + str(radius) + ")");
  const default_type max_radius_sq = Math::pow2(radius);
  // Cheap pre-filter along each axis:
  //   only offsets with magnitude strictly less than the radius can lie within the sphere
  const int half_extent = int(std::ceil(radius)) - 1;
  data.reserve(Math::pow3(2 * size_t(half_extent) + 1));
  // Offsets are generated with the last axis varying fastest,
  //   such that for any centre the neighbours come out in ascending linear index
  Offset::index_type offset({0, 0, 0});
  for (offset[0] = -half_extent; offset[0] <= half_extent; ++offset[0]) {
    for (offset[1] = -half_extent; offset[1] <= half_extent; ++offset[1]) {
      for (offset[2] = -half_extent; offset[2] <= half_extent; ++offset[2]) {
        const default_type squared_distance = Math::pow2(offset[0])    //
                                              + Math::pow2(offset[1])  //
                                              + Math::pow2(offset[2]); //
        if (squared_distance < max_radius_sq)
          data.emplace_back(Offset(offset, squared_distance));
      }
    }
  }
  DEBUG("Spherical searchlight construction:");
  DEBUG("  Nominated radius: " + str(radius));
  DEBUG("  Bounding box for search: [" + str(-half_extent) + " " + str(half_extent) + "] along each axis");
  DEBUG("  Number of elements: " + str(data.size()));
}

Sphere::Sphere(const shape_type &shape, const default_type radius) : H(shape), shared(new Shared(radius)) {
  for (size_t axis = 0; axis != 3; ++axis) {
    if (shape[axis] <= 0)
      throw Exception("Invalid image dimensions for searchlight construction: " //
                      + str(shape[0]) + "x" + str(shape[1]) + "x" + str(shape[2]));
  }
}

Neighbourhood Sphere::operator()(const Voxel::index_type &centre) const {
  Neighbourhood result(centre, shared->size());
  result.voxels.reserve(shared->size());
  for (auto table_it = shared->begin(); table_it != shared->end(); ++table_it) {
    const Voxel::index_type voxel({centre[0] + table_it->index[0],   //
                                   centre[1] + table_it->index[1],   //
                                   centre[2] + table_it->index[2]}); //
    if (in_bounds(voxel, H)) {
      result.voxels.push_back(Voxel(voxel, table_it->sq_distance, ravel(voxel, H)));
      result.max_distance = std::max(result.max_distance, table_it->sq_distance);
    }
  }
  // Centre with no voxel of the sphere inside the field of view
  if (result.voxels.empty())
    result.max_distance = 0.0;
  else
    result.max_distance = std::sqrt(result.max_distance);
  return result;
}

} // namespace MR::RSA::Searchlight
