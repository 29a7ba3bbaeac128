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

#include <limits>
#include <memory>
#include <vector>

#include "rsa/searchlight/voxel.h"
#include "types.h"

namespace MR::RSA::Searchlight {

class Neighbourhood {
public:
  Neighbourhood(const Voxel::index_type &centre, const ssize_t sphere_size)
      : centre(centre), sphere_size(sphere_size), max_distance(-std::numeric_limits<default_type>::infinity()) {}
  ssize_t num_voxels() const { return voxels.size(); }
  std::vector<ssize_t> raveled() const;
  Voxel::index_type centre;
  // Only those voxels of the sphere that lie within the image field of view
  std::vector<Voxel> voxels;
  // Number of voxels in the complete sphere, regardless of the field of view
  ssize_t sphere_size;
  default_type max_distance;
};

// Locates all voxels whose Euclidean distance from a centre voxel
//   is strictly less than the radius (in voxel units)
// The table of offsets is computed once on construction,
//   and is shared between copies of the class
class Sphere {

public:
  Sphere(const shape_type &shape, const default_type radius);
  Sphere(const Sphere &) = default;

  Neighbourhood operator()(const Voxel::index_type &centre) const;

  default_type radius() const { return shared->radius(); }
  ssize_t size() const { return shared->size(); }
  const shape_type &shape() const { return H; }

protected:
  class Shared {
  public:
    using TableType = std::vector<Offset>;
    Shared(const default_type radius);
    TableType::const_iterator begin() const { return data.begin(); }
    TableType::const_iterator end() const { return data.end(); }
    ssize_t size() const { return data.size(); }
    default_type radius() const { return max_radius; }

  private:
    const default_type max_radius;
    TableType data;
  };

  const shape_type H;
  std::shared_ptr<Shared> shared;
};

} // namespace MR::RSA::Searchlight
