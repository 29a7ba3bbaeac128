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

#include <array>
#include <cmath>

#include <Eigen/Dense>

#include "types.h"

namespace MR::RSA::Searchlight {

using shape_type = std::array<ssize_t, 3>;

template <class T> class VoxelBase {
public:
  using index_type = Eigen::Array<T, 3, 1>;
  VoxelBase(const index_type &index, const default_type sq_distance) : index(index), sq_distance(sq_distance) {}
  VoxelBase(const VoxelBase &) = default;
  VoxelBase(VoxelBase &&) = default;
  ~VoxelBase() {}
  VoxelBase &operator=(const VoxelBase &that) {
    index = that.index;
    sq_distance = that.sq_distance;
    return *this;
  }
  VoxelBase &operator=(VoxelBase &&that) noexcept {
    index = that.index;
    sq_distance = that.sq_distance;
    return *this;
  }
  bool operator<(const VoxelBase &that) const { return sq_distance < that.sq_distance; }
  default_type distance() const { return std::sqrt(sq_distance); }

  index_type index;
  default_type sq_distance;
};

// Offsets from the centre of the sphere need to be signed;
//   absolute voxel positions additionally carry their linear index within the image
class Voxel : public VoxelBase<ssize_t> {
public:
  using index_type = VoxelBase<ssize_t>::index_type;
  Voxel(const index_type &index, const default_type sq_distance, const ssize_t raveled)
      : VoxelBase<ssize_t>(index, sq_distance), raveled(raveled) {}
  ssize_t raveled;
};

using Offset = VoxelBase<int>;

// C-order flattening:
//   the last axis varies fastest, matching numpy.ravel_multi_index()
inline ssize_t ravel(const Voxel::index_type &pos, const shape_type &shape) {
  return (pos[0] * shape[1] + pos[1]) * shape[2] + pos[2];
}

inline Voxel::index_type unravel(const ssize_t index, const shape_type &shape) {
  return Voxel::index_type({index / (shape[1] * shape[2]), //
                            (index / shape[2]) % shape[1], //
                            index % shape[2]});            //
}

inline ssize_t voxel_count(const shape_type &shape) { return shape[0] * shape[1] * shape[2]; }

inline bool in_bounds(const Voxel::index_type &pos, const shape_type &shape) {
  return pos[0] >= 0 && pos[0] < shape[0] && //
         pos[1] >= 0 && pos[1] < shape[1] && //
         pos[2] >= 0 && pos[2] < shape[2];   //
}

} // namespace MR::RSA::Searchlight
