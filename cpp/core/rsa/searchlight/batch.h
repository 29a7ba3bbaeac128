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

#include <utility>
#include <vector>

#include "rsa/rdm/rdms.h"
#include "rsa/rsa.h"
#include "rsa/searchlight/generate.h"

namespace MR::RSA::Searchlight {

// Number of chunks into which searchlight centres are divided,
//   unless the config file sets "SearchlightRDMChunks"
size_t default_chunk_count();

class BatchConfig {
public:
  BatchConfig() : num_chunks(default_chunk_count()), num_threads(1), noise(noise_type::NONE) {}
  BatchConfig(const size_t num_chunks, const size_t num_threads, const noise_type noise)
      : num_chunks(num_chunks), num_threads(num_threads), noise(noise) {}
  size_t num_chunks;
  size_t num_threads;
  noise_type noise;
};

// Contiguous half-open ranges [first, second) covering [0, count);
//   boundaries at floor(k * count / num_chunks), with empty ranges omitted
std::vector<std::pair<size_t, size_t>> partition(const size_t count, const size_t num_chunks);

// observations: one row per observation, one column per voxel (C-order linear index)
// events: condition label of each observation
// Returns one RDM per searchlight, in the order of the searchlight centres;
//   RDM descriptor "voxel_index" holds the centre linear indices
RDMs compute_rdms(const matrix_type &observations,
                  const Searchlights &searchlights,
                  const descriptor_type &events,
                  const method_type method,
                  const BatchConfig &config = BatchConfig(),
                  const progress_callback &progress = nullptr);

} // namespace MR::RSA::Searchlight
