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

#include "rsa/searchlight/batch.h"

#include "exception.h"
#include "file/config.h"
#include "mrtrix.h"
#include "rsa/dataset.h"
#include "rsa/rdm/calc.h"

namespace MR::RSA::Searchlight {

// CONF option: SearchlightRDMChunks
// CONF default: 100
// CONF Number of chunks into which searchlight centres are divided
// CONF during RDM calculation; only one chunk of per-searchlight
// CONF datasets is held in memory at any one time.
size_t default_chunk_count() {
  const int value = File::Config::get_int("SearchlightRDMChunks", int(default_chunks));
  if (value < 1)
    throw Exception("Config file entry \"SearchlightRDMChunks\" must be a positive integer (got " + str(value) + ")");
  return size_t(value);
}

std::vector<std::pair<size_t, size_t>> partition(const size_t count, const size_t num_chunks) {
  if (!num_chunks)
    throw Exception("Number of chunks for searchlight RDM calculation must be at least 1");
  std::vector<std::pair<size_t, size_t>> result;
  for (size_t k = 0; k != num_chunks; ++k) {
    const size_t first = (k * count) / num_chunks;
    const size_t last = ((k + 1) * count) / num_chunks;
    if (last > first)
      result.emplace_back(first, last);
  }
  return result;
}

RDMs compute_rdms(const matrix_type &observations,
                  const Searchlights &searchlights,
                  const descriptor_type &events,
                  const method_type method,
                  const BatchConfig &config,
                  const progress_callback &progress) {
  if (ssize_t(events.size()) != observations.rows())
    throw Exception("Number of event labels (" + str(events.size()) + ")" +
                    " does not match number of observations (" + str(observations.rows()) + ")");
  if (searchlights.centres.size() != searchlights.neighbours.size())
    throw Exception("Number of searchlight centres (" + str(searchlights.centres.size()) + ")" +
                    " does not match number of neighbour sets (" + str(searchlights.neighbours.size()) + ")");
  const descriptor_type conditions = Descriptor::unique(events);
  if (conditions.size() < 2)
    throw Exception("At least two distinct conditions are required to compute RDMs"
                    " (found " + str(conditions.size()) + ")");
  const ssize_t pairs = RSA::n_pairs(conditions.size());

  const size_t count = searchlights.size();
  matrix_type dissimilarities(count, pairs);
  descriptor_type voxel_index(count);
  for (size_t i = 0; i != count; ++i) {
    voxel_index[i] = default_type(searchlights.centres[i]);
    for (const auto n : searchlights.neighbours[i]) {
      if (n < 0 || n >= observations.cols())
        throw Exception("Searchlight centred at voxel " + str(searchlights.centres[i]) + " contains neighbour index " +
                        str(n) + " outside of data with " + str(observations.cols()) + " voxels");
    }
  }

  const auto chunks = partition(count, config.num_chunks);
  DEBUG("Computing " + str(count) + " " + method_name(method) + " RDMs in " + str(chunks.size()) + " chunks" +
        " of " + str(conditions.size()) + " conditions each");
  const Descriptors obs_descriptors{{"events", events}};
  size_t completed = 0;
  for (const auto &chunk : chunks) {
    std::vector<Dataset> datasets;
    datasets.reserve(chunk.second - chunk.first);
    for (size_t i = chunk.first; i != chunk.second; ++i) {
      const auto &neighbours = searchlights.neighbours[i];
      matrix_type patterns(observations.rows(), neighbours.size());
      descriptor_type voxels(neighbours.size());
      for (size_t c = 0; c != neighbours.size(); ++c) {
        patterns.col(c) = observations.col(neighbours[c]);
        voxels[c] = default_type(neighbours[c]);
      }
      datasets.emplace_back(std::move(patterns),
                            Descriptors{{"centre", {voxel_index[i]}}},
                            obs_descriptors,
                            Descriptors{{"voxels", voxels}});
    }
    const RDMs chunk_rdms = calc_rdm(datasets, method, "events", config.noise, config.num_threads);
    if (chunk_rdms.n_pairs() != pairs)
      throw Exception("RDMs for searchlights " + str(chunk.first) + "-" + str(chunk.second - 1) + " contain " +
                      str(chunk_rdms.n_pairs()) + " dissimilarities; expected " + str(pairs));
    dissimilarities.middleRows(chunk.first, chunk.second - chunk.first) = chunk_rdms.dissimilarities;
    completed = chunk.second;
    if (progress)
      progress(completed, count);
  }

  return RDMs(dissimilarities, method_name(method), conditions, Descriptors{{"voxel_index", voxel_index}});
}

} // namespace MR::RSA::Searchlight
