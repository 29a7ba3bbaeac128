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

#include "rsa/searchlight/generate.h"

#include <cmath>
#include <fstream>
#include <limits>

#include "app.h"
#include "exception.h"
#include "file/ofstream.h"
#include "mrtrix.h"

namespace MR::RSA::Searchlight {

namespace {
const std::string shape_key("shape");
const std::string radius_key("radius");
const std::string threshold_key("threshold");

void check_parameters(const default_type radius, const default_type threshold) {
  if (!std::isfinite(radius) || radius <= 0.0)
    throw Exception("Searchlight radius must be a positive finite value (got " + str(radius) + ")");
  if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0)
    throw Exception("Searchlight threshold must lie within [0.0, 1.0] (got " + str(threshold) + ")");
}
} // namespace

void Searchlights::save(const std::string &path) const {
  File::OFStream out(path);
  out << "# " << App::command_history_string << "\n";
  out << shape_key << ": " << shape[0] << " " << shape[1] << " " << shape[2] << "\n";
  out << radius_key << ": " << str(radius) << "\n";
  out << threshold_key << ": " << str(threshold) << "\n";
  for (size_t i = 0; i != centres.size(); ++i) {
    out << centres[i];
    for (const auto n : neighbours[i])
      out << " " << n;
    out << "\n";
  }
}

Searchlights Searchlights::load(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw Exception("Unable to open searchlight definition file \"" + path + "\"");
  shape_type shape({-1, -1, -1});
  default_type radius = std::numeric_limits<default_type>::quiet_NaN();
  default_type threshold = std::numeric_limits<default_type>::quiet_NaN();
  std::vector<std::vector<ssize_t>> rows;
  std::string line;
  size_t line_number = 0;
  try {
    while (std::getline(in, line)) {
      ++line_number;
      line = strip(line);
      if (line.empty() || line[0] == '#')
        continue;
      const auto colon = line.find(':');
      if (colon != std::string::npos) {
        const std::string key = strip(line.substr(0, colon));
        const auto values = split(strip(line.substr(colon + 1)), " \t", true);
        if (key == shape_key) {
          if (values.size() != 3)
            throw Exception("image shape must contain three values");
          for (size_t axis = 0; axis != 3; ++axis)
            shape[axis] = to<ssize_t>(values[axis]);
        } else if (key == radius_key && values.size() == 1) {
          radius = to<default_type>(values[0]);
        } else if (key == threshold_key && values.size() == 1) {
          threshold = to<default_type>(values[0]);
        } else {
          throw Exception("unrecognised header entry \"" + key + "\"");
        }
        continue;
      }
      std::vector<ssize_t> row;
      for (const auto &entry : split(line, " \t", true))
        row.push_back(to<ssize_t>(entry));
      rows.push_back(std::move(row));
    }
  } catch (Exception &e) {
    throw Exception(e, "Error parsing line " + str(line_number) + " of searchlight definition file \"" + path + "\"");
  }

  if (shape[0] <= 0 || shape[1] <= 0 || shape[2] <= 0)
    throw Exception("Searchlight definition file \"" + path + "\" does not contain a valid image shape");
  if (!std::isfinite(radius) || !std::isfinite(threshold))
    throw Exception("Searchlight definition file \"" + path + "\" does not contain the radius and threshold");
  try {
    check_parameters(radius, threshold);
  } catch (Exception &e) {
    throw Exception(e, "Invalid parameters in searchlight definition file \"" + path + "\"");
  }

  Searchlights result(shape, radius, threshold);
  result.centres.reserve(rows.size());
  result.neighbours.reserve(rows.size());
  const ssize_t count = voxel_count(shape);
  for (auto &row : rows) {
    for (const auto index : row) {
      if (index < 0 || index >= count)
        throw Exception("Searchlight definition file \"" + path + "\" contains voxel index " + str(index) +
                        " outside of image with " + str(count) + " voxels");
    }
    result.centres.push_back(row.front());
    result.neighbours.emplace_back(row.begin() + 1, row.end());
  }
  INFO("Loaded " + str(result.size()) + " searchlights from file \"" + path + "\"");
  return result;
}

default_type coverage(Image<bool> &mask, const Neighbourhood &neighbourhood) {
  if (!neighbourhood.sphere_size)
    return 0.0;
  ssize_t inside = 0;
  for (const auto &v : neighbourhood.voxels) {
    for (size_t axis = 0; axis != 3; ++axis)
      mask.index(axis) = v.index[axis];
    if (mask.value())
      ++inside;
  }
  return default_type(inside) / default_type(neighbourhood.sphere_size);
}

Searchlights generate(Image<bool> &mask,
                      const default_type radius,
                      const default_type threshold,
                      const progress_callback &progress) {
  if (mask.ndim() != 3)
    throw Exception("Mask image for searchlight generation must be 3-dimensional"
                    " (image \"" + mask.name() + "\" has " + str(mask.ndim()) + " dimensions)");
  check_parameters(radius, threshold);

  const shape_type shape({mask.size(0), mask.size(1), mask.size(2)});
  const Sphere sphere(shape, radius);
  Searchlights result(shape, radius, threshold);

  // Candidate centres are visited in C order;
  //   all downstream outputs preserve this ordering
  const size_t total = voxel_count(shape);
  size_t visited = 0;
  size_t candidates = 0;
  Image<bool> centre_mask(mask);
  Voxel::index_type centre({0, 0, 0});
  for (centre[0] = 0; centre[0] != shape[0]; ++centre[0]) {
    for (centre[1] = 0; centre[1] != shape[1]; ++centre[1]) {
      for (centre[2] = 0; centre[2] != shape[2]; ++centre[2]) {
        for (size_t axis = 0; axis != 3; ++axis)
          centre_mask.index(axis) = centre[axis];
        if (centre_mask.value()) {
          ++candidates;
          const Neighbourhood neighbourhood = sphere(centre);
          if (coverage(mask, neighbourhood) >= threshold) {
            result.centres.push_back(ravel(centre, shape));
            result.neighbours.push_back(neighbourhood.raveled());
          }
        }
        if (progress)
          progress(++visited, total);
      }
    }
  }

  if (result.centres.size() != result.neighbours.size())
    throw Exception("Number of searchlight centres (" + str(result.centres.size()) + ")" +
                    " does not match number of neighbour sets (" + str(result.neighbours.size()) + ")");
  if (result.empty()) {
    WARN("No searchlights found: none of the " + str(candidates) + " voxels in the mask"
         " has a searchlight coverage of at least " + str(threshold));
  } else {
    INFO("Found " + str(result.size()) + " searchlights from " + str(candidates) + " mask voxels");
  }
  return result;
}

} // namespace MR::RSA::Searchlight
