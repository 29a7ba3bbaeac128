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

#include "rsa/rsa.h"

#include <cmath>
#include <memory>

#include "exception.h"
#include "mrtrix.h"

namespace MR::RSA {

using namespace App;

const char *searchlight_description =
    "A searchlight is the set of voxels lying within a sphere of the nominated radius"
    " (in voxel units; a voxel is included if its distance from the centre is strictly less than the radius)"
    " around a centre voxel. "
    "Every voxel within the mask is considered as a candidate centre;"
    " it is retained only if the fraction of the sphere that lies within the mask"
    " is at least the nominated threshold."
    " Locations outside of the image field of view count as lying outside of the mask.";

const char *ordering_description =
    "Searchlights are identified by the linear index of their centre voxel,"
    " computed in C order (i.e. index = (x * size_y + y) * size_z + z,"
    " equivalent to numpy.ravel_multi_index() on an array of the same shape);"
    " rows of the output RDM matrix are sorted by this index.";

const char *method_description =
    "The dissimilarity between two conditions is computed from the mean pattern of each condition"
    " across the voxels of the searchlight. "
    "The available measures are: "
    "'euclidean': the squared Euclidean distance between condition means, normalised by the number of voxels; "
    "'correlation': one minus the Pearson correlation between condition means; "
    "'mahalanobis': as 'euclidean', but weighted by the precision matrix of the noise (see -noise); "
    "'crossnobis': the cross-validated Mahalanobis distance, "
    "where cross-validation folds are defined by the repetition number of each observation within its condition.";

const OptionGroup searchlight_options =
    OptionGroup("Options controlling searchlight geometry")

    + Option("radius",
             "the radius of each searchlight sphere in voxels"
             " (default: " + str(default_radius) + ")")
      + Argument("value").type_float(0.0)

    + Option("threshold",
             "the minimal fraction of the searchlight sphere that must lie within the mask"
             " for a voxel to be used as a searchlight centre"
             " (default: " + str(default_threshold) + ")")
      + Argument("value").type_float(0.0, 1.0)

    + Option("searchlights_in",
             "import searchlight definitions from a file generated previously using -searchlights_out,"
             " rather than computing them from the mask")
      + Argument("file").type_file_in()

    + Option("searchlights_out",
             "export the searchlight definitions (centre and neighbour voxel indices) to a text file")
      + Argument("file").type_file_out();

const OptionGroup rdm_options =
    OptionGroup("Options controlling RDM calculation")

    + Option("method",
             "the dissimilarity measure; options are: " + join(methods, ",") + " (default: correlation)")
      + Argument("choice").type_choice(methods)

    + Option("noise",
             "the noise treatment for the mahalanobis and crossnobis measures; options are: "
             + join(noise_treatments, ",") + " (default: none, i.e. identity precision)")
      + Argument("choice").type_choice(noise_treatments)

    + Option("chunks",
             "the number of chunks into which searchlight centres are divided for processing;"
             " a greater number reduces peak memory usage"
             " (default: " + str(default_chunks) + ", or the value of config file entry SearchlightRDMChunks)")
      + Argument("number").type_integer(1);

method_type method_from_name(const std::string &name) {
  const std::string lower = lowercase(name);
  for (size_t i = 0; i != methods.size(); ++i) {
    if (lower == methods[i])
      return method_type(i);
  }
  throw Exception("Unknown dissimilarity measure \"" + name + "\"; options are: " + join(methods, ","));
}

const std::string &method_name(const method_type method) { return methods[size_t(method)]; }

progress_callback progress_to(ProgressBar &progress) {
  auto shown = std::make_shared<size_t>(0);
  return [&progress, shown](const size_t done, const size_t) {
    while (*shown < done) {
      ++progress;
      ++(*shown);
    }
  };
}

ssize_t n_pairs(const ssize_t n_conditions) { return n_conditions * (n_conditions - 1) / 2; }

ssize_t n_conditions(const ssize_t n_pairs) {
  if (n_pairs < 0)
    throw Exception("Invalid number of condition pairs: " + str(n_pairs));
  const ssize_t result = ssize_t(std::round(0.5 * (1.0 + std::sqrt(1.0 + 8.0 * n_pairs))));
  if (RSA::n_pairs(result) != n_pairs)
    throw Exception("Number of dissimilarities (" + str(n_pairs) + ")" +
                    " does not correspond to the upper triangle of a square matrix");
  return result;
}

} // namespace MR::RSA
