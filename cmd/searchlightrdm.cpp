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


#include "command.h"
#include "exception.h"
#include "file/matrix.h"
#include "header.h"
#include "image.h"
#include "progressbar.h"
#include "rsa/rdm/rdms.h"
#include "rsa/rsa.h"
#include "rsa/searchlight/batch.h"
#include "rsa/searchlight/generate.h"
#include "rsa/searchlight/volume.h"
#include "thread.h"

using namespace MR;
using namespace App;
using namespace MR::RSA;

// clang-format off
void usage() {

  SYNOPSIS = "Compute representational dissimilarity matrices within searchlights across the brain";

  DESCRIPTION
  + "For every voxel within the mask whose searchlight sphere is sufficiently covered by the mask,"
    " the patterns of the input data across the voxels of that sphere"
    " are averaged within each experimental condition,"
    " and the dissimilarity between every pair of conditions is computed."
    " The output is a matrix with one row per searchlight"
    " and one column per pair of conditions,"
    " ordered as the upper triangle of the square RDM read row by row."

  + "The events file must contain one numeric condition label per volume of the input data;"
    " conditions are the sorted unique labels."

  + searchlight_description

  + ordering_description

  + method_description;

  AUTHOR = "Robert E. Smith (robert.smith@florey.edu.au)";

  COPYRIGHT =
  "Copyright (c) 2025 Robert E. Smith <robert.smith@florey.edu.au>;"
  " The Florey Institute of Neuroscience and Mental Health."
  " Licensed under the PolyForm Noncommercial License 1.0.0 (the \"License\");"
  " you may not use this file except in compliance with the License."
  " You may obtain a copy of the License at:"
  " https://polyformproject.org/licenses/noncommercial/1.0.0."
  " Unless required by applicable law or agreed to in writing,"
  " software distributed under the License is distributed on an \"AS IS\" BASIS,"
  " WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND,"
  " either express or implied."
  " See the License of the specific language"
  " governing permissions and limitations under the License.";

  REFERENCES
  + "Kriegeskorte, N.; Goebel, R. & Bandettini, P. "
    "Information-based functional brain mapping. "
    "Proceedings of the National Academy of Sciences, 2006, 103(10), 3863-3868"

  + "* If using -method crossnobis: "
    "Walther, A.; Nili, H.; Ejaz, N.; Alink, A.; Kriegeskorte, N. & Diedrichsen, J. "
    "Reliability of dissimilarity measures for multi-voxel pattern analysis. "
    "NeuroImage, 2016, 137, 188-200";

  ARGUMENTS
  + Argument("data", "the input 4D image series; one volume per observation").type_image_in()
  + Argument("events", "a text file containing the condition label of each volume").type_file_in()
  + Argument("mask", "a mask image defining the candidate searchlight centres").type_image_in()
  + Argument("output", "the output matrix of searchlight RDMs").type_file_out();

  OPTIONS
  + searchlight_options
  + rdm_options

  + OptionGroup("Options for exporting additional data")
  + Option("centres",
           "export the linear indices of the searchlight centres,"
           " corresponding to the rows of the output matrix")
    + Argument("file").type_file_out()
  + Option("rdm_image",
           "export the RDMs as a 4D image,"
           " with one volume per pair of conditions and zero-filled outside of searchlight centres")
    + Argument("image").type_image_out();

}
// clang-format on

Searchlight::Searchlights get_searchlights(Image<bool> &mask) {
  auto opt = get_options("searchlights_in");
  if (!opt.empty()) {
    if (!get_options("radius").empty() || !get_options("threshold").empty())
      WARN("Options -radius and -threshold are ignored when searchlights are imported using -searchlights_in");
    auto searchlights = Searchlight::Searchlights::load(opt[0][0]);
    if (searchlights.shape != Searchlight::shape_type({mask.size(0), mask.size(1), mask.size(2)}))
      throw Exception("Searchlights imported from file \"" + std::string(opt[0][0]) + "\"" +
                      " were not generated for an image of the same dimensions as mask \"" + mask.name() + "\"");
    return searchlights;
  }
  const default_type radius = get_option_value("radius", default_radius);
  const default_type threshold = get_option_value("threshold", default_threshold);
  const Searchlight::shape_type shape({mask.size(0), mask.size(1), mask.size(2)});
  ProgressBar progress("Identifying searchlights", Searchlight::voxel_count(shape));
  return Searchlight::generate(mask, radius, threshold, progress_to(progress));
}

void run() {
  auto data = Image<float>::open(argument[0]);
  if (data.ndim() != 4 || data.size(3) <= 1)
    throw Exception("Input image must be 4-dimensional with more than one volume");

  const vector_type labels = File::Matrix::load_vector<default_type>(argument[1]);
  const descriptor_type events(labels.data(), labels.data() + labels.size());
  if (ssize_t(events.size()) != data.size(3))
    throw Exception("Number of condition labels in file \"" + std::string(argument[1]) + "\" (" + str(events.size()) +
                    ") does not match number of volumes in image \"" + data.name() + "\" (" + str(data.size(3)) + ")");

  Image<bool> mask = Searchlight::load_mask(argument[2]);
  for (size_t axis = 0; axis != 3; ++axis) {
    if (mask.size(axis) != data.size(axis))
      throw Exception("Dimensions of mask image \"" + mask.name() + "\"" +
                      " do not match those of input image \"" + data.name() + "\"");
  }

  const auto searchlights = get_searchlights(mask);
  auto opt = get_options("searchlights_out");
  if (!opt.empty())
    searchlights.save(opt[0][0]);

  Searchlight::BatchConfig config;
  config.num_chunks = get_option_value("chunks", config.num_chunks);
  config.num_threads = Thread::number_of_threads();
  config.noise = noise_type(get_option_value("noise", 0));
  const method_type method = method_type(get_option_value("method", int(method_type::CORRELATION)));
  if (config.noise == noise_type::RESIDUALS &&
      !(method == method_type::MAHALANOBIS || method == method_type::CROSSNOBIS))
    WARN("Noise treatment is only applicable to the mahalanobis and crossnobis measures; -noise will be ignored");

  const matrix_type observations = Searchlight::load_observations(data);

  ProgressBar progress("Computing " + method_name(method) + " RDMs within searchlights", searchlights.size());
  const RDMs rdms =
      Searchlight::compute_rdms(observations, searchlights, events, method, config, progress_to(progress));
  progress.done();
  INFO("Computed " + str(rdms.n_rdm()) + " RDMs of " + str(rdms.n_cond()) + " conditions");

  File::Matrix::save_matrix(rdms.dissimilarities, argument[3]);

  opt = get_options("centres");
  if (!opt.empty()) {
    vector_type centres(searchlights.size());
    for (size_t i = 0; i != searchlights.size(); ++i)
      centres[i] = default_type(searchlights.centres[i]);
    File::Matrix::save_vector(centres, opt[0][0]);
  }

  opt = get_options("rdm_image");
  if (!opt.empty())
    Searchlight::write_rdm_image(rdms, Header(mask), opt[0][0]);
}
