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

#include "rsa/searchlight/volume.h"

#include <limits>

#include "algo/loop.h"
#include "datatype.h"
#include "exception.h"
#include "mrtrix.h"

namespace MR::RSA::Searchlight {

namespace {

shape_type check_template(const Header &template_header) {
  if (template_header.ndim() < 3)
    throw Exception("Template image \"" + template_header.name() + "\" must have at least 3 dimensions");
  for (size_t axis = 3; axis < template_header.ndim(); ++axis) {
    if (template_header.size(axis) != 1)
      throw Exception("Template image \"" + template_header.name() + "\" must be a 3D volume");
  }
  return shape_type({template_header.size(0), template_header.size(1), template_header.size(2)});
}

Header output_header(const Header &template_header, const ssize_t volumes) {
  Header H(template_header);
  H.ndim() = 4;
  H.size(3) = volumes;
  H.stride(3) = 4;
  H.spacing(3) = 1.0;
  H.datatype() = DataType::Float32;
  H.datatype().set_byte_order_native();
  return H;
}

void set_position(Image<float> &image, const ssize_t raveled, const shape_type &shape) {
  const auto index = unravel(raveled, shape);
  for (size_t axis = 0; axis != 3; ++axis)
    image.index(axis) = index[axis];
}

} // namespace

Image<bool> load_mask(const std::string &path) {
  Image<bool> mask = Image<bool>::open(path);
  if (mask.ndim() != 3)
    throw Exception("Mask image \"" + path + "\" must be 3-dimensional"
                    " (image has " + str(mask.ndim()) + " dimensions)");
  return mask;
}

void write_rdm_image(const RDMs &rdms, const Header &template_header, const std::string &path) {
  const shape_type shape = check_template(template_header);
  const descriptor_type &centres = Descriptor::get(rdms.rdm_descriptors, "voxel_index");
  const ssize_t count = voxel_count(shape);
  Image<float> image = Image<float>::create(path, output_header(template_header, rdms.n_pairs()));
  for (auto l = Loop(image)(image); l; ++l)
    image.value() = 0.0f;
  for (ssize_t row = 0; row != rdms.n_rdm(); ++row) {
    const ssize_t centre = ssize_t(centres[row]);
    if (centre < 0 || centre >= count)
      throw Exception("Searchlight centre " + str(centre) + " lies outside of template image \"" +
                      template_header.name() + "\"");
    set_position(image, centre, shape);
    for (image.index(3) = 0; image.index(3) != rdms.n_pairs(); ++image.index(3))
      image.value() = float(rdms.dissimilarities(row, ssize_t(image.index(3))));
  }
}

void write_scores_image(const std::vector<Evaluation::Result> &results,
                        const std::vector<ssize_t> &centres,
                        const Header &template_header,
                        const std::string &path) {
  if (results.size() != centres.size())
    throw Exception("Number of evaluation results (" + str(results.size()) + ")" +
                    " does not match number of searchlight centres (" + str(centres.size()) + ")");
  const shape_type shape = check_template(template_header);
  ssize_t n_models = 0;
  for (const auto &result : results) {
    if (result.evaluations.size()) {
      n_models = result.evaluations.size();
      break;
    }
  }
  if (!n_models)
    throw Exception("No model evaluations available to write to image \"" + path + "\"");
  const ssize_t count = voxel_count(shape);
  Image<float> image = Image<float>::create(path, output_header(template_header, n_models));
  for (auto l = Loop(image)(image); l; ++l)
    image.value() = std::numeric_limits<float>::quiet_NaN();
  for (size_t i = 0; i != results.size(); ++i) {
    if (centres[i] < 0 || centres[i] >= count)
      throw Exception("Searchlight centre " + str(centres[i]) + " lies outside of template image \"" +
                      template_header.name() + "\"");
    if (!results[i].valid)
      continue;
    set_position(image, centres[i], shape);
    for (image.index(3) = 0; image.index(3) != n_models; ++image.index(3))
      image.value() = float(results[i].evaluations[ssize_t(image.index(3))]);
  }
}

} // namespace MR::RSA::Searchlight
