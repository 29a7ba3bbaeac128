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

#include "rsa/model.h"

#include "exception.h"
#include "file/matrix.h"
#include "mrtrix.h"
#include "path.h"
#include "rsa/rdm/rdms.h"

namespace MR::RSA::Model {

std::shared_ptr<Base> load(const std::string &path) {
  const matrix_type data = File::Matrix::load_matrix<default_type>(path);
  vector_type rdm;
  if (data.rows() == 1 || data.cols() == 1) {
    rdm = Eigen::Map<const vector_type>(data.data(), data.size());
  } else if (data.rows() == data.cols()) {
    if (!data.isApprox(data.transpose()))
      WARN("Model RDM in file \"" + path + "\" is not symmetric; only upper triangle will be used");
    rdm = upper_triangle(data);
  } else {
    throw Exception("Model file \"" + path + "\" contains a " + str(data.rows()) + "x" + str(data.cols()) +
                    " matrix; expected either a square RDM or a vector of dissimilarities");
  }
  try {
    auto model = std::make_shared<Fixed>(Path::basename(path), rdm);
    DEBUG("Model \"" + model->name + "\" loaded: " + str(rdm.size()) + " dissimilarities");
    return model;
  } catch (Exception &e) {
    throw Exception(e, "Invalid model RDM in file \"" + path + "\"");
  }
}

} // namespace MR::RSA::Model
