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

#include <memory>
#include <string>
#include <vector>

#include "rsa/rsa.h"

namespace MR::RSA::Model {

class Base {
public:
  Base(const std::string &name) : name(name) {}
  virtual ~Base() {}
  // Predicted RDM, as upper-triangle dissimilarities
  virtual vector_type predict() const = 0;
  ssize_t n_pairs() const { return predict().size(); }
  const std::string name;
};

class Fixed : public Base {
public:
  Fixed(const std::string &name, const vector_type &rdm) : Base(name), rdm(rdm) {
    RSA::n_conditions(rdm.size());
  }
  vector_type predict() const override { return rdm; }

private:
  const vector_type rdm;
};

using model_list = std::vector<std::shared_ptr<Base>>;

// Read a fixed model from a matrix file;
//   the file may contain either a square RDM or a single row / column of dissimilarities
std::shared_ptr<Base> load(const std::string &path);

} // namespace MR::RSA::Model
