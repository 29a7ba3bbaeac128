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

#include <map>
#include <string>
#include <vector>

#include "types.h"

namespace MR::RSA {

// Named vectors of per-element values
//   (one value per observation, per channel, or per RDM, depending on context)
using descriptor_type = std::vector<default_type>;
using Descriptors = std::map<std::string, descriptor_type>;

namespace Descriptor {

std::vector<bool> bool_index(const descriptor_type &descriptor, const default_type value);
std::vector<bool> bool_index(const descriptor_type &descriptor, const descriptor_type &values);

// Positions at which a boolean index is true
std::vector<size_t> where(const std::vector<bool> &index);

// Sorted unique values
descriptor_type unique(const descriptor_type &descriptor);

bool check_length(const Descriptors &descriptors, const size_t n);
void check_length_error(const Descriptors &descriptors, const std::string &name, const size_t n);

Descriptors subset(const Descriptors &descriptors, const std::vector<size_t> &indices);

std::string format(const Descriptors &descriptors);

const descriptor_type &get(const Descriptors &descriptors, const std::string &name);

} // namespace Descriptor

} // namespace MR::RSA
