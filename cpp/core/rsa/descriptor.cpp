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

#include "rsa/descriptor.h"

#include <algorithm>

#include "exception.h"
#include "mrtrix.h"

namespace MR::RSA::Descriptor {

std::vector<bool> bool_index(const descriptor_type &descriptor, const default_type value) {
  std::vector<bool> result(descriptor.size());
  for (size_t i = 0; i != descriptor.size(); ++i)
    result[i] = descriptor[i] == value;
  return result;
}

std::vector<bool> bool_index(const descriptor_type &descriptor, const descriptor_type &values) {
  std::vector<bool> result(descriptor.size(), false);
  for (size_t i = 0; i != descriptor.size(); ++i)
    result[i] = std::find(values.begin(), values.end(), descriptor[i]) != values.end();
  return result;
}

std::vector<size_t> where(const std::vector<bool> &index) {
  std::vector<size_t> result;
  for (size_t i = 0; i != index.size(); ++i) {
    if (index[i])
      result.push_back(i);
  }
  return result;
}

descriptor_type unique(const descriptor_type &descriptor) {
  descriptor_type result(descriptor);
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

bool check_length(const Descriptors &descriptors, const size_t n) {
  for (const auto &d : descriptors) {
    if (d.second.size() != n)
      return false;
  }
  return true;
}

void check_length_error(const Descriptors &descriptors, const std::string &name, const size_t n) {
  if (!check_length(descriptors, n))
    throw Exception(name + " have mismatched dimension with measurements (expected " + str(n) + " entries)");
}

Descriptors subset(const Descriptors &descriptors, const std::vector<size_t> &indices) {
  Descriptors result;
  for (const auto &d : descriptors) {
    descriptor_type values;
    values.reserve(indices.size());
    for (const auto i : indices) {
      if (i >= d.second.size())
        throw Exception("Index " + str(i) + " out of range for descriptor \"" + d.first + "\"" +
                        " with " + str(d.second.size()) + " entries");
      values.push_back(d.second[i]);
    }
    result[d.first] = std::move(values);
  }
  return result;
}

std::string format(const Descriptors &descriptors) {
  std::string result;
  for (const auto &d : descriptors) {
    result += d.first + " = [";
    for (size_t i = 0; i != d.second.size(); ++i)
      result += (i ? " " : "") + str(d.second[i]);
    result += "]\n";
  }
  return result;
}

const descriptor_type &get(const Descriptors &descriptors, const std::string &name) {
  const auto it = descriptors.find(name);
  if (it == descriptors.end())
    throw Exception("Descriptor \"" + name + "\" not found");
  return it->second;
}

} // namespace MR::RSA::Descriptor
