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

#include <string>
#include <vector>

#include "rsa/rsa.h"

namespace MR::RSA::Compare {

const std::vector<std::string> comparisons = {"corr", "cosine", "spearman"};
enum class compare_type { CORR, COSINE, SPEARMAN };
compare_type from_name(const std::string &name);
const std::string &name(const compare_type type);

// Fractional ranks (1-based); ties receive the average of their ranks
vector_type ranks(const vector_type &x);

// Similarity between two RDM vectors;
//   entries that are non-finite in either vector are excluded from both,
//   and the result is NaN if either remaining vector is degenerate
default_type compare(const vector_type &a, const vector_type &b, const compare_type type);

} // namespace MR::RSA::Compare
