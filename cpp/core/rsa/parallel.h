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

#include <type_traits>

#include "rsa/rsa.h"
#include "thread_queue.h"

namespace MR::RSA {

// Dispenses the indices [0, count) in order;
//   runs in a single thread, so is also where progress is reported
class IndexSender {
public:
  IndexSender(const size_t count, const progress_callback &progress) : count(count), next(0), progress(progress) {}
  bool operator()(size_t &out) {
    if (next == count)
      return false;
    out = next++;
    if (progress)
      progress(next, count);
    return true;
  }

private:
  const size_t count;
  size_t next;
  progress_callback progress;
};

// One copy per thread;
//   the functor must write its result only into storage dedicated to the received index
template <class Functor> class IndexReceiver {
public:
  IndexReceiver(Functor &functor) : functor(functor) {}
  bool operator()(const size_t &index) {
    functor(index);
    return true;
  }

private:
  Functor functor;
};

// Apply a functor to every index in [0, count);
//   completion order across threads is arbitrary,
//   so anything order-dependent must be keyed by the received index
template <class Functor>
void run_indexed(const size_t count, Functor &&functor, const size_t num_threads, const progress_callback &progress) {
  if (num_threads <= 1 || count < 2) {
    for (size_t index = 0; index != count; ++index) {
      functor(index);
      if (progress)
        progress(index + 1, count);
    }
    return;
  }
  IndexSender sender(count, progress);
  IndexReceiver<typename std::remove_reference<Functor>::type> receiver(functor);
  Thread::run_queue(sender, size_t(), Thread::multi(receiver, num_threads));
}

} // namespace MR::RSA
