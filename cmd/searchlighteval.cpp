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

#include <string>
#include <vector>

#include "command.h"
#include "exception.h"
#include "file/matrix.h"
#include "file/ofstream.h"
#include "header.h"
#include "progressbar.h"
#include "rsa/evaluate.h"
#include "rsa/model.h"
#include "rsa/rdm/compare.h"
#include "rsa/rdm/rdms.h"
#include "rsa/rsa.h"
#include "rsa/searchlight/volume.h"
#include "thread.h"

using namespace MR;
using namespace App;
using namespace MR::RSA;

// clang-format off
void usage() {

  SYNOPSIS = "Evaluate model RDMs against searchlight RDMs";

  DESCRIPTION
  + "Each model RDM is compared to the data RDM of every searchlight,"
    " yielding one score per model per searchlight;"
    " these scores are written to a 4D image with one volume per model,"
    " in the order in which the -model options were provided."

  + "The input RDM matrix and centre indices are those generated by the searchlightrdm command"
    " (via its output and -centres option respectively);"
    " the template image defines the voxel grid on which the searchlights were defined."

  + "Model files may contain either a square RDM"
    " or a single row or column of dissimilarities ordered as the upper triangle of the square RDM."

  + "Comparison metrics: "
    "'corr': Pearson correlation; "
    "'cosine': cosine similarity; "
    "'spearman': Spearman rank correlation (tied values receive their average rank). "
    "Dissimilarities that are not finite in either RDM are excluded from the comparison."

  + "If the evaluation of any searchlight fails,"
    " it is by default marked as invalid, given a value of NaN in the output image,"
    " and a warning is issued reporting the number of such failures;"
    " option -abort_on_failure instead terminates the command."

  + ordering_description;

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

  ARGUMENTS
  + Argument("rdms", "the matrix of searchlight RDMs, one row per searchlight").type_file_in()
  + Argument("centres", "the linear indices of the searchlight centres").type_file_in()
  + Argument("template", "an image defining the voxel grid of the searchlights").type_image_in()
  + Argument("output", "the output 4D image of model evaluations").type_image_out();

  OPTIONS
  + OptionGroup("Options controlling model evaluation")
  + Option("model",
           "a file containing a model RDM;"
           " provide this option once per model").required().allow_multiple()
    + Argument("file").type_file_in()
  + Option("metric",
           "the measure of similarity between model and data RDMs;"
           " options are: " + join(Compare::comparisons, ",") + " (default: corr)")
    + Argument("choice").type_choice(Compare::comparisons)
  + Option("abort_on_failure",
           "terminate if the evaluation of any searchlight fails,"
           " rather than marking that searchlight as invalid")

  + OptionGroup("Options for exporting additional data")
  + Option("results",
           "export all evaluations as comma-separated text,"
           " with one row per searchlight")
    + Argument("file").type_file_out();

}
// clang-format on

void save_results(const std::vector<Evaluation::Result> &results,
                  const std::vector<ssize_t> &centres,
                  const Model::model_list &models,
                  const std::string &path) {
  File::OFStream out(path);
  out << "# " << App::command_history_string << "\n";
  out << "voxel_index,valid";
  for (const auto &model : models)
    out << "," << model->name;
  out << "\n";
  for (size_t i = 0; i != results.size(); ++i) {
    out << centres[i] << "," << (results[i].valid ? "1" : "0");
    for (ssize_t m = 0; m != results[i].evaluations.size(); ++m)
      out << "," << str(results[i].evaluations[m]);
    out << "\n";
  }
}

void run() {
  const matrix_type dissimilarities = File::Matrix::load_matrix<default_type>(argument[0]);
  const vector_type centre_values = File::Matrix::load_vector<default_type>(argument[1]);
  if (centre_values.size() != dissimilarities.rows())
    throw Exception("Number of searchlight centres (" + str(centre_values.size()) + ")" +
                    " does not match number of RDMs (" + str(dissimilarities.rows()) + ")");
  std::vector<ssize_t> centres(centre_values.size());
  for (ssize_t i = 0; i != centre_values.size(); ++i)
    centres[i] = ssize_t(centre_values[i]);
  const RDMs rdms(dissimilarities,
                  "unknown",
                  descriptor_type(),
                  Descriptors{{"voxel_index", descriptor_type(centre_values.data(),
                                                              centre_values.data() + centre_values.size())}});

  const Header template_header = Header::open(argument[2]);

  Model::model_list models;
  for (const auto &opt : get_options("model"))
    models.push_back(Model::load(opt[0]));

  const auto metric = Compare::compare_type(get_option_value("metric", int(Compare::compare_type::CORR)));
  const auto policy =
      get_options("abort_on_failure").empty() ? Evaluation::failure_policy::MARK : Evaluation::failure_policy::ABORT;

  ProgressBar progress("Evaluating " + str(models.size()) + " model" + (models.size() > 1 ? "s" : "") +
                           " using " + Compare::name(metric),
                       rdms.n_rdm());
  const auto results = Evaluation::evaluate_searchlight(rdms,
                                                        models,
                                                        Evaluation::make_eval_fixed(metric),
                                                        Thread::number_of_threads(),
                                                        policy,
                                                        progress_to(progress));
  progress.done();

  Searchlight::write_scores_image(results, centres, template_header, argument[3]);

  auto opt = get_options("results");
  if (!opt.empty())
    save_results(results, centres, models, opt[0][0]);
}
