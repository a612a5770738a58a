/*
 * 
 * Copyright (c) 2026, The asmcheck developers
 *
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

/** Module containing main() method.
 */

#include <getopt.h>
#include <cmath>
#include <sys/stat.h>

#include "globalDefs.hpp"
#include "Detector.hpp"


/** Module containing main() method for reading and processing arguments.
 */

namespace asmcheck{
void usage (void);
void decodeFlags(int argc, char* argv [], InputFlags& flags);
UINT32 get_uint_arg(const std::string& arg, const std::string& what);
double get_double_arg(const std::string& arg, const std::string& what);

static struct option long_options[] = {
    {"bam", required_argument, NULL, 'b'},
    {"output-prefix", required_argument, NULL, 'o'},
    {"min-dist-to-end", required_argument, NULL, 'd'},
    {"clipping-ratio", required_argument, NULL, 'r'},
    {"threads", required_argument, NULL, 't'},
    {"just-do-it", no_argument, NULL, 'j'},
    {"version", no_argument, NULL, 'v'},
    {"help", no_argument, NULL, 'h'},
    {NULL, 0, NULL, 0}};

inline bool file_exists (const std::string& name) {
  struct stat st;   
  return (stat (name.c_str(), &st) == 0); 
}

/** Decode the input flags
   */
void decodeFlags(int argc, char *argv[], InputFlags &flags)
{
  int opt;

  flags.bam_filename = "";
  flags.output_prefix = "";
  flags.min_dist_to_end = 100;
  flags.min_clipping_ratio = 1.0;
  flags.threads = 1;
  flags.just_do_it = false;

  std::string cmd = "asmcheck ";
  /* initialisation */
  while ((opt = getopt_long(argc, argv, "b:o:d:r:t:jvh", long_options,
                            nullptr)) != -1)
  {
    switch (opt)
    {
    case 'b':
      flags.bam_filename = std::string(optarg);
      cmd += (" -b " + std::string(optarg));
      break;

    case 'o':
      flags.output_prefix = std::string(optarg);
      cmd += (" -o " + std::string(optarg));
      break;

    case 'd':
      flags.min_dist_to_end = get_uint_arg(std::string(optarg), "Minimum distance to contig end (d)");
      cmd += (" -d " + std::string(optarg));
      break;

    case 'r':
      flags.min_clipping_ratio = get_double_arg(std::string(optarg), "Clipping ratio (r)");
      if (flags.min_clipping_ratio < 0) {
        fprintf(stderr, "[Asmcheck::Utils] Error: Arg Error: Clipping ratio (r) must NOT be negative %s!\n",optarg);
        exit(1);
      }
      cmd += (" -r " + std::string(optarg));
      break;

    case 't':
      flags.threads = get_uint_arg(std::string(optarg), "Number of threads (t)");
      if (flags.threads == 0) {
        fprintf(stderr, "[Asmcheck::Utils] Error: Arg Error: Number of threads (t) must be positive %s!\n",optarg);
        exit(1);
      }
      cmd += (" -t " + std::string(optarg));
      break;

    case 'j':
      flags.just_do_it = true;
      cmd += (" -j ");
      break;

    case 'v':
      std::cout << "asmcheck " << VERSION << std::endl;
      exit(0);

    case 'h':
      usage();
      exit(0);

    default:
      usage();
      exit(1);
    }
  }
  // Alignment file and output prefix can also be given as positional args
  if (optind < argc && flags.bam_filename == "") {
    flags.bam_filename = std::string(argv[optind++]);
    cmd += (" " + flags.bam_filename);
  }
  if (optind < argc && flags.output_prefix == "") {
    flags.output_prefix = std::string(argv[optind++]);
    cmd += (" " + flags.output_prefix);
  }
  if (optind < argc) {
    fprintf(stderr, "[Asmcheck::Utils] Error: Invalid command: Unexpected argument %s!\n",argv[optind]);
    usage();
    exit(1);
  }

  if (flags.bam_filename == "" || flags.output_prefix == "")
  {
    fprintf(stderr, "[Asmcheck::Utils] Error: Invalid command: Too few arguments!\n");
    usage();
    exit(1);
  }
  if (!flags.just_do_it) {
    fprintf(stderr, "[Asmcheck::Utils] Error: Confirmation missing: This program ONLY makes sense if you are using a BAM file that was made from\n"
                    "mapping long reads onto an assembly made with the SAME long reads.\n"
                    "If you are positive that you did JUST that, then re-run this program with the --just-do-it flag.\n");
    exit(1);
  }
  if (!file_exists(flags.bam_filename)) {
    fprintf(stderr, "[Asmcheck::Utils] Error: File Error: Alignment file does not exist %s!\n",flags.bam_filename.c_str());
    exit(1);
  }
  fprintf(stdout, "Given Command: %s.\n",cmd.c_str()); 
}

/*
   * Usage of the tool
   */
void usage(void)
{
  std::cout << "\n Usage: asmcheck <args> [<bam> <output_prefix>]\n\n";
  std::cout << " Identifies potential errors in long read assemblies using the mapping of the same long reads onto the assembly.\n\n";
  std::cout << " ** Mandatory args:\n";
  std::cout << "\t-b, --bam <str>\n"
            << "\tInput file name containing the alignments of long reads against an assembly made from these reads (in bam/sam/cram format; must have CIGAR information). "
            << "Can also be given as the first positional argument.\n\n";
  std::cout << "\t-o, --output-prefix <str>\n"
            << "\tPrefix for the output files (<prefix>" << CLIPPING_SUFF << " and <prefix>" << ZERO_COV_SUFF << "). "
            << "Can also be given as the second positional argument.\n\n";
  std::cout << "\t-j, --just-do-it\n"
            << "\tConfirm that the alignments are of the SAME long reads the assembly was made from. The program refuses to run without it.\n\n\n";

  std::cout << " ** Optional args:\n";
  std::cout << "\t-d, --min-dist-to-end <int>\n"
            << "\tMinimum distance from contig ends for a clip site to be reported. \n"
            << "\t[Default] 100.\n\n ";
  std::cout << "\t-r, --clipping-ratio <float>\n"
            << "\tMinimum ratio of clipped reads to coverage for a clip site to be reported. \n"
            << "\t[Default] 1.0.\n\n ";
  std::cout << "\t-t, --threads <int>\n"
            << "\tNumber of threads used for finding the regions to report. \n"
            << "\t[Default] 1.\n\n ";
  std::cout << "\t-v, --version\n"
            << "\tPrint the version. \n\n";
  std::cout << "\t-h, --help\n"
            << "\tPrint the usage. \n\n";
}

UINT32 get_uint_arg(const std::string& arg, const std::string& what) {
  size_t ind = 0;
  unsigned long val = 0;
  try {
    val = std::stoul(arg,&ind);
  }
  catch (const std::logic_error&) { // invalid_argument or out_of_range
    ind = 0;
  }
  if (ind == 0 || ind < arg.size() || arg[0] == '-' || val > UINT32(-1)) {
    fprintf(stderr, "[Asmcheck::Utils] Error: Arg Error: %s must be a non-negative integer %s!\n",what.c_str(),arg.c_str());
    exit(1);
  }
  return UINT32(val);
}

double get_double_arg(const std::string& arg, const std::string& what) {
  size_t ind = 0;
  double val = 0;
  try {
    val = std::stod(arg,&ind);
  }
  catch (const std::logic_error&) { // invalid_argument or out_of_range
    ind = 0;
  }
  if (ind == 0 || ind < arg.size() || std::isnan(val)) {
    fprintf(stderr, "[Asmcheck::Utils] Error: Arg Error: %s must be a number %s!\n",what.c_str(),arg.c_str());
    exit(1);
  }
  return val;
}

} // end namespace

int main(int argc, char **argv) {

  /* Decode arguments */
  asmcheck::InputFlags flags;
  asmcheck::decodeFlags(argc, argv, flags);

  asmcheck::Detector detector(flags);
  detector.detect();
  return 0;
}
