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

#pragma once

#include <cstdlib>
#include <cassert>
#include <fstream>
#include <cstdint>
#include <stdio.h>
#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>
#include <sstream>

#include <htslib/sam.h>

namespace asmcheck{

  // Types
  using UINT = unsigned int;
  using INT = int;
  using INT8 = int8_t;
  using UINT8 = uint8_t;
  using BYTE = uint8_t;
  using INT16 = int16_t;
  using UINT16 = uint16_t;
  using INT32 = int32_t;
  using UINT32 = uint32_t;
  using INT64 = int64_t;
  using UINT64 = uint64_t;

  using InputFlags = struct SInputFlags{
    std::string bam_filename;
    std::string output_prefix;
    UINT32 min_dist_to_end; // clip sites closer than this to either contig end are ignored
    double min_clipping_ratio; // clip count / coverage must reach this
    UINT32 threads;
    // Set only by --just-do-it; the input must be the same long reads mapped
    // onto an assembly made from them.
    bool just_do_it;
  };

  #define VERSION "1.0"

  // Output files (appended to the output prefix)
  #define CLIPPING_SUFF "-clipping.txt"
  #define ZERO_COV_SUFF "-zero_cov.txt"

  // Number of records between two progress reports
  #define PROGRESS_STEP 500u

  // Contig as declared in the alignment file header
  using ContigRecord = struct SContigRecord{
    std::string name;
    UINT32 len;
  };

  // Operation kinds the walker distinguishes; all other cigar operations are OTHER
  enum class OpKind: UINT8 {
      MATCH, // M, =, X
      DELETION, // D
      CLIP, // S, H
      OTHER
  };

  using CigarOp = struct SCigarOp{
    OpKind kind;
    UINT32 len;
  };

} // end namespace
