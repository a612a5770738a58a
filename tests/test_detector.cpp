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
/** End-to-end check of Detector over a small SAM file.
 * Runs in the test working directory; writes test_detector.sam and test_detector-*.txt there.
 */

#include <iostream>
#include <iterator>
#include <string>

#include "Detector.hpp"

using namespace asmcheck;

static int check(bool ok, const std::string &label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static std::string read_file(const std::string& filename) {
    std::ifstream ifs(filename);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

static void write_sam(const std::string& filename) {
    std::ofstream ofs(filename);
    ofs << "@HD\tVN:1.6\tSO:unsorted\n"
        << "@SQ\tSN:ctg1\tLN:1000\n"
        << "@SQ\tSN:ctg2\tLN:500\n"
        << "@SQ\tSN:ctg3\tLN:300\n"
        << "@SQ\tSN:ctg4\tLN:3000\n";
    // ctg1: one read over [100,900)
    ofs << "r1\t0\tctg1\t101\t60\t800M\t*\t0\t0\t*\t*\n";
    // ctg2: three reads over [100,200) clipped after 199, three over [200,300) clipped before 200
    for (int i = 0; i < 3; ++i) {
        ofs << "a" << i << "\t0\tctg2\t101\t60\t100M10S\t*\t0\t0\t*\t*\n";
        ofs << "b" << i << "\t16\tctg2\t201\t60\t10S100M\t*\t0\t0\t*\t*\n";
    }
    // ctg4: three reads over [1234,1334) clipped before 1234
    for (int i = 0; i < 3; ++i) {
        ofs << "c" << i << "\t0\tctg4\t1235\t60\t10S100M\t*\t0\t0\t*\t*\n";
    }
    ofs << "u1\t4\t*\t0\t0\t*\t*\t0\t0\t*\t*\n";
}

int main() {
    std::cout << "Test: Detector end-to-end" << std::endl;
    const std::string sam = "test_detector.sam";
    write_sam(sam);

    InputFlags flags;
    flags.bam_filename = sam;
    flags.output_prefix = "test_detector";
    flags.min_dist_to_end = 50;
    flags.min_clipping_ratio = 1.0;
    flags.threads = 2;
    flags.just_do_it = true;

    Detector detector(flags);
    detector.detect();

    int failures = 0;
    failures += check(detector.get_num_contigs() == 4, "contigs in header");
    failures += check(detector.get_num_touched_contigs() == 3, "only contigs with mapped reads are accumulated");
    failures += check(detector.get_num_aln_read() == 11, "alignments read");
    failures += check(detector.get_num_unmapped() == 1, "unmapped alignments");

    const std::string expected_clipping =
        "contig\tlength\tpos\trelative_pos\tcov\tclipping\tclipping_ratio\n"
        "ctg2\t500\t199\t0.398\t3\t3\t1\n"
        "ctg2\t500\t200\t0.4\t3\t3\t1\n"
        "ctg4\t3000\t1234\t0.411333333333333\t3\t3\t1\n";
    failures += check(read_file("test_detector-clipping.txt") == expected_clipping, "clipping report");

    const std::string expected_zero_cov =
        "contig\tlength\trange\trange_size\n"
        "ctg1\t1000\t0-100\t100\n"
        "ctg1\t1000\t900-1000\t100\n"
        "ctg2\t500\t0-100\t100\n"
        "ctg2\t500\t300-500\t200\n"
        "ctg4\t3000\t0-1234\t1234\n"
        "ctg4\t3000\t1334-3000\t1666\n";
    failures += check(read_file("test_detector-zero_cov.txt") == expected_zero_cov, "zero-coverage report");

    if (failures != 0) {
        std::cerr << failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "PASS" << std::endl;
    return 0;
}
