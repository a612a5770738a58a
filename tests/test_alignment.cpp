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
/** Checks of Alignment: reducing htslib records to the classified operations.
 */

#include <cstring>
#include <iostream>
#include <string>

#include "Alignment.hpp"

using namespace asmcheck;

static int check(bool ok, const std::string &label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static int testClassify() {
    if (check(Alignment::classify(BAM_CMATCH) == OpKind::MATCH, "classify: M") != 0) return 1;
    if (check(Alignment::classify(BAM_CEQUAL) == OpKind::MATCH, "classify: =") != 0) return 1;
    if (check(Alignment::classify(BAM_CDIFF) == OpKind::MATCH, "classify: X") != 0) return 1;
    if (check(Alignment::classify(BAM_CDEL) == OpKind::DELETION, "classify: D") != 0) return 1;
    if (check(Alignment::classify(BAM_CSOFT_CLIP) == OpKind::CLIP, "classify: S") != 0) return 1;
    if (check(Alignment::classify(BAM_CHARD_CLIP) == OpKind::CLIP, "classify: H") != 0) return 1;
    if (check(Alignment::classify(BAM_CINS) == OpKind::OTHER, "classify: I") != 0) return 1;
    if (check(Alignment::classify(BAM_CREF_SKIP) == OpKind::OTHER, "classify: N") != 0) return 1;
    if (check(Alignment::classify(BAM_CPAD) == OpKind::OTHER, "classify: P") != 0) return 1;
    return 0;
}

static int testFromRecord() {
    // 5S 20M 3I 10M 2D 5M 4H
    const uint32_t cigar[] = {
        bam_cigar_gen(5, BAM_CSOFT_CLIP), bam_cigar_gen(20, BAM_CMATCH), bam_cigar_gen(3, BAM_CINS),
        bam_cigar_gen(10, BAM_CEQUAL), bam_cigar_gen(2, BAM_CDEL), bam_cigar_gen(5, BAM_CDIFF),
        bam_cigar_gen(4, BAM_CHARD_CLIP)};
    const size_t n_cigar = sizeof(cigar)/sizeof(cigar[0]);
    const std::string qname = "read_1";
    const std::string seq(43, 'A'); // query length of the cigar
    bam1_t *b = bam_init1();
    int ret = bam_set1(b, qname.size(), qname.c_str(), 0, 2, 1234, 60, n_cigar, cigar, -1, -1, 0,
                       seq.size(), seq.c_str(), NULL, 0);
    if (check(ret >= 0, "record: built") != 0) {bam_destroy1(b); return 1;}

    Alignment aln(b);
    bam_destroy1(b);
    if (check(aln.get_tid() == 2, "record: tid") != 0) return 1;
    if (check(aln.get_pos() == 1234, "record: pos") != 0) return 1;
    if (check(!aln.is_unmapped(), "record: mapped") != 0) return 1;
    if (check(aln.get_qname() == qname, "record: qname") != 0) return 1;

    const auto& ops = aln.get_ops();
    if (check(ops.size() == n_cigar, "record: number of ops") != 0) return 1;
    if (check(ops[0].kind == OpKind::CLIP && ops[0].len == 5, "record: op 1") != 0) return 1;
    if (check(ops[1].kind == OpKind::MATCH && ops[1].len == 20, "record: op 2") != 0) return 1;
    if (check(ops[2].kind == OpKind::OTHER && ops[2].len == 3, "record: op 3") != 0) return 1;
    if (check(ops[3].kind == OpKind::MATCH && ops[3].len == 10, "record: op 4") != 0) return 1;
    if (check(ops[4].kind == OpKind::DELETION && ops[4].len == 2, "record: op 5") != 0) return 1;
    if (check(ops[5].kind == OpKind::MATCH && ops[5].len == 5, "record: op 6") != 0) return 1;
    if (check(ops[6].kind == OpKind::CLIP && ops[6].len == 4, "record: op 7") != 0) return 1;
    if (check(aln.get_ref_span() == 37, "record: reference span") != 0) return 1;
    return 0;
}

static int testUnmappedRecord() {
    const std::string qname = "read_2";
    bam1_t *b = bam_init1();
    int ret = bam_set1(b, qname.size(), qname.c_str(), BAM_FUNMAP, -1, -1, 0, 0, NULL, -1, -1, 0,
                       0, NULL, NULL, 0);
    if (check(ret >= 0, "unmapped record: built") != 0) {bam_destroy1(b); return 1;}
    Alignment aln(b);
    bam_destroy1(b);
    if (check(aln.is_unmapped(), "unmapped record: flag") != 0) return 1;
    if (check(aln.get_ops().empty(), "unmapped record: no ops") != 0) return 1;
    if (check(aln.get_ref_span() == 0, "unmapped record: no span") != 0) return 1;
    return 0;
}

int main() {
    std::cout << "Test: Alignment from htslib records" << std::endl;
    int failures = 0;
    failures += testClassify();
    failures += testFromRecord();
    failures += testUnmappedRecord();
    if (failures != 0) {
        std::cerr << failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "PASS" << std::endl;
    return 0;
}
