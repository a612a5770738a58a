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
/** Defines the class Alignment.
 * It represents one record of the alignment file reduced to what the walker needs.
 */
#include "Alignment.hpp"

namespace asmcheck
{
Alignment::Alignment(const bam1_t *hts_align):
_tid(hts_align->core.tid), _rb(hts_align->core.pos), _unmapped((hts_align->core.flag & BAM_FUNMAP) != 0),
_qname(bam_get_qname(hts_align)) {
    const UINT32 * pcigar = bam_get_cigar(hts_align);
    UINT32 num_cigar_op = hts_align->core.n_cigar;
    _ops.reserve(num_cigar_op);
    for(UINT32 i = 0; i < num_cigar_op; ++i) {
        UINT32 current_cigar = pcigar[i];
        _ops.push_back({classify(bam_cigar_op(current_cigar)), bam_cigar_oplen(current_cigar)});
    }
}

Alignment::Alignment(const INT32 tid, const INT64 pos, const bool unmapped, const std::vector<CigarOp>& ops, const std::string& qname):
_tid(tid), _rb(pos), _unmapped(unmapped), _qname(qname), _ops(ops) {}

OpKind Alignment::classify(const UINT32 cigar_op) {
    switch (cigar_op)
    {
    case BAM_CMATCH:
    case BAM_CEQUAL:
    case BAM_CDIFF:
        return OpKind::MATCH;
    case BAM_CDEL:
        return OpKind::DELETION;
    case BAM_CSOFT_CLIP:
    case BAM_CHARD_CLIP:
        return OpKind::CLIP;
    default: // I, N, P, B
        return OpKind::OTHER;
    }
}

UINT64 Alignment::get_ref_span() const {
    UINT64 span = 0;
    for (const auto& op: _ops) {
        if (op.kind == OpKind::MATCH || op.kind == OpKind::DELETION) {
            span += op.len;
        }
    }
    return span;
}

} // namespace asmcheck
