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
/** Class Alignment.
 * It represents one record of the alignment file reduced to what the walker needs:
 * target id, leftmost position, mapping status and the classified cigar operations.
 */
#pragma once
#include "globalDefs.hpp"

namespace asmcheck
{
class Alignment {
public:
    // Alignment from an htslib record
    Alignment(const bam1_t *hts_align);

    // Alignment from already classified operations
    Alignment(const INT32 tid, const INT64 pos, const bool unmapped, const std::vector<CigarOp>& ops, const std::string& qname="");

    Alignment(const Alignment &) = delete;
    Alignment &operator=(const Alignment &) = delete;
    Alignment(Alignment&&) = default;
    Alignment& operator=(Alignment&&) = default;
    ~Alignment()= default;

    // Maps a BAM cigar operation code to the kind used by the walker
    static OpKind classify(const UINT32 cigar_op);

    inline INT32 get_tid() const {return _tid;}
    inline INT64 get_pos() const {return _rb;}
    inline bool is_unmapped() const {return _unmapped;}
    inline const std::vector<CigarOp>& get_ops() const {return _ops;}
    inline const std::string& get_qname() const {return _qname;}

    // Number of reference bases consumed by the matches and deletions
    UINT64 get_ref_span() const;

private:
    INT32 _tid; // target id in the header
    INT64 _rb; // ref beginning/start pos (0-based)
    bool _unmapped;
    std::string _qname;
    std::vector<CigarOp> _ops;

}; // Alignment
} // namespace asmcheck
