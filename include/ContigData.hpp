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
/** Class ContigData.
 * It accumulates, for one contig, the per-base coverage and the clip sites of the reads mapped onto it,
 * and finds the clip sites and zero-coverage ranges to be reported once all the reads are seen.
 */
#pragma once
#include <map>

#include "globalDefs.hpp"
#include "Alignment.hpp"

namespace asmcheck
{
using ClipSite = struct SClipSite {
    UINT32 pos;
    UINT32 cov;
    UINT32 clipping;
    double ratio; // clipping/cov; infinity if cov is 0
};

// Zero-coverage range [beg, end)
using ZeroCovRange = struct SZeroCovRange {
    UINT32 beg;
    UINT32 end;
};

class ContigData {
public:
    ContigData(const std::string& name, const UINT32 len);
    ContigData(const ContigRecord& record);

    ContigData(const ContigData &) = delete;
    ContigData &operator=(const ContigData &) = delete;
    ~ContigData() = default;

    /** Walks the operations of a mapped alignment; increments coverage under the matches
     * and records a clip site at each clipped end.
     * Returns false (and changes nothing) if the alignment does not fit in the contig.
     * Unmapped alignments are ignored.
     * */
    bool add_alignment(const Alignment& aln);

    // Clip sites away from the contig ends whose clipping ratio reaches min_clipping_ratio; sorted by position
    std::vector<ClipSite> find_clip_sites(const UINT32 min_dist_to_end, const double min_clipping_ratio) const;

    // Maximal runs of zero coverage; sorted by position
    std::vector<ZeroCovRange> find_zero_cov_ranges() const;

    inline const std::string& get_name() const {return _name;}
    inline UINT32 get_len() const {return _len;}
    inline UINT32 get_coverage(const UINT32 pos) const {assert(pos<_len); return _coverage[pos];}
    inline UINT32 get_clipping(const UINT32 pos) const {
        auto it = _clipping.find(pos);
        return (it == _clipping.end()) ? 0 : it->second;
    }
    inline UINT64 get_num_clip_sites() const {return _clipping.size();}

private:
    const std::string _name;
    const UINT32 _len;
    std::vector<UINT32> _coverage; // one counter per base
    std::map<UINT32, UINT32> _clipping; // clip-site pos -> number of reads clipped there

    inline void add_clipping(const UINT32 pos) {++_clipping[pos];}
}; // ContigData
} // namespace asmcheck
