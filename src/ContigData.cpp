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
/** Defines the class ContigData.
 * It accumulates coverage and clip sites for one contig and finds the regions to be reported.
 */
#include <limits>
#include "ContigData.hpp"

namespace asmcheck
{
ContigData::ContigData(const std::string& name, const UINT32 len):
_name(name), _len(len), _coverage(len, 0) {}

ContigData::ContigData(const ContigRecord& record):
_name(record.name), _len(record.len), _coverage(record.len, 0) {}

bool ContigData::add_alignment(const Alignment& aln) {
    if (aln.is_unmapped()) {
        return true;
    }
    // Check the whole span first so that a bad record leaves no partial update
    if (aln.get_pos() < 0 || aln.get_pos() >= _len || aln.get_pos() + aln.get_ref_span() > _len) {
        return false;
    }
    UINT32 curr_pos = aln.get_pos();
    UINT32 num_op = 0; // 1-based index of the current operation
    for (const auto& op: aln.get_ops()) {
        ++num_op;
        switch (op.kind)
        {
        case OpKind::MATCH:
            for (UINT32 pos = curr_pos; pos < curr_pos + op.len; ++pos) {
                ++_coverage[pos];
            }
            curr_pos += op.len;
            break;
        case OpKind::DELETION:
            curr_pos += op.len;
            break;
        case OpKind::CLIP:
            if (num_op == 1) {
                // Clipped at the start of the contig; not an assembly error
                if (curr_pos != 0) {
                    add_clipping(curr_pos);
                }
            }
            else if (curr_pos != _len) { // right end; last aligned base, unless at the end of the contig
                add_clipping((curr_pos > 0) ? (curr_pos - 1) : (0));
            }
            break;
        default:
            break;
        }
    }
    return true;
}

std::vector<ClipSite> ContigData::find_clip_sites(const UINT32 min_dist_to_end, const double min_clipping_ratio) const {
    std::vector<ClipSite> sites;
    for (const auto& cl: _clipping) {
        UINT32 pos = cl.first;
        UINT32 clipping = cl.second;
        if (pos <= min_dist_to_end || (_len - pos) <= min_dist_to_end) {
            continue;
        }
        UINT32 cov = _coverage[pos];
        // A clip site no read covers is the most suspicious of all
        double ratio = (cov > 0) ? (double(clipping) / cov) : (std::numeric_limits<double>::infinity());
        if (clipping > 0 && ratio >= min_clipping_ratio) {
            sites.push_back({pos, cov, clipping, ratio});
        }
    }
    return sites;
}

std::vector<ZeroCovRange> ContigData::find_zero_cov_ranges() const {
    std::vector<ZeroCovRange> ranges;
    bool in_window = false;
    UINT32 window_start = 0;
    for (UINT32 pos = 0; pos < _len; ++pos) {
        if (_coverage[pos] == 0 && !in_window) {
            window_start = pos;
            in_window = true;
        }
        else if (_coverage[pos] > 0 && in_window) {
            ranges.push_back({window_start, pos});
            in_window = false;
        }
    }
    if (in_window) { // runs till the end of the contig
        ranges.push_back({window_start, _len});
    }
    return ranges;
}

} // namespace asmcheck
