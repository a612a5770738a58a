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
/** Class Detector.
 * It is the master class: it reads the alignments once, accumulating per-contig coverage and clipping,
 * and then writes the clipping and zero-coverage reports.
 */
#pragma once
#include <unordered_map>
#include <memory>

#include "slog/Monitor.hpp"

#include "globalDefs.hpp"
#include "ContigData.hpp"
#include "Alignment.hpp"

namespace asmcheck
{
class Detector {
public:
    Detector(const InputFlags&);
    ~Detector();
    void detect();

    inline UINT64 get_num_contigs() const {return _contig_records.size();}
    // Number of contigs with at least one mapped read
    inline UINT64 get_num_touched_contigs() const {return _contig_data.size();}
    inline UINT64 get_num_aln_read() const {return _num_aln_read;}
    inline UINT64 get_num_unmapped() const {return _num_unmapped;}
private:
    const InputFlags& _cFlags;
    samFile *_sf;
    bam_hdr_t *_sam_header;
    bam1_t *_hts_align;
    slog::Monitor _monitor;

    std::vector<ContigRecord> _contig_records; // in header order
    // Created on the first read mapped to a contig
    std::unordered_map<std::string, std::unique_ptr<ContigData>> _contig_data;

    UINT64 _num_aln_read;
    UINT64 _num_unmapped;

    void load_contigs();
    void process_alignments();
    ContigData& get_contig_data(const UINT32 cid);
    // Touched contigs in header order
    std::vector<const ContigData*> get_touched_contigs() const;
    void write_clipping(const std::string& filename);
    void write_zero_cov(const std::string& filename);
}; // Detector
} // namespace asmcheck
