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
/** Defines the class Detector.
 * It is the master class: it reads the alignments once and writes the reports.
 */

#include <iomanip>
#include <limits>
#include "Detector.hpp"
# include <omp.h>


namespace asmcheck
{

Detector::Detector(const InputFlags& flags): _cFlags(flags), _sf(nullptr), _sam_header(nullptr), _hts_align(nullptr),
_monitor(), _num_aln_read(0), _num_unmapped(0) {
    omp_set_num_threads(_cFlags.threads);
}

Detector::~Detector() {
    if (_hts_align) {bam_destroy1(_hts_align);}
    if (_sam_header) {bam_hdr_destroy(_sam_header);}
    if (_sf) {sam_close(_sf);}
}

void Detector::detect() {
    fprintf(stdout, "[Asmcheck::Detector] Info: Alignment file: %s\n",_cFlags.bam_filename.c_str());
    fprintf(stdout, "[Asmcheck::Detector] Info: Length of contig's end to ignore: %u\n",_cFlags.min_dist_to_end);

    ///////////////////////////////////
    /* Get contigs */
    _monitor.start();
    load_contigs();
    _monitor.stop("[Asmcheck:Detector]: Loaded contigs. ");

    ///////////////////////////////////
    /* Accumulate coverage and clipping */
    _monitor.start();
    process_alignments();
    _monitor.stop("[Asmcheck:Detector]: Processed alignments. ");

    ///////////////////////////////////
    /* Write results */
    _monitor.start();
    std::string clipping_filename = _cFlags.output_prefix + CLIPPING_SUFF;
    fprintf(stdout, "[Asmcheck::Detector] Info: Output file: %s\n",clipping_filename.c_str());
    write_clipping(clipping_filename);

    std::string zero_cov_filename = _cFlags.output_prefix + ZERO_COV_SUFF;
    fprintf(stdout, "[Asmcheck::Detector] Info: Output file: %s\n",zero_cov_filename.c_str());
    write_zero_cov(zero_cov_filename);
    _monitor.stop("[Asmcheck:Detector]: Writing results. ");

    _monitor.total("[Asmcheck:Detector]: Overall. ");
    fprintf(stdout, "[Asmcheck::Detector] Info: Analysis complete!\n");
}

void Detector::load_contigs() {
    _sf = sam_open(_cFlags.bam_filename.c_str(), "r");
    if (_sf == nullptr) {
        fprintf(stderr, "[Asmcheck::Detector] Error: File open error: Alignment file (%s) could not be opened!\n",_cFlags.bam_filename.c_str());
        exit(1);
    }
    _sam_header = sam_hdr_read(_sf);
    if (_sam_header == nullptr) {
        fprintf(stderr, "[Asmcheck::Detector] Error: Alignment File error: Could not read the header of %s!\n",_cFlags.bam_filename.c_str());
        exit(1);
    }
    INT32 num_ref = sam_hdr_nref(_sam_header);
    if (num_ref <= 0) {
        fprintf(stderr, "[Asmcheck::Detector] Error: Alignment File error: No reference sequences in the header of %s!\n",_cFlags.bam_filename.c_str());
        exit(1);
    }
    _contig_records.reserve(num_ref);
    for (INT32 tid = 0; tid < num_ref; ++tid) {
        std::string cname(sam_hdr_tid2name(_sam_header,tid));
        _contig_records.push_back({cname, UINT32(sam_hdr_tid2len(_sam_header,tid))});
    }
    fprintf(stdout, "[Asmcheck::Detector] Info: Number of contigs: %lu\n",_contig_records.size());
}

ContigData& Detector::get_contig_data(const UINT32 cid) {
    const ContigRecord& record = _contig_records[cid];
    auto it = _contig_data.find(record.name);
    if (it == _contig_data.end()) {
        it = _contig_data.emplace(record.name, std::make_unique<ContigData>(record)).first;
    }
    return *(it->second);
}

void Detector::process_alignments() {
    _hts_align = bam_init1();
    INT32 ret;
    while((ret = sam_read1(_sf, _sam_header, _hts_align)) >= 0) {
        ++_num_aln_read;
        if (_hts_align->core.flag & BAM_FUNMAP) {
            ++_num_unmapped;
            continue;
        }
        if ((_num_aln_read % PROGRESS_STEP)==0) {
            std::cerr << "\rProcessed " << _num_aln_read << " reads" << std::flush;
        }
        Alignment aln(_hts_align);
        if (aln.get_tid() < 0 || aln.get_tid() >= INT32(_contig_records.size())) {
            fprintf(stderr, "\n[Asmcheck::Detector] Error: Alignment File error: Read (%s) refers to a contig (tid %d) missing from the header!\n",aln.get_qname().c_str(),aln.get_tid());
            exit(1);
        }
        ContigData& contig = get_contig_data(aln.get_tid());
        if (!contig.add_alignment(aln)) {
            fprintf(stderr, "\n[Asmcheck::Detector] Error: Alignment File error: Alignment does not fit in the contig. Contig (%s): Read (%s): rb (%ld): span (%lu): clen (%u)\n",
                contig.get_name().c_str(), aln.get_qname().c_str(), aln.get_pos(), aln.get_ref_span(), contig.get_len());
            exit(1);
        }
    }
    if (ret < -1) {
        fprintf(stderr, "\n[Asmcheck::Detector] Error: Alignment File error: Could not decode record %lu of %s!\n",_num_aln_read+1,_cFlags.bam_filename.c_str());
        exit(1);
    }
    std::cerr << std::endl;
    fprintf(stdout, "[Asmcheck::Detector] Info: Read processing complete\n");
    fprintf(stdout, "[Asmcheck::Detector] Info: Number of alignments: read (%lu) unmapped (%lu); Contigs with mapped reads: %lu\n",
        _num_aln_read,_num_unmapped,_contig_data.size());
}

std::vector<const ContigData*> Detector::get_touched_contigs() const {
    std::vector<const ContigData*> touched;
    touched.reserve(_contig_data.size());
    for (const auto& record: _contig_records) {
        auto it = _contig_data.find(record.name);
        if (it != _contig_data.end()) {
            touched.push_back(it->second.get());
        }
    }
    return touched;
}

void Detector::write_clipping(const std::string& filename) {
    auto contigs = get_touched_contigs();
    std::vector<std::vector<ClipSite>> sites(contigs.size());
    #pragma omp parallel for schedule(static,1)
    for (UINT64 i = 0; i < contigs.size(); ++i) {
        sites[i] = contigs[i]->find_clip_sites(_cFlags.min_dist_to_end,_cFlags.min_clipping_ratio);
    }

    std::ofstream ofile(filename);
    if (!ofile.is_open()) {
        fprintf(stderr, "[Asmcheck::Detector] Error: File open error: Output File (%s) could not be opened!\n",filename.c_str());
        exit(1);
    }
    ofile << "contig\tlength\tpos\trelative_pos\tcov\tclipping\tclipping_ratio\n";
    // Full precision for relative_pos and clipping_ratio
    ofile << std::setprecision(std::numeric_limits<double>::digits10);
    UINT64 num_sites = 0;
    for (UINT64 i = 0; i < contigs.size(); ++i) {
        const auto& name = contigs[i]->get_name();
        UINT32 len = contigs[i]->get_len();
        for (const auto& site: sites[i]) {
            ofile << name << "\t" << len << "\t" << site.pos << "\t" << (double(site.pos)/len) << "\t"
                  << site.cov << "\t" << site.clipping << "\t" << site.ratio << "\n";
        }
        num_sites += sites[i].size();
    }
    ofile.close();
    if (ofile.fail()) {
        fprintf(stderr, "[Asmcheck::Detector] Error: File write error: Output File (%s) could not be written!\n",filename.c_str());
        exit(1);
    }
    fprintf(stdout, "[Asmcheck::Detector] Info: Number of clip sites reported: %lu\n",num_sites);
}

void Detector::write_zero_cov(const std::string& filename) {
    auto contigs = get_touched_contigs();
    std::vector<std::vector<ZeroCovRange>> ranges(contigs.size());
    #pragma omp parallel for schedule(static,1)
    for (UINT64 i = 0; i < contigs.size(); ++i) {
        ranges[i] = contigs[i]->find_zero_cov_ranges();
    }

    std::ofstream ofile(filename);
    if (!ofile.is_open()) {
        fprintf(stderr, "[Asmcheck::Detector] Error: File open error: Output File (%s) could not be opened!\n",filename.c_str());
        exit(1);
    }
    ofile << "contig\tlength\trange\trange_size\n";
    UINT64 num_ranges = 0;
    for (UINT64 i = 0; i < contigs.size(); ++i) {
        const auto& name = contigs[i]->get_name();
        UINT32 len = contigs[i]->get_len();
        for (const auto& range: ranges[i]) {
            ofile << name << "\t" << len << "\t" << range.beg << "-" << range.end << "\t" << (range.end - range.beg) << "\n";
        }
        num_ranges += ranges[i].size();
    }
    ofile.close();
    if (ofile.fail()) {
        fprintf(stderr, "[Asmcheck::Detector] Error: File write error: Output File (%s) could not be written!\n",filename.c_str());
        exit(1);
    }
    fprintf(stdout, "[Asmcheck::Detector] Info: Number of zero-coverage ranges reported: %lu\n",num_ranges);
}

} // namespace asmcheck
