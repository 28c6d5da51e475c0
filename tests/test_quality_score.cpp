// Unit tests for genome quality scoring

#include "core/errors.h"
#include "core/quality_score.h"
#include "test_utils.h"

#include <cassert>
#include <iostream>

using namespace specter;
using specter_test::make_complete_record;
using specter_test::make_record;
using specter_test::near;

void test_draft_score() {
    std::cout << "Testing draft assembly score... ";
    MetadataRecord rec = make_record("GB_GCA_000000001.1");
    assert(!is_complete_assembly(rec));
    // 95 - 5*2 - 5*100/100
    assert(near(genome_quality_score(rec), 80.0));
    std::cout << "PASSED\n";
}

void test_complete_assembly_bonus() {
    std::cout << "Testing complete assembly bonus... ";
    MetadataRecord rec = make_complete_record("RS_GCF_000000001.1");
    assert(is_complete_assembly(rec));
    // 100 + 95 - 10 - 5*2/100
    assert(near(genome_quality_score(rec), 184.9));

    MetadataRecord chromosome = rec;
    chromosome.ncbi_assembly_level = "Chromosome";
    assert(is_complete_assembly(chromosome));

    MetadataRecord partial = rec;
    partial.ncbi_genome_representation = "partial";
    assert(!is_complete_assembly(partial));

    MetadataRecord extra_scaffold = rec;
    extra_scaffold.scaffold_count = 3;
    assert(!is_complete_assembly(extra_scaffold));

    MetadataRecord unspanned = rec;
    unspanned.ncbi_unspanned_gaps = 1;
    assert(!is_complete_assembly(unspanned));

    MetadataRecord spanned = rec;
    spanned.ncbi_spanned_gaps = 10;
    assert(is_complete_assembly(spanned));
    spanned.ncbi_spanned_gaps = 11;
    assert(!is_complete_assembly(spanned));

    // no spanned gap count is not a reason to withhold the bonus
    MetadataRecord no_spanned = rec;
    no_spanned.ncbi_spanned_gaps.reset();
    assert(is_complete_assembly(no_spanned));
    assert(near(genome_quality_score(no_spanned), 184.9));

    MetadataRecord no_unspanned = rec;
    no_unspanned.ncbi_unspanned_gaps.reset();
    assert(!is_complete_assembly(no_unspanned));

    MetadataRecord no_molecules = rec;
    no_molecules.ncbi_molecule_count.reset();
    assert(!is_complete_assembly(no_molecules));

    MetadataRecord no_ssu = rec;
    no_ssu.ssu_count = 0;
    assert(!is_complete_assembly(no_ssu));

    MetadataRecord gappy = rec;
    gappy.total_gap_length = 10001;
    assert(!is_complete_assembly(gappy));
    std::cout << "PASSED\n";
}

void test_monotonic_in_checkm() {
    std::cout << "Testing monotonicity in completeness and contamination... ";
    MetadataRecord rec = make_record("G1");
    double prev = genome_quality_score(rec);
    for (double cont = 2.5; cont <= 10.0; cont += 0.5) {
        rec.checkm_contamination = cont;
        double s = genome_quality_score(rec);
        assert(s < prev);
        prev = s;
    }

    rec = make_record("G1");
    prev = genome_quality_score(rec);
    for (double comp = 95.5; comp <= 100.0; comp += 0.5) {
        rec.checkm_completeness = comp;
        double s = genome_quality_score(rec);
        assert(s > prev);
        prev = s;
    }
    std::cout << "PASSED\n";
}

void test_type_material_bonus() {
    std::cout << "Testing type material bonus... ";
    MetadataRecord base = make_record("G1");
    const double s0 = genome_quality_score(base);

    MetadataRecord type = base;
    type.ncbi_type_material_designation = "assembly from type material";
    assert(near(genome_quality_score(type) - s0, 200.0));

    // scoring is case-insensitive
    type.ncbi_type_material_designation = "Assembly From Neotype Material";
    assert(near(genome_quality_score(type) - s0, 200.0));

    MetadataRecord proxy = base;
    proxy.ncbi_type_material_designation = "assembly from proxytype material";
    assert(near(genome_quality_score(proxy) - s0, 10.0));

    MetadataRecord refseq = base;
    refseq.ncbi_refseq_category = "representative genome";
    assert(near(genome_quality_score(refseq) - s0, 10.0));
    refseq.ncbi_refseq_category = "reference genome";
    assert(near(genome_quality_score(refseq) - s0, 10.0));

    // proxytype and RefSeq reference earn a single bonus
    MetadataRecord both = proxy;
    both.ncbi_refseq_category = "reference genome";
    assert(near(genome_quality_score(both) - s0, 10.0));

    MetadataRecord synonym = base;
    synonym.ncbi_type_material_designation = "assembly from synonym type material";
    assert(near(genome_quality_score(synonym), s0));
    std::cout << "PASSED\n";
}

void test_assembly_penalties() {
    std::cout << "Testing contig and ambiguous base penalties... ";
    MetadataRecord rec = make_record("G1");
    const double s0 = genome_quality_score(rec);

    rec.contig_count = 300;
    assert(near(s0 - genome_quality_score(rec), 10.0));

    rec = make_record("G1");
    rec.ambiguous_bases = 200000;
    assert(near(s0 - genome_quality_score(rec), 10.0));
    std::cout << "PASSED\n";
}

void test_genome_category_penalties() {
    std::cout << "Testing MAG and SAG penalties... ";
    MetadataRecord rec = make_record("G1");
    const double s0 = genome_quality_score(rec);

    rec.ncbi_genome_category = "derived from metagenome";
    assert(near(s0 - genome_quality_score(rec), 200.0));

    rec.ncbi_genome_category = "Derived From Environmental Sample; Metagenome";
    assert(near(s0 - genome_quality_score(rec), 200.0));

    rec.ncbi_genome_category = "derived from single cell";
    assert(near(s0 - genome_quality_score(rec), 100.0));

    rec.ncbi_genome_category = "single cell; metagenome";
    assert(near(s0 - genome_quality_score(rec), 300.0));

    rec.ncbi_genome_category = "none";
    assert(near(genome_quality_score(rec), s0));
    std::cout << "PASSED\n";
}

void test_ssu_bonus() {
    std::cout << "Testing 16S rRNA length bonus... ";
    MetadataRecord bac = make_record("G1");
    const double s0 = genome_quality_score(bac);

    bac.ssu_length = 950;
    assert(near(genome_quality_score(bac), s0));
    bac.ssu_length = 1200;
    assert(near(genome_quality_score(bac) - s0, 10.0));

    MetadataRecord ar = make_record("G2");
    ar.gtdb_taxonomy = parse_taxonomy("d__Archaea;p__Halobacteriota");
    const double a0 = genome_quality_score(ar);
    ar.ssu_length = 899;
    assert(near(genome_quality_score(ar), a0));
    ar.ssu_length = 950;
    assert(near(genome_quality_score(ar) - a0, 10.0));
    std::cout << "PASSED\n";
}

void test_batch_score() {
    std::cout << "Testing batch scoring... ";
    MetadataMap metadata;
    metadata["G1"] = make_record("G1");
    metadata["G2"] = make_complete_record("G2");

    auto scores = quality_score({"G1", "G2"}, metadata);
    assert(scores.size() == 2);
    assert(scores["G2"] > scores["G1"]);

    bool threw = false;
    try {
        quality_score({"G1", "G3"}, metadata);
    } catch (const MissingFieldError& e) {
        threw = true;
        assert(e.genome_id() == "G3");
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Quality Score Tests ===\n\n";

    test_draft_score();
    test_complete_assembly_bonus();
    test_monotonic_in_checkm();
    test_type_material_bonus();
    test_assembly_penalties();
    test_genome_category_penalties();
    test_ssu_bonus();
    test_batch_score();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
