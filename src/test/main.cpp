/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifdef NDEBUG
#undef NDEBUG
#endif

#include "hapkit/codec.hpp"
#include "hapkit/errors.hpp"
#include "hapkit/header.hpp"
#include "hapkit/linear_index.hpp"
#include "hapkit/logging.hpp"
#include "hapkit/reader.hpp"
#include "hapkit/record_set.hpp"
#include "hapkit/region.hpp"
#include "hapkit/schema.hpp"
#include "hapkit/tabix_index.hpp"
#include "hapkit/typed_value.hpp"
#include "hapkit/utility.hpp"
#include "hapkit/validator.hpp"
#include "hapkit/writer.hpp"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define HAPKIT_TEST_EXAMPLE_FILE HAPKIT_TEST_DATA_DIR "/example.hap"

template <typename E, typename F>
bool throws(F fn, std::size_t expected_line = std::size_t(-1))
{
  try
  {
    fn();
  }
  catch (const E& e)
  {
    return expected_line == std::size_t(-1) || e.line_number() == expected_line;
  }
  return false;
}

template <typename E, typename F>
bool throws_any_line(F fn)
{
  try
  {
    fn();
  }
  catch (const E&)
  {
    return true;
  }
  return false;
}

std::string output_path(const std::string& file_name)
{
  return std::string(HAPKIT_TEST_OUTPUT_DIR) + "/" + file_name;
}

void write_text(const std::string& file_path, const std::string& contents)
{
  std::ofstream ofs(file_path, std::ios::binary);
  ofs << contents;
  assert(ofs.good());
}

hapkit::schema example_schema()
{
  hapkit::schema s;
  s.declare(hapkit::line_type::haplotype, "beta", ".2f", "Effect size in linear model");
  s.declare(hapkit::line_type::variant, "score", ".3f", "Importance of inclusion");
  return s;
}

// 50 haplotypes on chr1 (h001 at 100-150, h002 at 200-250, ...), 3 variants each.
hapkit::record_set make_large_set()
{
  hapkit::header hdr({"#\tgenerated"}, example_schema());
  hapkit::record_set ret(hdr);
  for (int i = 1; i <= 50; ++i)
  {
    char id[8];
    std::snprintf(id, sizeof(id), "h%03d", i);
    ret.add(hapkit::haplotype("chr1", i * 100, i * 100 + 50, id, {{"beta", i / 8.}}));
    for (int j = 0; j < 3; ++j)
      ret.add(hapkit::variant(id, i * 100 + j * 10, i * 100 + j * 10 + 1, std::string(id) + "_v" + std::to_string(j), std::string(1, "ACG"[j]), {{"score", j * 0.5}}));
  }
  return ret;
}

//================================================================//
void format_tag_test()
{
  using hapkit::format_tag;
  using hapkit::value_kind;

  assert(format_tag::parse("d").kind() == value_kind::integer);
  assert(format_tag::parse("s").kind() == value_kind::string);
  assert(format_tag::parse("f").kind() == value_kind::real);
  assert(format_tag::parse("f").precision() == format_tag::default_precision);
  assert(format_tag::parse("f").str() == "f");
  assert(format_tag::parse(".2f").precision() == 2);
  assert(format_tag::parse(".2f").str() == ".2f");
  assert(format_tag::parse(".0f").precision() == 0);

  assert(throws_any_line<hapkit::type_coercion_error>([]() { format_tag::parse("x"); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { format_tag::parse(".f"); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { format_tag::parse(".99f"); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { format_tag::parse(""); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { format_tag::parse(".02f"); }));
  assert(format_tag::parse(".10f").str() == ".10f");
}

void rounding_test()
{
  using hapkit::format_tag;
  using hapkit::typed_value;

  assert(typed_value(1.005).format(format_tag::real(2)) == "1.00");
  assert(typed_value(0.125).format(format_tag::real(2)) == "0.12");
  assert(typed_value(0.375).format(format_tag::real(2)) == "0.38");
  assert(typed_value(2.5).format(format_tag::real(0)) == "2");
  assert(typed_value(0.5).format(format_tag::real(2)) == "0.50");
  assert(typed_value(-0.25).format(format_tag::real(1)) == "-0.2");
  assert(typed_value(3).format(format_tag::real(2)) == "3.00");
  assert(typed_value(42).format(format_tag::integer()) == "42");
  assert(typed_value("abc").format(format_tag::string()) == "abc");

  assert(throws_any_line<hapkit::type_coercion_error>([]() { typed_value("abc").format(format_tag::integer()); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { typed_value(1.5).format(format_tag::integer()); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { typed_value().format(format_tag::string()); }));

  assert(typed_value::parse("-17", format_tag::integer()) == typed_value(-17));
  assert(throws<hapkit::type_coercion_error>([]() { typed_value::parse("1.5", format_tag::integer(), "count", 9); }, 9));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { typed_value::parse(" 1.5", format_tag::real(2)); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { typed_value::parse("nan", format_tag::real(2)); }));
  assert(throws_any_line<hapkit::type_coercion_error>([]() { typed_value::parse("", format_tag::integer()); }));

  assert(typed_value::equivalent(typed_value(0.5), typed_value(0.504), format_tag::real(2)));
  assert(!typed_value::equivalent(typed_value(0.5), typed_value(0.51), format_tag::real(2)));
}

void schema_test()
{
  using hapkit::line_type;

  hapkit::schema s;
  assert(s.empty());
  s.declare_from_line("#H\tbeta\t.2f\tEffect size", 4);
  s.declare(line_type::variant, "score", hapkit::format_tag::integer(), "Score");
  s.declare(line_type::haplotype, "ancestry", "s");

  assert(s.fields_for(line_type::haplotype).size() == 2);
  assert(s.fields_for(line_type::haplotype)[0].name == "beta");
  assert(s.fields_for(line_type::haplotype)[0].description == "Effect size");
  assert(s.field_index(line_type::haplotype, "ancestry") == 1);
  assert(s.field_index(line_type::variant, "beta") == -1);

  // Same name may be declared once per line type.
  s.declare(line_type::variant, "beta", "f");

  assert(throws_any_line<hapkit::duplicate_field_error>([&s]() { s.declare(line_type::haplotype, "beta", "d"); }));
  assert(throws<hapkit::duplicate_field_error>([&s]() { s.declare_from_line("#H\tbeta\td\tagain", 7); }, 7));
  assert(throws<hapkit::malformed_line_error>([&s]() { s.declare_from_line("#H\tgamma\td", 8); }, 8));
  assert(throws<hapkit::type_coercion_error>([&s]() { s.declare_from_line("#H\tgamma\tq\tbad tag", 9); }, 9));

  std::vector<std::string> lines = s.declaration_lines();
  assert(lines.size() == 4);
  assert(lines[0] == "#H\tbeta\t.2f\tEffect size");
  assert(lines[1] == "#H\tancestry\ts\t");
  assert(lines[2] == "#V\tscore\td\tScore");
  assert(lines[3] == "#V\tbeta\tf\t");

  assert(throws_any_line<hapkit::malformed_line_error>([&s]() { s.declare(line_type::variant, "multi\nline", "d"); }));
  assert(throws_any_line<hapkit::malformed_line_error>([&s]() { s.declare(line_type::variant, "delta", "d", "two\nlines"); }));
  assert(s.fields_for(line_type::variant).size() == 2);

  assert(hapkit::schema::is_declaration_line("#V\tx\td\t"));
  assert(!hapkit::schema::is_declaration_line("#\torderH\tbeta"));
}

void header_test()
{
  std::istringstream is("#\tversion\t0.2.0\n#H\tbeta\t.2f\tEffect size\nH\tchr1\t100\t200\thap1\t0.5\n");
  std::size_t lines_read = 0;
  hapkit::header hdr = hapkit::header::parse(is, lines_read);
  assert(lines_read == 2);
  assert(hdr.comments().size() == 1);
  assert(hdr.comments()[0] == "#\tversion\t0.2.0");
  assert(hdr.schema().fields_for(hapkit::line_type::haplotype).size() == 1);

  std::string rest;
  std::getline(is, rest);
  assert(rest == "H\tchr1\t100\t200\thap1\t0.5");

  hdr.add_comment("no hash");
  assert(hdr.comments().back() == "#no hash");
  assert(throws_any_line<hapkit::malformed_line_error>([&hdr]() { hdr.add_comment("#V\tscore\td\t"); }));
  assert(throws_any_line<hapkit::malformed_line_error>([&hdr]() { hdr.add_comment("#a\nb"); }));

  std::ostringstream os;
  hdr.write(os);
  assert(os.str() == "#\tversion\t0.2.0\n#no hash\n#H\tbeta\t.2f\tEffect size\n");
}

void codec_test()
{
  using hapkit::codec;

  hapkit::schema s;
  s.declare_from_line("#H\tbeta\t.2f\tEffect size");

  hapkit::haplotype h = codec::parse_haplotype("H\tchr1\t100\t200\thap1\t0.5", s, 6);
  assert(h.chrom() == "chr1" && h.start() == 100 && h.end() == 200 && h.id() == "hap1");
  double beta = 0.;
  assert(h.get_extra("beta", beta) && beta == 0.5);
  assert(codec::serialize(h, s) == "H\tchr1\t100\t200\thap1\t0.50");

  hapkit::variant v = codec::parse_variant("V\thap1\t100\t150\trs123\tA", s, 7);
  assert(v.haplotype_id() == "hap1" && v.start() == 100 && v.end() == 150 && v.id() == "rs123" && v.allele() == "A");
  assert(codec::serialize(v, s) == "V\thap1\t100\t150\trs123\tA");

  hapkit::record r;
  codec::parse("V\thap1\t100\t150\trs123\tA", s, r, 7);
  assert(r.is_variant() && r.contig() == "hap1");

  assert(throws<hapkit::undeclared_field_error>([&s]() { codec::parse_variant("V\thap1\t100\t150\trs123\tA\t0.9", s, 8); }, 8));
  assert(throws<hapkit::malformed_line_error>([&s]() { codec::parse_haplotype("H\tchr1\t100\t200\thap1", s, 9); }, 9));
  assert(throws<hapkit::malformed_line_error>([&s]() { codec::parse_haplotype("H\tchr1\t200\t100\thap1\t0.5", s, 10); }, 10));
  assert(throws<hapkit::malformed_line_error>([&s]() { codec::parse_haplotype("H\tchr1\t-1\t100\thap1\t0.5", s, 11); }, 11));
  assert(throws<hapkit::malformed_line_error>([&s]() { codec::parse_variant("V\t\t100\t150\trs1\tA", s, 12); }, 12));
  assert(throws<hapkit::malformed_line_error>([&s]() { hapkit::record tmp; codec::parse("X\tfoo", s, tmp, 13); }, 13));
  assert(throws<hapkit::malformed_line_error>([&s]() { hapkit::record tmp; codec::parse("#late comment", s, tmp, 14); }, 14));
  assert(throws<hapkit::type_coercion_error>([&s]() { codec::parse_haplotype("H\tchr1\t100\t200\thap1\thigh", s, 15); }, 15));

  hapkit::haplotype extra("chr1", 1, 2, "hx", {{"beta", 1.0}, {"gamma", 2}});
  assert(throws_any_line<hapkit::undeclared_field_error>([&]() { codec::serialize(extra, s); }));

  hapkit::haplotype missing("chr1", 1, 2, "hx");
  assert(throws_any_line<hapkit::type_coercion_error>([&]() { codec::serialize(missing, s); }));

  hapkit::haplotype wrong("chr1", 1, 2, "hx", {{"beta", "large"}});
  assert(throws_any_line<hapkit::type_coercion_error>([&]() { codec::serialize(wrong, s); }));

  hapkit::variant tabbed("hap1", 1, 2, "rs\t1", "A");
  assert(throws_any_line<hapkit::malformed_line_error>([&]() { codec::serialize(tabbed, s); }));

  hapkit::haplotype again = codec::parse_haplotype(codec::serialize(h, s), s);
  assert(hapkit::equivalent(h, again, s));
  again.set_extra("beta", 0.51);
  assert(!hapkit::equivalent(h, again, s));
}

void validator_test()
{
  using hapkit::haplotype;
  using hapkit::variant;

  {
    hapkit::validator val(hapkit::validator::mode::streaming);
    val.add(haplotype("chr1", 100, 200, "hap1"), 1);
    val.add(variant("hap1", 100, 150, "rs123", "A"), 2);
    assert(throws<hapkit::dangling_variant_error>([&val]() { val.add(variant("hap2", 100, 150, "rs123", "A"), 3); }, 3));
    assert(throws<hapkit::duplicate_haplotype_error>([&val]() { val.add(haplotype("chr2", 1, 2, "hap1"), 4); }, 4));
  }

  {
    hapkit::validator val(hapkit::validator::mode::deferred);
    val.add(variant("hap1", 100, 150, "rs1", "A"), 1);
    val.add(variant("hap9", 100, 150, "rs2", "A"), 2);
    val.add(variant("hap8", 100, 150, "rs3", "A"), 3);
    val.add(haplotype("chr1", 100, 200, "hap1"), 4);

    try
    {
      val.finish();
      assert(!"finish() should have thrown");
    }
    catch (const hapkit::dangling_variant_error& e)
    {
      assert(e.references().size() == 2);
      assert(e.references()[0].variant_id == "rs2" && e.references()[0].haplotype_id == "hap9" && e.references()[0].line_number == 2);
      assert(e.references()[1].variant_id == "rs3" && e.references()[1].line_number == 3);
    }
  }

  {
    hapkit::sort_checker chk;
    chk.check(haplotype("chr1", 100, 200, "hap1"), 1);
    chk.check(haplotype("chr1", 100, 300, "hap2"), 2);
    chk.check(haplotype("chr10", 5, 6, "hap3"), 3);
    chk.check(variant("hap1", 100, 101, "rs1", "A"), 4);
    chk.check(variant("hap1", 100, 101, "rs2", "A"), 5);
    assert(throws<hapkit::unsorted_file_error>([&chk]() { chk.check(variant("hap1", 99, 101, "rs3", "A"), 6, "V\thap1\t99\t101\trs3\tA"); }, 6));
    assert(throws_any_line<hapkit::unsorted_file_error>([&chk]() { chk.check(haplotype("chr2", 1, 2, "hap4"), 7); }));
  }

  {
    hapkit::sort_checker chk;
    chk.check(haplotype("chr1", 100, 200, "chr2"), 1);
    assert(throws<hapkit::unsorted_file_error>([&chk]() { chk.check(haplotype("chr2", 100, 200, "hap2"), 2); }, 2));
  }

  {
    hapkit::sort_checker chk;
    chk.check(haplotype("chr1", 100, 200, "hap1"), 1);
    assert(throws<hapkit::unsorted_file_error>([&chk]() { chk.check(haplotype("chr1", 300, 400, "chr1"), 2); }, 2));
  }
}

void region_test()
{
  hapkit::genomic_region whole = hapkit::string_to_region("chr7");
  assert(whole.chromosome() == "chr7" && whole.from() == 0 && whole.to() == std::numeric_limits<std::uint64_t>::max());

  hapkit::genomic_region r = hapkit::string_to_region("chr1:1234-34566");
  assert(r.chromosome() == "chr1" && r.from() == 1234 && r.to() == 34566);

  hapkit::genomic_region point = hapkit::string_to_region("chr1:100");
  assert(point.from() == 100 && point.to() == 100);

  hapkit::genomic_region open = hapkit::string_to_region("hap1:100-");
  assert(open.chromosome() == "hap1" && open.from() == 100 && open.to() == std::numeric_limits<std::uint64_t>::max());

  assert(throws_any_line<std::invalid_argument>([]() { hapkit::string_to_region("chr1:abc"); }));
  assert(throws_any_line<std::invalid_argument>([]() { hapkit::string_to_region("chr1:10-x"); }));
  assert(throws_any_line<std::invalid_argument>([]() { hapkit::string_to_region("chr1:20-10"); }));
  assert(throws_any_line<std::invalid_argument>([]() { hapkit::string_to_region(":1-2"); }));

  assert(hapkit::region_overlaps(100, 200, r) == false);
  assert(hapkit::region_overlaps(1000, 1234, r));
  assert(hapkit::region_overlaps(34566, 40000, r));
  assert(!hapkit::region_overlaps(34567, 40000, r));

  std::vector<hapkit::genomic_region> regs = {hapkit::genomic_region("chr1", 10, 20), hapkit::genomic_region("chr2", 5, 6), hapkit::genomic_region("chr1", 15, 40)};
  std::vector<hapkit::genomic_region> merged = hapkit::genomic_region::merge(regs.begin(), regs.end());
  assert(merged.size() == 2);
  assert(merged[0].chromosome() == "chr1" && merged[0].from() == 10 && merged[0].to() == 40);
}

void reader_test()
{
  hapkit::reader::options opts;
  opts.validation = hapkit::reader::validation_mode::streaming;
  hapkit::reader rdr(HAPKIT_TEST_EXAMPLE_FILE, opts);
  assert(rdr.good());
  assert(rdr.file_header().comments().size() == 3);
  assert(rdr.line_number() == 5);

  std::size_t n_haps = 0, n_vars = 0;
  hapkit::record rec;
  while (rdr.read(rec))
  {
    if (rec.is_haplotype())
      ++n_haps;
    else
      ++n_vars;
  }

  assert(!rdr.bad() && rdr.eof());
  assert(n_haps == 3 && n_vars == 5);

  assert(throws_any_line<hapkit::io_error>([]() { hapkit::reader missing(output_path("does_not_exist.hap")); }));

  // Variants before their haplotype are fine when validation is deferred.
  const std::string reordered = output_path("reordered.hap");
  write_text(reordered, "V\thap1\t100\t150\trs123\tA\nH\tchr1\t100\t200\thap1\n");
  {
    hapkit::reader::options deferred;
    deferred.validation = hapkit::reader::validation_mode::deferred;
    hapkit::reader in(reordered, deferred);
    std::size_t cnt = 0;
    while (in.read(rec))
      ++cnt;
    assert(cnt == 2 && in.eof());
  }

  {
    hapkit::reader::options streaming;
    streaming.validation = hapkit::reader::validation_mode::streaming;
    hapkit::reader in(reordered, streaming);
    assert(throws<hapkit::dangling_variant_error>([&]() { in.read(rec); }, 1));
  }

  const std::string dangling = output_path("dangling.hap");
  write_text(dangling, "H\tchr1\t100\t200\thap1\nV\thap1\t100\t150\trs123\tA\nV\thap2\t100\t150\trs124\tA\n");
  assert(throws<hapkit::dangling_variant_error>([&]() { hapkit::record_set::read(dangling); }, 3));

  const std::string duplicate = output_path("duplicate.hap");
  write_text(duplicate, "H\tchr1\t100\t200\thap1\nH\tchr1\t150\t200\thap1\n");
  assert(throws<hapkit::duplicate_haplotype_error>([&]() { hapkit::record_set::read(duplicate); }, 2));

  const std::string undeclared = output_path("undeclared.hap");
  write_text(undeclared, "#H\tbeta\t.2f\tEffect size\nH\tchr1\t100\t200\thap1\t0.5\nV\thap1\t100\t150\trs123\tA\t0.9\n");
  assert(throws<hapkit::undeclared_field_error>([&]() { hapkit::record_set::read(undeclared); }, 3));

  const std::string late_header = output_path("late_header.hap");
  write_text(late_header, "H\tchr1\t100\t200\thap1\n#\tlate\n");
  assert(throws<hapkit::malformed_line_error>([&]() { hapkit::record_set::read(late_header); }, 2));

  // The last line of a file may lack its newline.
  const std::string unterminated = output_path("unterminated.hap");
  write_text(unterminated, "H\tchr1\t100\t200\thap1\nH\tchr1\t300\t400\thap2");
  {
    hapkit::reader in(unterminated);
    std::vector<std::string> ids;
    while (in.read(rec))
      ids.push_back(rec.hap().id());
    assert((ids == std::vector<std::string>{"hap1", "hap2"}));
    assert(in.eof() && !in.bad());
    assert(hapkit::record_set::read(unterminated).size() == 2);
  }

  const std::string unterminated_dangling = output_path("unterminated_dangling.hap");
  write_text(unterminated_dangling, "H\tchr1\t100\t200\thap1\nV\thap9\t100\t150\trs9\tA");
  assert(throws<hapkit::dangling_variant_error>([&]() { hapkit::record_set::read(unterminated_dangling); }, 2));
  {
    hapkit::reader::options deferred;
    deferred.validation = hapkit::reader::validation_mode::deferred;
    hapkit::reader in(unterminated_dangling, deferred);
    assert(in.read(rec) && rec.is_haplotype());
    assert(in.read(rec) && rec.is_variant() && rec.var().id() == "rs9");
    assert(throws<hapkit::dangling_variant_error>([&]() { in.read(rec); }, 2));
  }
}

void round_trip_test()
{
  hapkit::record_set loaded = hapkit::record_set::read(HAPKIT_TEST_EXAMPLE_FILE);
  assert(loaded.size() == 3);
  assert(loaded.variant_count() == 5);

  const hapkit::haplotype* hap1 = loaded.find("hap1");
  assert(hap1 && hap1->chrom() == "chr20" && hap1->start() == 100);
  assert(loaded.variants_of("hap1").size() == 2);
  assert(loaded.variants_of("nope").empty());
  assert(!loaded.find("nope"));

  double beta = 0.;
  assert(hap1->get_extra("beta", beta) && beta == 0.5);

  const std::string plain = output_path("round_trip.hap");
  const std::string compressed = output_path("round_trip.hap.gz");
  loaded.write(plain);
  loaded.write(compressed);

  hapkit::record_set from_plain = hapkit::record_set::read(plain);
  hapkit::record_set from_compressed = hapkit::record_set::read(compressed);
  assert(hapkit::equivalent(loaded, from_plain));
  assert(hapkit::equivalent(loaded, from_compressed));

  // Data lines are reproduced exactly.
  std::ifstream expected(HAPKIT_TEST_EXAMPLE_FILE);
  std::ifstream actual(plain);
  std::vector<std::string> expected_lines, actual_lines;
  std::string line;
  while (std::getline(expected, line))
    expected_lines.push_back(line);
  while (std::getline(actual, line))
    actual_lines.push_back(line);
  std::sort(expected_lines.begin(), expected_lines.end());
  std::sort(actual_lines.begin(), actual_lines.end());
  assert(expected_lines == actual_lines);
}

void writer_test()
{
  hapkit::header hdr({"#\twriter test"}, example_schema());

  {
    hapkit::writer::options opts;
    opts.require_sorted = true;
    hapkit::writer out(output_path("sorted_writer.hap"), hdr, opts);
    assert(out.compression() == hapkit::compression_type::none);
    out.write(hapkit::haplotype("chr1", 100, 200, "hap1", {{"beta", 0.5}}));
    out.write(hapkit::haplotype("chr1", 150, 200, "hap2", {{"beta", 0.25}}));
    // Three header lines precede the data.
    assert(throws<hapkit::unsorted_file_error>([&]() { out.write(hapkit::haplotype("chr1", 50, 60, "hap3", {{"beta", 1.}})); }, 6));
    assert(throws_any_line<hapkit::dangling_variant_error>([&]() { out.write(hapkit::variant("hap9", 100, 101, "rs1", "A", {{"score", 1.}})); }));
    assert(throws_any_line<hapkit::duplicate_haplotype_error>([&]() { out.write(hapkit::haplotype("chr1", 150, 200, "hap2", {{"beta", 0.25}})); }));
    out.write(hapkit::variant("hap1", 100, 101, "rs1", "A", {{"score", 1.}}));
    assert(out.good());
    out.close();
    assert(!out.good());
  }

  {
    hapkit::record_set rs = hapkit::record_set::read(output_path("sorted_writer.hap"));
    assert(rs.size() == 2 && rs.variants_of("hap1").size() == 1);
  }

  {
    std::vector<hapkit::haplotype> haps = {hapkit::haplotype("chr1", 100, 200, "hap1", {{"beta", 0.5}}), hapkit::haplotype("chr1", 150, 200, "hap2", {{"beta", 0.25}})};
    std::vector<hapkit::variant> vars = {hapkit::variant("hap2", 160, 161, "rs2", "T", {{"score", 1.}}), hapkit::variant("hap1", 100, 101, "rs1", "A", {{"score", 1.}}), hapkit::variant("hap2", 170, 171, "rs3", "G", {{"score", 0.}})};

    {
      hapkit::writer out(output_path("grouped.hap"), hdr);
      out.write_grouped(haps, vars);
    }

    hapkit::reader in(output_path("grouped.hap"));
    std::vector<std::string> ids;
    hapkit::record rec;
    while (in.read(rec))
      ids.push_back(rec.is_haplotype() ? rec.hap().id() : rec.var().id());
    assert((ids == std::vector<std::string>{"hap1", "rs1", "hap2", "rs2", "rs3"}));

    vars.push_back(hapkit::variant("hap7", 1, 2, "rs7", "A", {{"score", 0.}}));
    hapkit::writer out(output_path("grouped_dangling.hap"), hdr);
    assert(throws_any_line<hapkit::dangling_variant_error>([&]() { out.write_grouped(haps, vars); }));
  }

  assert(throws_any_line<std::invalid_argument>([&]()
  {
    hapkit::writer::options opts;
    opts.create_index = true;
    hapkit::writer out(output_path("plain_indexed.hap"), hdr, opts);
  }));

  {
    hapkit::writer out(output_path("unsorted_dangling.hap"), hdr);
    out.write(hapkit::haplotype("chr1", 1, 2, "hap1", {{"beta", 0.5}}));
    out.write(hapkit::variant("hap2", 1, 2, "rs1", "A", {{"score", 1.}}));
    assert(throws<hapkit::dangling_variant_error>([&]() { out.close(); }, 5));
  }

  {
    // A variant may precede its haplotype when order is not required.
    hapkit::writer out(output_path("unsorted_resolved.hap"), hdr);
    out.write(hapkit::variant("hap1", 1, 2, "rs1", "A", {{"score", 1.}}));
    out.write(hapkit::haplotype("chr1", 1, 2, "hap1", {{"beta", 0.5}}));
    out.close();
  }
}

void check_query(const hapkit::record_set& all, const std::string& file_path, const hapkit::genomic_region& reg, std::shared_ptr<hapkit::index_service> service)
{
  std::vector<std::string> expected;
  for (auto it = all.haplotypes().begin(); it != all.haplotypes().end(); ++it)
  {
    if (it->chrom() == reg.chromosome() && hapkit::region_overlaps(it->start(), it->end(), reg))
      expected.push_back(it->id());
  }

  const std::vector<hapkit::variant>& vars = all.variants_of(reg.chromosome());
  for (auto it = vars.begin(); it != vars.end(); ++it)
  {
    if (hapkit::region_overlaps(it->start(), it->end(), reg))
      expected.push_back(it->id());
  }

  hapkit::indexed_reader rdr(file_path, reg, service);
  std::vector<std::string> actual;
  hapkit::record rec;
  while (rdr.read(rec))
    actual.push_back(rec.is_haplotype() ? rec.hap().id() : rec.var().id());

  assert(!rdr.bad() && rdr.eof());
  assert(actual == expected);
}

void random_access_test(std::shared_ptr<hapkit::index_service> service, const std::string& file_name)
{
  hapkit::record_set all = make_large_set();
  const std::string file_path = output_path(file_name);

  hapkit::writer::options opts;
  opts.create_index = true;
  opts.index = service;
  all.write(file_path, opts);
  assert(service->index_exists(file_path));

  check_query(all, file_path, hapkit::string_to_region("chr1:1000-1260"), service);
  check_query(all, file_path, hapkit::string_to_region("chr1:1"), service);
  check_query(all, file_path, hapkit::string_to_region("chr1:5050-"), service);
  check_query(all, file_path, hapkit::string_to_region("chr1"), service);
  check_query(all, file_path, hapkit::string_to_region("chr2"), service);
  check_query(all, file_path, hapkit::string_to_region("h010"), service);
  check_query(all, file_path, hapkit::string_to_region("h010:1005-1011"), service);
  check_query(all, file_path, hapkit::string_to_region("h050:5020"), service);

  {
    hapkit::indexed_reader rdr(file_path, hapkit::string_to_region("chr1:1000-1260"), service);
    std::vector<std::string> ids;
    hapkit::record rec;
    while (rdr.read(rec))
      ids.push_back(rec.hap().id());
    assert((ids == std::vector<std::string>{"h010", "h011", "h012"}));

    rdr.reset_bounds(hapkit::string_to_region("h010:1005-1011"));
    assert(rdr.read(rec) && rec.is_variant() && rec.var().id() == "h010_v1");
    assert(!rdr.read(rec) && rdr.eof());
  }

  {
    std::vector<std::string> wanted = {"h011", "h040"};
    hapkit::record_set subset = hapkit::record_set::read(file_path, hapkit::string_to_region("chr1:1000-1260"), wanted, service);
    assert(subset.size() == 1 && subset.find("h011"));
    assert(subset.variants_of("h011").size() == 3);

    hapkit::record_set by_id = hapkit::record_set::read(file_path, wanted, service);
    assert(by_id.size() == 2);
    assert(by_id.variants_of("h040").size() == 3);
    assert(by_id.variants_of("h040")[2].id() == "h040_v2");
  }

  const std::string unindexed = output_path("unindexed_" + file_name);
  all.write(unindexed);
  assert(throws_any_line<hapkit::io_error>([&]() { hapkit::indexed_reader rdr(unindexed, hapkit::genomic_region("chr1"), service); }));
}

void unsorted_index_test(std::shared_ptr<hapkit::index_service> service, const std::string& prefix)
{
  hapkit::header hdr({}, example_schema());
  const std::string file_path = output_path(prefix + "_unsorted.hap.gz");
  {
    hapkit::writer out(file_path, hdr);
    assert(out.compression() == hapkit::compression_type::bgzf);
    out.write(hapkit::haplotype("chr1", 300, 400, "hap1", {{"beta", 0.5}}));
    out.write(hapkit::haplotype("chr1", 100, 200, "hap2", {{"beta", 0.5}}));
  }

  assert(throws<hapkit::unsorted_file_error>([&]() { service->build(file_path); }, 4));
  assert(!service->index_exists(file_path));

  // Variants interleaved with haplotypes are not in index order either.
  hapkit::record_set rs(hdr);
  rs.add(hapkit::haplotype("chr1", 300, 400, "hap1", {{"beta", 0.5}}));
  rs.add(hapkit::haplotype("chr1", 100, 200, "hap2", {{"beta", 0.5}}));
  rs.add(hapkit::variant("hap2", 100, 101, "rs1", "A", {{"score", 0.5}}));

  hapkit::writer::options opts;
  opts.create_index = true;
  opts.index = service;
  assert(throws_any_line<hapkit::unsorted_file_error>([&]() { rs.write(output_path(prefix + "_unsorted_set.hap.gz"), opts); }));

  rs.sort();
  assert(rs.haplotypes().front().id() == "hap2");
  rs.write(output_path(prefix + "_sorted_set.hap.gz"), opts);
  assert(service->index_exists(output_path(prefix + "_sorted_set.hap.gz")));
  assert(!service->index_exists(output_path(prefix + "_unsorted_set.hap.gz")));
}

void linear_index_format_test()
{
  hapkit::linear_index::options opts;
  opts.records_per_block = 4;
  std::shared_ptr<hapkit::linear_index> idx = std::make_shared<hapkit::linear_index>(opts);

  hapkit::record_set all = make_large_set();
  const std::string file_path = output_path("blocks.hap.gz");
  hapkit::writer::options wopts;
  wopts.create_index = true;
  wopts.index = idx;
  all.write(file_path, wopts);

  hapkit::linear_index::contig_table table = hapkit::linear_index::read_index(idx->index_path(file_path));
  assert(table.size() == 51);
  assert(table[0].first == "chr1");
  assert(table[0].second.size() == 13);
  assert(table[0].second[0].min_start == 100 && table[0].second[0].max_end == 450 && table[0].second[0].record_count == 4);
  assert(table[0].second[12].record_count == 2);
  assert(table[1].first == "h001" && table[1].second.size() == 1 && table[1].second[0].record_count == 3);

  write_text(output_path("bogus.hap.gz.hpi"), "not an index");
  assert(throws_any_line<hapkit::io_error>([]() { hapkit::linear_index::read_index(output_path("bogus.hap.gz.hpi")); }));

  // An index written over an unsorted file is caught while querying.
  const std::string unsorted = output_path("unsorted_behind_index.hap.gz");
  {
    hapkit::writer out(unsorted, hapkit::header({}, example_schema()));
    out.write(hapkit::haplotype("chr1", 300, 400, "hap1", {{"beta", 0.5}}));
    out.write(hapkit::haplotype("chr1", 100, 200, "hap2", {{"beta", 0.5}}));
  }

  hapkit::linear_index::contig_table forged;
  hapkit::linear_index::checkpoint cp = {100, 400, 0, 2};
  forged.emplace_back("chr1", std::vector<hapkit::linear_index::checkpoint>(1, cp));
  hapkit::linear_index::write_index(idx->index_path(unsorted), forged);

  hapkit::indexed_reader rdr(unsorted, hapkit::genomic_region("chr1"), std::make_shared<hapkit::linear_index>());
  hapkit::record rec;
  assert(rdr.read(rec) && rec.hap().id() == "hap1");
  assert(throws_any_line<hapkit::unsorted_file_error>([&]() { rdr.read(rec); }));
}

void logging_test()
{
  assert(hapkit::logger::level() == hapkit::log_level::error);
  assert(!hapkit::logger::enabled(hapkit::log_level::warning));
  assert(hapkit::logger::enabled(hapkit::log_level::critical));

  hapkit::logger::set_level(hapkit::log_level::debug);
  assert(hapkit::logger::enabled(hapkit::log_level::debug));
  hapkit::logger::log(hapkit::log_level::info, "logging %s", "works");
  hapkit::logger::cerr_once(hapkit::log_level::warning, "printed once");
  hapkit::logger::cerr_once(hapkit::log_level::warning, "printed once");
  hapkit::logger::set_level(hapkit::log_level::error);
}

int main(int argc, char** argv)
{
  std::string cmd = (argc < 2) ? "" : argv[1];

  if (cmd.empty())
  {
    std::cout << "Enter Command:" << std::endl;
    std::cout << "- format-tag" << std::endl;
    std::cout << "- rounding" << std::endl;
    std::cout << "- schema" << std::endl;
    std::cout << "- header" << std::endl;
    std::cout << "- codec" << std::endl;
    std::cout << "- validator" << std::endl;
    std::cout << "- region" << std::endl;
    std::cout << "- reader" << std::endl;
    std::cout << "- round-trip" << std::endl;
    std::cout << "- writer" << std::endl;
    std::cout << "- tabix" << std::endl;
    std::cout << "- linear-index" << std::endl;
    std::cout << "- logging" << std::endl;
    std::cin >> cmd;
  }

  if (cmd == "format-tag")
  {
    format_tag_test();
  }
  else if (cmd == "rounding")
  {
    rounding_test();
  }
  else if (cmd == "schema")
  {
    schema_test();
  }
  else if (cmd == "header")
  {
    header_test();
  }
  else if (cmd == "codec")
  {
    codec_test();
  }
  else if (cmd == "validator")
  {
    validator_test();
  }
  else if (cmd == "region")
  {
    region_test();
  }
  else if (cmd == "reader")
  {
    reader_test();
  }
  else if (cmd == "round-trip")
  {
    round_trip_test();
  }
  else if (cmd == "writer")
  {
    writer_test();
  }
  else if (cmd == "tabix")
  {
    random_access_test(std::make_shared<hapkit::tabix_index>(), "tabix.hap.gz");
    unsorted_index_test(std::make_shared<hapkit::tabix_index>(), "tabix");
  }
  else if (cmd == "linear-index")
  {
    hapkit::linear_index::options opts;
    opts.records_per_block = 4;
    random_access_test(std::make_shared<hapkit::linear_index>(opts), "linear.hap.gz");
    unsorted_index_test(std::make_shared<hapkit::linear_index>(), "linear");
    linear_index_format_test();
  }
  else if (cmd == "logging")
  {
    logging_test();
  }
  else
  {
    std::cerr << "Invalid Command" << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
