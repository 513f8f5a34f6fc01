#include "foa_codec/decoder.hpp"
#include "foa_codec/encoder.hpp"
#include "foa_codec/errors.hpp"
#include "foa_codec/text_codec.hpp"
#include "../test_util.hpp"

#include <sstream>
#include <string>
#include <vector>

using foa::EntityKind;
using foa_test::make;

template <class F>
static bool throws_encode_error(F&& f) {
  try { f(); } catch (const foa::EncodeError&) { return true; }
  return false;
}

int main(){
  foa_test::Checker t("encoder");

  {
    std::ostringstream out;
    foa::Encoder enc(out);
    enc.write_structural("person", EntityKind::StartObject);
    enc.write_data("name", "Adam");
    enc.write_integer("age", 35);
    enc.write_number("ratio", 8.37);
    enc.write_structural(EntityKind::EndObject);
    t.check(out.str() == "person = (\nname = Adam\nage = 35\nratio = 8.37\n)\n", "object layout");
    t.check(enc.lines_written() == 5, "line count");
  }

  // No backing store: last_line() holds the latest write only.
  {
    foa::Encoder enc;
    enc.write_data("a(b[c]d)e=f");
    t.check(enc.last_line() == "a%28b%5Bc%5Dd%29e%3Df\n", "escaped unnamed value");
    enc.write_data("k", "v");
    t.check(enc.last_line() == "k = v\n", "last line replaced");

    foa::EncoderConfig raw; raw.escape = false;
    foa::Encoder plain(raw);
    plain.write_data("a(b[c]d)e=f");
    t.check(plain.last_line() == "a(b[c]d)e=f\n", "escaping disabled");
  }

  t.check(foa::format_double(8.37) == "8.37", "shortest double text");
  t.check(foa::format_double(0.1) == "0.1", "0.1");
  t.check(foa::format_double(-2.5e-300) == "-2.5e-300", "tiny exponent");
  t.check(foa::format_double(1e21) == "1e+21", "large exponent");

  t.check(throws_encode_error([]{ foa::Encoder e; e.write_data("x\ny"); }), "newline in value rejected");
  t.check(throws_encode_error([]{ foa::Encoder e; e.write_data("a=b", "v"); }), "'=' in name rejected");
  t.check(throws_encode_error([]{ foa::Encoder e; e.write_structural(EntityKind::Data); }),
          "Data is not structural");
  t.check(throws_encode_error([]{ foa::Encoder e; e.write_data(""); }), "unnamed empty value rejected");
  {
    foa::Encoder e;
    e.write_data("empty", "");
    t.check(e.last_line() == "empty = \n", "named empty value allowed");
  }

  // Every unnamed value the encoder accepts survives decoding.
  {
    std::ostringstream out;
    foa::Encoder enc(out);
    enc.write_structural(EntityKind::StartArray);
    const bool rejected = throws_encode_error([&]{ enc.write_data(""); });
    enc.write_data("x");
    enc.write_data(" ");
    enc.write_structural(EntityKind::EndArray);
    t.check(rejected && enc.lines_written() == 4, "rejected write emits nothing");
    const std::string text = out.str();
    foa::Decoder dec(text);
    auto got = foa_test::drain(dec);
    t.check(got.size() == 4 && got[1].data == "x" && got[2].data.empty() &&
            got[2].kind == EntityKind::Data, "whitespace-only value decodes as empty Data");
  }

  // Round trip: encoder output decodes to the same triples.
  {
    const std::vector<foa::Entity> seq = {
      make(std::string("arr"), "[", EntityKind::StartArray, 0),
      make(std::nullopt, "(", EntityKind::StartObject, 0),
      make(std::string("expr"), "f(x) = [1, 2]", EntityKind::Data, 0),
      make(std::string("empty"), "", EntityKind::Data, 0),
      make(std::string("paren"), "(", EntityKind::Data, 0),
      make(std::nullopt, ")", EntityKind::EndObject, 0),
      make(std::nullopt, "plain value", EntityKind::Data, 0),
      make(std::nullopt, "]", EntityKind::EndArray, 0),
    };
    std::ostringstream out;
    foa::Encoder enc(out);
    for (auto& e : seq) enc.write(e);
    const std::string text = out.str();
    foa::Decoder dec(text);
    auto got = foa_test::drain(dec);
    t.check(foa_test::same_tokens(got, seq), "encode/decode round trip");
    t.check(got.size() == seq.size() && got.back().line == seq.size(), "one line per entity");
  }

  // Round trip through a non-default codec.
  {
    foa::EncoderConfig ecfg; ecfg.codec = &foa::latin1_codec();
    std::ostringstream out;
    foa::Encoder enc(out, ecfg);
    enc.write_data("city", "M\xC3\xBCnchen");
    t.check(out.str() == "city = M\xFCnchen\n", "latin1 bytes written");

    foa::DecoderConfig dcfg; dcfg.codec = &foa::latin1_codec();
    const std::string bytes = out.str();
    foa::Decoder dec(bytes, dcfg);
    foa::Entity e;
    t.check(dec.next(e) && e.data == "M\xC3\xBCnchen", "latin1 decoded back to utf-8");
  }

  return t.finish();
}
