#include "foa_codec/decoder.hpp"
#include "../test_util.hpp"

#include <string>
#include <vector>

using foa::EntityKind;
using foa_test::make;

int main(){
  foa_test::Checker t("decoder_buffer");

  {
    const std::string in = "obj = (\nname = adam\nage = 24\n)\n";
    foa::Decoder dec(in);
    auto got = foa_test::drain(dec);
    std::vector<foa::Entity> want = {
      make(std::string("obj"),  "(",    EntityKind::StartObject, 1),
      make(std::string("name"), "adam", EntityKind::Data,        2),
      make(std::string("age"),  "24",   EntityKind::Data,        3),
      make(std::nullopt,        ")",    EntityKind::EndObject,   4),
    };
    t.check(got == want, "named object decodes to four entities");
    for (auto& e : got) std::cout << "  " << foa_test::describe(e) << "\n";
    t.check(got.size() == 4 && got[2].as_integer() == 24, "age as integer");
  }

  {
    const std::string in = "a%28b%5Bc%5Dd%29e%3Df\n";
    foa::Decoder on(in);
    auto got = foa_test::drain(on);
    t.check(got.size() == 1 && !got[0].name && got[0].data == "a(b[c]d)e=f" &&
            got[0].kind == EntityKind::Data && got[0].line == 1, "escaped value decoded");

    foa::DecoderConfig cfg; cfg.escape = false;
    foa::Decoder off(in, cfg);
    auto raw = foa_test::drain(off);
    t.check(raw.size() == 1 && raw[0].data == "a%28b%5Bc%5Dd%29e%3Df", "escape disabled keeps codes");
  }

  // Borrowed buffers are never grown; the unterminated tail is not emitted.
  {
    const std::string in = "a = 1\nb = 2\npartial = 3";
    foa::Decoder dec(in);
    const char* data0 = dec.buffer_data();
    const std::size_t cap0 = dec.buffer_capacity();
    t.check(dec.mode() == foa::ScanBuffer::Mode::Borrowed, "borrowed mode");
    t.check(data0 == in.data() && cap0 == in.size(), "decoder scans caller memory");

    foa::Entity e;
    std::size_t n = 0;
    while (dec.next(e)) {
      ++n;
      t.check(dec.buffer_data() == data0 && dec.buffer_capacity() == cap0, "identity kept while decoding");
    }
    t.check(n == 2, "partial tail dropped");
    t.check(!dec.next(e) && !dec.next(e), "end of input is stable");
    t.check(dec.buffer_data() == data0 && dec.buffer_capacity() == cap0, "identity kept at end");
    t.check(dec.stats().grows == 0, "no growth");
  }

  // Blank lines are skipped and are not counted as records.
  {
    foa::Decoder dec(std::string_view("\na = 1\n\n\nb = 2\n"));
    auto got = foa_test::drain(dec);
    std::vector<foa::Entity> want = {
      make(std::string("a"), "1", EntityKind::Data, 1),
      make(std::string("b"), "2", EntityKind::Data, 2),
    };
    t.check(got == want, "records after blank lines are numbered 1 and 2");
  }

  // Default decoder has no input.
  {
    foa::Decoder dec;
    foa::Entity e;
    t.check(!dec.next(e), "empty decoder yields nothing");
  }

  // attach() resets cursors and line numbers.
  {
    const std::string first = "x = 1\ny = 2\n";
    const std::string second = "(\nadam\n24\n)\n";
    foa::Decoder dec(first);
    foa::Entity e;
    t.check(dec.next(e) && e.data == "1", "first source");
    dec.attach(second);
    auto got = foa_test::drain(dec);
    t.check(got.size() == 4 && got[0].line == 1 && got[0].kind == EntityKind::StartObject,
            "attach restarts at line 1");
    t.check(got.size() == 4 && got[1].data == "adam" && !got[1].name, "anonymous members");
  }

  // Object array.
  {
    const std::string in =
      "arr = [\nobj1 = (\nname = adam\nage = 24\n)\nobj2 = (\nname = eve\nage = 31\n)\n]\n";
    foa::Decoder dec(in);
    auto got = foa_test::drain(dec);
    t.check(got.size() == 10, "object array entity count");
    t.check(got.size() == 10 && got.back().kind == EntityKind::EndArray && got.back().line == 10,
            "closing bracket on line 10");
    std::size_t opens = 0;
    for (auto& x : got) if (x.kind == EntityKind::StartObject) ++opens;
    t.check(opens == 2, "two objects");
  }

  // Unbalanced input is not the decoder's concern.
  {
    const std::string in = ")\n]\n(\n";
    foa::Decoder dec(in);
    t.check(foa_test::drain(dec).size() == 3, "unbalanced structure still tokenized");
  }

  // Ambiguity: a lone structural char is structural when escaping is off.
  {
    const std::string in = "v = (\n";
    foa::DecoderConfig cfg; cfg.escape = false;
    foa::Decoder dec(in, cfg);
    auto got = foa_test::drain(dec);
    t.check(got.size() == 1 && got[0].kind == EntityKind::StartObject, "lone '(' is structural");
  }

  {
    foa::Decoder dec(std::string_view("ratio = 8.37\nword = abc\n"));
    auto got = foa_test::drain(dec);
    t.check(got.size() == 2 && got[0].as_number() && *got[0].as_number() == 8.37, "as_number");
    t.check(got.size() == 2 && !got[1].as_number() && !got[1].as_integer(), "non-numeric");
  }

  return t.finish();
}
