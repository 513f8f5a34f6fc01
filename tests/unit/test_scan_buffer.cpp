#include "foa_codec/errors.hpp"
#include "foa_codec/growth_policy.hpp"
#include "foa_codec/scan_buffer.hpp"
#include "../test_util.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

using foa::ScanBuffer;

static void put(ScanBuffer& b, const std::string& s) {
  std::memcpy(b.free_data(), s.data(), s.size());
  b.commit(s.size());
}

int main(){
  foa_test::Checker t("scan_buffer");

  // Borrowed framing; line counts framed records, blank lines excluded.
  {
    const std::string in = "\n\nalpha\n\nbeta = 2\n";
    ScanBuffer b;
    b.reset_borrowed(in);
    t.check(b.mode() == ScanBuffer::Mode::Borrowed, "borrowed mode");
    t.check(b.fill() == in.size(), "fill covers region");

    t.check(b.find_next(), "first record");
    t.check(b.current() == "alpha", "first record text");
    t.check(b.line() == 1, "leading blank lines are not records");
    t.check(b.find_next(), "second record");
    t.check(b.current() == "beta = 2", "second record text");
    t.check(b.line() == 2, "blank line between records not counted");
    t.check(!b.find_next(), "no third record");
    t.check(b.line() == 2, "failed scan leaves line alone");
  }

  // Runs of interior blank lines advance line once per record.
  {
    const std::string in = "\na = 1\n\n\nb = 2\n";
    ScanBuffer b;
    b.reset_borrowed(in);
    t.check(b.find_next() && b.current() == "a = 1" && b.line() == 1, "record after blank is line 1");
    t.check(b.find_next() && b.current() == "b = 2" && b.line() == 2, "record after two blanks is line 2");
  }

  // Unterminated tail: cursors restored, never emitted.
  {
    const std::string in = "a\npartial";
    ScanBuffer b;
    b.reset_borrowed(in);
    t.check(b.find_next() && b.current() == "a", "terminated record");
    const auto s = b.start(), e = b.end();
    t.check(!b.find_next(), "partial tail not framed");
    t.check(b.start() == s && b.end() == e && b.line() == 1, "cursors restored after miss");
  }

  // Only newlines: nothing to frame.
  {
    const std::string in = "\n\n\n";
    ScanBuffer b;
    b.reset_borrowed(in);
    t.check(!b.find_next(), "bare newlines yield nothing");
    t.check(b.end() == 0, "scan cursor not advanced");
  }

  // Owned: compaction shifts [end, fill) to zero.
  {
    foa::GrowthPolicy p(16, 8, 64);
    ScanBuffer b;
    b.reset_owned();
    b.grow(16, p);
    t.check(b.capacity() == 16, "initial owned capacity");
    put(b, "one\ntwo\nthr");
    t.check(b.find_next() && b.current() == "one", "owned first record");
    t.check(b.find_next() && b.current() == "two", "owned second record");
    t.check(!b.find_next(), "owned partial tail");
    const std::size_t pending = b.pending();
    b.compact();
    t.check(b.start() == 0 && b.end() == 0, "compact zeroes start/end");
    t.check(b.fill() == pending, "compact keeps pending bytes");
    put(b, "ee\n");
    t.check(b.find_next() && b.current() == "three", "record spanning compaction");
    t.check(b.line() == 3, "line count survives compaction");
  }

  // Growth preserves bytes; finite cap is enforced.
  {
    foa::GrowthPolicy p(4, 4, 8);
    ScanBuffer b;
    b.grow(4, p);
    put(b, "abcd");
    b.grow(8, p);
    t.check(b.capacity() == 8 && b.fill() == 4, "grow keeps fill");
    put(b, "ef\n");
    t.check(b.find_next() && b.current() == "abcdef", "bytes preserved across grow");

    bool threw = false;
    try { b.grow(12, p); } catch (const foa::BufferLimitExceeded& e) {
      threw = (e.requested() == 12 && e.max_size() == 8);
    }
    t.check(threw, "grow past max throws BufferLimitExceeded");
    t.check(b.capacity() == 8, "failed grow leaves capacity");
  }

  // Borrowed regions are never resized or refilled.
  {
    const std::string in = "x\n";
    ScanBuffer b;
    b.reset_borrowed(in);
    bool threw = false;
    try { b.resize(64); } catch (const std::logic_error&) { threw = true; }
    t.check(threw, "borrowed resize rejected");
    t.check(b.data() == in.data() && b.capacity() == in.size(), "borrowed region untouched");
  }

  return t.finish();
}
