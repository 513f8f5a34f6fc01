#include "foa_codec/byte_source.hpp"
#include "foa_codec/decoder.hpp"
#include "foa_codec/encoder.hpp"
#include "foa_codec/errors.hpp"
#include "foa_codec/growth_policy.hpp"
#include "foa_codec/json_bridge.hpp"
#include "foa_codec/metrics.hpp"
#include "foa_codec/text_codec.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

struct Cli {
  std::string command;            // decode | to-json | from-json
  std::string input = "-";        // path or "-" for stdin
  bool escape = true;
  std::string encoding = "utf-8";
  std::size_t init_size = foa::GrowthPolicy::kDefaultInitSize;
  std::size_t step_size = foa::GrowthPolicy::kDefaultStepSize;
  std::size_t max_size  = foa::GrowthPolicy::kDefaultMaxSize;
  bool stats = false;
};

void usage(std::ostream& os) {
  os <<
    "Usage: foa-tool <decode|to-json|from-json> [options] <file|->\n"
    "  decode      print one entity per line\n"
    "  to-json     convert FOA to JSON\n"
    "  from-json   convert JSON to FOA\n"
    "Options:\n"
    "  --no-escape            keep %XX codes literal / write reserved chars as-is\n"
    "  --encoding=NAME        utf-8 (default) | latin1\n"
    "  --init-size=N          initial scan buffer size\n"
    "  --step-size=N          scan buffer growth step\n"
    "  --max-size=N|unlimited scan buffer cap\n"
    "  --stats                print run statistics to stderr\n";
}

std::size_t parse_size(const std::string& s) {
  // stoull accepts a sign and wraps negatives.
  if (s.empty() || s[0] < '0' || s[0] > '9') throw std::invalid_argument("bad size: " + s);
  std::size_t pos = 0;
  unsigned long long v = std::stoull(s, &pos);
  if (pos != s.size()) throw std::invalid_argument("bad size: " + s);
  return static_cast<std::size_t>(v);
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  bool have_input = false;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_sz = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) == 0) { *out = parse_size(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    std::string max;
    if (eat("--encoding=", &c.encoding)) continue;
    if (eat_sz("--init-size=", &c.init_size)) continue;
    if (eat_sz("--step-size=", &c.step_size)) continue;
    if (eat("--max-size=", &max)) {
      c.max_size = (max == "unlimited") ? foa::GrowthPolicy::kUnlimited : parse_size(max);
      continue;
    }
    if (a == "--no-escape") { c.escape = false; continue; }
    if (a == "--stats")     { c.stats = true;   continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.size() > 1 && a[0] == '-') throw std::invalid_argument("unknown option: " + a);
    if (c.command.empty()) { c.command = a; continue; }
    if (!have_input) { c.input = a; have_input = true; continue; }
    throw std::invalid_argument("unexpected argument: " + a);
  }
  if (c.command != "decode" && c.command != "to-json" && c.command != "from-json")
    throw std::invalid_argument(c.command.empty() ? "missing command" : "unknown command: " + c.command);
  return c;
}

std::unique_ptr<foa::ByteSource> open_input(const std::string& path) {
  if (path == "-") return std::unique_ptr<foa::ByteSource>(new foa::FileSource(stdin, false));
  return std::unique_ptr<foa::ByteSource>(new foa::FileSource(path));
}

void print_entity(const foa::Entity& e) {
  std::cout << std::setw(3) << e.line << ": ";
  if (e.name) std::cout << *e.name << " = ";
  std::cout << e.data << "\t(" << foa::to_string(e.kind) << ")\n";
}

int run_decode(const Cli& cli, const foa::DecoderConfig& dcfg, foa::MetricsRegistry& m) {
  foa::Decoder dec(open_input(cli.input), dcfg);
  m.start_stage("decode");
  try {
    dec.for_each_entity([&](const foa::Entity& e){
      m.add_entity(e.kind);
      print_entity(e);
    });
  } catch (const foa::SourceError& ex) {
    m.end_stage("decode");
    std::cerr << "[decode] " << cli.input << ": " << ex.what() << "\n";
    return 2;
  } catch (const foa::Error& ex) {
    m.end_stage("decode");
    std::cerr << "[decode] " << cli.input << ": " << ex.what() << "\n";
    return 1;
  }
  m.end_stage("decode");
  m.add_bytes(dec.stats().bytes_read);
  m.set_buffer_stats(dec.stats());
  return 0;
}

int run_to_json(const Cli& cli, const foa::DecoderConfig& dcfg, foa::MetricsRegistry& m) {
  foa::Decoder dec(open_input(cli.input), dcfg);
  foa::JsonExportConfig jcfg;
  std::string err;
  m.start_stage("to-json");
  bool ok = false;
  try {
    ok = foa::foa_to_json(dec, std::cout, jcfg, &err);
  } catch (const foa::SourceError& ex) {
    m.end_stage("to-json");
    std::cerr << "[to-json] " << cli.input << ": " << ex.what() << "\n";
    return 2;
  }
  m.end_stage("to-json");
  const foa::DecoderStats ds = dec.stats();
  m.add_bytes(ds.bytes_read);
  m.set_buffer_stats(ds);
  if (!ok) { std::cerr << "[to-json] " << cli.input << ": " << err << "\n"; return 1; }
  return 0;
}

int run_from_json(const Cli& cli, const foa::EncoderConfig& ecfg, foa::MetricsRegistry& m) {
  std::string json;
  m.start_stage("read");
  if (cli.input == "-") {
    std::ostringstream ss; ss << std::cin.rdbuf(); json = ss.str();
  } else {
    std::ifstream in(cli.input, std::ios::binary);
    if (!in) { std::cerr << "[from-json] cannot open " << cli.input << "\n"; return 2; }
    std::ostringstream ss; ss << in.rdbuf(); json = ss.str();
  }
  m.end_stage("read");
  m.add_bytes(json.size());

  foa::Encoder enc(std::cout, ecfg);
  std::string err;
  m.start_stage("from-json");
  bool ok = foa::json_to_foa(json, enc, &err);
  m.end_stage("from-json");
  if (!ok) { std::cerr << "[from-json] " << cli.input << ": " << err << "\n"; return 1; }
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[foa-tool] " << e.what() << "\n";
    usage(std::cerr);
    return 2;
  }

  const foa::TextCodec* codec = foa::codec_by_name(cli.encoding);
  if (!codec) {
    std::cerr << "[foa-tool] unknown encoding: " << cli.encoding << "\n";
    return 2;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  foa::MetricsRegistry metrics;
  int rc = 0;

  try {
    if (cli.command == "from-json") {
      foa::EncoderConfig ecfg;
      ecfg.escape = cli.escape;
      ecfg.codec = codec;
      rc = run_from_json(cli, ecfg, metrics);
    } else {
      foa::DecoderConfig dcfg;
      dcfg.policy = foa::GrowthPolicy(cli.init_size, cli.step_size, cli.max_size);
      dcfg.escape = cli.escape;
      dcfg.codec = codec;
      rc = (cli.command == "decode") ? run_decode(cli, dcfg, metrics)
                                     : run_to_json(cli, dcfg, metrics);
    }
  } catch (const foa::ConfigurationError& e) {
    std::cerr << "[foa-tool] " << e.what() << "\n";
    return 2;
  } catch (const foa::SourceError& e) {
    std::cerr << "[foa-tool] " << e.what() << "\n";
    return 2;
  }
  std::cout.flush();

  if (cli.stats) {
    const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
    std::cerr << "[stats] " << metrics.snapshot(wall_ms).to_json() << "\n";
  }
  return rc;
}
