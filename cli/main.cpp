/**
 * @file main.cpp
 * @brief ledgerpack CLI - encode a file into ledger entries, decode it back.
 *
 * Responsibilities:
 *  - Parse subcommands and options (CLI11).
 *  - Resolve the ledger profile: built-in defaults → profile file → environment → flags.
 *  - Read/write files and record-set files; the pipeline itself does no I/O.
 *  - Report stats the way operators read them: pretty (TTY colours), json, or raw.
 *
 * Subcommands:
 *  - encode <input>    [-o records.json]   write (or print) ledger entries
 *  - decode <records>  -o <output>         verify and write the original file
 *  - inspect <records>                     show manifest and entry counts
 *
 * Exit status: 0 ok, 1 codec or integrity failure, 2 usage / profile / I/O error.
 */

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "ledgerpack/checksum.hpp"
#include "ledgerpack/payload_file.hpp"
#include "ledgerpack/pipeline.hpp"
#include "ledgerpack/profile.hpp"
#include "ledgerpack/record_file.hpp"

using json = nlohmann::json;
using namespace ledgerpack;

static constexpr int EXIT_CODEC = 1;
static constexpr int EXIT_USAGE = 2;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static std::string str(const etl::istring& s) { return std::string(s.data(), s.size()); }

static std::string fmt_ms(uint64_t us) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2) << (static_cast<double>(us) / 1000.0) << "ms";
  return o.str();
}

static std::string fmt_ratio(double r) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2) << r << "x";
  return o.str();
}

static int report_fault(const Fault& f, const Ansi& ansi) {
  std::cerr << ansi.red("error: " + describe(f)) << "\n";
  switch (f.status) {
    case Status::MalformedEncoding:
    case Status::IncompleteData:
    case Status::DuplicateIndex:
    case Status::ChecksumMismatch:
    case Status::BadManifest:
      return EXIT_CODEC;
    default:
      return EXIT_USAGE;
  }
}

static int report_error(const std::string& msg, const Ansi& ansi) {
  std::cerr << ansi.red("error: " + msg) << "\n";
  return EXIT_USAGE;
}

// "key value" per line; values never contain newlines.
static void print_entries_raw(const std::vector<Record>& entries) {
  for (const auto& r : entries) std::cout << str(r.key) << " " << str(r.value) << "\n";
}

static json entries_json(const std::vector<Record>& entries) {
  json arr = json::array();
  for (const auto& r : entries) {
    json e; e["key"] = str(r.key); e["value"] = str(r.value); arr.push_back(e);
  }
  return arr;
}

// ---------- option bundles ----------

struct ProfileFlags {
  std::string config;       // --config
  std::string ns;           // --namespace
  size_t      max_key   = 0;
  size_t      max_value = 0;
  uint64_t    max_records = 0;
  bool        max_records_set = false;
  std::string media_type;
  std::vector<std::string> media_params;  // key=value
};

struct OutputFlags {
  std::string format = "pretty"; // pretty|json|raw
  bool        no_color = false;
};

static void add_profile_flags(CLI::App* cmd, ProfileFlags& pf) {
  cmd->add_option("--config", pf.config, "Ledger profile (JSON); default $XDG_CONFIG_HOME/ledgerpack/profile.json");
  cmd->add_option("-n,--namespace", pf.ns, "Key namespace");
  cmd->add_option("--max-key", pf.max_key, "Maximum key length (1..64)")->check(CLI::Range(size_t{1}, LP_KEY_CAP));
  cmd->add_option("--max-value", pf.max_value, "Maximum value length (1..64)")->check(CLI::Range(size_t{1}, LP_VALUE_CAP));
  cmd->add_option_function<uint64_t>("--max-records",
      [&pf](const uint64_t& v) { pf.max_records = v; pf.max_records_set = true; },
      "Maximum number of data records (0 = unlimited)");
}

static void add_output_flags(CLI::App* cmd, OutputFlags& of) {
  cmd->add_option("--format", of.format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  cmd->add_flag("--no-color", of.no_color, "Disable ANSI colors");
}

// defaults → file → environment → flags
static bool resolve_profile(const ProfileFlags& pf, Profile& profile, std::string& error) {
  const std::string path = pf.config.empty() ? default_profile_path() : pf.config;
  if (load_profile(path, profile, &error) != Status::Ok) return false;
  apply_environment(profile);

  if (!pf.ns.empty())         profile.key_namespace        = pf.ns;
  if (pf.max_key > 0)         profile.limits.max_key_len   = pf.max_key;
  if (pf.max_value > 0)       profile.limits.max_value_len = pf.max_value;
  if (pf.max_records_set)     profile.limits.max_records   = pf.max_records;
  if (!pf.media_type.empty()) profile.media_type           = pf.media_type;
  if (pf.media_params.empty()) return true;

  MediaType media;
  if (!MediaType::parse(profile.media_type.data(), profile.media_type.size(), media)) {
    error = "--media-param needs a valid --media-type (type/subtype)";
    return false;
  }
  for (const auto& kv : pf.media_params) {
    const size_t eq = kv.find('=');
    if (eq == std::string::npos ||
        !media.set(kv.substr(0, eq).c_str(), kv.substr(eq + 1).c_str())) {
      error = "bad --media-param '" + kv + "' (expected key=value, no spaces, ';' or ',')";
      return false;
    }
  }
  profile.media_type = media.to_string();
  return true;
}

// ---------- subcommands ----------

static int run_encode(const std::string& input, const std::string& output,
                      const ProfileFlags& pf, const OutputFlags& of, const Ansi& ansi) {
  Profile profile;
  std::string error;
  if (!resolve_profile(pf, profile, error)) return report_error(error, ansi);

  Bytes payload;
  if (read_payload(input, payload, &error) != Status::Ok) return report_error(error, ansi);

  if (of.format == "pretty") std::cout << "Encoding file '" << input << "' ...\n";

  Encoded encoded;
  Fault   fault;
  if (pipeline::encode(payload, profile.encode_options(), encoded, &fault) != Status::Ok) {
    return report_fault(fault, ansi);
  }

  const std::vector<Record> entries = pipeline::ledger_entries(encoded, profile.key_namespace);

  if (!output.empty()) {
    RecordSet set;
    set.key_namespace = profile.key_namespace;
    set.entries       = entries;
    if (save_record_set(output, set, &error) != Status::Ok) return report_error(error, ansi);
  }

  const EncodeStats& s = encoded.stats;
  if (of.format == "json") {
    json j;
    j["input"]         = input;
    j["namespace"]     = profile.key_namespace;
    j["checksum"]      = std::string(checksum_to_hex(s.checksum).c_str());
    j["elapsed_us"]    = s.elapsed_us;
    j["original_size"] = s.original_size;
    j["records"]       = s.record_count;
    j["entries"]       = entries.size();
    j["encoded_size"]  = s.encoded_size;
    j["stored_size"]   = s.stored_size;
    j["ratio"]         = s.ratio;
    if (output.empty()) j["ledger_entries"] = entries_json(entries);
    std::cout << j.dump(2) << "\n";
  } else if (of.format == "raw") {
    if (output.empty()) print_entries_raw(entries);
  } else {
    std::cout << "  " << ansi.green("done") << " (took " << fmt_ms(s.elapsed_us) << ")\n";
    std::cout << "  checksum: " << ansi.bold(checksum_to_hex(s.checksum).c_str()) << "\n";
    std::cout << "  stats:\n";
    std::cout << "   - original size:   " << s.original_size << "\n";
    std::cout << "   - data records:    " << s.record_count << "\n";
    std::cout << "   - ledger entries:  " << entries.size() << "\n";
    std::cout << "   - encoded size:    " << s.encoded_size << "\n";
    std::cout << "   - stored size:     " << s.stored_size << "\n";
    std::cout << "   - ratio:           " << fmt_ratio(s.ratio) << "\n";
    if (!output.empty()) std::cout << "  wrote " << output << "\n";
    else                 std::cout << ansi.dim("  (no -o given; use --format raw to print entries)") << "\n";
  }
  return 0;
}

static std::string resolve_namespace(const ProfileFlags& pf, const RecordSet& set, std::string& error) {
  if (!pf.ns.empty()) return pf.ns;
  if (!set.key_namespace.empty()) return set.key_namespace;

  Profile profile;
  const std::string path = pf.config.empty() ? default_profile_path() : pf.config;
  if (load_profile(path, profile, &error) != Status::Ok) return {};
  apply_environment(profile);
  return profile.key_namespace;
}

static int run_decode(const std::string& input, const std::string& output,
                      const ProfileFlags& pf, const OutputFlags& of, const Ansi& ansi) {
  RecordSet   set;
  std::string error;
  if (load_record_set(input, set, &error) != Status::Ok) return report_error(error, ansi);

  const std::string ns = resolve_namespace(pf, set, error);
  if (ns.empty()) return report_error(error, ansi);

  if (of.format == "pretty") std::cout << "Decoding '" << input << "' (namespace " << ns << ") ...\n";

  Bytes       payload;
  Fault       fault;
  DecodeStats stats;
  if (pipeline::decode_entries(set.entries, ns, payload, &fault, &stats) != Status::Ok) {
    return report_fault(fault, ansi);
  }

  if (write_payload(output, payload, &error) != Status::Ok) return report_error(error, ansi);

  if (of.format == "json") {
    json j;
    j["output"]       = output;
    j["namespace"]    = ns;
    j["checksum"]     = std::string(checksum_to_hex(stats.checksum).c_str());
    j["elapsed_us"]   = stats.elapsed_us;
    j["records"]      = stats.record_count;
    j["encoded_size"] = stats.encoded_size;
    j["decoded_size"] = stats.decoded_size;
    std::cout << j.dump(2) << "\n";
  } else if (of.format == "pretty") {
    std::cout << "  " << ansi.green("verified") << " (took " << fmt_ms(stats.elapsed_us) << ")\n";
    std::cout << "  checksum: " << ansi.bold(checksum_to_hex(stats.checksum).c_str()) << "\n";
    std::cout << "   - data records:    " << stats.record_count << "\n";
    std::cout << "   - encoded size:    " << stats.encoded_size << "\n";
    std::cout << "   - decoded size:    " << stats.decoded_size << "\n";
    std::cout << "  wrote " << output << "\n";
  }
  return 0;
}

static int run_inspect(const std::string& input, const ProfileFlags& pf,
                       const OutputFlags& of, const Ansi& ansi) {
  RecordSet   set;
  std::string error;
  if (load_record_set(input, set, &error) != Status::Ok) return report_error(error, ansi);

  const std::string ns = resolve_namespace(pf, set, error);
  if (ns.empty()) return report_error(error, ansi);

  uint64_t data = 0, foreign = 0, invalid = 0;
  for (const auto& r : set.entries) {
    switch (classify(r.key, ns)) {
      case RecordKind::Data:    ++data;    break;
      case RecordKind::Foreign: ++foreign; break;
      case RecordKind::Invalid: ++invalid; break;
      default: break;
    }
  }

  Manifest manifest;
  Fault    fault;
  const bool have_manifest = pipeline::find_manifest(set.entries, ns, manifest, &fault) == Status::Ok;

  if (of.format == "json") {
    json j;
    j["namespace"] = ns;
    j["entries"]   = set.entries.size();
    j["data"]      = data;
    j["foreign"]   = foreign;
    j["invalid"]   = invalid;
    if (have_manifest) {
      json m;
      m["version"]    = manifest.version;
      m["family"]     = family_tag(manifest.family);
      m["size"]       = manifest.size;
      m["checksum"]   = std::string(checksum_to_hex(manifest.checksum).c_str());
      m["count"]      = manifest.count;
      m["media_type"] = str(manifest.media_type);
      MediaType media;
      if (manifest.media(media)) {
        json params = json::object();
        for (const auto& p : media.params) params[str(p.k)] = str(p.v);
        m["media_params"] = params;
      }
      j["manifest"]   = m;
    } else {
      j["manifest_error"] = describe(fault);
    }
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << ansi.bold("namespace ") << ns << "\n";
    std::cout << "  entries: " << set.entries.size()
              << "  data: " << data << "  foreign: " << foreign << "  invalid: " << invalid << "\n";
    if (have_manifest) {
      std::cout << "  manifest: v" << unsigned(manifest.version) << " " << family_tag(manifest.family)
                << " size=" << manifest.size
                << " crc32=" << checksum_to_hex(manifest.checksum).c_str()
                << " count=" << manifest.count << "\n";
      MediaType media;
      if (manifest.media(media)) {
        std::cout << "  media type: " << str(media.essence) << "\n";
        for (const auto& p : media.params) {
          std::cout << "   - " << str(p.k) << " = " << str(p.v) << "\n";
        }
      }
      if (manifest.count != data) {
        std::cout << ansi.red("  data records do not match manifest count") << "\n";
      }
    } else {
      std::cout << ansi.red("  manifest: " + describe(fault)) << "\n";
    }
  }
  return have_manifest ? 0 : EXIT_CODEC;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"ledgerpack - store files as bounded ledger key/value entries"};
  app.require_subcommand(1);

  ProfileFlags pf;
  OutputFlags  of;
  std::string  input, output;

  CLI::App* enc = app.add_subcommand("encode", "Encode a file into ledger entries");
  enc->add_option("input", input, "File to encode")->required()->check(CLI::ExistingFile);
  enc->add_option("-o,--output", output, "Record-set file to write");
  enc->add_option("--media-type", pf.media_type, "Media type stored with the payload (e.g. image/png)");
  enc->add_option("--media-param", pf.media_params, "Media type parameter key=value (repeatable, e.g. n=picture)");
  add_profile_flags(enc, pf);
  add_output_flags(enc, of);

  CLI::App* dec = app.add_subcommand("decode", "Decode a record-set file back into the original");
  dec->add_option("input", input, "Record-set file")->required()->check(CLI::ExistingFile);
  dec->add_option("-o,--output", output, "File to write")->required();
  dec->add_option("--config", pf.config, "Ledger profile (JSON)");
  dec->add_option("-n,--namespace", pf.ns, "Key namespace (default: from the record file)");
  add_output_flags(dec, of);

  CLI::App* ins = app.add_subcommand("inspect", "Show the manifest and entry counts of a record-set file");
  ins->add_option("input", input, "Record-set file")->required()->check(CLI::ExistingFile);
  ins->add_option("--config", pf.config, "Ledger profile (JSON)");
  ins->add_option("-n,--namespace", pf.ns, "Key namespace (default: from the record file)");
  add_output_flags(ins, of);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !of.no_color && is_tty_stdout() && (of.format == "pretty");

  if (enc->parsed()) return run_encode(input, output, pf, of, ansi);
  if (dec->parsed()) return run_decode(input, output, pf, of, ansi);
  return run_inspect(input, pf, of, ansi);
}
