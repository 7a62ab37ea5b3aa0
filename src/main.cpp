#include <iostream>
#include <string>
#include <vector>

#include "clipscan/all.h"

namespace {
using clipscan::cli::Args;
using clipscan::cli::Command;
using clipscan::util::Expected;

Expected<std::vector<clipscan::util::ReferenceFingerprint>>
load_references(const Args& a, clipscan::store::FingerprintCache& cache) {
  if (!a.from_catalog)
    return clipscan::store::make_directory_store(a.fingerprints, cache)->list();

  clipscan::store::LmdbOptions opts;
  opts.create_if_missing = false;
  auto catalog = clipscan::store::make_lmdb_catalog_factory(a.fingerprints, opts);
  if (!catalog) return tl::unexpected(catalog.error());
  return (*catalog)->create_reader()->list();
}

int run_scan(const Args& a) {
  clipscan::store::FingerprintCache cache;
  auto refs = load_references(a, cache);
  if (!refs) {
    std::cerr << "cannot load fingerprints from " << a.fingerprints << ": "
              << clipscan::util::error_description(refs.error()) << "\n";
    return 2;
  }

  auto source = clipscan::source::open_fpcalc_source(a.source, a.tools);
  if (!source) {
    std::cerr << "cannot open " << a.source << ": "
              << clipscan::util::error_description(source.error()) << "\n";
    return 2;
  }

  auto scanner = clipscan::scan::make_default_scan_factory()->create_scanner();
  auto found = scanner->scan(**source, (*source)->duration_s(), *refs, a.scan);
  if (!found) {
    std::cerr << "scan failed: " << clipscan::util::error_description(found.error()) << "\n";
    return 2;
  }

  const std::string list = clipscan::report::make_songlist(*found);
  if (!list.empty()) std::cout << list << "\n";
  return 0;
}

int run_index(const Args& a) {
  clipscan::store::FingerprintCache cache;
  auto dir = clipscan::store::make_directory_store(a.fingerprints, cache);
  auto catalog = clipscan::store::make_lmdb_catalog_factory(a.catalog_out, {});
  if (!catalog) {
    std::cerr << "cannot open catalog " << a.catalog_out << ": "
              << clipscan::util::error_description(catalog.error()) << "\n";
    return 2;
  }
  auto writer = (*catalog)->create_writer();
  auto n = clipscan::store::ingest(*dir, *writer);
  if (!n) {
    std::cerr << "index failed: " << clipscan::util::error_description(n.error()) << "\n";
    return 2;
  }
  std::cout << "indexed " << *n << " fingerprints into " << a.catalog_out << "\n";
  return 0;
}
} // namespace

int main(int argc, char** argv) {
  auto args = clipscan::cli::parse_args(argc, argv);
  if (!args) {
    std::cerr << clipscan::cli::usage();
    return 1;
  }
  if (args->command == Command::Help) {
    std::cout << clipscan::cli::usage();
    return 0;
  }

  clipscan::log::set_log_verbosity(clipscan::log::verbosity_from_count(args->verbosity));

  switch (args->command) {
    case Command::Index:
      return run_index(*args);
    case Command::Scan:
    default:
      return run_scan(*args);
  }
}
