#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "clipscan/util/util.hpp"

namespace clipscan::store {

/** File suffix of fingerprint files written by `fpcalc -raw`. */
inline constexpr std::string_view kFpcalcSuffix = ".fpcalc";

/**
 * Parse `fpcalc -raw` output: the comma-separated integers following
 * "FINGERPRINT=" up to the end of that line.
 *
 * Values may be printed unsigned (Chromaprint >= 1.4) or signed; negative
 * values are reinterpreted as their 32-bit two's complement word.
 *
 * Errors:
 *  - DecodeError: no "FINGERPRINT=" marker, or a token that is not an
 *    integer in [-2^31, 2^32).
 * Postconditions: an empty value yields an empty fingerprint.
 * Thread-safety: YES (pure function).
 */
util::Expected<util::Fingerprint> parse_fpcalc(std::string_view text);

/**
 * Caller-owned cache of parsed fingerprint files keyed by path.
 * Entries are loaded lazily on first access and never invalidated.
 *
 * Thread-safety: NO; one cache per owner.
 */
class FingerprintCache {
public:
  /**
   * Purpose: Return the parsed fingerprint of `path`, reading and parsing
   * the file on first access.
   * Errors: IOError (unreadable file), DecodeError (parse failure). Failed
   * loads are not cached.
   */
  util::Expected<util::FingerprintView> get(const std::string& path);

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

  [[nodiscard]] bool contains(const std::string& path) const {
    return entries_.find(path) != entries_.end();
  }

private:
  std::unordered_map<std::string, util::Fingerprint> entries_;
};

/**
 * Source of reference fingerprints for a scan.
 */
class IReferenceStore {
public:
  virtual ~IReferenceStore() = default;

  /**
   * Purpose: All references, in a stable order.
   * Postconditions: identifiers are unique within one listing.
   * Thread-safety: implementation-defined; listing is done once per scan.
   */
  virtual util::Expected<std::vector<util::ReferenceFingerprint>> list() = 0;
};

/**
 * Reference store over a directory tree of `.fpcalc` files.
 *
 * Listing walks the tree recursively and returns entries ordered by path.
 * Identifiers are the path relative to the root with a trailing ".fpcalc"
 * removed (generic '/' separators). Files are parsed through `cache`, which
 * must outlive the store.
 *
 * Errors: NotFound if `root` is not a directory; IOError/DecodeError from
 * individual files abort the listing.
 */
std::unique_ptr<IReferenceStore>
make_directory_store(std::string root, FingerprintCache& cache);

/** Derive a reference id from a file path below `root`. */
std::string reference_id(std::string_view root, std::string_view path);

// -----------------------------
// LMDB-backed reference catalog
// -----------------------------

/**
 * LMDB environment/options.
 * Units:
 *  - map_size_bytes: bytes
 *
 * Value layout (LE): [version u8 = 1][count u32][word u32 ...], key = id bytes.
 */
struct LmdbOptions {
  std::size_t map_size_bytes{1ull << 30}; // 1 GiB default; tune per catalog
  bool use_nosync{false};                 // if true, MDB_NOSYNC for faster builds (crash risk)
  bool use_writemap{false};               // MDB_WRITEMAP (can speed up builds)
  bool create_if_missing{true};           // false for read-only use: a missing directory is NotFound
};

/**
 * Single-writer catalog ingest.
 * Thread-safety: NOT thread-safe; one instance per building thread.
 */
class ICatalogWriter {
public:
  virtual ~ICatalogWriter() = default;

  /**
   * Purpose: Stage `fp` under `id`, replacing any staged or stored entry.
   * Errors: InvalidArgument for an empty id.
   */
  virtual util::Expected<void> put(std::string_view id, util::FingerprintView fp) = 0;

  /**
   * Purpose: Write all staged entries in one LMDB transaction.
   * Postconditions: on success the entries are visible to new readers.
   */
  virtual util::Expected<void> commit() = 0;
};

/** Factory bound to one LMDB environment directory. */
class ICatalogFactory {
public:
  virtual ~ICatalogFactory() = default;
  virtual std::unique_ptr<ICatalogWriter> create_writer() = 0;

  /** Reader listing every entry ordered by id. Thread-safe after creation. */
  virtual std::unique_ptr<IReferenceStore> create_reader() = 0;
};

/**
 * Open an LMDB catalog at directory `path`, creating the directory unless
 * opts.create_if_missing is false.
 * Errors: NotFound if `path` does not exist and may not be created;
 *   IOError/ResourceExhausted/InvalidArgument mapped from LMDB codes.
 */
util::Expected<std::unique_ptr<ICatalogFactory>>
make_lmdb_catalog_factory(std::string path, const LmdbOptions& opts);

/** Copy every reference from `from` into `to` and commit. Returns the count. */
util::Expected<std::size_t> ingest(IReferenceStore& from, ICatalogWriter& to);
} // namespace clipscan::store
