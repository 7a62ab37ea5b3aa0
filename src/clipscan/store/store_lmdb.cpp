#include "clipscan/store/store.hpp"

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <lmdb.h>

#include "clipscan/log/log.hpp"

namespace clipscan::store {
using clipscan::util::Expected;
using clipscan::util::Fingerprint;
using clipscan::util::FingerprintView;
using clipscan::util::ReferenceFingerprint;
using clipscan::util::ScanError;

// -----------------------------
// Helpers: error mapping, endian
// -----------------------------

namespace {
inline ScanError map_mdb(int rc) noexcept {
  if (rc == 0) return ScanError::None;
  switch (rc) {
    case MDB_NOTFOUND:
      return ScanError::NotFound;
    case MDB_MAP_FULL:
      return ScanError::ResourceExhausted;
    case MDB_PANIC:
    case MDB_CORRUPTED:
    case MDB_INVALID:
      return ScanError::CatalogCorrupt;
    case MDB_BAD_VALSIZE:
    case MDB_BAD_DBI:
    case EINVAL:
      return ScanError::InvalidArgument;
    case ENOSPC:
    case ENOMEM:
      return ScanError::ResourceExhausted;
    default:
      return ScanError::IOError;
  }
}

constexpr std::uint8_t kValueVersion = 1;

inline void put_u32(std::vector<std::uint8_t>& o, std::uint32_t v) {
  o.push_back((v) & 0xFFu);
  o.push_back((v >> 8) & 0xFFu);
  o.push_back((v >> 16) & 0xFFu);
  o.push_back((v >> 24) & 0xFFu);
}

inline std::uint32_t get_u32(const std::uint8_t* p) {
  return (std::uint32_t)p[0] | ((std::uint32_t)p[1] << 8) | (
           (std::uint32_t)p[2] << 16) | (
           (std::uint32_t)p[3] << 24);
}

// Value format (LE): [version u8][count u32][word u32 ...]
inline void encode_fingerprint(FingerprintView fp, std::vector<std::uint8_t>& out) {
  out.clear();
  out.reserve(1 + 4 + 4 * fp.size());
  out.push_back(kValueVersion);
  put_u32(out, static_cast<std::uint32_t>(fp.size()));
  for (auto w : fp) put_u32(out, w);
}

inline Expected<Fingerprint> decode_fingerprint(const std::uint8_t* data, size_t len) {
  if (len < 1 + 4) return tl::unexpected(ScanError::CatalogCorrupt);
  if (data[0] != kValueVersion) return tl::unexpected(ScanError::CatalogCorrupt);
  const std::uint32_t count = get_u32(data + 1);
  if (len != 1 + 4 + 4ull * count) return tl::unexpected(ScanError::CatalogCorrupt);
  Fingerprint fp(count);
  const std::uint8_t* p = data + 5;
  for (std::uint32_t i = 0; i < count; ++i, p += 4) fp[i] = get_u32(p);
  return fp;
}
} // namespace

// Shared environment handle; closed when the last writer/reader/factory goes.
struct LmdbEnv {
  MDB_env* env{nullptr};
  MDB_dbi dbi{0};

  LmdbEnv() = default;
  LmdbEnv(const LmdbEnv&) = delete;
  LmdbEnv& operator=(const LmdbEnv&) = delete;

  ~LmdbEnv() {
    // dbi closed with the env
    if (env) mdb_env_close(env);
  }
};

// -----------------------------
// LMDB Writer (single-writer)
// -----------------------------

class LmdbCatalogWriter final : public ICatalogWriter {
public:
  explicit LmdbCatalogWriter(std::shared_ptr<LmdbEnv> env) : env_(std::move(env)) {}

  Expected<void> put(std::string_view id, FingerprintView fp) override {
    if (id.empty()) return tl::unexpected(ScanError::InvalidArgument);
    staging_[std::string(id)] = util::to_fingerprint(fp);
    return {};
  }

  // One write txn for everything staged.
  Expected<void> commit() override {
    if (staging_.empty()) return {};

    MDB_txn* txn = nullptr;
    int rc = mdb_txn_begin(env_->env, nullptr, 0, &txn);
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    std::vector<std::uint8_t> valbuf;
    for (const auto& [id, fp] : staging_) {
      encode_fingerprint(util::as_view(fp), valbuf);

      MDB_val k, v;
      k.mv_size = id.size();
      k.mv_data = const_cast<char*>(id.data());
      v.mv_size = valbuf.size();
      v.mv_data = valbuf.data();
      rc = mdb_put(txn, env_->dbi, &k, &v, 0);
      if (rc != 0) {
        mdb_txn_abort(txn);
        CLIPSCAN_LOG_ERROR("catalog put failed for " << id << ": " << mdb_strerror(rc));
        return tl::unexpected(map_mdb(rc));
      }
    }

    rc = mdb_txn_commit(txn);
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    CLIPSCAN_LOG_INFO("catalog committed " << staging_.size() << " references");
    staging_.clear();
    return {};
  }

private:
  std::shared_ptr<LmdbEnv> env_;
  std::map<std::string, Fingerprint> staging_; // id -> fingerprint
};

// -----------------------------
// LMDB Reader (multi-reader, thread-safe)
// -----------------------------

class LmdbCatalogReader final : public IReferenceStore {
public:
  explicit LmdbCatalogReader(std::shared_ptr<LmdbEnv> env) : env_(std::move(env)) {}

  // Cursor walk in key order; LMDB compares keys bytewise.
  Expected<std::vector<ReferenceFingerprint>> list() override {
    MDB_txn* txn = nullptr;
    int rc = mdb_txn_begin(env_->env, nullptr, MDB_RDONLY, &txn);
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    MDB_cursor* cur = nullptr;
    rc = mdb_cursor_open(txn, env_->dbi, &cur);
    if (rc != 0) {
      mdb_txn_abort(txn);
      return tl::unexpected(map_mdb(rc));
    }

    std::vector<ReferenceFingerprint> out;
    MDB_val k, v;
    for (rc = mdb_cursor_get(cur, &k, &v, MDB_FIRST); rc == 0;
         rc = mdb_cursor_get(cur, &k, &v, MDB_NEXT)) {
      auto fp = decode_fingerprint(static_cast<const std::uint8_t*>(v.mv_data), v.mv_size);
      if (!fp) {
        mdb_cursor_close(cur);
        mdb_txn_abort(txn);
        return tl::unexpected(fp.error());
      }
      out.push_back(ReferenceFingerprint{
          std::string(static_cast<const char*>(k.mv_data), k.mv_size), std::move(*fp)});
    }
    mdb_cursor_close(cur);
    mdb_txn_abort(txn);
    if (rc != MDB_NOTFOUND) return tl::unexpected(map_mdb(rc));
    return out;
  }

private:
  std::shared_ptr<LmdbEnv> env_;
};

// -----------------------------
// Factory: open LMDB env/DBI, hand out writer/reader
// -----------------------------

class LmdbCatalogFactory final : public ICatalogFactory {
public:
  explicit LmdbCatalogFactory(std::shared_ptr<LmdbEnv> env) : env_(std::move(env)) {}

  std::unique_ptr<ICatalogWriter> create_writer() override {
    return std::make_unique<LmdbCatalogWriter>(env_);
  }

  std::unique_ptr<IReferenceStore> create_reader() override {
    return std::make_unique<LmdbCatalogReader>(env_);
  }

private:
  std::shared_ptr<LmdbEnv> env_;
};

Expected<std::unique_ptr<ICatalogFactory>>
make_lmdb_catalog_factory(std::string path, const LmdbOptions& opts) {
  std::error_code ec;
  if (!opts.create_if_missing) {
    if (!std::filesystem::is_directory(path, ec)) {
      CLIPSCAN_LOG_ERROR("no catalog at " << path);
      return tl::unexpected(ScanError::NotFound);
    }
  } else {
    std::filesystem::create_directories(path, ec);
    if (ec) return tl::unexpected(ScanError::IOError);
  }

  auto env = std::make_shared<LmdbEnv>();
  int rc = mdb_env_create(&env->env);
  if (rc != 0) return tl::unexpected(map_mdb(rc));

  unsigned int flags = 0;
  if (opts.use_nosync) flags |= MDB_NOSYNC;
  if (opts.use_writemap) flags |= MDB_WRITEMAP;

  rc = mdb_env_set_mapsize(env->env, opts.map_size_bytes);
  if (rc != 0) return tl::unexpected(map_mdb(rc));

  rc = mdb_env_open(env->env, path.c_str(), flags, 0644);
  if (rc != 0) {
    CLIPSCAN_LOG_ERROR("cannot open catalog " << path << ": " << mdb_strerror(rc));
    return tl::unexpected(map_mdb(rc));
  }

  MDB_txn* txn = nullptr;
  rc = mdb_txn_begin(env->env, nullptr, 0, &txn);
  if (rc != 0) return tl::unexpected(map_mdb(rc));

  // Unnamed main DBI, id -> fingerprint
  rc = mdb_dbi_open(txn, nullptr, 0, &env->dbi);
  if (rc != 0) {
    mdb_txn_abort(txn);
    return tl::unexpected(map_mdb(rc));
  }
  rc = mdb_txn_commit(txn);
  if (rc != 0) return tl::unexpected(map_mdb(rc));

  return std::unique_ptr<ICatalogFactory>(std::make_unique<LmdbCatalogFactory>(std::move(env)));
}
} // namespace clipscan::store
