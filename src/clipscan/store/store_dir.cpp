#include "clipscan/store/store.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "clipscan/log/log.hpp"

namespace clipscan::store {
using clipscan::util::Expected;
using clipscan::util::Fingerprint;
using clipscan::util::FingerprintView;
using clipscan::util::ReferenceFingerprint;
using clipscan::util::ScanError;

namespace {
constexpr std::string_view kMarker = "FINGERPRINT=";

inline std::string_view trim(std::string_view s) noexcept {
  const auto ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!s.empty() && ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && ws(s.back())) s.remove_suffix(1);
  return s;
}

Expected<std::uint32_t> parse_word(std::string_view tok) {
  tok = trim(tok);
  if (tok.empty()) return tl::unexpected(ScanError::DecodeError);
  std::int64_t v = 0;
  const auto* first = tok.data();
  const auto* last = tok.data() + tok.size();
  if (*first == '+') ++first;
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || ptr != last) return tl::unexpected(ScanError::DecodeError);
  if (v < -(std::int64_t{1} << 31) || v >= (std::int64_t{1} << 32))
    return tl::unexpected(ScanError::DecodeError);
  return static_cast<std::uint32_t>(v);
}

Expected<std::string> read_text(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return tl::unexpected(ScanError::IOError);
  std::string text((std::istreambuf_iterator<char>(ifs)), {});
  if (ifs.bad()) return tl::unexpected(ScanError::IOError);
  return text;
}
} // namespace

Expected<Fingerprint> parse_fpcalc(std::string_view text) {
  const auto at = text.find(kMarker);
  if (at == std::string_view::npos) return tl::unexpected(ScanError::DecodeError);

  std::string_view value = text.substr(at + kMarker.size());
  const auto eol = value.find('\n');
  if (eol != std::string_view::npos) value = value.substr(0, eol);
  value = trim(value);

  std::vector<std::uint32_t> words;
  while (!value.empty()) {
    const auto comma = value.find(',');
    auto w = parse_word(value.substr(0, comma));
    if (!w) return tl::unexpected(w.error());
    words.push_back(*w);
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return util::to_fingerprint(FingerprintView(words.data(), words.size()));
}

// -----------------------------
// FingerprintCache
// -----------------------------

Expected<FingerprintView> FingerprintCache::get(const std::string& path) {
  if (auto it = entries_.find(path); it != entries_.end())
    return util::as_view(it->second);

  auto text = read_text(path);
  if (!text) return tl::unexpected(text.error());
  auto fp = parse_fpcalc(*text);
  if (!fp) {
    CLIPSCAN_LOG_WARN("cannot parse fingerprint file " << path);
    return tl::unexpected(fp.error());
  }
  auto [it, inserted] = entries_.emplace(path, std::move(*fp));
  (void)inserted;
  return util::as_view(it->second);
}

// -----------------------------
// Directory store
// -----------------------------

std::string reference_id(std::string_view root, std::string_view path) {
  namespace fs = std::filesystem;
  std::string id = fs::path(path).lexically_relative(fs::path(root)).generic_string();
  if (id.empty() || id.rfind("..", 0) == 0) id = fs::path(path).filename().generic_string();
  if (id.size() > kFpcalcSuffix.size() &&
      id.compare(id.size() - kFpcalcSuffix.size(), kFpcalcSuffix.size(), kFpcalcSuffix) == 0)
    id.resize(id.size() - kFpcalcSuffix.size());
  return id;
}

class DirectoryReferenceStore final : public IReferenceStore {
public:
  DirectoryReferenceStore(std::string root, FingerprintCache& cache)
    : root_(std::move(root)), cache_(cache) {}

  Expected<std::vector<ReferenceFingerprint>> list() override {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return tl::unexpected(ScanError::NotFound);

    std::vector<std::string> paths;
    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
      if (it->is_regular_file(ec)) paths.push_back(it->path().string());
    }
    if (ec) {
      CLIPSCAN_LOG_ERROR("cannot walk " << root_ << ": " << ec.message());
      return tl::unexpected(ScanError::IOError);
    }
    std::sort(paths.begin(), paths.end());

    std::vector<ReferenceFingerprint> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
      auto fp = cache_.get(p);
      if (!fp) return tl::unexpected(fp.error());
      out.push_back(ReferenceFingerprint{reference_id(root_, p), util::to_fingerprint(*fp)});
    }
    CLIPSCAN_LOG_INFO("loaded " << out.size() << " reference fingerprints from " << root_);
    return out;
  }

private:
  std::string root_;
  FingerprintCache& cache_;
};

std::unique_ptr<IReferenceStore>
make_directory_store(std::string root, FingerprintCache& cache) {
  return std::make_unique<DirectoryReferenceStore>(std::move(root), cache);
}

Expected<std::size_t> ingest(IReferenceStore& from, ICatalogWriter& to) {
  auto refs = from.list();
  if (!refs) return tl::unexpected(refs.error());
  for (const auto& r : *refs) {
    auto put = to.put(r.id, util::as_view(r.fingerprint));
    if (!put) return tl::unexpected(put.error());
  }
  auto done = to.commit();
  if (!done) return tl::unexpected(done.error());
  return refs->size();
}
} // namespace clipscan::store
