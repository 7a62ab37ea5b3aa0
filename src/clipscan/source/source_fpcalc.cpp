#include "clipscan/source/source.hpp"

#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

#include <sys/wait.h>
#include <unistd.h>

#include "clipscan/io/io.hpp"
#include "clipscan/log/log.hpp"
#include "clipscan/store/store.hpp"

namespace clipscan::source {
using clipscan::util::Expected;
using clipscan::util::Fingerprint;
using clipscan::util::PcmBuffer;
using clipscan::util::ScanError;
using clipscan::util::Seconds;

namespace {
// Removes the staged window file on scope exit.
class ScopedTempFile {
public:
  explicit ScopedTempFile(std::string path) : path_(std::move(path)) {}
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  ~ScopedTempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
};

std::atomic<std::uint64_t> g_temp_counter{0};

std::string temp_path(const std::string& dir) {
  std::filesystem::path base;
  if (dir.empty()) {
    std::error_code ec;
    base = std::filesystem::temp_directory_path(ec);
    if (ec) base = "/tmp";
  } else {
    base = dir;
  }
  const auto n = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  return (base / ("clipscan-" + std::to_string(::getpid()) + "-" + std::to_string(n) + ".wav")).string();
}

struct ProcessOutput {
  int exit_code{-1};
  std::string text;
};

// Runs `cmd` through /bin/sh, capturing stdout (stderr is merged by the caller).
Expected<ProcessOutput> run_capture(const std::string& cmd) {
  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe) return tl::unexpected(ScanError::ExternalFingerprint);

  ProcessOutput out;
  std::array<char, 4096> buf{};
  for (;;) {
    const std::size_t got = std::fread(buf.data(), 1, buf.size(), pipe);
    if (got == 0) break;
    out.text.append(buf.data(), got);
  }
  const int status = ::pclose(pipe);
  if (status == -1) return tl::unexpected(ScanError::ExternalFingerprint);
  out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return out;
}

std::string first_line(const std::string& text) {
  const auto eol = text.find('\n');
  return (eol == std::string::npos) ? text : text.substr(0, eol);
}
} // namespace

std::string shell_quote(std::string_view arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

// -----------------------------
// Window staging
// -----------------------------
//
// A stager writes [start, start + duration) of the recording as a WAV file
// that fpcalc can read. Stagers are shared by all scan workers.
//

namespace {
class WindowStager {
public:
  virtual ~WindowStager() = default;
  [[nodiscard]] virtual Seconds duration_s() const noexcept = 0;
  virtual Expected<void> stage(Seconds start_s, Seconds duration_s, const std::string& wav) const = 0;
};

// Mono PCM already in memory.
class PcmStager final : public WindowStager {
public:
  explicit PcmStager(PcmBuffer pcm)
    : pcm_(std::move(pcm)), writer_(io::make_default_decoder_factory()->create_wav_writer()) {}

  Seconds duration_s() const noexcept override {
    return static_cast<Seconds>(pcm_.samples.size() / pcm_.sample_rate_hz);
  }

  Expected<void> stage(Seconds start_s, Seconds duration_s, const std::string& wav) const override {
    return writer_->write_file(wav, io::slice_seconds(pcm_, start_s, duration_s));
  }

private:
  PcmBuffer pcm_;
  std::unique_ptr<io::IWavWriter> writer_;
};

// WAV/MP3/FLAC on disk, decoded one window at a time.
class ReaderStager final : public WindowStager {
public:
  explicit ReaderStager(std::unique_ptr<io::IWindowReader> reader)
    : reader_(std::move(reader)), writer_(io::make_default_decoder_factory()->create_wav_writer()) {}

  Seconds duration_s() const noexcept override {
    return static_cast<Seconds>(reader_->frame_count() / reader_->sample_rate_hz());
  }

  Expected<void> stage(Seconds start_s, Seconds duration_s, const std::string& wav) const override {
    auto pcm = reader_->read_window(start_s, duration_s);
    if (!pcm) return tl::unexpected(pcm.error());
    return writer_->write_file(wav, util::PcmSpan{pcm->sample_rate_hz, util::as_span(*pcm)});
  }

private:
  std::unique_ptr<io::IWindowReader> reader_;
  std::unique_ptr<io::IWavWriter> writer_;
};

// Any container ffmpeg understands; one ffmpeg run per window.
class FfmpegStager final : public WindowStager {
public:
  FfmpegStager(std::string path, std::string ffmpeg, Seconds duration)
    : path_(std::move(path)), ffmpeg_(std::move(ffmpeg)), duration_(duration) {}

  Seconds duration_s() const noexcept override { return duration_; }

  Expected<void> stage(Seconds start_s, Seconds duration_s, const std::string& wav) const override {
    const std::string cmd = shell_quote(ffmpeg_) + " -hide_banner -loglevel error -nostdin -y" +
                            " -ss " + std::to_string(start_s) + " -t " + std::to_string(duration_s) +
                            " -i " + shell_quote(path_) +
                            " -vn -ac 1 -acodec pcm_s16le -f wav " + shell_quote(wav) + " 2>&1";
    CLIPSCAN_LOG_DEBUG("running " << cmd);

    auto proc = run_capture(cmd);
    if (!proc) return tl::unexpected(proc.error());
    if (proc->exit_code != 0) {
      CLIPSCAN_LOG_WARN("ffmpeg failed (exit " << proc->exit_code << ") at offset "
                        << start_s << "s: " << first_line(proc->text));
      return tl::unexpected(ScanError::ExternalFingerprint);
    }
    return {};
  }

private:
  std::string path_;
  std::string ffmpeg_;
  Seconds duration_;
};

// Whole seconds from `ffprobe -show_entries format=duration` output.
Expected<Seconds> parse_ffprobe_duration(const std::string& text) {
  const std::string line = first_line(text);
  char* end = nullptr;
  const double d = std::strtod(line.c_str(), &end);
  if (end == line.c_str() || !std::isfinite(d) || d < 0.0 ||
      d >= static_cast<double>(std::numeric_limits<Seconds>::max()))
    return tl::unexpected(ScanError::DecodeError);
  return static_cast<Seconds>(d);
}
} // namespace

// -----------------------------
// fpcalc-backed source
// -----------------------------
//
// Every request stages its window as a WAV in a unique temp file and runs
// `fpcalc -raw -length <duration> <file>`.
// Thread-safety: YES (stagers are immutable after construction; temp names are unique).
//

class FpcalcSource final : public ISourceFingerprinter {
public:
  FpcalcSource(std::unique_ptr<WindowStager> stager, FpcalcParams params)
    : stager_(std::move(stager)), params_(std::move(params)) {}

  Seconds duration_s() const noexcept override { return stager_->duration_s(); }

  Expected<Fingerprint> fingerprint(Seconds start_s, Seconds duration_s) const override {
    if (duration_s == 0 || start_s >= stager_->duration_s())
      return tl::unexpected(ScanError::InvalidArgument);

    ScopedTempFile wav(temp_path(params_.temp_dir));
    if (auto w = stager_->stage(start_s, duration_s, wav.path()); !w) {
      CLIPSCAN_LOG_WARN("cannot stage window at " << start_s << "s to " << wav.path());
      return tl::unexpected(w.error());
    }

    const std::string cmd = shell_quote(params_.fpcalc_path) + " -raw -length " +
                            std::to_string(duration_s) + " " + shell_quote(wav.path()) +
                            " 2>&1";
    CLIPSCAN_LOG_DEBUG("running " << cmd);

    auto proc = run_capture(cmd);
    if (!proc) return tl::unexpected(proc.error());
    if (proc->exit_code != 0) {
      CLIPSCAN_LOG_WARN("fpcalc failed (exit " << proc->exit_code << ") at offset "
                        << start_s << "s: " << first_line(proc->text));
      return tl::unexpected(ScanError::ExternalFingerprint);
    }

    auto fp = store::parse_fpcalc(proc->text);
    if (!fp) {
      CLIPSCAN_LOG_WARN("fingerprint not found in fpcalc output at offset " << start_s << "s");
      return tl::unexpected(ScanError::ExternalFingerprint);
    }
    return fp;
  }

private:
  std::unique_ptr<WindowStager> stager_;
  FpcalcParams params_;
};

Expected<std::unique_ptr<ISourceFingerprinter>>
make_fpcalc_source(PcmBuffer pcm, const FpcalcParams& params) {
  if (pcm.sample_rate_hz == 0) return tl::unexpected(ScanError::InvalidArgument);
  return std::unique_ptr<ISourceFingerprinter>(
      std::make_unique<FpcalcSource>(std::make_unique<PcmStager>(std::move(pcm)), params));
}

Expected<std::unique_ptr<ISourceFingerprinter>>
open_ffmpeg_source(std::string_view path, const FpcalcParams& params) {
  const std::string cmd = shell_quote(params.ffprobe_path) +
                          " -v error -show_entries format=duration"
                          " -of default=noprint_wrappers=1:nokey=1 " +
                          shell_quote(path) + " 2>&1";
  CLIPSCAN_LOG_DEBUG("running " << cmd);

  auto proc = run_capture(cmd);
  if (!proc || proc->exit_code != 0) {
    CLIPSCAN_LOG_ERROR("ffprobe cannot read " << path << ": "
                       << (proc ? first_line(proc->text) : std::string("not started")));
    return tl::unexpected(ScanError::DecodeError);
  }
  auto duration = parse_ffprobe_duration(proc->text);
  if (!duration) {
    CLIPSCAN_LOG_ERROR("ffprobe reported no duration for " << path << ": " << first_line(proc->text));
    return tl::unexpected(duration.error());
  }

  CLIPSCAN_LOG_INFO("ffprobe: " << path << " lasts " << *duration << " s");
  return std::unique_ptr<ISourceFingerprinter>(std::make_unique<FpcalcSource>(
      std::make_unique<FfmpegStager>(std::string(path), params.ffmpeg_path, *duration), params));
}

Expected<std::unique_ptr<ISourceFingerprinter>>
open_fpcalc_source(std::string_view path, const FpcalcParams& params) {
  auto reader = io::make_default_decoder_factory()->open_window_reader(path);
  if (!reader) {
    CLIPSCAN_LOG_DEBUG("dr_libs cannot read " << path << " ("
                       << util::error_name(reader.error()) << "), trying ffmpeg");
    return open_ffmpeg_source(path, params);
  }
  CLIPSCAN_LOG_INFO("opened " << path << ": " << (*reader)->frame_count() << " frames at "
                    << (*reader)->sample_rate_hz() << " Hz");
  return std::unique_ptr<ISourceFingerprinter>(std::make_unique<FpcalcSource>(
      std::make_unique<ReaderStager>(std::move(*reader)), params));
}
} // namespace clipscan::source
