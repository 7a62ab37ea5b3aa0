#include "clipscan/util/util.hpp"

namespace clipscan::util {
std::string_view error_name(ScanError e) noexcept {
  switch (e) {
    case ScanError::None:
      return "None";
    case ScanError::InvalidArgument:
      return "InvalidArgument";
    case ScanError::EmptyInput:
      return "EmptyInput";
    case ScanError::SpanTooLarge:
      return "SpanTooLarge";
    case ScanError::SizeMismatch:
      return "SizeMismatch";
    case ScanError::IOError:
      return "IOError";
    case ScanError::DecodeError:
      return "DecodeError";
    case ScanError::UnsupportedFormat:
      return "UnsupportedFormat";
    case ScanError::ExternalFingerprint:
      return "ExternalFingerprint";
    case ScanError::CatalogCorrupt:
      return "CatalogCorrupt";
    case ScanError::NotFound:
      return "NotFound";
    case ScanError::Unavailable:
      return "Unavailable";
    case ScanError::Internal:
      return "Internal";
    case ScanError::ResourceExhausted:
      return "ResourceExhausted";
  }
  return "Unknown";
}

std::string_view error_description(ScanError e) noexcept {
  switch (e) {
    case ScanError::None:
      return "Success";
    case ScanError::InvalidArgument:
      return "An input argument violated preconditions.";
    case ScanError::EmptyInput:
      return "Empty fingerprints cannot be correlated.";
    case ScanError::SpanTooLarge:
      return "Sweep span exceeds the fingerprint length; reduce the span or increase the window.";
    case ScanError::SizeMismatch:
      return "Buffer or shape sizes do not match.";
    case ScanError::IOError:
      return "Underlying I/O operation failed.";
    case ScanError::DecodeError:
      return "Data could not be decoded or parsed.";
    case ScanError::UnsupportedFormat:
      return "Requested format or feature is not supported.";
    case ScanError::ExternalFingerprint:
      return "External fingerprinter failed or produced no fingerprint.";
    case ScanError::CatalogCorrupt:
      return "Reference catalog appears corrupt or inconsistent.";
    case ScanError::NotFound:
      return "Requested item does not exist.";
    case ScanError::Unavailable:
      return "Subsystem not initialized or temporarily unavailable.";
    case ScanError::Internal:
      return "An internal invariant was violated (bug).";
    case ScanError::ResourceExhausted:
      return "Resource exhausted or unavailable.";
  }
  return "Unknown error";
}
} // namespace clipscan::util
