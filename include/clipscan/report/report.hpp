#pragma once
#include <span>
#include <string>
#include <string_view>

#include "clipscan/util/util.hpp"

namespace clipscan::report {
/**
 * Format a source position as [DD:][HH:][MM:]SS, every component two-digit
 * zero-padded and leading zero components omitted (e.g. 5 -> "05",
 * 3725 -> "01:02:05").
 */
std::string format_timestamp(util::Seconds seconds);

/** Reference id as shown to the user (a trailing ".mp3" removed). */
std::string display_title(std::string_view reference_id);

/**
 * Render candidates as "<timestamp> - <title>" lines joined by '\n'.
 * A candidate whose title equals the previous candidate's title is dropped,
 * so a clip detected in consecutive windows is listed once, at its first
 * window. No trailing newline; empty input gives "".
 */
std::string make_songlist(std::span<const util::MatchCandidate> candidates);
} // namespace clipscan::report
