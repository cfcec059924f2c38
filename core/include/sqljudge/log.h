#pragma once

#include <ostream>
#include <string>

namespace sqljudge::log {

enum class Level { Debug, Info, Warn, Error, Off };

/// Parses "debug|info|warn|error|off"; unknown values fall back to Warn.
Level parse_level(const std::string& name);
/// Current threshold; initialized from SQLJUDGE_LOG_LEVEL on first use.
Level level();
void set_level(Level level);
/// Redirects output (tests); nullptr restores stderr.
void set_sink(std::ostream* sink);

/// Writes "[sqljudge] LEVEL: message" when `lvl` passes the threshold.
/// Lines from concurrent threads never interleave.
void write(Level lvl, const std::string& message);

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warn(const std::string& message) { write(Level::Warn, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

}  // namespace sqljudge::log
