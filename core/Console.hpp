/**
 * @file Console.hpp
 * @brief Serialized, optionally colored status lines for the device console
 *
 * All components report progress through these helpers instead of writing
 * to std::cout directly, so lines emitted by the two publish threads never
 * interleave. Messages carry their own component tag, e.g. "[DPS] ...".
 *
 * @note Colors are ANSI escape sequences, enabled only when stdout is a TTY
 */

#pragma once

#include <string>

namespace devsim::console {

/// Progress line (white)
void info(const std::string& line);

/// Successful milestone (green)
void success(const std::string& line);

/// Section banner or notable event (yellow)
void highlight(const std::string& line);

/// Failure line (red), written to stderr
void error(const std::string& line);

/// Force colors on or off, overriding TTY detection
void setColorEnabled(bool enabled);

} // namespace devsim::console
