#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <ducat/log/formatter.hpp>
#include <ducat/log/frontend.hpp>

namespace ducat::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the level of the root logger from its name ("trace_l1", "debug", "info", ...).
 *
 * Throws if the name is not a known level.
 */
void set_level( std::string_view level );

} // namespace ducat::log
