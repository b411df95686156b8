#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <offchain/log/formatter.hpp>
#include <offchain/log/frontend.hpp>

namespace offchain::log {

/**
 * Start the logging backend thread and set the root logger's level.
 * Unknown level names fall back to info.
 */
void initialize( std::string_view level = "info" ) noexcept;
logger* instance() noexcept;

} // namespace offchain::log
