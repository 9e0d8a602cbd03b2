#pragma once

#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include <fungible/log/formatter.hpp>
#include <fungible/log/frontend.hpp>

namespace fungible::log {

void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

} // namespace fungible::log
