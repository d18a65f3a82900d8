#pragma once

#include <iostream>
#include <string_view>

#include <unistd.h>

#include "hashfeed/log/logger.hpp"


namespace hashfeed::examples {

    // Tool output goes to stdout; log records go to stderr so piping the
    // feed keeps it clean. Colour only when stderr is a terminal.
    inline void configure_logging(std::string_view log_level) {
        using namespace hashfeed::log;
        Logger::instance().set_output(&std::cerr);
        Logger::instance().enable_color(::isatty(STDERR_FILENO) != 0);
        set_level(log_level);
    }

} // namespace hashfeed::examples
