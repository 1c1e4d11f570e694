#pragma once

#include <string>

#include "wheelbuf/log/logger.hpp"


namespace wheelbuf::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace wheelbuf::log;
        Logger::instance().set_level(parse_level(log_level));
    }

} // namespace wheelbuf::examples
