/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORRERY_TESTS_LOG_CAPTURE_HPP
#define __ORRERY_TESTS_LOG_CAPTURE_HPP

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

namespace orrery::test {

/**
 * Routes the default spdlog logger into a string while in scope.
 */
class LogCapture {
public:
    LogCapture() : previous(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(stream);
        sink->set_pattern("%l %v");
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }

    ~LogCapture() {
        spdlog::set_default_logger(previous);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string text() const {
        return stream.str();
    }

    bool contains(const std::string &fragment) const {
        return text().find(fragment) != std::string::npos;
    }

    // Number of lines logged at warn level
    int warnings() const {
        int count = 0;
        std::istringstream lines(text());
        for (std::string line; std::getline(lines, line);) {
            if (line.rfind("warning ", 0) == 0) {
                ++count;
            }
        }
        return count;
    }

private:
    std::ostringstream stream;
    std::shared_ptr<spdlog::logger> previous;
};

}

#endif
