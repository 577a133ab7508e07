#pragma once

#include "strata/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace strata {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink by default; pass a directory to also write strata.log there.
 * The initial level is taken from LOG_LEVEL (or SPDLOG_LEVEL) when set.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace strata
