#pragma once

#include <source_location>
#include <string>

namespace strata {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Destination for the diagnostics of the layout pipeline
 *
 * strata logs while it lays out a graph: ingestion warns about duplicate node
 * and edge ids and reports dropped edges at debug level, the phases report
 * reversed arcs, inserted routing nodes and crossing counts, and grid
 * alignment warns when the grid size is not positive. Messages reach the
 * backend already formatted as "Func() - text".
 *
 * SpdlogBackend is installed on first use. An application that keeps its own
 * log replaces it through Logger::setBackend(); a test can install a backend
 * that records messages and assert on the warnings of a single layout() call.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /**
     * @brief Set minimum log level
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace strata
