/**
 * @file logging.hpp
 * @brief Thread-safe logging to syslog or stdout.
 */

#pragma once

#include <sstream>
#include <string>

/**
 * @namespace Log
 * @brief Namespace containing logging utilities and state.
 */
namespace Log {
    /**
     * @enum Level
     * @brief Defines severity levels for log messages.
     */
    enum class Level {
        Debug,   ///< Detailed debug information.
        Verbose, ///< Verbose operational info.
        Info,    ///< Standard informational messages.
        Error    ///< Critical errors.
    };

    /**
     * @brief Initializes the logging subsystem.
     *
     * @param id The identifier string (tag) for syslog messages.
     * @param syslogFacility Syslog facility name, see parseFacility(). Logs go to stdout when empty.
     * @param lvl The initial logging verbosity level.
     */
    void init(const std::string &id, const std::string &syslogFacility, Level lvl);

    /**
     * @brief Gets the current log level.
     * @return Level Current globally set log level.
     */
    Level getLogLevel();

    /**
     * @brief Sets the global log level.
     * @param lvl New log level.
     */
    void setLogLevel(Level lvl);

    /**
     * @brief Converts a level name (debug, verbose, info, error) to Level.
     *
     * Comparison is case-insensitive.
     *
     * @param name Level name.
     * @param lvl Receives the parsed level on success.
     * @return bool False if the name is not recognized.
     */
    bool parseLevel(const std::string &name, Level &lvl);

    /** @brief Returns upper-case name of the level. */
    const char *levelName(Level lvl);

    /**
     * @brief Converts a syslog facility name (LOCAL0..7, USER, SYSLOG, DAEMON) to its value.
     * @return bool False if the name is not recognized.
     */
    bool parseFacility(const std::string &name, int &facility);

    /**
     * @brief Variadic template entry point for writing log messages.
     *
     * Constructs a message stream and passes it to the recursive writer.
     * Messages below current level are discarded before formatting.
     *
     * @tparam Args Argument types to log.
     * @param lvl Severity level of this message.
     * @param args The values to append to the log message.
     */
    template<typename... Args>
    void write(Level lvl, const Args&... args)
    {
        if (lvl < getLogLevel()) {
            return;
        }
        std::ostringstream msg;
        write(lvl, msg, args...);
    }

    /**
     * @brief Recursive helper to unroll variadic arguments into the stream.
     */
    template<typename T, typename... Args>
    void write(Level lvl, std::ostringstream& msg, const T& value, const Args&... args)
    {
        msg << value;
        write(lvl, msg, args...);
    }

    /**
     * @brief Base case for the recursive writer.
     *
     * Writes the final composed message to the configured output (syslog or stdout).
     * Safe to call from multiple threads.
     *
     * @param lvl Severity level.
     * @param msg The fully constructed message stream.
     */
    void write(Level lvl, std::ostringstream &msg);
};

/** @brief Helper macro for Debug logs */
#define LOG_DEBUG(args ...)    Log::write(Log::Level::Debug,   args)
/** @brief Helper macro for Verbose logs */
#define LOG_VERBOSE(args ...)  Log::write(Log::Level::Verbose, args)
/** @brief Helper macro for Info logs */
#define LOG_INFO(args ...)     Log::write(Log::Level::Info,    args)
/** @brief Helper macro for Error logs */
#define LOG_ERROR(args ...)    Log::write(Log::Level::Error,   args)
