#include "logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <strings.h>
#include <syslog.h>

namespace Log {
    static std::atomic<Level> _level{Level::Error};
    static bool _syslog = false;
    static std::mutex _mutex;

    inline int level2prio(Level level) {
        switch (level) {
            case Level::Info:       return LOG_INFO;
            case Level::Verbose:    return LOG_NOTICE;
            case Level::Debug:      return LOG_DEBUG;
            default:                return LOG_ERR;
        }
    }

    const char* levelName(Level level) {
        switch (level) {
            case Level::Info:       return "INFO";
            case Level::Verbose:    return "VERBOSE";
            case Level::Debug:      return "DEBUG";
            default:                return "ERROR";
        }
    }

    static const struct {
        const char* name;
        int facility;
    } _facilities[] = {
        { "LOCAL0", LOG_LOCAL0 }, { "LOCAL1", LOG_LOCAL1 }, { "LOCAL2", LOG_LOCAL2 }, { "LOCAL3", LOG_LOCAL3 },
        { "LOCAL4", LOG_LOCAL4 }, { "LOCAL5", LOG_LOCAL5 }, { "LOCAL6", LOG_LOCAL6 }, { "LOCAL7", LOG_LOCAL7 },
        { "USER",   LOG_USER   }, { "SYSLOG", LOG_SYSLOG }, { "DAEMON", LOG_DAEMON },
    };

    static std::string toLower(const std::string& text)
    {
        std::string lower;
        for (auto c: text) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return lower;
    }

    bool parseFacility(const std::string& name, int& facility)
    {
        for (auto& entry: _facilities) {
            if (strcasecmp(name.c_str(), entry.name) == 0) {
                facility = entry.facility;
                return true;
            }
        }
        return false;
    }

    void init(const std::string& id, const std::string& syslogFacility, Level lvl)
    {
        _level = lvl;

        if (syslogFacility.empty() == false) {
            int facility = LOG_DAEMON;
            if (parseFacility(syslogFacility, facility) == false) {
                fprintf(stderr, "Unknown syslog facility %s, using DAEMON\n", syslogFacility.c_str());
            }
            // openlog() keeps the pointer, must outlive the process
            static char ident[80] = {0};
            id.copy(ident, sizeof(ident) - 1);
            openlog(ident, LOG_CONS | LOG_PID, facility);
            _syslog = true;
        }
    }

    Level getLogLevel()
    {
        return _level;
    }

    void setLogLevel(Level lvl)
    {
        _level = lvl;
    }

    bool parseLevel(const std::string& name, Level& lvl)
    {
        auto lower = toLower(name);
        if      (lower == "debug")   { lvl = Level::Debug; }
        else if (lower == "verbose") { lvl = Level::Verbose; }
        else if (lower == "info")    { lvl = Level::Info; }
        else if (lower == "error")   { lvl = Level::Error; }
        else { return false; }
        return true;
    }

    void write(Level lvl, std::ostringstream &msg)
    {
        if (lvl < _level) {
            return;
        }

        // Resolver workers log concurrently with the event loop
        std::lock_guard<std::mutex> lock(_mutex);
        if (_syslog == true) {
            syslog(level2prio(lvl), "%s", msg.str().c_str());
        } else {
            const auto now = std::chrono::system_clock::now();
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
            const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
            struct tm timeinfo;
            localtime_r(&now_t, &timeinfo);
            char buffer[64] = {0};
            strftime(buffer, sizeof(buffer) - 1, "%Y-%m-%d %H:%M:%S", &timeinfo);
            printf("%s.%03d %-7s %s\n", buffer, static_cast<int>(millis), levelName(lvl), msg.str().c_str());
            fflush(stdout);
        }
    }

};
