/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "../pch.h"
#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <atomic>
#include <string_view>

namespace statuslist {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // Support engineering: detailed tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Null sink returned when a message is filtered out by the level check.
     */
    class ILogger {
    public:
        virtual ~ILogger() {};

        virtual ILogger& operator<<(const char*) { return *this; }
        virtual ILogger& operator<<(const string&) { return *this; }
        virtual ILogger& operator<<(std::string_view) { return *this; }
        virtual ILogger& operator<<(char) { return *this; }
        virtual ILogger& operator<<(int) { return *this; }
        virtual ILogger& operator<<(unsigned) { return *this; }
        virtual ILogger& operator<<(long) { return *this; }
        virtual ILogger& operator<<(unsigned long) { return *this; }
        virtual ILogger& operator<<(long long) { return *this; }
        virtual ILogger& operator<<(unsigned long long) { return *this; }
        virtual ILogger& operator<<(double) { return *this; }
        virtual ILogger& operator<<(bool) { return *this; }
        virtual ILogger& operator<<(const void*) { return *this; }
        virtual ILogger& operator<< (ostream& ( *endl )(ostream&)) { return *this; }
        virtual void flush() {}

        /**
         * converts time_t to a string
         */
        inline string time_t_to_String(time_t t = time(0)) {
            char buf[26];
            ctime_r(&t, buf);
            buf[24] = 0; // don't want the \n
            return buf;
        }
    };
    extern ILogger iLogger;

    class Logger : public ILogger {
        static boost::mutex sm;
        static FILE* logfile;
        stringstream ss;
        LogLevel logLevel;
        string _threadName;
    public:

        friend class LogManager;

        /**
         * set the log file; nullptr restores stderr
         */
        static void setLogFile(FILE* f);

        void flush() override;

        inline const string& getThreadName() const { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        Logger& operator<<(const char *x) override        { ss << x; return *this; }
        Logger& operator<<(const string& x) override      { ss << x; return *this; }
        Logger& operator<<(std::string_view x) override   { ss << x; return *this; }
        Logger& operator<<(char x) override               { ss << x; return *this; }
        Logger& operator<<(int x) override                { ss << x; return *this; }
        Logger& operator<<(unsigned x) override           { ss << x; return *this; }
        Logger& operator<<(long x) override               { ss << x; return *this; }
        Logger& operator<<(unsigned long x) override      { ss << x; return *this; }
        Logger& operator<<(long long x) override          { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) override { ss << x; return *this; }
        Logger& operator<<(double x) override             { ss << x; return *this; }
        Logger& operator<<(bool x) override               { ss << (x ? "true" : "false"); return *this; }
        Logger& operator<<(const void *x) override        { ss << x; return *this; }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) override {
            flush();
            return *this;
        }

        Logger& prolog() {
            return *this;
        }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() {
            _threadName = "STATUSLIST";
            _init();
        }
        void _init() {
            ss.str("");
            ss.clear();
            logLevel = LOG_INFO;
        }
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }
    };

    extern std::atomic<int> logLevel;

    inline ILogger& log( int level ) {
        if ( level < logLevel.load(std::memory_order_relaxed) )
            return iLogger;
        return Logger::get().prolog();
    }

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        __attribute__((always_inline))
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
            // filtered messages carry a null logger
            if (should_flush_ && logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushes
            }
            return *this;
        }
    };

    __attribute__((always_inline))
    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().prolog().setLogLevel( l ), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper trace()   { return log(LOG_TRACE); }

    __attribute__((always_inline))
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }

    __attribute__((always_inline))
    inline LoggerWrapper info()    { return log(LOG_INFO); }

    __attribute__((always_inline))
    inline LoggerWrapper warning() { return log(LOG_WARNING); }

    __attribute__((always_inline))
    inline LoggerWrapper warn()    { return log(LOG_WARNING); }

    __attribute__((always_inline))
    inline LoggerWrapper error()   { return log(LOG_ERROR); }

    __attribute__((always_inline))
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")   { logLevel.store(LOG_TRACE, std::memory_order_relaxed); return true; }
        if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG, std::memory_order_relaxed); return true; }
        if (upper == "INFO")    { logLevel.store(LOG_INFO, std::memory_order_relaxed); return true; }
        if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
        if (upper == "ERROR")   { logLevel.store(LOG_ERROR, std::memory_order_relaxed); return true; }
        if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

        return false;
    }

    // Initialize logging from environment variable
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level) {
            if (!setLogLevelFromString(env_level)) {
                std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                          << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }
        }
    }

}
