#pragma once

#include <iostream>
#include <string>
#include <sstream>

// Diagnostic logging for navigate
// Everything goes to stderr: stdout carries nothing but the resolved directory,
// which the calling shell captures.
class DebugLog {
public:
    // Enable or disable debug logging (-v/--verbose or "debug: true" in config)
    static void set_enabled(bool enabled) {
        enabled_ = enabled;
    }

    static bool is_enabled() {
        return enabled_;
    }

    // Redirect all diagnostics (tests capture them in a stringstream)
    static void set_stream(std::ostream& stream) {
        stream_ = &stream;
    }

    static std::ostream& stream() {
        return *stream_;
    }

    // Stream-based debug logger
    class Logger {
    public:
        Logger(bool newline = false) : newline_(newline) {
            if (DebugLog::enabled_) {
                DebugLog::stream() << "DEBUG: ";
            }
        }

        ~Logger() {
            if (DebugLog::enabled_) {
                if (newline_) {
                    DebugLog::stream() << "\n";
                }
                DebugLog::stream() << std::flush;
            }
        }

        template<typename T>
        Logger& operator<<(const T& val) {
            if (DebugLog::enabled_) {
                DebugLog::stream() << val;
            }
            return *this;
        }

    private:
        bool newline_;
    };

private:
    static bool enabled_;
    static std::ostream* stream_;
};

inline bool DebugLog::enabled_ = false;
inline std::ostream* DebugLog::stream_ = &std::cerr;

// Convenience macros for debug logging with stream syntax
#define DEBUG_LOG DebugLog::Logger(false)
#define DEBUG_LOGLN DebugLog::Logger(true)

// Always shown regardless of debug mode
#define ERROR_LOG(msg) DebugLog::stream() << "ERROR: " << msg << std::endl
#define INFO_LOG(msg) DebugLog::stream() << msg << std::endl
