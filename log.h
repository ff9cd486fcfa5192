#ifndef LUSOLVE_LOG_H
#define LUSOLVE_LOG_H

#include <cstdlib>
#include <iostream>

#define LUSOLVE_LOG_LEVEL_NONE 0
#define LUSOLVE_LOG_LEVEL_INFO 1
#define LUSOLVE_LOG_LEVEL_VERBOSE 2

#ifndef LUSOLVE_LOG_LEVEL
#define LUSOLVE_LOG_LEVEL LUSOLVE_LOG_LEVEL_INFO
#endif

// Diagnostic messages go to std::cerr so that reports printed on std::cout stay clean.
// The level can be overridden at run time with the LUSOLVE_LOG_LEVEL environment variable.
class LogStream {
public:
    static LogStream& get() {
        static LogStream log;
        return log;
    }

    std::ostream& stream() const { return stream_; }
    int level() const { return level_; }

private:
    LogStream() : level_(LUSOLVE_LOG_LEVEL), stream_(std::cerr) {
        if (const char* env = std::getenv("LUSOLVE_LOG_LEVEL"))
            level_ = std::atoi(env);
    }

    int level_;
    std::ostream& stream_;
};

#define LUSOLVE_LOG_STREAM(lvl)                   \
    if ((lvl) > LogStream::get().level())         \
        ;                                         \
    else                                          \
        LogStream::get().stream() << "[lusolve] "

#define LUSOLVE_LOG LUSOLVE_LOG_STREAM(LUSOLVE_LOG_LEVEL_INFO)
#define LUSOLVE_LOG_VERBOSE LUSOLVE_LOG_STREAM(LUSOLVE_LOG_LEVEL_VERBOSE)

#endif // LUSOLVE_LOG_H
