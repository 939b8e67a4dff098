#ifndef BLOCKALIGN_LOGGER_HPP
#define BLOCKALIGN_LOGGER_HPP

#include <cstring>
#include <iostream>
#include <ostream>
#include <string>


/*

Very simple logging.

Usage:

Logger& logger = Logger::get();  // returns the logging singleton
logger.set_level(LOG_INFO);
logger.info() << "info message" << std::endl; // printed
logger.debug() << "debug message" << std::endl; // not printed
logger.warning() << "no improvement\n"; // printed as "Warning: no improvement"

Warning and error lines start with the name of their level. Messages go to
stderr unless set_output() redirects them.

*/


enum LogLevel {
    LOG_DEBUG = 1,
    LOG_INFO = 2,
    LOG_WARNING = 3,
    LOG_ERROR = 4,
};

class Logger;

class LogStream {
public:
    LogStream(int level, const char* prefix, Logger& logger)
        : level(level)
        , prefix(prefix)
        , logger(logger)
    { }

    template <typename T>
    LogStream& operator<<(const T& val);

    // Text ending in a newline makes the next message start a new line
    LogStream& operator<<(const char* text);
    LogStream& operator<<(const std::string& text);
    LogStream& operator<<(char c);

    // This overload is required for supporting std::endl
    LogStream& operator<<(std::ostream& (*f)(std::ostream&));

private:
    std::ostream* begin();

    int level;
    const char* prefix;
    bool line_start{true};
    Logger& logger;
};


class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }
    Logger(Logger const&) = delete;
    void operator=(Logger const&) = delete;

    void set_level(int level) { this->level = level; }
    int get_level() const { return level; }

    // Callers use this to skip building messages nobody will see
    bool enabled(int message_level) const { return message_level >= level; }

    void set_output(std::ostream& os) { _os = &os; }

    LogStream& debug() { return _debug; }
    LogStream& info() { return _info; }
    LogStream& warning() { return _warning; }
    LogStream& error() { return _error; }

private:
    Logger()
        : level(LOG_INFO)
        , _os(&std::cerr)
        , _debug(LOG_DEBUG, "", *this)
        , _info(LOG_INFO, "", *this)
        , _warning(LOG_WARNING, "Warning: ", *this)
        , _error(LOG_ERROR, "Error: ", *this)
    { }
    int level;
    std::ostream* _os;
    LogStream _debug;
    LogStream _info;
    LogStream _warning;
    LogStream _error;

    friend class LogStream;
};


// Output stream for an enabled message, with the prefix written if a line starts
inline std::ostream* LogStream::begin() {
    if (!logger.enabled(level)) {
        return nullptr;
    }
    if (line_start) {
        *logger._os << prefix;
        line_start = false;
    }
    return logger._os;
}

template <typename T>
LogStream& LogStream::operator<<(const T& val) {
    if (auto os = begin()) {
        *os << val;
    }
    return *this;
}

inline LogStream& LogStream::operator<<(const char* text) {
    if (auto os = begin()) {
        *os << text;
        size_t length = std::strlen(text);
        line_start = length > 0 && text[length - 1] == '\n';
    }
    return *this;
}

inline LogStream& LogStream::operator<<(const std::string& text) {
    return *this << text.c_str();
}

inline LogStream& LogStream::operator<<(char c) {
    if (auto os = begin()) {
        *os << c;
        line_start = c == '\n';
    }
    return *this;
}

inline LogStream& LogStream::operator<<(std::ostream& (*f)(std::ostream&)) {
    if (auto os = begin()) {
        f(*os);
        line_start = true;
    }
    return *this;
}

#endif
