#ifndef SCRUB_EXCEPTIONS_H
#define SCRUB_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Scrub {

class ScrubException : public std::runtime_error {
public:
    explicit ScrubException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public ScrubException {
public:
    explicit IOException(const std::string& message) : ScrubException("IO Error: " + message) {}
};

class DatasetException : public ScrubException {
public:
    explicit DatasetException(const std::string& message) : ScrubException("Dataset Error: " + message) {}
};

class ConfigurationException : public ScrubException {
public:
    explicit ConfigurationException(const std::string& message) : ScrubException("Configuration Error: " + message) {}
};

class InvalidArgumentException : public ScrubException {
public:
    explicit InvalidArgumentException(const std::string& message) : ScrubException("Invalid Argument: " + message) {}
};

class MissingColumnException : public ScrubException {
public:
    explicit MissingColumnException(const std::string& column)
        : ScrubException("Missing Column: '" + column + "'"), column_(column) {}

    const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

class WrongColumnTypeException : public ScrubException {
public:
    WrongColumnTypeException(const std::string& column, const std::string& expected, const std::string& actual)
        : ScrubException("Wrong Column Type: '" + column + "' is " + actual + ", expected " + expected),
          column_(column), expected_(expected), actual_(actual) {}

    const std::string& column() const noexcept { return column_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string column_;
    std::string expected_;
    std::string actual_;
};

} // namespace Scrub

#endif // SCRUB_EXCEPTIONS_H
