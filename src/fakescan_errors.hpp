#ifndef FAKESCAN_ERRORS_HPP
#define FAKESCAN_ERRORS_HPP

#include <stdexcept>
#include <string>

// Fatal upstream failures. Probe-level problems never surface as exceptions.
class FakescanError : public std::runtime_error {
public:
    explicit FakescanError(const std::string& message) : std::runtime_error(message) {}
};

// Media could not be fetched or decoded
class MediaDecodeError : public FakescanError {
public:
    explicit MediaDecodeError(const std::string& message) : FakescanError(message) {}
};

// Frame classifier missing or returned an unusable batch
class ClassifierError : public FakescanError {
public:
    explicit ClassifierError(const std::string& message) : FakescanError(message) {}
};

#endif // FAKESCAN_ERRORS_HPP
