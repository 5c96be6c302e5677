#ifndef EARMARK_ERRORS_H
#define EARMARK_ERRORS_H

#include <stdexcept>
#include <string>

namespace Earmark {

// Spectrogram arrays disagree in shape or an axis is not strictly increasing
class InvalidSpectrogram : public std::runtime_error {
public:
    explicit InvalidSpectrogram(const std::string& what)
        : std::runtime_error("Invalid spectrogram: " + what) {}
};

// A tunable is out of range; raised before any processing starts
class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::runtime_error("Invalid configuration: " + what) {}
};

class AudioLoadError : public std::runtime_error {
public:
    explicit AudioLoadError(const std::string& what)
        : std::runtime_error(what) {}
};

class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what)
        : std::runtime_error("Cancelled: " + what) {}
};

} // namespace Earmark

#endif
