#ifndef FAIRLENS_EXCEPTIONS_H
#define FAIRLENS_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace FairLens {

class FairLensException : public std::runtime_error {
public:
    explicit FairLensException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public FairLensException {
public:
    explicit IOException(const std::string& message) : FairLensException("IO Error: " + message) {}
};

class DatasetException : public FairLensException {
public:
    explicit DatasetException(const std::string& message) : FairLensException("Dataset Error: " + message) {}
};

class ConfigurationException : public FairLensException {
public:
    explicit ConfigurationException(const std::string& message) : FairLensException("Configuration Error: " + message) {}
};

} // namespace FairLens

#endif // FAIRLENS_EXCEPTIONS_H
