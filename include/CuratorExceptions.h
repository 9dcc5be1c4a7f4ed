#ifndef CURATOR_EXCEPTIONS_H
#define CURATOR_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Curator {

class CuratorException : public std::runtime_error {
public:
    explicit CuratorException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public CuratorException {
public:
    explicit IOException(const std::string& message) : CuratorException("IO Error: " + message) {}
};

class DatasetException : public CuratorException {
public:
    explicit DatasetException(const std::string& message) : CuratorException("Dataset Error: " + message) {}
};

class ConfigurationException : public CuratorException {
public:
    explicit ConfigurationException(const std::string& message) : CuratorException("Configuration Error: " + message) {}
};

class TransformException : public CuratorException {
public:
    explicit TransformException(const std::string& message) : CuratorException("Transform Error: " + message) {}
};

} // namespace Curator

#endif // CURATOR_EXCEPTIONS_H
