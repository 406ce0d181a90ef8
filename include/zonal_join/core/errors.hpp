#pragma once

#include <stdexcept>
#include <string>

namespace zonal_join {

class ZonalJoinError : public std::runtime_error {
public:
    explicit ZonalJoinError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ZonalJoinError {
public:
    explicit ConfigError(const std::string& message)
        : ZonalJoinError("Config error: " + message) {}
};

class ValidationError : public ZonalJoinError {
public:
    explicit ValidationError(const std::string& message)
        : ZonalJoinError("Validation error: " + message) {}
};

class GeometryError : public ZonalJoinError {
public:
    explicit GeometryError(const std::string& message)
        : ZonalJoinError("Geometry error: " + message) {}
};

class IOError : public ZonalJoinError {
public:
    explicit IOError(const std::string& message)
        : ZonalJoinError("I/O error: " + message) {}
};

class GdalError : public IOError {
public:
    explicit GdalError(const std::string& message)
        : IOError("GDAL error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

} // namespace zonal_join
