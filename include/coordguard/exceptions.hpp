#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace coordguard {

class CoordGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigException : public CoordGuardException {
public:
    using CoordGuardException::CoordGuardException;
};

class SerializationException : public CoordGuardException {
public:
    using CoordGuardException::CoordGuardException;
};

class PersistenceException : public CoordGuardException {
public:
    PersistenceException(std::string path, const std::string& reason)
        : CoordGuardException("Failed to persist " + path + ": " + reason)
        , path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace coordguard
