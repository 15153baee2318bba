#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Malformed construction input (empty vertex list, non-positive dimensions, ...)
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// Target and rendered buffers differ in size. The run cannot continue.
class DimensionMismatchError : public std::runtime_error {
public:
    explicit DimensionMismatchError(const std::string& what) : std::runtime_error(what) {}
};

// Mutate/Pop/Commit requested on a polygon without a pending snapshot
class NoSnapshotError : public std::logic_error {
public:
    explicit NoSnapshotError(const std::string& what) : std::logic_error(what) {}
};

#endif // ERRORS_H
