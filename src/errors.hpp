#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>

// A vector or weight tensor does not have the size a layer expects
class ShapeMismatchError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class IoError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Content (model file, CSV data) that does not decode into the expected shape
class FormatError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif // ERRORS_HPP
