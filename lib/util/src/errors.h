#pragma once

#include <stdexcept>
#include <string>

namespace procrate
{

class ProcRateException : public std::runtime_error
{
   public:
    explicit ProcRateException(const std::string& error) : runtime_error(error) {}
};

// Invalid pid list or constructor arguments.
class ConfigurationError : public ProcRateException
{
   public:
    explicit ConfigurationError(const std::string& error) : ProcRateException(error) {}
};

// sample() called before initialize().
class UninitializedUse : public ProcRateException
{
   public:
    explicit UninitializedUse(const std::string& error) : ProcRateException(error) {}
};

// Stored state cannot be diffed: a counter went backwards for the same process,
// or a stored value is missing or invalid.
class IntegrityError : public ProcRateException
{
   public:
    explicit IntegrityError(const std::string& error) : ProcRateException(error) {}
};

class MissingField : public IntegrityError
{
   public:
    explicit MissingField(const std::string& field) : IntegrityError("not defined key found '" + field + "'") {}
};

class InvalidValue : public IntegrityError
{
   public:
    explicit InvalidValue(const std::string& field) : IntegrityError("invalid value for key '" + field + "'") {}
};

// The process list or the system uptime could not be read.
class EnumerationFailure : public ProcRateException
{
   public:
    explicit EnumerationFailure(const std::string& error) : ProcRateException(error) {}
};

}  // namespace procrate
