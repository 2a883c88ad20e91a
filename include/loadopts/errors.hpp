#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace loadopts
{
    class Error : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    // Malformed duration, stage list, IP or CIDR text.
    class ParseError : public Error
    {
      public:
        using Error::Error;
    };

    // JSON payload could not be decoded into an options field.
    class DecodeError : public Error
    {
      public:
        using Error::Error;
    };

    class BindingError : public Error
    {
      public:
        BindingError(std::string variable, std::string value, const std::string& reason)
            : Error("invalid value \"" + value + "\" for " + variable + ": " + reason),
              variable_(std::move(variable)),
              value_(std::move(value))
        {
        }

        const std::string& variable() const noexcept { return variable_; }
        const std::string& value() const noexcept { return value_; }

      private:
        std::string variable_;
        std::string value_;
    };

    class CertificateError : public Error
    {
      public:
        using Error::Error;
    };

} // namespace loadopts
