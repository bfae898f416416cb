/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace j2m {

std::string format_number(double value);

class ConvertError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// The hint table names a tag that is not a MessagePack numeric type.
class UnsupportedTypeHint : public ConvertError {
   public:
    UnsupportedTypeHint(std::string key, std::string tag)
        : ConvertError("Unsupported numeric type hint " + key + "=" + tag),
          key_(std::move(key)),
          tag_(std::move(tag)) {}

    const std::string& key() const { return key_; }
    const std::string& tag() const { return tag_; }

   private:
    std::string key_;
    std::string tag_;
};

// No hint applies and the number is not an exact 64-bit signed integer.
class UnsupportedNumericValue : public ConvertError {
   public:
    explicit UnsupportedNumericValue(double value)
        : ConvertError("Unsupported numeric value " + format_number(value)), value_(value) {}

    double value() const { return value_; }

   private:
    double value_;
};

// Strict mode only: the hinted type cannot hold the value.
class HintedValueOutOfRange : public ConvertError {
   public:
    HintedValueOutOfRange(std::string key, std::string tag, double value)
        : ConvertError(
              "Value " + format_number(value) + " does not fit type hint " + key + "=" + tag
          ),
          key_(std::move(key)),
          tag_(std::move(tag)),
          value_(value) {}

    const std::string& key() const { return key_; }
    const std::string& tag() const { return tag_; }
    double value() const { return value_; }

   private:
    std::string key_;
    std::string tag_;
    double value_;
};

class ParseError : public ConvertError {
   public:
    using ConvertError::ConvertError;
};

class IoError : public ConvertError {
   public:
    using ConvertError::ConvertError;
};

}  // namespace j2m
