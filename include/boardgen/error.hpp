#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace boardgen {

enum class ErrorCode {
    // decode / resolve
    UnsupportedColor,
    InvalidBandCount,
    UnrecognizedMarking,
    InvalidQuantity,
    // encode
    UnsupportedTolerance,
    ValueNotRepresentable,
    AmbiguousUnit,
    // io
    BomSyntax
};

inline const char* to_cstr(ErrorCode c) {
    switch (c) {
        case ErrorCode::UnsupportedColor:      return "UnsupportedColor";
        case ErrorCode::InvalidBandCount:      return "InvalidBandCount";
        case ErrorCode::UnrecognizedMarking:   return "UnrecognizedMarking";
        case ErrorCode::InvalidQuantity:       return "InvalidQuantity";
        case ErrorCode::UnsupportedTolerance:  return "UnsupportedTolerance";
        case ErrorCode::ValueNotRepresentable: return "ValueNotRepresentable";
        case ErrorCode::AmbiguousUnit:         return "AmbiguousUnit";
        case ErrorCode::BomSyntax:             return "BomSyntax";
    }
    return "Unknown";
}

// Base for every error raised by the library. Carries the offending input
// text verbatim so callers can show it next to the message.
class BoardgenError : public std::exception {
public:
    BoardgenError(ErrorCode code, std::string input, std::string message)
        : code_(code), input_(std::move(input)), message_(std::move(message)) {
        std::ostringstream os;
        os << to_cstr(code_) << ": " << message_;
        if (!input_.empty()) os << " (input: '" << input_ << "')";
        full_ = os.str();
    }

    const char* what() const noexcept override { return full_.c_str(); }

    ErrorCode code() const { return code_; }
    const std::string& input() const { return input_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string input_;
    std::string message_;
    std::string full_;
};

// Input text matched no supported grammar.
class DecodeError : public BoardgenError {
public:
    DecodeError(ErrorCode code, const std::string& input, const std::string& message)
        : BoardgenError(code, input, message) {}
};

// A numeric value has no representation under the target scheme.
class EncodeError : public BoardgenError {
public:
    EncodeError(ErrorCode code, const std::string& input, const std::string& message)
        : BoardgenError(code, input, message) {}
};

// Malformed BOM or config file line (io layer only).
class BomParseError : public BoardgenError {
public:
    BomParseError(const std::string& file, int line, const std::string& text, const std::string& message)
        : BoardgenError(ErrorCode::BomSyntax, text, file + ":" + std::to_string(line) + " " + message),
          file_(file), line_(line) {}

    const std::string& file() const { return file_; }
    int line() const { return line_; }

private:
    std::string file_;
    int line_ = 0;
};

template <typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream os;
    (os << ... << args);
    return os.str();
}

} // namespace boardgen
