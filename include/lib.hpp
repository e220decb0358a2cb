#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string


using str = std::string;
using er = std::runtime_error;

/****************** ERROR KINDS */

// Base of every error raised by the migration engine.
class MigrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid model declaration (bad field name, reserved name, duplicate group...).
class DeclarationError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// Abstract / proxy models can not be migrated.
class ModelNotAllowedError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class DiffError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class GenerationError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class HistoryConsistencyError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// Failure inside a unit transaction. Keeps the failing unit and the db text.
class ApplyError : public MigrationError {
public:
    ApplyError(const std::string& model, int sequence, const std::string& db_error)
        : MigrationError("Migration " + model + " #" + std::to_string(sequence) + " failed: " + db_error)
        , model_(model), sequence_(sequence), db_error_(db_error) { }

    const std::string& model() const { return model_; }
    int sequence() const { return sequence_; }
    const std::string& db_error() const { return db_error_; }

private:
    std::string model_;
    int sequence_;
    std::string db_error_;
};

// printf style formatting, prefixed with "file:line: "
std::string format_error(const char* msg, const char* file, int line, va_list args);

[[noreturn]] void error(const std::string& msg, const char* file, int line, ...);

template <class E>
[[noreturn]] void error_as(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = format_error(msg.c_str(), file, line, args);
    va_end(args);
    throw E(text);
}

// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
#define THROW_AS(type, msg, ...) error_as<type>(msg, __FILE__, __LINE__, ##__VA_ARGS__)

// "abc" -> "\"abc\"", inner quotes doubled
std::string quote_ident(const std::string& ident);

// zero padded decimal: pad(7, 4) == "0007"
std::string zero_pad(int value, int width);

// local time formatted for file names: 2021_03_10_16_42_13_521641
std::string file_timestamp();

// ISO-8601 UTC timestamp
std::string iso_timestamp();
