#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/*
-------------------------------------------------------------------------------
 errors.hpp — Exception types raised by the core
-------------------------------------------------------------------------------
Every failure of generate/load/Dataset construction is one of the types below,
all derived from ExamDataError so a caller can catch the whole family in one
place. None of them is fatal: the caller keeps whatever Dataset it had before.

  ConfigurationError        generation request can never succeed
  GenerationExhaustedError  unique-name search ran out of attempts
  InputNotFoundError        input path missing or not a regular file
  SchemaError               required columns missing after normalization
  ValidationError           data present but breaks a field constraint
  IoError                   read/write failure, wrapped with the path
-------------------------------------------------------------------------------
*/

class ExamDataError : public std::runtime_error {
public:
    explicit ExamDataError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigurationError : public ExamDataError {
public:
    explicit ConfigurationError(const std::string& msg) : ExamDataError(msg) {}
};

class GenerationExhaustedError : public ExamDataError {
public:
    GenerationExhaustedError(int attempts, int student_id)
        : ExamDataError("Could not generate a unique name for student "
            + std::to_string(student_id) + " after "
            + std::to_string(attempts) + " attempts."),
        attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

class InputNotFoundError : public ExamDataError {
public:
    explicit InputNotFoundError(const std::string& path)
        : ExamDataError("File '" + path + "' does not exist."), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class SchemaError : public ExamDataError {
public:
    SchemaError(const std::string& msg, std::vector<std::string> missing)
        : ExamDataError(msg), missing_(std::move(missing)) {}

    // Canonical names of the columns that were not found, in canonical order.
    const std::vector<std::string>& missing_columns() const { return missing_; }

private:
    std::vector<std::string> missing_;
};

enum class ValidationKind {
    Type,       // value cannot be coerced to the column type
    Range,      // value outside the allowed interval
    Empty,      // required text is blank
    Duplicate,  // student_id repeated
    Format,     // file layout problem (extension, ragged row)
    NoRows      // nothing to load
};

class ValidationError : public ExamDataError {
public:
    ValidationError(ValidationKind kind, std::string field, const std::string& msg)
        : ExamDataError(msg), kind_(kind), field_(std::move(field)) {}

    ValidationKind kind() const { return kind_; }

    // Canonical column name, or empty when the problem is not tied to one.
    const std::string& field() const { return field_; }

private:
    ValidationKind kind_;
    std::string field_;
};

class IoError : public ExamDataError {
public:
    IoError(const std::string& path, const std::string& what)
        : ExamDataError("I/O error on '" + path + "': " + what), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
