#pragma once
/*
 * Errors
 *
 * Purpose: exception taxonomy shared by reader, tree and key handlers.
 * Boundary: ModeController turns ReadError/InvalidUserInput/IndexOutOfRange
 * into one-line messages; UsageError only reaches main; QuitRequested is not a
 * std::exception so it passes every handler boundary untouched.
 */
#include <stdexcept>
#include <string>

class ReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class IndexOutOfRange : public std::out_of_range {
public:
  using std::out_of_range::out_of_range;
};

class InvalidUserInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct QuitRequested {};
