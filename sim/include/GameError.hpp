#ifndef CUBEMAZE_GAME_ERROR_HPP
#define CUBEMAZE_GAME_ERROR_HPP

#include <string>

enum class ErrorKind : int {
  NONE = 0,
  INVALID_DIMENSIONS,        // Maze width/height below MIN_DIMENSION
  CONFIGURATION_OUT_OF_RANGE // Negative timer, zero speed, unknown override...
};

struct GameError {
  ErrorKind kind = ErrorKind::NONE;
  std::string message;
};

inline const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NONE:
    return "None";
  case ErrorKind::INVALID_DIMENSIONS:
    return "InvalidDimensions";
  case ErrorKind::CONFIGURATION_OUT_OF_RANGE:
    return "ConfigurationOutOfRange";
  }
  return "Unknown";
}

#endif // CUBEMAZE_GAME_ERROR_HPP
