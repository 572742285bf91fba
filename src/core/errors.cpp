#include "core/errors.h"

namespace testforge {

ParseError::ParseError(const std::string& file, int line, const std::string& detail)
    : Error(file + ":" + std::to_string(line) + ": " + detail),
      file_(file),
      line_(line) {
}

}  // namespace testforge
