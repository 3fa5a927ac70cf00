/**
 * @file parse_error.h
 * @brief Configuration errors that name the offending field and file
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace duplex {
namespace config {

/**
 * @brief Raised while loading or validating a polling configuration.
 *
 * what() reads "Configuration parse error in <file>:<line> at field
 * '<a.b>': <message>", leaving out the parts that are unknown.
 */
class ConfigParseError : public std::runtime_error {
 public:
  explicit ConfigParseError(const std::string& message,
                            const std::string& field = "",
                            const std::string& file = "",
                            int line = -1)
      : std::runtime_error(describe(message, field, file, line)),
        message_(message),
        field_(field),
        file_(file),
        line_(line) {}

  const std::string& message() const { return message_; }
  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }
  int line() const { return line_; }

 private:
  static std::string describe(const std::string& message,
                              const std::string& field,
                              const std::string& file,
                              int line) {
    std::string text = "Configuration parse error";
    if (!file.empty()) {
      text += " in " + file;
      if (line > 0) {
        text += ":" + std::to_string(line);
      }
    }
    if (!field.empty()) {
      text += " at field '" + field + "'";
    }
    return text + ": " + message;
  }

  std::string message_;
  std::string field_;
  std::string file_;
  int line_;
};

/**
 * @brief Dotted path of the field being parsed, for error reporting.
 */
class ParseContext {
 public:
  ParseContext() = default;
  explicit ParseContext(const std::string& file) : file_(file) {}

  void pushField(const std::string& field) { fields_.push_back(field); }

  void popField() {
    if (!fields_.empty()) {
      fields_.pop_back();
    }
  }

  std::string getCurrentPath() const {
    std::string path;
    for (const auto& field : fields_) {
      if (!path.empty()) {
        path += '.';
      }
      path += field;
    }
    return path;
  }

  const std::string& getFile() const { return file_; }

  ConfigParseError createError(const std::string& message) const {
    return ConfigParseError(message, getCurrentPath(), file_);
  }

  // Pushes a field for the lifetime of the scope
  class FieldScope {
   public:
    FieldScope(ParseContext& ctx, const std::string& field) : ctx_(ctx) {
      ctx_.pushField(field);
    }
    ~FieldScope() { ctx_.popField(); }

    FieldScope(const FieldScope&) = delete;
    FieldScope& operator=(const FieldScope&) = delete;

   private:
    ParseContext& ctx_;
  };

 private:
  std::vector<std::string> fields_;
  std::string file_;
};

}  // namespace config
}  // namespace duplex
