#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace workshop {

enum class ErrorKind {
  Io,
  YamlParsing,
  JsonParsing,
  InvalidLanguageCode,
  ApplicationDirsNotFound,
  WorkshopDataDirNotFound,
  WorkshopNotFound,
  WorkshopDefaultsNotFound,
  WorkshopLicenseNotFound,
  WorkshopNoDescriptions,
  WorkshopNoMetadata,
  WorkshopNoSetupInstructions,
  WorkshopNoLessonsData,
  WorkshopNoProgrammingLanguagesForSpokenLanguage,
  WorkshopDataSpokenDirNotFound,
  WorkshopDataProgrammingDirNotFound,
  LessonDataDirNotFound,
  LessonTextFileMissing,
  LessonMetadataFileMissing,
  NoSpokenLanguageSpecified,
  NoProgrammingLanguageSpecified,
  NoPythonExecutable,
  CommandFailed,
  CommandCancelled,
};

std::string_view error_kind_name(ErrorKind kind);

/**
 * Error is the single exception type thrown by the workshop engine. The kind
 * identifies the structural problem; the message names the workshop, language
 * or path involved.
 */
class Error : public std::runtime_error {
public:
  explicit Error(ErrorKind kind);
  Error(ErrorKind kind, const std::string& detail);

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace workshop
