#include "workshop/error.hpp"

namespace workshop {
namespace {

std::string describe(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Io:
      return "IO error";
    case ErrorKind::YamlParsing:
      return "YAML parsing error";
    case ErrorKind::JsonParsing:
      return "JSON parsing error";
    case ErrorKind::InvalidLanguageCode:
      return "Invalid language code";
    case ErrorKind::ApplicationDirsNotFound:
      return "Application standard dirs not found";
    case ErrorKind::WorkshopDataDirNotFound:
      return "Workshop data directory not found";
    case ErrorKind::WorkshopNotFound:
      return "Workshop data not found";
    case ErrorKind::WorkshopDefaultsNotFound:
      return "Workshop defaults not found";
    case ErrorKind::WorkshopLicenseNotFound:
      return "Workshop license not found";
    case ErrorKind::WorkshopNoDescriptions:
      return "Workshop has no descriptions";
    case ErrorKind::WorkshopNoMetadata:
      return "Workshop has no metadata";
    case ErrorKind::WorkshopNoSetupInstructions:
      return "Workshop has no setup instructions";
    case ErrorKind::WorkshopNoLessonsData:
      return "Workshop has no lessons data";
    case ErrorKind::WorkshopNoProgrammingLanguagesForSpokenLanguage:
      return "Workshop has no programming languages for spoken language";
    case ErrorKind::WorkshopDataSpokenDirNotFound:
      return "Workshop data spoken dir not found";
    case ErrorKind::WorkshopDataProgrammingDirNotFound:
      return "Workshop data programming dir not found";
    case ErrorKind::LessonDataDirNotFound:
      return "Lesson data directory not found";
    case ErrorKind::LessonTextFileMissing:
      return "Lesson text file missing";
    case ErrorKind::LessonMetadataFileMissing:
      return "Lesson metadata file missing";
    case ErrorKind::NoSpokenLanguageSpecified:
      return "No spoken language specified";
    case ErrorKind::NoProgrammingLanguageSpecified:
      return "No programming language specified";
    case ErrorKind::NoPythonExecutable:
      return "No Python executable found";
    case ErrorKind::CommandFailed:
      return "Command failed";
    case ErrorKind::CommandCancelled:
      return "Command cancelled";
  }
  return "Unknown error";
}

} // namespace

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Io: return "Io";
    case ErrorKind::YamlParsing: return "YamlParsing";
    case ErrorKind::JsonParsing: return "JsonParsing";
    case ErrorKind::InvalidLanguageCode: return "InvalidLanguageCode";
    case ErrorKind::ApplicationDirsNotFound: return "ApplicationDirsNotFound";
    case ErrorKind::WorkshopDataDirNotFound: return "WorkshopDataDirNotFound";
    case ErrorKind::WorkshopNotFound: return "WorkshopNotFound";
    case ErrorKind::WorkshopDefaultsNotFound: return "WorkshopDefaultsNotFound";
    case ErrorKind::WorkshopLicenseNotFound: return "WorkshopLicenseNotFound";
    case ErrorKind::WorkshopNoDescriptions: return "WorkshopNoDescriptions";
    case ErrorKind::WorkshopNoMetadata: return "WorkshopNoMetadata";
    case ErrorKind::WorkshopNoSetupInstructions: return "WorkshopNoSetupInstructions";
    case ErrorKind::WorkshopNoLessonsData: return "WorkshopNoLessonsData";
    case ErrorKind::WorkshopNoProgrammingLanguagesForSpokenLanguage:
      return "WorkshopNoProgrammingLanguagesForSpokenLanguage";
    case ErrorKind::WorkshopDataSpokenDirNotFound: return "WorkshopDataSpokenDirNotFound";
    case ErrorKind::WorkshopDataProgrammingDirNotFound:
      return "WorkshopDataProgrammingDirNotFound";
    case ErrorKind::LessonDataDirNotFound: return "LessonDataDirNotFound";
    case ErrorKind::LessonTextFileMissing: return "LessonTextFileMissing";
    case ErrorKind::LessonMetadataFileMissing: return "LessonMetadataFileMissing";
    case ErrorKind::NoSpokenLanguageSpecified: return "NoSpokenLanguageSpecified";
    case ErrorKind::NoProgrammingLanguageSpecified: return "NoProgrammingLanguageSpecified";
    case ErrorKind::NoPythonExecutable: return "NoPythonExecutable";
    case ErrorKind::CommandFailed: return "CommandFailed";
    case ErrorKind::CommandCancelled: return "CommandCancelled";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind) : std::runtime_error(describe(kind)), kind_(kind) {}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail.empty() ? describe(kind) : describe(kind) + ": " + detail),
      kind_(kind) {}

} // namespace workshop
