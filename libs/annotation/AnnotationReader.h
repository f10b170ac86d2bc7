#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "AnnotationTypes.h"

namespace culturebench
{
  namespace annotation
  {
    class AnnotationReaderException : public std::runtime_error
    {
    public:
      explicit AnnotationReaderException(const std::string& msg)
	: std::runtime_error(msg)
      {}
    };

    /**
     * @brief Loads annotation entries from JSON arrays.
     *
     * A directory is scanned for *.json files in file-name order; each file must
     * contain a JSON array of objects. Files whose top level is not an array
     * are skipped with a warning on the log stream. Missing string fields are
     * read as empty strings; a rubric dimension whose value is not a number is
     * treated as unscored.
     */
    class AnnotationReader
    {
    public:
      explicit AnnotationReader(std::ostream& log);

      /**
       * @throws AnnotationReaderException on unreadable or unparsable files.
       */
      std::vector<RawPairwiseEntry> readPairwiseDirectory(const std::string& directory) const;
      std::vector<RawRubricEntry>   readRubricDirectory(const std::string& directory) const;

      /**
       * @param source Name used in diagnostics (usually the file path).
       * @throws AnnotationReaderException if json is not valid JSON.
       */
      std::vector<RawPairwiseEntry> parsePairwiseJson(const std::string& json,
						      const std::string& source) const;
      std::vector<RawRubricEntry>   parseRubricJson(const std::string& json,
						    const std::string& source) const;

    private:
      std::vector<std::string> listJsonFiles(const std::string& directory) const;

    private:
      std::ostream& mLog;
    };

    // Reads a whole file; throws AnnotationReaderException if it cannot be opened.
    std::string readFileContents(const std::string& path);
  } // namespace annotation
} // namespace culturebench
