#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

#include "PromptMetadata.h"

namespace culturebench
{
  namespace annotation
  {
    class PromptCatalogException : public std::runtime_error
    {
    public:
      explicit PromptCatalogException(const std::string& msg)
	: std::runtime_error(msg)
      {}
    };

    /**
     * @brief Populates a PromptMetadataLookup from prompt catalogues.
     *
     * Primary source: YAML catalogues, one per language, of the form
     *
     *   language: igala
     *   prompts:
     *     - id: ig_001
     *       category: real_world_use
     *
     * The document-level language takes precedence over a per-prompt one.
     * schema.yaml is never read as a catalogue.
     *
     * Fallback source: a model results JSON file, either an array of result
     * objects or an object with a "results" array. Each result may carry
     * prompt_id, category and language; the first occurrence of a prompt wins.
     */
    class PromptCatalogReader
    {
    public:
      explicit PromptCatalogReader(std::ostream& log);

      /**
       * @brief Reads every *.yaml / *.yml file of a directory in name order.
       * @return number of prompts added (a missing directory adds none)
       * @throws PromptCatalogException on malformed YAML.
       */
      std::size_t readCatalogDirectory(const std::string& directory,
				       PromptMetadataLookup& lookup) const;

      std::size_t parseCatalogYaml(const std::string& yaml,
				   const std::string& source,
				   PromptMetadataLookup& lookup) const;

      /**
       * @brief Reads the most recently modified *.json file of the directory.
       * @return number of prompts added
       * @throws PromptCatalogException on malformed JSON.
       */
      std::size_t readResultsMetadata(const std::string& directory,
				      PromptMetadataLookup& lookup) const;

      std::size_t parseResultsJson(const std::string& json,
				   const std::string& source,
				   PromptMetadataLookup& lookup) const;

    private:
      std::ostream& mLog;
    };
  } // namespace annotation
} // namespace culturebench
