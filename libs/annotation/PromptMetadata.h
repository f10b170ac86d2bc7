#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace culturebench
{
  namespace annotation
  {
    extern const std::string kUnknownLabel;

    struct PromptInfo
    {
      std::string category;
      std::string language;
    };

    /**
     * @brief prompt_id -> {category, language} with a last-resort language guess.
     *
     * Language resolution:
     *   1. the prompt's metadata entry, unless it is missing or "unknown";
     *   2. the language prefix table, keyed on the id text before the first '_'
     *      (known-imprecise: it only recognises the prefixes it is given);
     *   3. "unknown".
     * Category resolution uses the metadata entry, else "unknown".
     */
    class PromptMetadataLookup
    {
    public:
      PromptMetadataLookup();
      explicit PromptMetadataLookup(std::map<std::string, std::string> languagePrefixes);

      // Inserts or replaces the entry for promptId.
      void addPrompt(const std::string& promptId, const PromptInfo& info);

      // Inserts only if promptId has no entry yet. Returns true on insert.
      bool addPromptIfAbsent(const std::string& promptId, const PromptInfo& info);

      std::optional<PromptInfo> find(const std::string& promptId) const;

      std::string resolveLanguage(const std::string& promptId) const;
      std::string resolveCategory(const std::string& promptId) const;

      std::size_t size() const
      {
	return mPrompts.size();
      }

      bool empty() const
      {
	return mPrompts.empty();
      }

      const std::map<std::string, std::string>& getLanguagePrefixes() const
      {
	return mLanguagePrefixes;
      }

      void setLanguagePrefixes(const std::map<std::string, std::string>& prefixes)
      {
	mLanguagePrefixes = prefixes;
      }

      // {"ig" -> "igala", "la" -> "lebanese_arabic"}
      static std::map<std::string, std::string> defaultLanguagePrefixes();

    private:
      std::unordered_map<std::string, PromptInfo> mPrompts;
      std::map<std::string, std::string>          mLanguagePrefixes;
    };
  } // namespace annotation
} // namespace culturebench
