#include "PromptMetadata.h"

#include <utility>

namespace culturebench
{
  namespace annotation
  {
    const std::string kUnknownLabel = "unknown";

    PromptMetadataLookup::PromptMetadataLookup()
      : PromptMetadataLookup(defaultLanguagePrefixes())
    {
    }

    PromptMetadataLookup::PromptMetadataLookup(std::map<std::string, std::string> languagePrefixes)
      : mPrompts(),
	mLanguagePrefixes(std::move(languagePrefixes))
    {
    }

    std::map<std::string, std::string> PromptMetadataLookup::defaultLanguagePrefixes()
    {
      return {{"ig", "igala"}, {"la", "lebanese_arabic"}};
    }

    void PromptMetadataLookup::addPrompt(const std::string& promptId, const PromptInfo& info)
    {
      mPrompts[promptId] = info;
    }

    bool PromptMetadataLookup::addPromptIfAbsent(const std::string& promptId, const PromptInfo& info)
    {
      return mPrompts.emplace(promptId, info).second;
    }

    std::optional<PromptInfo> PromptMetadataLookup::find(const std::string& promptId) const
    {
      auto it = mPrompts.find(promptId);
      if (it == mPrompts.end())
	return std::nullopt;
      return it->second;
    }

    std::string PromptMetadataLookup::resolveLanguage(const std::string& promptId) const
    {
      auto it = mPrompts.find(promptId);
      if (it != mPrompts.end() && !it->second.language.empty() && it->second.language != kUnknownLabel)
	return it->second.language;

      const std::string prefix = promptId.substr(0, promptId.find('_'));
      auto p = mLanguagePrefixes.find(prefix);
      if (p != mLanguagePrefixes.end())
	return p->second;

      return kUnknownLabel;
    }

    std::string PromptMetadataLookup::resolveCategory(const std::string& promptId) const
    {
      auto it = mPrompts.find(promptId);
      if (it != mPrompts.end() && !it->second.category.empty())
	return it->second.category;
      return kUnknownLabel;
    }
  } // namespace annotation
} // namespace culturebench
