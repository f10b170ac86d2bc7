#include "PromptCatalogReader.h"

#include <algorithm>
#include <ctime>
#include <sstream>
#include <vector>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <yaml-cpp/yaml.h>

#include "AnnotationReader.h"

namespace fs = boost::filesystem;
using namespace rapidjson;

namespace culturebench
{
  namespace annotation
  {
    namespace
    {
      const char* const kSchemaFileName = "schema.yaml";

      std::string scalarOrEmpty(const YAML::Node& node, const char* key)
      {
	const YAML::Node value = node[key];
	if (value && value.IsScalar())
	  return value.as<std::string>();
	return std::string();
      }

      std::string jsonStringOrEmpty(const Value& obj, const char* name)
      {
	if (obj.HasMember(name) && obj[name].IsString())
	  return obj[name].GetString();
	return std::string();
      }

      std::string labelOrUnknown(const std::string& s)
      {
	return s.empty() ? kUnknownLabel : s;
      }
    }

    PromptCatalogReader::PromptCatalogReader(std::ostream& log)
      : mLog(log)
    {
    }

    std::size_t PromptCatalogReader::readCatalogDirectory(const std::string& directory,
							  PromptMetadataLookup& lookup) const
    {
      const fs::path dir(directory);
      if (!fs::exists(dir) || !fs::is_directory(dir))
	return 0;

      std::vector<fs::path> files;
      for (fs::directory_iterator it(dir); it != fs::directory_iterator(); ++it) {
	const fs::path& p = it->path();
	if (!fs::is_regular_file(it->status()))
	  continue;
	if (p.extension() != ".yaml" && p.extension() != ".yml")
	  continue;
	if (p.filename() == kSchemaFileName)
	  continue;
	files.push_back(p);
      }
      std::sort(files.begin(), files.end());

      std::size_t added = 0;
      for (const auto& file : files)
	added += parseCatalogYaml(readFileContents(file.string()), file.string(), lookup);

      if (added > 0)
	mLog << "Loaded metadata for " << added << " prompts from " << directory << "\n";
      return added;
    }

    std::size_t PromptCatalogReader::parseCatalogYaml(const std::string& yaml,
						      const std::string& source,
						      PromptMetadataLookup& lookup) const
    {
      YAML::Node doc;
      try {
	doc = YAML::Load(yaml);
      }
      catch (const YAML::Exception& e) {
	throw PromptCatalogException("PromptCatalogReader: malformed YAML in " + source +
				     ": " + e.what());
      }

      if (!doc.IsMap()) {
	mLog << "Warning: " << source << " is not a prompt catalogue, skipped\n";
	return 0;
      }

      const std::string docLanguage = scalarOrEmpty(doc, "language");
      const YAML::Node prompts = doc["prompts"];
      if (!prompts || !prompts.IsSequence())
	return 0;

      std::size_t added = 0;
      for (const auto& prompt : prompts) {
	if (!prompt.IsMap())
	  continue;

	const std::string id = scalarOrEmpty(prompt, "id");
	if (id.empty())
	  continue;

	PromptInfo info;
	info.category = labelOrUnknown(scalarOrEmpty(prompt, "category"));
	info.language = labelOrUnknown(docLanguage.empty() ? scalarOrEmpty(prompt, "language")
				       : docLanguage);
	lookup.addPrompt(id, info);
	++added;
      }
      return added;
    }

    std::size_t PromptCatalogReader::readResultsMetadata(const std::string& directory,
							 PromptMetadataLookup& lookup) const
    {
      const fs::path dir(directory);
      if (!fs::exists(dir) || !fs::is_directory(dir))
	return 0;

      fs::path latest;
      std::time_t latestTime = 0;
      for (fs::directory_iterator it(dir); it != fs::directory_iterator(); ++it) {
	if (!fs::is_regular_file(it->status()) || it->path().extension() != ".json")
	  continue;

	const std::time_t t = fs::last_write_time(it->path());
	if (latest.empty() || t > latestTime || (t == latestTime && it->path() > latest)) {
	  latest = it->path();
	  latestTime = t;
	}
      }

      if (latest.empty())
	return 0;

      const std::size_t added = parseResultsJson(readFileContents(latest.string()),
						 latest.string(), lookup);
      mLog << "Loaded metadata for " << added << " prompts from " << latest.string() << "\n";
      return added;
    }

    std::size_t PromptCatalogReader::parseResultsJson(const std::string& json,
						      const std::string& source,
						      PromptMetadataLookup& lookup) const
    {
      Document doc;
      doc.Parse(json.c_str());
      if (doc.HasParseError()) {
	std::ostringstream msg;
	msg << "PromptCatalogReader: JSON parse error in " << source << " at offset "
	    << doc.GetErrorOffset() << ": " << GetParseError_En(doc.GetParseError());
	throw PromptCatalogException(msg.str());
      }

      const Value* results = nullptr;
      if (doc.IsArray())
	results = &doc;
      else if (doc.IsObject() && doc.HasMember("results") && doc["results"].IsArray())
	results = &doc["results"];

      if (results == nullptr) {
	mLog << "Warning: " << source << " holds no results array, skipped\n";
	return 0;
      }

      std::size_t added = 0;
      for (const auto& item : results->GetArray()) {
	if (!item.IsObject())
	  continue;

	const std::string id = jsonStringOrEmpty(item, "prompt_id");
	if (id.empty())
	  continue;

	PromptInfo info;
	info.category = labelOrUnknown(jsonStringOrEmpty(item, "category"));
	info.language = labelOrUnknown(jsonStringOrEmpty(item, "language"));
	if (lookup.addPromptIfAbsent(id, info))
	  ++added;
      }
      return added;
    }
  } // namespace annotation
} // namespace culturebench
