#include "AnnotationReader.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace fs = boost::filesystem;
using namespace rapidjson;

namespace culturebench
{
  namespace annotation
  {
    namespace
    {
      std::string getString(const Value& obj, const char* name)
      {
	if (obj.HasMember(name) && obj[name].IsString())
	  return obj[name].GetString();
	return std::string();
      }

      std::optional<std::string> getOptionalString(const Value& obj, const char* name)
      {
	if (obj.HasMember(name) && obj[name].IsString())
	  return std::string(obj[name].GetString());
	return std::nullopt;
      }

      void parseArrayDocument(Document& doc, const std::string& json, const std::string& source)
      {
	doc.Parse(json.c_str());
	if (doc.HasParseError()) {
	  std::ostringstream msg;
	  msg << "AnnotationReader: JSON parse error in " << source << " at offset "
	      << doc.GetErrorOffset() << ": " << GetParseError_En(doc.GetParseError());
	  throw AnnotationReaderException(msg.str());
	}
      }
    }

    std::string readFileContents(const std::string& path)
    {
      std::ifstream file(path);
      if (!file.is_open())
	throw AnnotationReaderException("Could not open file: " + path);

      std::stringstream buffer;
      buffer << file.rdbuf();
      return buffer.str();
    }

    AnnotationReader::AnnotationReader(std::ostream& log)
      : mLog(log)
    {
    }

    std::vector<std::string> AnnotationReader::listJsonFiles(const std::string& directory) const
    {
      std::vector<std::string> files;
      const fs::path dir(directory);
      if (!fs::exists(dir) || !fs::is_directory(dir))
	return files;

      for (fs::directory_iterator it(dir); it != fs::directory_iterator(); ++it) {
	if (fs::is_regular_file(it->status()) && it->path().extension() == ".json")
	  files.push_back(it->path().string());
      }
      std::sort(files.begin(), files.end());
      return files;
    }

    std::vector<RawPairwiseEntry> AnnotationReader::readPairwiseDirectory(const std::string& directory) const
    {
      std::vector<RawPairwiseEntry> entries;
      for (const auto& file : listJsonFiles(directory)) {
	auto parsed = parsePairwiseJson(readFileContents(file), file);
	mLog << "Loaded " << parsed.size() << " pairwise annotations from " << file << "\n";
	entries.insert(entries.end(), parsed.begin(), parsed.end());
      }
      return entries;
    }

    std::vector<RawRubricEntry> AnnotationReader::readRubricDirectory(const std::string& directory) const
    {
      std::vector<RawRubricEntry> entries;
      for (const auto& file : listJsonFiles(directory)) {
	auto parsed = parseRubricJson(readFileContents(file), file);
	mLog << "Loaded " << parsed.size() << " rubric annotations from " << file << "\n";
	entries.insert(entries.end(), parsed.begin(), parsed.end());
      }
      return entries;
    }

    std::vector<RawPairwiseEntry> AnnotationReader::parsePairwiseJson(const std::string& json,
								      const std::string& source) const
    {
      Document doc;
      parseArrayDocument(doc, json, source);

      std::vector<RawPairwiseEntry> entries;
      if (!doc.IsArray()) {
	mLog << "Warning: " << source << " is not a JSON array, skipped\n";
	return entries;
      }

      for (const auto& item : doc.GetArray()) {
	if (!item.IsObject()) {
	  mLog << "Warning: non-object pairwise entry in " << source << " ignored\n";
	  continue;
	}

	RawPairwiseEntry entry;
	entry.promptId = getString(item, "prompt_id");
	entry.modelA = getString(item, "model_a");
	entry.modelB = getString(item, "model_b");
	entry.annotatorId = getString(item, "annotator_id");
	entry.winner = getString(item, "winner");
	entry.timestamp = getOptionalString(item, "timestamp");
	entry.explanation = getOptionalString(item, "explanation");
	entries.push_back(std::move(entry));
      }
      return entries;
    }

    std::vector<RawRubricEntry> AnnotationReader::parseRubricJson(const std::string& json,
								  const std::string& source) const
    {
      Document doc;
      parseArrayDocument(doc, json, source);

      std::vector<RawRubricEntry> entries;
      if (!doc.IsArray()) {
	mLog << "Warning: " << source << " is not a JSON array, skipped\n";
	return entries;
      }

      for (const auto& item : doc.GetArray()) {
	if (!item.IsObject()) {
	  mLog << "Warning: non-object rubric entry in " << source << " ignored\n";
	  continue;
	}

	RawRubricEntry entry;
	entry.promptId = getString(item, "prompt_id");
	entry.model = getString(item, "model");
	entry.annotatorId = getString(item, "annotator_id");
	entry.timestamp = getOptionalString(item, "timestamp");

	if (item.HasMember("scores") && item["scores"].IsObject()) {
	  const Value& scores = item["scores"];
	  for (Value::ConstMemberIterator it = scores.MemberBegin(); it != scores.MemberEnd(); ++it) {
	    if (it->value.IsNumber())
	      entry.scores[it->name.GetString()] = it->value.GetDouble();
	  }
	}
	entries.push_back(std::move(entry));
      }
      return entries;
    }
  } // namespace annotation
} // namespace culturebench
