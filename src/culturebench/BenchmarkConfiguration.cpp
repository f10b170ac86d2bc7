#include "BenchmarkConfiguration.h"
#include "PromptMetadata.h"
#include "utils/OutputUtils.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace culturebench {

namespace {

bool parseMarginalPolicy(const std::string& text, agreement::MarginalPolicy& policy) {
    if (text == "pairable_only") {
        policy = agreement::MarginalPolicy::PairableOnly;
        return true;
    }
    if (text == "all_values") {
        policy = agreement::MarginalPolicy::AllValues;
        return true;
    }
    return false;
}

bool readStringMap(const Value& obj, std::map<std::string, std::string>& out) {
    if (!obj.IsObject()) {
        return false;
    }
    std::map<std::string, std::string> result;
    for (Value::ConstMemberIterator it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        if (!it->value.IsString()) {
            return false;
        }
        result[it->name.GetString()] = it->value.GetString();
    }
    out = result;
    return true;
}

Value writeStringMap(const std::map<std::string, std::string>& in, Document::AllocatorType& allocator) {
    Value obj(kObjectType);
    for (const auto& entry : in) {
        obj.AddMember(Value(entry.first.c_str(), allocator),
                      Value(entry.second.c_str(), allocator),
                      allocator);
    }
    return obj;
}

} // namespace

std::string toString(agreement::MarginalPolicy policy) {
    switch (policy) {
    case agreement::MarginalPolicy::PairableOnly:
        return "pairable_only";
    case agreement::MarginalPolicy::AllValues:
        return "all_values";
    }
    throw std::invalid_argument("toString: unknown MarginalPolicy");
}

BenchmarkConfiguration::BenchmarkConfiguration()
    : dimensions_({
          RubricDimension("cultural_accuracy", "Cultural Accuracy"),
          RubricDimension("linguistic_authenticity", "Linguistic Authenticity"),
          RubricDimension("creative_depth", "Creative Depth"),
          RubricDimension("factual_correctness", "Factual Correctness")
      }),
      categoryLabels_({
          {"real_world_use", "Real-World Use"},
          {"words_concepts", "Words & Concepts"},
          {"frontier_aspirations", "Frontier Aspirations"},
          {"abstract_vs_everyday", "Abstract vs Everyday"}
      }),
      scoreScale_(),
      bootstrap_(),
      languagePrefixes_(annotation::PromptMetadataLookup::defaultLanguagePrefixes()),
      marginalPolicy_(agreement::MarginalPolicy::PairableOnly),
      threads_(1) {
}

BenchmarkConfiguration BenchmarkConfiguration::createDefault() {
    return BenchmarkConfiguration();
}

bool BenchmarkConfiguration::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return loadFromString(buffer.str());
}

bool BenchmarkConfiguration::loadFromString(const std::string& jsonContent) {
    return parseJson(jsonContent);
}

bool BenchmarkConfiguration::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open file for writing: " + configPath);
        return false;
    }

    file << toJsonString();
    file.close();
    return true;
}

std::vector<std::string> BenchmarkConfiguration::getDimensionNames() const {
    std::vector<std::string> names;
    names.reserve(dimensions_.size());
    for (const auto& dim : dimensions_) {
        names.push_back(dim.name);
    }
    return names;
}

std::string BenchmarkConfiguration::getDimensionLabel(const std::string& dimension) const {
    for (const auto& dim : dimensions_) {
        if (dim.name == dimension && !dim.label.empty()) {
            return dim.label;
        }
    }
    return dimension;
}

std::string BenchmarkConfiguration::getCategoryLabel(const std::string& category) const {
    auto it = categoryLabels_.find(category);
    if (it != categoryLabels_.end()) {
        return it->second;
    }
    return utils::toDisplayName(category);
}

bool BenchmarkConfiguration::parseJson(const std::string& jsonContent) {
    Document doc;
    doc.Parse(jsonContent.c_str());
    if (doc.HasParseError()) {
        std::ostringstream msg;
        msg << "JSON parse error at offset " << doc.GetErrorOffset() << ": "
            << GetParseError_En(doc.GetParseError());
        setError(msg.str());
        return false;
    }
    if (!doc.IsObject()) {
        setError("Configuration root must be a JSON object");
        return false;
    }

    // Parse into a copy so a failed load leaves this configuration untouched
    BenchmarkConfiguration parsed(*this);

    if (doc.HasMember("rubric_dimensions")) {
        const Value& dims = doc["rubric_dimensions"];
        if (!dims.IsArray() || dims.Empty()) {
            setError("'rubric_dimensions' must be a non-empty array");
            return false;
        }
        parsed.dimensions_.clear();
        for (const auto& dim : dims.GetArray()) {
            if (dim.IsString()) {
                parsed.dimensions_.emplace_back(dim.GetString(), dim.GetString());
            } else if (dim.IsObject() && dim.HasMember("name") && dim["name"].IsString()) {
                std::string name = dim["name"].GetString();
                std::string label = (dim.HasMember("label") && dim["label"].IsString())
                    ? dim["label"].GetString() : name;
                parsed.dimensions_.emplace_back(name, label);
            } else {
                setError("Each rubric dimension must be a string or an object with a 'name'");
                return false;
            }
        }
    }

    if (doc.HasMember("category_labels")) {
        if (!readStringMap(doc["category_labels"], parsed.categoryLabels_)) {
            setError("'category_labels' must map category names to strings");
            return false;
        }
    }

    if (doc.HasMember("score_scale")) {
        const Value& scale = doc["score_scale"];
        if (!scale.IsObject()) {
            setError("'score_scale' must be an object");
            return false;
        }
        if (scale.HasMember("min")) {
            if (!scale["min"].IsInt()) {
                setError("'score_scale.min' must be an integer");
                return false;
            }
            parsed.scoreScale_.minimum = scale["min"].GetInt();
        }
        if (scale.HasMember("max")) {
            if (!scale["max"].IsInt()) {
                setError("'score_scale.max' must be an integer");
                return false;
            }
            parsed.scoreScale_.maximum = scale["max"].GetInt();
        }
        if (parsed.scoreScale_.minimum > parsed.scoreScale_.maximum) {
            setError("'score_scale.min' must not exceed 'score_scale.max'");
            return false;
        }
    }

    if (doc.HasMember("bootstrap")) {
        const Value& boot = doc["bootstrap"];
        if (!boot.IsObject()) {
            setError("'bootstrap' must be an object");
            return false;
        }
        if (boot.HasMember("resamples")) {
            if (!boot["resamples"].IsUint() || boot["resamples"].GetUint() == 0) {
                setError("'bootstrap.resamples' must be a positive integer");
                return false;
            }
            parsed.bootstrap_.numResamples = boot["resamples"].GetUint();
        }
        if (boot.HasMember("confidence_level")) {
            if (!boot["confidence_level"].IsNumber()) {
                setError("'bootstrap.confidence_level' must be a number");
                return false;
            }
            const double level = boot["confidence_level"].GetDouble();
            if (!(level > 0.0 && level < 1.0)) {
                setError("'bootstrap.confidence_level' must be in (0, 1)");
                return false;
            }
            parsed.bootstrap_.confidenceLevel = level;
        }
        if (boot.HasMember("seed")) {
            if (!boot["seed"].IsUint64()) {
                setError("'bootstrap.seed' must be a non-negative integer");
                return false;
            }
            parsed.bootstrap_.seed = boot["seed"].GetUint64();
        }
    }

    if (doc.HasMember("language_prefixes")) {
        if (!readStringMap(doc["language_prefixes"], parsed.languagePrefixes_)) {
            setError("'language_prefixes' must map prefixes to language names");
            return false;
        }
    }

    if (doc.HasMember("agreement")) {
        const Value& agreementSection = doc["agreement"];
        if (!agreementSection.IsObject()) {
            setError("'agreement' must be an object");
            return false;
        }
        if (agreementSection.HasMember("marginal_policy")) {
            const Value& policy = agreementSection["marginal_policy"];
            if (!policy.IsString() || !parseMarginalPolicy(policy.GetString(), parsed.marginalPolicy_)) {
                setError("'agreement.marginal_policy' must be \"pairable_only\" or \"all_values\"");
                return false;
            }
        }
    }

    if (doc.HasMember("threads")) {
        if (!doc["threads"].IsUint()) {
            setError("'threads' must be a non-negative integer");
            return false;
        }
        parsed.threads_ = doc["threads"].GetUint();
    }

    parsed.lastError_.clear();
    *this = parsed;
    return true;
}

std::string BenchmarkConfiguration::toJsonString() const {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value dims(kArrayType);
    for (const auto& dim : dimensions_) {
        Value d(kObjectType);
        d.AddMember("name", Value(dim.name.c_str(), allocator), allocator);
        d.AddMember("label", Value(dim.label.c_str(), allocator), allocator);
        dims.PushBack(d, allocator);
    }
    doc.AddMember("rubric_dimensions", dims, allocator);

    doc.AddMember("category_labels", writeStringMap(categoryLabels_, allocator), allocator);

    Value scale(kObjectType);
    scale.AddMember("min", scoreScale_.minimum, allocator);
    scale.AddMember("max", scoreScale_.maximum, allocator);
    doc.AddMember("score_scale", scale, allocator);

    Value boot(kObjectType);
    boot.AddMember("resamples", bootstrap_.numResamples, allocator);
    boot.AddMember("confidence_level", bootstrap_.confidenceLevel, allocator);
    boot.AddMember("seed", static_cast<uint64_t>(bootstrap_.seed), allocator);
    doc.AddMember("bootstrap", boot, allocator);

    doc.AddMember("language_prefixes", writeStringMap(languagePrefixes_, allocator), allocator);

    Value agreementSection(kObjectType);
    agreementSection.AddMember("marginal_policy",
                               Value(toString(marginalPolicy_).c_str(), allocator),
                               allocator);
    doc.AddMember("agreement", agreementSection, allocator);

    doc.AddMember("threads", threads_, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

} // namespace culturebench
