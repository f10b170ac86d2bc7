#pragma once

#include <map>
#include <string>
#include <vector>

#include "AnnotationTypes.h"
#include "BootstrapCI.h"
#include "KrippendorffAlpha.h"

namespace culturebench {

/**
 * @brief A rubric dimension and the label it is reported under
 */
struct RubricDimension {
    std::string name;
    std::string label;

    RubricDimension() = default;
    RubricDimension(const std::string& name, const std::string& label)
        : name(name), label(label) {}
};

/**
 * @brief Settings for one report run
 *
 * Holds everything the statistics engine treats as injected configuration:
 * the rubric dimensions and their display labels, category display labels,
 * the score scale, bootstrap settings, the prompt-id language prefix table,
 * the marginal pooling policy used by Krippendorff's alpha and the number of
 * worker threads.
 *
 * JSON layout (every section optional; absent sections keep their defaults):
 * @code
 * {
 *   "rubric_dimensions": [ {"name": "cultural_accuracy", "label": "Cultural Accuracy"} ],
 *   "category_labels":   { "real_world_use": "Real-World Use" },
 *   "score_scale":       { "min": 1, "max": 5 },
 *   "bootstrap":         { "resamples": 2000, "confidence_level": 0.95, "seed": 42 },
 *   "language_prefixes": { "ig": "igala", "la": "lebanese_arabic" },
 *   "agreement":         { "marginal_policy": "pairable_only" },
 *   "threads": 1
 * }
 * @endcode
 */
class BenchmarkConfiguration {
public:
    /**
     * @brief Default constructor; equivalent to createDefault()
     */
    BenchmarkConfiguration();

    /**
     * @brief Load configuration from JSON file
     *
     * @param configPath Path to the configuration file
     * @return true if loaded successfully, false otherwise (see getLastError())
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * @brief Load configuration from JSON string
     *
     * On failure the current configuration is left unchanged.
     *
     * @param jsonContent JSON content as string
     * @return true if parsed and validated successfully, false otherwise
     */
    bool loadFromString(const std::string& jsonContent);

    /**
     * @brief Save current configuration to JSON file
     */
    bool saveToFile(const std::string& configPath) const;

    /**
     * @brief Convert configuration to a pretty-printed JSON string
     */
    std::string toJsonString() const;

    const std::vector<RubricDimension>& getDimensions() const { return dimensions_; }
    void setDimensions(const std::vector<RubricDimension>& dimensions) { dimensions_ = dimensions; }

    std::vector<std::string> getDimensionNames() const;

    /**
     * @brief Display label for a dimension; the name itself when unlabeled
     */
    std::string getDimensionLabel(const std::string& dimension) const;

    const std::map<std::string, std::string>& getCategoryLabels() const { return categoryLabels_; }
    void setCategoryLabels(const std::map<std::string, std::string>& labels) { categoryLabels_ = labels; }

    /**
     * @brief Display label for a prompt category
     *
     * Unlabeled categories are title-cased with '_' replaced by ' '.
     */
    std::string getCategoryLabel(const std::string& category) const;

    const annotation::ScoreScale& getScoreScale() const { return scoreScale_; }
    void setScoreScale(const annotation::ScoreScale& scale) { scoreScale_ = scale; }

    const analysis::BootstrapSettings& getBootstrapSettings() const { return bootstrap_; }
    void setBootstrapSettings(const analysis::BootstrapSettings& settings) { bootstrap_ = settings; }

    const std::map<std::string, std::string>& getLanguagePrefixes() const { return languagePrefixes_; }
    void setLanguagePrefixes(const std::map<std::string, std::string>& prefixes) { languagePrefixes_ = prefixes; }

    agreement::MarginalPolicy getMarginalPolicy() const { return marginalPolicy_; }
    void setMarginalPolicy(agreement::MarginalPolicy policy) { marginalPolicy_ = policy; }

    /**
     * @brief Worker threads; 1 runs everything inline, 0 uses the hardware concurrency
     */
    unsigned int getThreads() const { return threads_; }
    void setThreads(unsigned int threads) { threads_ = threads; }

    /**
     * @brief Get last error message
     */
    const std::string& getLastError() const { return lastError_; }

    /**
     * @brief Four rubric dimensions, four category labels, a 1-5 scale,
     * 2000 resamples at 95% with seed 42, single-threaded
     */
    static BenchmarkConfiguration createDefault();

private:
    std::vector<RubricDimension> dimensions_;
    std::map<std::string, std::string> categoryLabels_;
    annotation::ScoreScale scoreScale_;
    analysis::BootstrapSettings bootstrap_;
    std::map<std::string, std::string> languagePrefixes_;
    agreement::MarginalPolicy marginalPolicy_;
    unsigned int threads_;
    mutable std::string lastError_;

    bool parseJson(const std::string& jsonContent);

    void setError(const std::string& error) const { lastError_ = error; }
};

std::string toString(agreement::MarginalPolicy policy);

} // namespace culturebench
