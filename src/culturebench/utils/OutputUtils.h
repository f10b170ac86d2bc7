#pragma once

#include <optional>
#include <ostream>
#include <streambuf>
#include <string>

#include "BootstrapCI.h"

namespace culturebench
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to the console and a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Capitalize the first letter of every word and lower-case the rest
 *
 * A word starts at any letter that does not follow another letter, so
 * "gpt-4o" becomes "Gpt-4O".
 */
std::string titleCase(const std::string& text);

/**
 * @brief '_' replaced by ' ', then title-cased ("lebanese_arabic" -> "Lebanese Arabic")
 */
std::string toDisplayName(const std::string& identifier);

/**
 * @brief A fraction in [0, 1] as a whole percentage ("75%"), "--" when undefined
 */
std::string formatPercent(const std::optional<double>& fraction);

/**
 * @brief A percentage value already in [0, 100] rounded to a whole number ("75%")
 */
std::string formatWholePercent(double percentage);

/**
 * @brief "mean +/- halfwidth" with two decimals
 */
std::string formatScore(double mean, const analysis::ConfidenceInterval& ci);

/**
 * @brief Alpha with three decimals, "N/A" when undefined
 */
std::string formatAlpha(const std::optional<double>& alpha);

/**
 * @brief Fixed-point formatting helper
 */
std::string formatFixed(double value, int decimals);

} // namespace utils
} // namespace culturebench
