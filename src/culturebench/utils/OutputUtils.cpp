#include "OutputUtils.h"
#include <cctype>
#include <cstdio>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace culturebench
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string titleCase(const std::string& text)
{
    std::string out;
    out.reserve(text.size());

    bool previousIsLetter = false;
    for (char ch : text)
    {
        const unsigned char uc = static_cast<unsigned char>(ch);
        if (std::isalpha(uc))
        {
            out.push_back(static_cast<char>(previousIsLetter ? std::tolower(uc) : std::toupper(uc)));
            previousIsLetter = true;
        }
        else
        {
            out.push_back(ch);
            previousIsLetter = false;
        }
    }
    return out;
}

std::string toDisplayName(const std::string& identifier)
{
    std::string spaced = identifier;
    for (char& ch : spaced)
    {
        if (ch == '_')
            ch = ' ';
    }
    return titleCase(spaced);
}

std::string formatFixed(double value, int decimals)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

std::string formatPercent(const std::optional<double>& fraction)
{
    if (!fraction || std::isnan(*fraction))
        return "--";
    return formatWholePercent(*fraction * 100.0);
}

std::string formatWholePercent(double percentage)
{
    return formatFixed(percentage, 0) + "%";
}

std::string formatScore(double mean, const analysis::ConfidenceInterval& ci)
{
    return formatFixed(mean, 2) + " +/- " + formatFixed(ci.halfWidth(), 2);
}

std::string formatAlpha(const std::optional<double>& alpha)
{
    if (!alpha)
        return "N/A";
    return formatFixed(*alpha, 3);
}

} // namespace utils
} // namespace culturebench
