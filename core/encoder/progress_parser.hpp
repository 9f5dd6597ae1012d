#ifndef PROGRESS_PARSER_H
#define PROGRESS_PARSER_H

#include <QString>
#include <optional>

//!
//! \brief Turns the engine's diagnostic lines into a completion percentage.
//! \details Stateless per line: markers are clamped to [0, 100] but never reordered or smoothed.
//!
class ProgressParser
{
public:
    explicit ProgressParser(double totalDurationSeconds);

    //! Returns a percentage when the line carries a time marker and the total duration is known.
    [[nodiscard]] std::optional<int> parse(const QString& line) const;

    [[nodiscard]] bool hasDuration() const { return totalDurationSeconds > 0; }

    //! Parses the elapsed time of a `time=HH:MM:SS.ffff` marker, in seconds.
    [[nodiscard]] static std::optional<double> elapsedSeconds(const QString& line);

private:
    double totalDurationSeconds;
};

#endif
